#pragma once

#include <iostream>
#include <stdexcept>
#include <string>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace epsim {

/** Unsupported obs/reward mode, unknown configuration key, incompatible backend request */
class ConfigurationError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

/** Named scene entity (mount actor, link, articulation, camera) not found */
class LookupError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

/** Malformed action command */
class ActionTypeError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

/** Extension hook without an implementation in the concrete task */
class UnimplementedHookError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

/** State vector does not match the captured scene layout */
class ShapeMismatchError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

}  // namespace epsim

#define EPSIM_THROW_AS(exception_t, ...)                                                         \
    do {                                                                                         \
        std::string message = fmt::format(__VA_ARGS__);                                          \
        std::cerr << "\033[31m\n"                                                                \
                  << "Exception thrown in file " << __FILE__ << " on line " << __LINE__ << ":\n" \
                  << message << "\n"                                                             \
                  << "\033[0m" << std::endl;                                                     \
        throw exception_t(message);                                                              \
    } while (0)

#define EPSIM_THROW(...) EPSIM_THROW_AS(std::runtime_error, __VA_ARGS__)

#define EPSIM_THROW_IF(condition, ...) \
    if (condition) {                   \
        EPSIM_THROW(__VA_ARGS__);      \
    }

#define EPSIM_THROW_UNLESS(condition, ...) \
    if (!(condition)) {                    \
        EPSIM_THROW(__VA_ARGS__);          \
    }
