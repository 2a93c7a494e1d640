#include <cstdlib>

#include <epsim_core/Env.hpp>
#include <epsim_core/Throws.hpp>

namespace epsim {

void setEnv(const std::string &var, const std::string &value) {
    if (setenv(var.c_str(), value.c_str(), 1) != 0) {
        EPSIM_THROW("Failed to set environment variable {}", var);
    }
}

void unsetEnv(const std::string &var) {
    if (unsetenv(var.c_str()) != 0) {
        EPSIM_THROW("Failed to unset environment variable {}", var);
    }
}

}  // namespace epsim
