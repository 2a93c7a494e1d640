#pragma once

#include <algorithm>
#include <cstdlib>
#include <string>
#include <vector>

#include <epsim_core/Throws.hpp>

namespace epsim {

template <typename T>
T getEnvAs(const std::string &var, bool allowDefault = false, T defaultValue = T());

template <>
inline std::string getEnvAs(const std::string &var, bool allowDefault, std::string defaultValue) {
    const char *value = std::getenv(var.c_str());
    if (value == nullptr) {
        if (allowDefault) {
            return defaultValue;
        }
        EPSIM_THROW("Environment variable {} is not set. Defaults are not allowed.", var);
    }
    return value;
}

template <>
inline bool getEnvAs(const std::string &var, bool allowDefault, bool defaultValue) {
    std::string value = getEnvAs<std::string>(var, allowDefault, defaultValue ? "true" : "false");
    std::transform(value.begin(), value.end(), value.begin(), ::tolower);
    return (value == "true" || value == "1" || value == "yes" || value == "on");
}

template <>
inline int getEnvAs(const std::string &var, bool allowDefault, int defaultValue) {
    std::string value = getEnvAs<std::string>(var, allowDefault, std::to_string(defaultValue));
    return std::stoi(value);
}

template <>
inline double getEnvAs(const std::string &var, bool allowDefault, double defaultValue) {
    std::string value = getEnvAs<std::string>(var, allowDefault, fmt::format("{}", defaultValue));
    return std::stod(value);
}

template <typename T>
T getEnvAsChecked(const std::string &var, const std::vector<T> &allowedValues, bool allowDefault = false,
                  T defaultValue = T()) {
    T value = getEnvAs<T>(var, allowDefault, defaultValue);
    if (std::find(allowedValues.begin(), allowedValues.end(), value) == allowedValues.end()) {
        EPSIM_THROW("Environment variable {} has invalid value: '{}'.\nExpected one of {}", var, value, allowedValues);
    }
    return value;
}

void setEnv(const std::string &var, const std::string &value);
void unsetEnv(const std::string &var);

}  // namespace epsim
