#pragma once

#include <algorithm>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

#include <epsim_core/Env.hpp>
#include <epsim_core/Throws.hpp>
#include <epsim_core/Types.hpp>
#include <yaml-cpp/yaml.h>

namespace epsim {

namespace {

constexpr char CONFIG_PATH_DELIM = '/';

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
inline std::vector<std::string> splitConfigPath(const std::string &s, char delim) {
    // Split config path: a/b/c -> {'a', 'b', 'c'}
    std::vector<std::string> result;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, delim)) {
        if (!item.empty()) {
            result.push_back(item);
        }
    }
    return result;
}

}  // namespace

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
template <typename T>
T parseNode(const YAML::Node &node) {
    return node.as<T>();
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
template <>
inline vector_t parseNode(const YAML::Node &node) {
    const size_t len = node.size();
    vector_t output(len);
    for (size_t i = 0; i < len; ++i) {
        output(i) = node[i].as<scalar_t>();
    }
    return output;
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
template <>
inline matrix_t parseNode(const YAML::Node &node) {
    const size_t rows = node.size();
    const size_t cols = rows > 0 ? node[0].size() : 0;
    matrix_t output(rows, cols);
    for (size_t i = 0; i < rows; ++i) {
        for (size_t j = 0; j < cols; ++j) {
            output(i, j) = node[i][j].as<scalar_t>();
        }
    }
    return output;
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
/**
 * @brief Reject any map key of node that is not in allowedKeys. Runs before a node is applied so that a bad key
 * never leaves a half-updated object behind.
 *
 * @param node : YAML map
 * @param allowedKeys : accepted key names
 * @param context : name of the configuration block, used in the error message
 */
inline void checkConfigKeys(const YAML::Node &node, const std::vector<std::string> &allowedKeys,
                            const std::string &context) {
    if (!node || node.IsNull()) {
        return;
    }
    if (!node.IsMap()) {
        EPSIM_THROW_AS(ConfigurationError, "Configuration block '{}' must be a map", context);
    }
    for (const auto &item : node) {
        const auto key = item.first.as<std::string>();
        if (std::find(allowedKeys.begin(), allowedKeys.end(), key) == allowedKeys.end()) {
            EPSIM_THROW_AS(ConfigurationError, "Unknown key '{}' in configuration block '{}'. Expected one of {}", key,
                           context, allowedKeys);
        }
    }
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
inline YAML::Node loadConfigNode(const std::string &path, const std::string &configPath) {
    // Make sure the config file exists
    EPSIM_THROW_UNLESS(std::filesystem::exists(configPath), "Config file does not exist: {}", configPath);

    // Load config
    YAML::Node config = YAML::LoadFile(configPath);

    // Traverse the config file, reassigning a YAML::Node would alias the parent
    std::vector<YAML::Node> components{config};
    for (auto &k : splitConfigPath(path, CONFIG_PATH_DELIM)) {
        const YAML::Node &current = components.back();
        if (!current.IsMap() || !current[k]) {
            EPSIM_THROW("Key '{}' does not exist in config file {}.", path, configPath);
        }
        components.push_back(current[k]);
    }
    return components.back();
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
template <typename T>
T fromConfig(const std::string &path, const std::string &configPath) {
    return parseNode<T>(loadConfigNode(path, configPath));
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
template <typename T>
T fromGlobalConfig(const std::string &path) {
    const std::string configPath = getEnvAs<std::string>("EPSIM_GLOBAL_CONFIG_PATH", true, "");
    EPSIM_THROW_UNLESS(!configPath.empty(), "EPSIM_GLOBAL_CONFIG_PATH is not set");
    return fromConfig<T>(path, configPath);
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
template <typename T>
T fromGlobalConfig(const std::string &path, const T &defaultValue) {
    try {
        return fromGlobalConfig<T>(path);
    } catch (const std::runtime_error &) {
        // Also covers YAML::Exception
        return defaultValue;
    }
}

}  // namespace epsim
