#include <algorithm>
#include <set>

#include <epsim_core/Rotations.hpp>
#include <epsim_core/Throws.hpp>
#include <epsim_core/config/Config.hpp>
#include <epsim_sensors/CameraConfig.hpp>

namespace epsim {
namespace sensors {

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
engine::Pose CameraConfig::getPose() const {
    engine::Pose pose;
    pose.position = position;
    pose.orientation = wxyz2quat(orientation).normalized();
    return pose;
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
const std::vector<std::string> &cameraAttributeNames() {
    static const std::vector<std::string> names = {"position", "orientation",        "width",       "height",
                                                   "fov",      "near",               "far",         "mount_actor",
                                                   "channels", "mount_articulation"};
    return names;
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
static vector_t parseFixedVector(const YAML::Node &value, long size, const std::string &name) {
    vector_t out = parseNode<vector_t>(value);
    if (out.size() != size) {
        EPSIM_THROW_AS(ConfigurationError, "Camera attribute '{}' needs {} values, got {}", name, size, out.size());
    }
    return out;
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
void setCameraAttribute(CameraConfig &config, const std::string &name, const YAML::Node &value) {
    try {
        if (name == "position") {
            config.position = parseFixedVector(value, 3, name);
        } else if (name == "orientation") {
            config.orientation = parseFixedVector(value, 4, name);
        } else if (name == "width") {
            config.width = value.as<int>();
        } else if (name == "height") {
            config.height = value.as<int>();
        } else if (name == "fov") {
            config.fov = value.as<scalar_t>();
        } else if (name == "near") {
            config.near = value.as<scalar_t>();
        } else if (name == "far") {
            config.far = value.as<scalar_t>();
        } else if (name == "mount_articulation") {
            config.mountArticulation = value.IsNull() ? "" : value.as<std::string>();
        } else if (name == "mount_actor") {
            config.mountActor = value.IsNull() ? "" : value.as<std::string>();
        } else if (name == "channels") {
            engine::ChannelSet channels;
            for (const auto &channelName : value.as<std::vector<std::string>>()) {
                auto channel = engine::channelFromString(channelName);
                if (!engine::containsChannel(channels, channel)) {
                    channels.push_back(channel);
                }
            }
            config.channels = channels;
        } else {
            EPSIM_THROW_AS(ConfigurationError, "'{}' is not a valid attribute of CameraConfig. Expected one of {}", name,
                           cameraAttributeNames());
        }
    } catch (const YAML::Exception &e) {
        EPSIM_THROW_AS(ConfigurationError, "Invalid value for camera attribute '{}': {}", name, e.what());
    }
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
CameraConfig parseCameraConfig(const YAML::Node &node) {
    std::vector<std::string> allowed = cameraAttributeNames();
    allowed.push_back("uuid");
    checkConfigKeys(node, allowed, "camera");

    if (!node["uuid"]) {
        EPSIM_THROW_AS(ConfigurationError, "Camera configuration is missing 'uuid'");
    }

    CameraConfig config;
    config.uuid = node["uuid"].as<std::string>();
    for (const auto &item : node) {
        const auto key = item.first.as<std::string>();
        if (key != "uuid") {
            setCameraAttribute(config, key, item.second);
        }
    }
    return config;
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
CameraConfigs parseCameraConfigs(const YAML::Node &node) {
    CameraConfigs configs;
    if (!node || node.IsNull()) {
        return configs;
    }
    if (!node.IsSequence()) {
        EPSIM_THROW_AS(ConfigurationError, "Camera configurations must be a list");
    }
    for (const auto &item : node) {
        configs.push_back(parseCameraConfig(item));
    }
    validateCameraConfigs(configs);
    return configs;
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
void updateCameraConfigs(CameraConfigs &configs, const YAML::Node &overrides) {
    if (!overrides || overrides.IsNull()) {
        return;
    }
    if (!overrides.IsMap()) {
        EPSIM_THROW_AS(ConfigurationError, "Camera overrides must be a map");
    }

    const auto &attributes = cameraAttributeNames();

    // Validate all names before touching any camera
    for (const auto &item : overrides) {
        const auto key = item.first.as<std::string>();
        if (findCameraConfig(configs, key) != nullptr) {
            checkConfigKeys(item.second, attributes, key);
        } else if (std::find(attributes.begin(), attributes.end(), key) == attributes.end()) {
            EPSIM_THROW_AS(ConfigurationError, "'{}' is neither a camera uuid nor a valid attribute of CameraConfig", key);
        }
    }

    // Work on a copy so that a bad value leaves the input untouched
    CameraConfigs updated = configs;

    // Global attributes first, skipping cameras that override the attribute themselves
    for (const auto &item : overrides) {
        const auto key = item.first.as<std::string>();
        if (findCameraConfig(updated, key) != nullptr) {
            continue;
        }
        for (auto &config : updated) {
            const YAML::Node own = overrides[config.uuid];
            if (own && own.IsMap() && own[key]) {
                continue;
            }
            setCameraAttribute(config, key, item.second);
        }
    }

    // Then camera-specific attributes
    for (auto &config : updated) {
        const YAML::Node own = overrides[config.uuid];
        if (!own || own.IsNull()) {
            continue;
        }
        for (const auto &attribute : own) {
            setCameraAttribute(config, attribute.first.as<std::string>(), attribute.second);
        }
    }

    validateCameraConfigs(updated);
    configs = std::move(updated);
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
void mergeCameraConfigs(CameraConfigs &base, const CameraConfigs &update) {
    for (const auto &config : update) {
        auto it = std::find_if(base.begin(), base.end(),
                               [&config](const CameraConfig &other) { return other.uuid == config.uuid; });
        if (it != base.end()) {
            *it = config;
        } else {
            base.push_back(config);
        }
    }
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
const CameraConfig *findCameraConfig(const CameraConfigs &configs, const std::string &uuid) {
    for (const auto &config : configs) {
        if (config.uuid == uuid) {
            return &config;
        }
    }
    return nullptr;
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
void validateCameraConfigs(const CameraConfigs &configs) {
    std::set<std::string> uuids;
    for (const auto &config : configs) {
        if (config.uuid.empty()) {
            EPSIM_THROW_AS(ConfigurationError, "Camera uuid must not be empty");
        }
        if (!uuids.insert(config.uuid).second) {
            EPSIM_THROW_AS(ConfigurationError, "Duplicate camera uuid: {}", config.uuid);
        }
        if (config.width <= 0 || config.height <= 0) {
            EPSIM_THROW_AS(ConfigurationError, "Camera {} has invalid resolution {}x{}", config.uuid, config.width,
                           config.height);
        }
        if (config.near <= 0.0 || config.far <= config.near) {
            EPSIM_THROW_AS(ConfigurationError, "Camera {} has invalid clip planes near={} far={}", config.uuid,
                           config.near, config.far);
        }
        if (config.fov <= 0.0 || config.fov >= M_PI) {
            EPSIM_THROW_AS(ConfigurationError, "Camera {} has invalid field of view {}", config.uuid, config.fov);
        }
        if (!config.mountArticulation.empty() && config.mountActor.empty()) {
            EPSIM_THROW_AS(ConfigurationError, "Camera {} is mounted on articulation {} but names no link", config.uuid,
                           config.mountArticulation);
        }
        if (config.orientation.norm() < 1e-9) {
            EPSIM_THROW_AS(ConfigurationError, "Camera {} has a zero orientation quaternion", config.uuid);
        }
    }
}

}  // namespace sensors
}  // namespace epsim
