#include <epsim_core/Throws.hpp>
#include <epsim_core/config/Config.hpp>
#include <epsim_env/EnvironmentConfig.hpp>

namespace epsim {

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
std::string toString(ObsMode mode) {
    switch (mode) {
        case ObsMode::NONE:
            return "none";
        case ObsMode::STATE:
            return "state";
        case ObsMode::STATE_DICT:
            return "state_dict";
        case ObsMode::RGBD:
            return "rgbd";
        case ObsMode::POINTCLOUD:
            return "pointcloud";
        case ObsMode::RGBD_ROBOT_SEG:
            return "rgbd_robot_seg";
        case ObsMode::POINTCLOUD_ROBOT_SEG:
            return "pointcloud_robot_seg";
    }
    return "unknown";
}

std::string toString(RewardMode mode) {
    switch (mode) {
        case RewardMode::DENSE:
            return "dense";
        case RewardMode::SPARSE:
            return "sparse";
    }
    return "unknown";
}

std::string toString(RenderMode mode) {
    switch (mode) {
        case RenderMode::HUMAN:
            return "human";
        case RenderMode::RGB_ARRAY:
            return "rgb_array";
        case RenderMode::CAMERAS:
            return "cameras";
    }
    return "unknown";
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
ObsMode obsModeFromString(const std::string &name) {
    for (auto mode : {ObsMode::STATE, ObsMode::STATE_DICT, ObsMode::NONE, ObsMode::RGBD, ObsMode::POINTCLOUD,
                      ObsMode::RGBD_ROBOT_SEG, ObsMode::POINTCLOUD_ROBOT_SEG}) {
        if (toString(mode) == name) {
            return mode;
        }
    }
    EPSIM_THROW_AS(ConfigurationError, "Unsupported obs mode: {}", name);
}

RewardMode rewardModeFromString(const std::string &name) {
    for (auto mode : {RewardMode::DENSE, RewardMode::SPARSE}) {
        if (toString(mode) == name) {
            return mode;
        }
    }
    EPSIM_THROW_AS(ConfigurationError, "Unsupported reward mode: {}", name);
}

RenderMode renderModeFromString(const std::string &name) {
    for (auto mode : {RenderMode::HUMAN, RenderMode::RGB_ARRAY, RenderMode::CAMERAS}) {
        if (toString(mode) == name) {
            return mode;
        }
    }
    EPSIM_THROW_AS(ConfigurationError, "Unsupported render mode: {}", name);
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
bool isImageMode(ObsMode mode) {
    switch (mode) {
        case ObsMode::NONE:
        case ObsMode::STATE:
        case ObsMode::STATE_DICT:
            return false;
        case ObsMode::RGBD:
        case ObsMode::POINTCLOUD:
        case ObsMode::RGBD_ROBOT_SEG:
        case ObsMode::POINTCLOUD_ROBOT_SEG:
            return true;
    }
    return false;
}

bool isPointcloudMode(ObsMode mode) {
    return mode == ObsMode::POINTCLOUD || mode == ObsMode::POINTCLOUD_ROBOT_SEG;
}

bool isRobotSegMode(ObsMode mode) {
    return mode == ObsMode::RGBD_ROBOT_SEG || mode == ObsMode::POINTCLOUD_ROBOT_SEG;
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
EnvironmentConfig parseEnvironmentConfig(const YAML::Node &node) {
    checkConfigKeys(node,
                    {"obs_mode", "reward_mode", "control_mode", "sim_freq", "control_freq", "enable_shadow",
                     "enable_gt_seg", "renderer", "scene", "camera_cfgs"},
                    "environment");

    EnvironmentConfig config;
    if (!node || node.IsNull()) {
        return config;
    }

    try {
        if (node["obs_mode"]) {
            config.obsMode = obsModeFromString(node["obs_mode"].as<std::string>());
        }
        if (node["reward_mode"]) {
            config.rewardMode = rewardModeFromString(node["reward_mode"].as<std::string>());
        }
        // Keys that are present must convert
        if (node["control_mode"]) {
            config.controlMode = node["control_mode"].as<std::string>();
        }
        if (node["sim_freq"]) {
            config.simFreq = node["sim_freq"].as<int>();
        }
        if (node["control_freq"]) {
            config.controlFreq = node["control_freq"].as<int>();
        }
        if (node["enable_shadow"]) {
            config.enableShadow = node["enable_shadow"].as<bool>();
        }
        if (node["enable_gt_seg"]) {
            config.enableGtSeg = node["enable_gt_seg"].as<bool>();
        }
        config.renderer = engine::parseRendererConfig(node["renderer"]);
        config.sceneConfig = engine::parseSceneConfig(node["scene"]);
    } catch (const YAML::Exception &e) {
        EPSIM_THROW_AS(ConfigurationError, "Invalid environment configuration: {}", e.what());
    }

    if (node["camera_cfgs"] && !node["camera_cfgs"].IsNull()) {
        if (!node["camera_cfgs"].IsMap()) {
            EPSIM_THROW_AS(ConfigurationError, "camera_cfgs must be a map of camera overrides");
        }
        config.cameraOverrides = YAML::Clone(node["camera_cfgs"]);
    }
    return config;
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
EnvironmentConfig loadEnvironmentConfig(const std::string &configPath, const std::string &key) {
    return parseEnvironmentConfig(loadConfigNode(key, configPath));
}

}  // namespace epsim
