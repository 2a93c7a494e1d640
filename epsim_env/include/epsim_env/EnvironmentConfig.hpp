#pragma once

#include <string>

#include <epsim_engine/Engine.hpp>
#include <epsim_engine/Renderer.hpp>
#include <yaml-cpp/yaml.h>

namespace epsim {

enum class ObsMode { NONE, STATE, STATE_DICT, RGBD, POINTCLOUD, RGBD_ROBOT_SEG, POINTCLOUD_ROBOT_SEG };

enum class RewardMode { DENSE, SPARSE };

enum class RenderMode { HUMAN, RGB_ARRAY, CAMERAS };

std::string toString(ObsMode mode);
std::string toString(RewardMode mode);
std::string toString(RenderMode mode);

/** Parse "none", "state", "state_dict", "rgbd", "pointcloud", "rgbd_robot_seg" or "pointcloud_robot_seg" */
ObsMode obsModeFromString(const std::string &name);

/** Parse "dense" or "sparse" */
RewardMode rewardModeFromString(const std::string &name);

/** Parse "human", "rgb_array" or "cameras" */
RenderMode renderModeFromString(const std::string &name);

/** True for modes capturing camera images */
bool isImageMode(ObsMode mode);

/** True for pointcloud and pointcloud_robot_seg */
bool isPointcloudMode(ObsMode mode);

/** True for rgbd_robot_seg and pointcloud_robot_seg */
bool isRobotSegMode(ObsMode mode);

/**
 * @brief Environment configuration, fixed at construction
 */
struct EnvironmentConfig {
    ObsMode obsMode = ObsMode::STATE;
    RewardMode rewardMode = RewardMode::DENSE;

    /** Initial control mode of the agent, empty for the agent default */
    std::string controlMode;

    /** Physics frequency [Hz] */
    int simFreq = 500;

    /** Control frequency [Hz] */
    int controlFreq = 20;

    /** Camera overrides, see sensors::updateCameraConfigs */
    YAML::Node cameraOverrides;

    bool enableShadow = false;

    /** Add visual and actor segmentation to image observations */
    bool enableGtSeg = false;

    engine::RendererConfig renderer;
    engine::SceneConfig sceneConfig;
};

/**
 * @brief Parse an environment configuration block. Keys: obs_mode, reward_mode, control_mode, sim_freq,
 * control_freq, enable_shadow, enable_gt_seg, renderer, scene, camera_cfgs. Unknown keys throw ConfigurationError.
 */
EnvironmentConfig parseEnvironmentConfig(const YAML::Node &node);

/**
 * @brief Load an environment configuration from a YAML file
 *
 * @param configPath : path to the YAML file
 * @param key : '/'-separated path of the block within the file, empty for the document root
 */
EnvironmentConfig loadEnvironmentConfig(const std::string &configPath, const std::string &key = "");

}  // namespace epsim
