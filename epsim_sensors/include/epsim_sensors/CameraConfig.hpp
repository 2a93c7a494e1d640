#pragma once

#include <cmath>
#include <string>
#include <vector>

#include <epsim_core/Types.hpp>
#include <epsim_engine/Engine.hpp>
#include <epsim_engine/Texture.hpp>
#include <yaml-cpp/yaml.h>

namespace epsim {
namespace sensors {

struct CameraConfig {
    /** Unique key of the camera within a configuration set */
    std::string uuid;

    /** Local position, relative to the mount or to the world */
    vector3_t position = vector3_t::Zero();

    /** Local orientation - wxyz quaternion */
    vector4_t orientation = vector4_t(1.0, 0.0, 0.0, 0.0);

    int width = 128;
    int height = 128;

    /** Vertical field of view in radians */
    scalar_t fov = M_PI / 2.0;

    scalar_t near = 0.01;
    scalar_t far = 10.0;

    /** Articulation owning the mount link, empty if the mount is a free actor */
    std::string mountArticulation;

    /** Mount link (if mountArticulation is set) or free actor, empty for a world-fixed camera */
    std::string mountActor;

    /** Requested texture channels */
    engine::ChannelSet channels = {engine::TextureChannel::COLOR, engine::TextureChannel::POSITION};

    engine::Pose getPose() const;

    bool isMounted() const { return !mountActor.empty(); }
};

/** Ordered set of camera configurations, uuids are unique */
using CameraConfigs = std::vector<CameraConfig>;

/** Attribute names accepted in camera configuration blocks and overrides */
const std::vector<std::string> &cameraAttributeNames();

/**
 * @brief Parse a camera configuration block. "uuid" is required, all other attributes are optional.
 */
CameraConfig parseCameraConfig(const YAML::Node &node);

/**
 * @brief Parse a list of camera configuration blocks
 */
CameraConfigs parseCameraConfigs(const YAML::Node &node);

/**
 * @brief Set one attribute of a camera configuration from a YAML value
 *
 * @param config : configuration to update
 * @param name : attribute name, one of cameraAttributeNames()
 * @param value : YAML value
 */
void setCameraAttribute(CameraConfig &config, const std::string &name, const YAML::Node &value);

/**
 * @brief Apply user overrides to a camera configuration set.
 *
 * Keys equal to a camera uuid hold a map of attributes for that camera only. Any other key is a global attribute
 * applied to every camera, except cameras overriding the same attribute themselves. Unknown attribute names are a
 * ConfigurationError, raised before any camera is modified.
 *
 * Example: {near: 0.05, hand_camera: {near: 0.2}} sets near to 0.2 for hand_camera and to 0.05 for all others.
 */
void updateCameraConfigs(CameraConfigs &configs, const YAML::Node &overrides);

/**
 * @brief Merge update into base. Configurations with a uuid already present in base replace it in place, others are
 * appended.
 */
void mergeCameraConfigs(CameraConfigs &base, const CameraConfigs &update);

/** Find a configuration by uuid, nullptr if absent */
const CameraConfig *findCameraConfig(const CameraConfigs &configs, const std::string &uuid);

/**
 * @brief Check uuid uniqueness, positive resolution, clip planes and mounts. Throws ConfigurationError.
 */
void validateCameraConfigs(const CameraConfigs &configs);

}  // namespace sensors
}  // namespace epsim
