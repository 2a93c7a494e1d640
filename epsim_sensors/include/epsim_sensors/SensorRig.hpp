#pragma once

#include <memory>
#include <string>
#include <vector>

#include <epsim_core/Logging.hpp>
#include <epsim_engine/Engine.hpp>
#include <epsim_sensors/Camera.hpp>
#include <epsim_sensors/CameraConfig.hpp>

namespace epsim {
namespace sensors {

/**
 * @brief Set of cameras bound to one scene. Rebuilt on every reconfigure, survives resets.
 */
class SensorRig {
   public:
    SensorRig();

    /**
     * @brief Create one camera per configuration, in configuration order. On failure the rig is left empty.
     *
     * @param configs : camera configurations
     * @param scene : scene to create the sensors in, must outlive the rig or be followed by clear()
     * @param backend : renderer backend
     * @param forcedChannels : channels added to every camera's request, e.g. segmentation for robot masks
     */
    void build(const CameraConfigs &configs, engine::Scene &scene, engine::RendererBackend backend,
               const engine::ChannelSet &forcedChannels = {});

    /** Drop all cameras, their sensors die with the scene */
    void clear() { cameras_.clear(); }

    /** Trigger a picture on every camera. Returns once every camera was triggered. */
    void captureAll();

    const std::vector<std::unique_ptr<Camera>> &getCameras() const { return cameras_; }

    /** Camera by uuid, nullptr if absent */
    Camera *findCamera(const std::string &uuid) const;

    /** Camera by uuid, throws LookupError if absent */
    Camera &getCamera(const std::string &uuid) const;

    size_t size() const { return cameras_.size(); }
    bool empty() const { return cameras_.empty(); }

   private:
    std::vector<std::unique_ptr<Camera>> cameras_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace sensors
}  // namespace epsim
