#include <epsim_core/Throws.hpp>
#include <epsim_sensors/SensorRig.hpp>

namespace epsim {
namespace sensors {

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
SensorRig::SensorRig() {
    logger_ = epsim::getLogger("sensor_rig");
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
void SensorRig::build(const CameraConfigs &configs, engine::Scene &scene, engine::RendererBackend backend,
                      const engine::ChannelSet &forcedChannels) {
    cameras_.clear();
    validateCameraConfigs(configs);

    std::vector<std::unique_ptr<Camera>> cameras;
    for (const auto &config : configs) {
        auto camera = std::make_unique<Camera>(config, scene, backend, forcedChannels);
        if (camera->getChannels().size() < config.channels.size()) {
            EPSIM_LOG_DEBUG(logger_, "Camera {}: {} of {} requested channels supported by the {} renderer",
                            config.uuid, camera->getChannels().size(), config.channels.size(),
                            engine::toString(backend));
        }
        cameras.push_back(std::move(camera));
    }
    cameras_ = std::move(cameras);

    EPSIM_LOG_INFO(logger_, "Built {} cameras", cameras_.size());
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
void SensorRig::captureAll() {
    for (auto &camera : cameras_) {
        camera->takePicture();
    }
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
Camera *SensorRig::findCamera(const std::string &uuid) const {
    for (const auto &camera : cameras_) {
        if (camera->getUuid() == uuid) {
            return camera.get();
        }
    }
    return nullptr;
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
Camera &SensorRig::getCamera(const std::string &uuid) const {
    auto *camera = findCamera(uuid);
    if (camera == nullptr) {
        EPSIM_THROW_AS(LookupError, "Camera ({}) is not found", uuid);
    }
    return *camera;
}

}  // namespace sensors
}  // namespace epsim
