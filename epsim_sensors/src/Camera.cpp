#include <epsim_core/Throws.hpp>
#include <epsim_engine/Renderer.hpp>
#include <epsim_sensors/Camera.hpp>

namespace epsim {
namespace sensors {

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
template <typename ENTITY_T>
static ENTITY_T *getEntityByName(const std::vector<ENTITY_T *> &entities, const std::string &name) {
    for (auto *entity : entities) {
        if (entity->getName() == name) {
            return entity;
        }
    }
    return nullptr;
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
Camera::Camera(const CameraConfig &config, engine::Scene &scene, engine::RendererBackend backend,
               const engine::ChannelSet &forcedChannels)
    : config_(config), backend_(backend) {
    mount_ = getMountActor(scene, config_.mountArticulation, config_.mountActor);

    if (mount_ == nullptr) {
        sensor_ = scene.addCamera(config_.uuid, config_.width, config_.height, config_.fov, config_.near, config_.far);
        EPSIM_THROW_IF(sensor_ == nullptr, "Engine failed to create camera {}", config_.uuid);
        sensor_->setLocalPose(config_.getPose());
    } else {
        sensor_ = scene.addMountedCamera(config_.uuid, mount_, config_.getPose(), config_.width, config_.height,
                                         config_.fov, config_.near, config_.far);
        EPSIM_THROW_IF(sensor_ == nullptr, "Engine failed to create camera {} mounted on {}", config_.uuid,
                       config_.mountActor);
    }

    // Effective channels: (requested + forced) restricted to what the backend can render
    engine::ChannelSet requested = config_.channels;
    for (auto channel : forcedChannels) {
        if (!engine::containsChannel(requested, channel)) {
            requested.push_back(channel);
        }
    }
    const auto supported = engine::supportedChannels(backend_);
    for (auto channel : requested) {
        if (engine::containsChannel(supported, channel)) {
            channels_.push_back(channel);
        }
    }
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
engine::Actor *Camera::getMountActor(engine::Scene &scene, const std::string &articulationName,
                                     const std::string &actorName) {
    if (actorName.empty()) {
        if (!articulationName.empty()) {
            EPSIM_THROW_AS(ConfigurationError, "Mount articulation {} given without a link name", articulationName);
        }
        return nullptr;
    }

    if (articulationName.empty()) {
        auto *actor = getEntityByName(scene.getAllActors(), actorName);
        if (actor == nullptr) {
            EPSIM_THROW_AS(LookupError, "Mount actor ({}) is not found", actorName);
        }
        return actor;
    }

    auto *articulation = getEntityByName(scene.getAllArticulations(), articulationName);
    if (articulation == nullptr) {
        EPSIM_THROW_AS(LookupError, "Mount articulation ({}) is not found", articulationName);
    }
    auto *link = getEntityByName(articulation->getLinks(), actorName);
    if (link == nullptr) {
        EPSIM_THROW_AS(LookupError, "Mount link ({}) is not found in articulation {}", actorName, articulationName);
    }
    return link;
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
CameraTextures Camera::getImages(bool takePicture) {
    if (takePicture) {
        this->takePicture();
    }

    CameraTextures textures;
    for (auto channel : channels_) {
        switch (engine::channelDtype(channel)) {
            case engine::TextureDtype::FLOAT32: {
                auto image = sensor_->getFloatTexture(channel);
                if (channel == engine::TextureChannel::COLOR) {
                    textures.color = std::move(image);
                } else {
                    textures.position = std::move(image);
                }
                break;
            }
            case engine::TextureDtype::UINT32:
                textures.segmentation = sensor_->getUintTexture(channel);
                break;
        }
    }
    return textures;
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
CameraParams Camera::getParams() const {
    CameraParams params;
    params.intrinsic = sensor_->getIntrinsicMatrix();
    params.extrinsic = sensor_->getExtrinsicMatrix();
    return params;
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
std::vector<TextureSpace> Camera::getObservationSpace() const {
    std::vector<TextureSpace> spaces;
    for (auto channel : channels_) {
        spaces.push_back(
            {channel, config_.height, config_.width, engine::TEXTURE_DEPTH, engine::channelDtype(channel)});
    }
    return spaces;
}

}  // namespace sensors
}  // namespace epsim
