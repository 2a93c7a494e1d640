#pragma once

#include <optional>
#include <string>
#include <vector>

#include <epsim_engine/Engine.hpp>
#include <epsim_engine/Texture.hpp>
#include <epsim_sensors/CameraConfig.hpp>

namespace epsim {
namespace sensors {

/** Raw textures captured by one camera, a texture is present iff its channel is in the effective channel set */
struct CameraTextures {
    std::optional<engine::FloatImage> color;
    std::optional<engine::FloatImage> position;
    std::optional<engine::UintImage> segmentation;
};

struct CameraParams {
    matrix3_t intrinsic;
    matrix4_t extrinsic;
};

/** Declared shape and type of one texture channel */
struct TextureSpace {
    engine::TextureChannel channel;
    int height;
    int width;
    int depth;
    engine::TextureDtype dtype;
};

/**
 * @brief Runtime binding of a camera configuration to an engine sensor
 */
class Camera {
   public:
    /**
     * @brief Create the engine sensor described by config
     *
     * @param config : camera configuration
     * @param scene : scene to create the sensor in, must outlive the camera
     * @param backend : renderer backend, narrows the requested channels
     * @param forcedChannels : channels captured regardless of the configuration, still subject to the backend
     */
    Camera(const CameraConfig &config, engine::Scene &scene, engine::RendererBackend backend,
           const engine::ChannelSet &forcedChannels = {});

    /**
     * @brief Resolve the mount of a camera
     *
     * @param scene : scene to search
     * @param articulationName : articulation owning the link, empty for a free actor
     * @param actorName : link or free actor name, empty for a world-fixed camera
     * @return engine::Actor* : mount, nullptr for a world-fixed camera
     */
    static engine::Actor *getMountActor(engine::Scene &scene, const std::string &articulationName,
                                        const std::string &actorName);

    void takePicture() { sensor_->takePicture(); }

    /**
     * @brief Read the captured textures
     *
     * @param takePicture : capture first
     */
    CameraTextures getImages(bool takePicture = false);

    CameraParams getParams() const;

    matrix4_t getModelMatrix() const { return sensor_->getModelMatrix(); }

    const std::string &getUuid() const { return config_.uuid; }
    const CameraConfig &getConfig() const { return config_; }

    /** Channels this camera captures */
    const engine::ChannelSet &getChannels() const { return channels_; }
    bool hasChannel(engine::TextureChannel channel) const { return engine::containsChannel(channels_, channel); }

    engine::Actor *getMount() const { return mount_; }
    engine::RendererBackend getBackend() const { return backend_; }

    std::vector<TextureSpace> getObservationSpace() const;

   private:
    CameraConfig config_;
    engine::RendererBackend backend_;
    engine::ChannelSet channels_;

    /** Non-owning, both live in the scene */
    engine::Actor *mount_ = nullptr;
    engine::CameraSensor *sensor_ = nullptr;
};

}  // namespace sensors
}  // namespace epsim
