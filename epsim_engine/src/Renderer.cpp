#include <epsim_core/config/Config.hpp>
#include <epsim_engine/Renderer.hpp>

namespace epsim {
namespace engine {

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
std::string toString(RendererBackend backend) {
    switch (backend) {
        case RendererBackend::RASTER:
            return "raster";
        case RendererBackend::RAY_TRACING:
            return "ray_tracing";
    }
    EPSIM_THROW("Invalid renderer backend");
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
RendererBackend rendererBackendFromString(const std::string &name) {
    if (name == "raster") {
        return RendererBackend::RASTER;
    }
    if (name == "ray_tracing") {
        return RendererBackend::RAY_TRACING;
    }
    EPSIM_THROW_AS(ConfigurationError, "Unsupported renderer type: {}. Available renderers: raster, ray_tracing", name);
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
ChannelSet supportedChannels(RendererBackend backend) {
    switch (backend) {
        case RendererBackend::RASTER:
            return {TextureChannel::COLOR, TextureChannel::POSITION, TextureChannel::SEGMENTATION};
        case RendererBackend::RAY_TRACING:
            return {TextureChannel::COLOR};
    }
    EPSIM_THROW("Invalid renderer backend");
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
RendererConfig parseRendererConfig(const YAML::Node &node) {
    RendererConfig config;
    if (!node || node.IsNull()) {
        return config;
    }

    // Validate every block first
    checkConfigKeys(node, {"type", "raster", "ray_tracing"}, "renderer");
    checkConfigKeys(node["raster"], {"device", "offscreen_only", "max_num_materials", "max_num_textures"},
                    "renderer/raster");
    checkConfigKeys(node["ray_tracing"], {"device", "spp", "max_bounces", "use_denoiser"}, "renderer/ray_tracing");

    if (node["type"]) {
        config.backend = rendererBackendFromString(node["type"].as<std::string>());
    }

    const YAML::Node raster = node["raster"];
    if (raster) {
        config.raster.device = raster["device"].as<std::string>(config.raster.device);
        config.raster.offscreenOnly = raster["offscreen_only"].as<bool>(config.raster.offscreenOnly);
        config.raster.maxNumMaterials = raster["max_num_materials"].as<int>(config.raster.maxNumMaterials);
        config.raster.maxNumTextures = raster["max_num_textures"].as<int>(config.raster.maxNumTextures);
    }

    const YAML::Node rayTracing = node["ray_tracing"];
    if (rayTracing) {
        config.rayTracing.device = rayTracing["device"].as<std::string>(config.rayTracing.device);
        config.rayTracing.spp = rayTracing["spp"].as<int>(config.rayTracing.spp);
        config.rayTracing.maxBounces = rayTracing["max_bounces"].as<int>(config.rayTracing.maxBounces);
        config.rayTracing.useDenoiser = rayTracing["use_denoiser"].as<bool>(config.rayTracing.useDenoiser);
    }

    if (config.rayTracing.spp <= 0) {
        EPSIM_THROW_AS(ConfigurationError, "renderer/ray_tracing/spp must be positive, got {}", config.rayTracing.spp);
    }
    return config;
}

}  // namespace engine
}  // namespace epsim
