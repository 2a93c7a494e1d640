#pragma once

#include <string>

#include <epsim_engine/Texture.hpp>
#include <yaml-cpp/yaml.h>

namespace epsim {
namespace engine {

/** Renderer backends. RAY_TRACING is capability limited: it only produces color. */
enum class RendererBackend { RASTER, RAY_TRACING };

struct RasterRendererConfig {
    /** Render device, e.g. "cuda:0", empty for the default device */
    std::string device;

    /** Render without a window system */
    bool offscreenOnly = true;

    int maxNumMaterials = 128;
    int maxNumTextures = 512;
};

struct RayTracingRendererConfig {
    std::string device;

    /** Samples per pixel */
    int spp = 4;

    int maxBounces = 8;
    bool useDenoiser = false;
};

struct RendererConfig {
    RendererBackend backend = RendererBackend::RASTER;
    RasterRendererConfig raster;
    RayTracingRendererConfig rayTracing;
};

std::string toString(RendererBackend backend);
RendererBackend rendererBackendFromString(const std::string &name);

/**
 * @brief Channels the backend can capture. Requests for other channels are dropped, not rejected.
 */
ChannelSet supportedChannels(RendererBackend backend);

/**
 * @brief Parse a renderer configuration block:
 *
 *   type: raster | ray_tracing
 *   raster: {device, offscreen_only, max_num_materials, max_num_textures}
 *   ray_tracing: {device, spp, max_bounces, use_denoiser}
 *
 * Unknown keys throw ConfigurationError before any field is assigned.
 */
RendererConfig parseRendererConfig(const YAML::Node &node);

}  // namespace engine
}  // namespace epsim
