#pragma once

#include <cstdint>
#include <vector>

#include <epsim_engine/Texture.hpp>
#include <epsim_sensors/Camera.hpp>

namespace epsim {

/** 8-bit RGB image */
using RgbImage = engine::Image<std::uint8_t>;

/**
 * @brief Convert the first three channels of a color texture to 8 bit, clamp(c * 255, 0, 255)
 */
RgbImage colorToRgb(const engine::FloatImage &color);

/**
 * @brief Gray-scale depth image from a position texture. Depth is -z, scaled by the largest depth in the image.
 */
RgbImage positionToDepthRgb(const engine::FloatImage &position);

/**
 * @brief Viewable images of the captured textures of one camera: color first, then depth
 */
std::vector<RgbImage> texturesToImages(const sensors::CameraTextures &textures);

/**
 * @brief Place images side by side in one row, top aligned. Shorter images are padded with black.
 */
RgbImage tileImages(const std::vector<RgbImage> &images);

}  // namespace epsim
