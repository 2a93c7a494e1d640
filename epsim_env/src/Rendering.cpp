#include <algorithm>

#include <epsim_core/Throws.hpp>
#include <epsim_env/Rendering.hpp>

namespace epsim {

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
RgbImage colorToRgb(const engine::FloatImage &color) {
    if (color.channels < 3) {
        EPSIM_THROW_AS(ShapeMismatchError, "Color texture needs at least 3 channels, got {}", color.channels);
    }
    RgbImage rgb(color.height, color.width, 3);
    for (int r = 0; r < color.height; ++r) {
        for (int c = 0; c < color.width; ++c) {
            for (int k = 0; k < 3; ++k) {
                const float value = std::clamp(color.at(r, c, k) * 255.0f, 0.0f, 255.0f);
                rgb.at(r, c, k) = static_cast<std::uint8_t>(value);
            }
        }
    }
    return rgb;
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
RgbImage positionToDepthRgb(const engine::FloatImage &position) {
    if (position.channels < 3) {
        EPSIM_THROW_AS(ShapeMismatchError, "Position texture needs at least 3 channels, got {}", position.channels);
    }
    float maxDepth = 0.0f;
    for (int r = 0; r < position.height; ++r) {
        for (int c = 0; c < position.width; ++c) {
            maxDepth = std::max(maxDepth, -position.at(r, c, 2));
        }
    }

    RgbImage depth(position.height, position.width, 3);
    if (maxDepth <= 0.0f) {
        return depth;
    }
    for (int r = 0; r < position.height; ++r) {
        for (int c = 0; c < position.width; ++c) {
            const float value = std::clamp(-position.at(r, c, 2) / maxDepth * 255.0f, 0.0f, 255.0f);
            for (int k = 0; k < 3; ++k) {
                depth.at(r, c, k) = static_cast<std::uint8_t>(value);
            }
        }
    }
    return depth;
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
std::vector<RgbImage> texturesToImages(const sensors::CameraTextures &textures) {
    std::vector<RgbImage> images;
    if (textures.color) {
        images.push_back(colorToRgb(*textures.color));
    }
    if (textures.position) {
        images.push_back(positionToDepthRgb(*textures.position));
    }
    return images;
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
RgbImage tileImages(const std::vector<RgbImage> &images) {
    int height = 0;
    int width = 0;
    for (const auto &image : images) {
        if (image.channels != 3) {
            EPSIM_THROW_AS(ShapeMismatchError, "Only RGB images can be tiled, got {} channels", image.channels);
        }
        height = std::max(height, image.height);
        width += image.width;
    }

    RgbImage tiled(height, width, 3);
    int offset = 0;
    for (const auto &image : images) {
        for (int r = 0; r < image.height; ++r) {
            for (int c = 0; c < image.width; ++c) {
                for (int k = 0; k < 3; ++k) {
                    tiled.at(r, offset + c, k) = image.at(r, c, k);
                }
            }
        }
        offset += image.width;
    }
    return tiled;
}

}  // namespace epsim
