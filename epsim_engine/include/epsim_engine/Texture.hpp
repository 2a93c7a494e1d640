#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <epsim_core/Throws.hpp>

namespace epsim {
namespace engine {

/** Texture channels a camera sensor can capture, every texture is H x W x 4 */
enum class TextureChannel { COLOR, POSITION, SEGMENTATION };

/** Element type of a captured texture */
enum class TextureDtype { FLOAT32, UINT32 };

/** Ordered set of texture channels */
using ChannelSet = std::vector<TextureChannel>;

/**
 * @brief Element type of a channel. Fixed by the channel identity, not configurable.
 */
constexpr TextureDtype channelDtype(TextureChannel channel) {
    switch (channel) {
        case TextureChannel::COLOR:
            return TextureDtype::FLOAT32;
        case TextureChannel::POSITION:
            return TextureDtype::FLOAT32;
        case TextureChannel::SEGMENTATION:
            return TextureDtype::UINT32;
    }
    return TextureDtype::FLOAT32;
}

/** Number of values per pixel of every texture channel */
constexpr int TEXTURE_DEPTH = 4;

std::string toString(TextureChannel channel);
TextureChannel channelFromString(const std::string &name);

bool containsChannel(const ChannelSet &channels, TextureChannel channel);

/**
 * @brief Row-major H x W x C image
 */
template <typename T>
struct Image {
    using value_type = T;

    Image() = default;
    Image(int height, int width, int channels, T fill = T())
        : height(height), width(width), channels(channels), data(static_cast<size_t>(height * width * channels), fill) {}

    inline T &at(int row, int col, int channel) { return data[index(row, col, channel)]; }
    inline const T &at(int row, int col, int channel) const { return data[index(row, col, channel)]; }

    inline size_t index(int row, int col, int channel) const {
        return (static_cast<size_t>(row) * width + col) * channels + channel;
    }

    /** Number of pixels */
    inline int numPixels() const { return height * width; }

    bool operator==(const Image &other) const {
        return height == other.height && width == other.width && channels == other.channels && data == other.data;
    }

    int height = 0;
    int width = 0;
    int channels = 0;
    std::vector<T> data;
};

using FloatImage = Image<float>;
using UintImage = Image<std::uint32_t>;

/**
 * @brief Copy a subset of the channels of an image
 *
 * @param image : source image
 * @param first : first channel to copy
 * @param count : number of channels to copy
 */
template <typename T>
Image<T> sliceChannels(const Image<T> &image, int first, int count) {
    if (first < 0 || count < 0 || first + count > image.channels) {
        EPSIM_THROW_AS(ShapeMismatchError, "Cannot slice channels [{}, {}) of an image with {} channels", first,
                       first + count, image.channels);
    }
    Image<T> out(image.height, image.width, count);
    for (int r = 0; r < image.height; ++r) {
        for (int c = 0; c < image.width; ++c) {
            for (int k = 0; k < count; ++k) {
                out.at(r, c, k) = image.at(r, c, first + k);
            }
        }
    }
    return out;
}

}  // namespace engine
}  // namespace epsim
