#include <algorithm>

#include <epsim_engine/Texture.hpp>

namespace epsim {
namespace engine {

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
std::string toString(TextureChannel channel) {
    switch (channel) {
        case TextureChannel::COLOR:
            return "Color";
        case TextureChannel::POSITION:
            return "Position";
        case TextureChannel::SEGMENTATION:
            return "Segmentation";
    }
    EPSIM_THROW("Invalid texture channel");
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
TextureChannel channelFromString(const std::string &name) {
    for (auto channel : {TextureChannel::COLOR, TextureChannel::POSITION, TextureChannel::SEGMENTATION}) {
        if (toString(channel) == name) {
            return channel;
        }
    }
    EPSIM_THROW_AS(ConfigurationError, "Unsupported texture channel: {}. Available channels: Color, Position, "
                   "Segmentation", name);
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
bool containsChannel(const ChannelSet &channels, TextureChannel channel) {
    return std::find(channels.begin(), channels.end(), channel) != channels.end();
}

}  // namespace engine
}  // namespace epsim
