#include <epsim_engine/Engine.hpp>
#include <epsim_engine/Renderer.hpp>
#include <epsim_engine/Texture.hpp>
#include <gtest/gtest.h>

using namespace epsim;
using namespace epsim::engine;

TEST(TextureTest, DtypeIsFixedByChannel) {
    static_assert(channelDtype(TextureChannel::COLOR) == TextureDtype::FLOAT32, "color is float");
    static_assert(channelDtype(TextureChannel::POSITION) == TextureDtype::FLOAT32, "position is float");
    static_assert(channelDtype(TextureChannel::SEGMENTATION) == TextureDtype::UINT32, "segmentation is uint32");
    EXPECT_EQ(channelFromString("Segmentation"), TextureChannel::SEGMENTATION);
    EXPECT_EQ(toString(TextureChannel::POSITION), "Position");
    EXPECT_THROW(channelFromString("Normal"), ConfigurationError);
}

TEST(TextureTest, SliceChannels) {
    UintImage image(2, 3, 4);
    for (int r = 0; r < 2; ++r) {
        for (int c = 0; c < 3; ++c) {
            image.at(r, c, 0) = 10 * r + c;
            image.at(r, c, 1) = 100 + 10 * r + c;
        }
    }
    UintImage actorIds = sliceChannels(image, 1, 1);
    EXPECT_EQ(actorIds.height, 2);
    EXPECT_EQ(actorIds.width, 3);
    EXPECT_EQ(actorIds.channels, 1);
    EXPECT_EQ(actorIds.at(1, 2, 0), 112u);
    EXPECT_THROW(sliceChannels(image, 3, 2), ShapeMismatchError);
}

TEST(RendererConfigTest, Defaults) {
    RendererConfig config = parseRendererConfig(YAML::Node());
    EXPECT_EQ(config.backend, RendererBackend::RASTER);
    EXPECT_TRUE(config.raster.offscreenOnly);
    EXPECT_EQ(config.rayTracing.spp, 4);
}

TEST(RendererConfigTest, RayTracingBlock) {
    RendererConfig config =
        parseRendererConfig(YAML::Load("{type: ray_tracing, ray_tracing: {spp: 64, use_denoiser: true}}"));
    EXPECT_EQ(config.backend, RendererBackend::RAY_TRACING);
    EXPECT_EQ(config.rayTracing.spp, 64);
    EXPECT_TRUE(config.rayTracing.useDenoiser);
    EXPECT_EQ(config.rayTracing.maxBounces, 8);
}

TEST(RendererConfigTest, UnknownKeysAreRejected) {
    EXPECT_THROW(parseRendererConfig(YAML::Load("{type: raster, exposure: 2}")), ConfigurationError);
    EXPECT_THROW(parseRendererConfig(YAML::Load("{raster: {msaa: 4}}")), ConfigurationError);
    EXPECT_THROW(parseRendererConfig(YAML::Load("{type: client}")), ConfigurationError);
}

TEST(RendererConfigTest, NonPositiveSamplesPerPixel) {
    EXPECT_THROW(parseRendererConfig(YAML::Load("{type: ray_tracing, ray_tracing: {spp: 0}}")), ConfigurationError);
    EXPECT_THROW(parseRendererConfig(YAML::Load("{ray_tracing: {spp: -4}}")), ConfigurationError);
}

TEST(RendererConfigTest, SupportedChannels) {
    EXPECT_EQ(supportedChannels(RendererBackend::RASTER).size(), 3u);
    ChannelSet rayTracing = supportedChannels(RendererBackend::RAY_TRACING);
    ASSERT_EQ(rayTracing.size(), 1u);
    EXPECT_EQ(rayTracing[0], TextureChannel::COLOR);
}

TEST(SceneConfigTest, Overrides) {
    SceneConfig config = parseSceneConfig(YAML::Load("{solver_iterations: 50, enable_pcm: true}"));
    EXPECT_EQ(config.solverIterations, 50);
    EXPECT_TRUE(config.enablePcm);
    EXPECT_DOUBLE_EQ(config.contactOffset, 0.02);
    EXPECT_THROW(parseSceneConfig(YAML::Load("{gravity: [0, 0, -9.81]}")), ConfigurationError);
}

int main(int argc, char **argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
