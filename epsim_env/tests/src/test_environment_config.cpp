#include <cstdio>
#include <fstream>

#include <epsim_core/Throws.hpp>
#include <epsim_env/EnvironmentConfig.hpp>
#include <gtest/gtest.h>

#define ENVIRONMENT_CONFIG_PATH "/tmp/epsim_test_environment_config_q7x2.yaml"

using namespace epsim;

TEST(EnvironmentConfig, Defaults) {
    const EnvironmentConfig config = parseEnvironmentConfig(YAML::Node());
    EXPECT_EQ(config.obsMode, ObsMode::STATE);
    EXPECT_EQ(config.rewardMode, RewardMode::DENSE);
    EXPECT_TRUE(config.controlMode.empty());
    EXPECT_EQ(config.simFreq, 500);
    EXPECT_EQ(config.controlFreq, 20);
    EXPECT_FALSE(config.enableShadow);
    EXPECT_FALSE(config.enableGtSeg);
    EXPECT_EQ(config.renderer.backend, engine::RendererBackend::RASTER);
    EXPECT_FALSE(config.cameraOverrides.IsDefined() && !config.cameraOverrides.IsNull());
}

TEST(EnvironmentConfig, ParseBlock) {
    const YAML::Node node = YAML::Load(R"(
obs_mode: pointcloud_robot_seg
reward_mode: sparse
control_mode: pd_joint_vel
sim_freq: 240
control_freq: 40
enable_shadow: true
enable_gt_seg: true
renderer:
  type: ray_tracing
  ray_tracing: {spp: 16}
scene:
  solver_iterations: 50
camera_cfgs:
  width: 64
  hand_camera: {fov: 1.2}
)");
    const EnvironmentConfig config = parseEnvironmentConfig(node);
    EXPECT_EQ(config.obsMode, ObsMode::POINTCLOUD_ROBOT_SEG);
    EXPECT_EQ(config.rewardMode, RewardMode::SPARSE);
    EXPECT_EQ(config.controlMode, "pd_joint_vel");
    EXPECT_EQ(config.simFreq, 240);
    EXPECT_EQ(config.controlFreq, 40);
    EXPECT_TRUE(config.enableShadow);
    EXPECT_TRUE(config.enableGtSeg);
    EXPECT_EQ(config.renderer.backend, engine::RendererBackend::RAY_TRACING);
    EXPECT_EQ(config.renderer.rayTracing.spp, 16);
    EXPECT_EQ(config.sceneConfig.solverIterations, 50);
    ASSERT_TRUE(config.cameraOverrides.IsMap());
    EXPECT_EQ(config.cameraOverrides["width"].as<int>(), 64);
    EXPECT_DOUBLE_EQ(config.cameraOverrides["hand_camera"]["fov"].as<double>(), 1.2);
}

TEST(EnvironmentConfig, RejectsUnknownKeys) {
    EXPECT_THROW(parseEnvironmentConfig(YAML::Load("{obs_mode: state, frame_skip: 4}")), ConfigurationError);
    EXPECT_THROW(parseEnvironmentConfig(YAML::Load("{scene: {gravity: -9.81}}")), ConfigurationError);
    EXPECT_THROW(parseEnvironmentConfig(YAML::Load("[state]")), ConfigurationError);
}

TEST(EnvironmentConfig, RejectsBadValues) {
    EXPECT_THROW(parseEnvironmentConfig(YAML::Load("{obs_mode: depth}")), ConfigurationError);
    EXPECT_THROW(parseEnvironmentConfig(YAML::Load("{reward_mode: shaped}")), ConfigurationError);
    EXPECT_THROW(parseEnvironmentConfig(YAML::Load("{sim_freq: fast}")), ConfigurationError);
    EXPECT_THROW(parseEnvironmentConfig(YAML::Load("{camera_cfgs: [base_camera]}")), ConfigurationError);
}

TEST(EnvironmentConfig, ModeNames) {
    for (auto mode : {ObsMode::NONE, ObsMode::STATE, ObsMode::STATE_DICT, ObsMode::RGBD, ObsMode::POINTCLOUD,
                      ObsMode::RGBD_ROBOT_SEG, ObsMode::POINTCLOUD_ROBOT_SEG}) {
        EXPECT_EQ(obsModeFromString(toString(mode)), mode);
    }
    EXPECT_EQ(rewardModeFromString("dense"), RewardMode::DENSE);
    EXPECT_EQ(renderModeFromString("rgb_array"), RenderMode::RGB_ARRAY);
    EXPECT_EQ(renderModeFromString("cameras"), RenderMode::CAMERAS);
    EXPECT_THROW(renderModeFromString("rgb"), ConfigurationError);
}

TEST(EnvironmentConfig, ModeClassification) {
    EXPECT_FALSE(isImageMode(ObsMode::STATE_DICT));
    EXPECT_TRUE(isImageMode(ObsMode::RGBD));
    EXPECT_TRUE(isImageMode(ObsMode::POINTCLOUD_ROBOT_SEG));
    EXPECT_TRUE(isPointcloudMode(ObsMode::POINTCLOUD_ROBOT_SEG));
    EXPECT_FALSE(isPointcloudMode(ObsMode::RGBD_ROBOT_SEG));
    EXPECT_TRUE(isRobotSegMode(ObsMode::RGBD_ROBOT_SEG));
    EXPECT_FALSE(isRobotSegMode(ObsMode::RGBD));
}

class EnvironmentConfigFileTest : public ::testing::Test {
   protected:
    static void SetUpTestSuite() {
        std::ofstream file(ENVIRONMENT_CONFIG_PATH);
        file << "reward_mode: sparse\n"
             << "tasks:\n  push_cube:\n    obs_mode: rgbd\n    control_freq: 25\n";
        file.close();
    }

    static void TearDownTestSuite() { std::remove(ENVIRONMENT_CONFIG_PATH); }
};

TEST_F(EnvironmentConfigFileTest, NestedBlock) {
    const EnvironmentConfig config = loadEnvironmentConfig(ENVIRONMENT_CONFIG_PATH, "tasks/push_cube");
    EXPECT_EQ(config.obsMode, ObsMode::RGBD);
    EXPECT_EQ(config.controlFreq, 25);
    EXPECT_EQ(config.rewardMode, RewardMode::DENSE);
}

TEST_F(EnvironmentConfigFileTest, DocumentRoot) {
    // The root holds the "tasks" key, which is not an environment option
    EXPECT_THROW(loadEnvironmentConfig(ENVIRONMENT_CONFIG_PATH), ConfigurationError);
}

TEST_F(EnvironmentConfigFileTest, MissingFileOrKey) {
    EXPECT_THROW(loadEnvironmentConfig("/tmp/epsim_no_such_environment.yaml"), std::runtime_error);
    EXPECT_THROW(loadEnvironmentConfig(ENVIRONMENT_CONFIG_PATH, "tasks/open_drawer"), std::runtime_error);
}

int main(int argc, char **argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
