#include <epsim_core/Throws.hpp>
#include <epsim_engine/FakeEngine.hpp>
#include <epsim_env/StateCodec.hpp>
#include <gtest/gtest.h>

using namespace epsim;
using namespace epsim::engine;

class StateCodecTest : public ::testing::Test {
   protected:
    void SetUp() override {
        scene_ = std::make_unique<fake::FakeScene>(SceneConfig());

        ActorDescription ground;
        ground.name = "ground";
        ground.type = ActorType::STATIC;
        scene_->addActor(ground);

        ActorDescription cube;
        cube.name = "cube";
        cube.pose.position = vector3_t(0.1, 0.2, 0.3);
        cube_ = scene_->addActor(cube);
        cube_->setVelocity(vector3_t(1.0, 0.0, 0.0));

        ArticulationDescription robot;
        robot.name = "robot";
        robot.linkNames = {"base", "link1", "ee"};
        robot.dof = 2;
        robot_ = scene_->addArticulation(robot);

        ArticulationDescription cabinet;
        cabinet.name = "cabinet";
        cabinet.linkNames = {"cabinet_base", "door"};
        cabinet.dof = 1;
        scene_->addArticulation(cabinet);
    }

    std::unique_ptr<fake::FakeScene> scene_;
    Actor *cube_ = nullptr;
    Articulation *robot_ = nullptr;
};

TEST_F(StateCodecTest, SegmentLaw) {
    StateCodec codec;
    codec.capture(SceneSnapshot::capture(*scene_), *scene_);
    // 2 actors, articulations with 2 and 1 dofs
    EXPECT_EQ(codec.getStateSize(), 13 * 2 + (13 + 2 * 2) + (13 + 2 * 1));
    EXPECT_EQ(codec.encode().size(), codec.getStateSize());
}

TEST_F(StateCodecTest, LayoutFollowsSnapshotOrder) {
    vector_t qpos(2);
    qpos << 0.5, -0.5;
    robot_->setQpos(qpos);

    StateCodec codec;
    codec.capture(SceneSnapshot::capture(*scene_), *scene_);
    const vector_t state = codec.encode();

    // Second actor: position, wxyz quaternion, linear velocity, angular velocity
    EXPECT_TRUE(state.segment<3>(13).isApprox(vector3_t(0.1, 0.2, 0.3)));
    EXPECT_DOUBLE_EQ(state(16), 1.0);
    EXPECT_TRUE(state.segment<3>(20).isApprox(vector3_t(1.0, 0.0, 0.0)));

    // First articulation: root segment, then joint positions and joint velocities
    EXPECT_TRUE(state.segment(26 + 13, 2).isApprox(qpos));
    EXPECT_TRUE(state.segment(26 + 15, 2).isZero());
}

TEST_F(StateCodecTest, RoundTrip) {
    StateCodec codec;
    codec.capture(SceneSnapshot::capture(*scene_), *scene_);
    const vector_t original = codec.encode();

    for (int i = 0; i < 10; ++i) {
        scene_->step();
    }
    vector_t qvel(2);
    qvel << 1.0, 2.0;
    robot_->setQvel(qvel);
    EXPECT_FALSE(codec.encode().isApprox(original));

    codec.decode(original);
    EXPECT_TRUE(codec.encode().isApprox(original));
    EXPECT_TRUE(cube_->getPose().position.isApprox(vector3_t(0.1, 0.2, 0.3)));
    EXPECT_TRUE(robot_->getQvel().isZero());
}

TEST_F(StateCodecTest, WrongLengthIsRejected) {
    StateCodec codec;
    codec.capture(SceneSnapshot::capture(*scene_), *scene_);
    const vector_t original = codec.encode();

    vector_t shorter = original.head(original.size() - 1);
    EXPECT_THROW(codec.decode(shorter), ShapeMismatchError);

    vector_t longer = vector_t::Zero(original.size() + 1);
    EXPECT_THROW(codec.decode(longer), ShapeMismatchError);

    // Nothing was applied
    EXPECT_TRUE(codec.encode().isApprox(original));
}

TEST_F(StateCodecTest, ChangedSceneIsRejected) {
    StateCodec codec;
    codec.capture(SceneSnapshot::capture(*scene_), *scene_);
    const vector_t original = codec.encode();

    ActorDescription sphere;
    sphere.name = "sphere";
    scene_->addActor(sphere);
    EXPECT_THROW(codec.encode(), ShapeMismatchError);
    EXPECT_THROW(codec.decode(original), ShapeMismatchError);

    scene_->removeActor("sphere");
    EXPECT_NO_THROW(codec.encode());

    scene_->removeActor("cube");
    EXPECT_THROW(codec.encode(), ShapeMismatchError);
    EXPECT_THROW(codec.decode(original), ShapeMismatchError);

    codec.capture(SceneSnapshot::capture(*scene_), *scene_);
    EXPECT_EQ(codec.encode().size(), original.size() - 13);
}

TEST_F(StateCodecTest, InvalidatedCodecThrows) {
    StateCodec codec;
    EXPECT_FALSE(codec.isCaptured());
    EXPECT_THROW(codec.encode(), ShapeMismatchError);

    codec.capture(SceneSnapshot::capture(*scene_), *scene_);
    EXPECT_TRUE(codec.isCaptured());
    const vector_t state = codec.encode();

    codec.invalidate();
    EXPECT_FALSE(codec.isCaptured());
    EXPECT_EQ(codec.getStateSize(), 0);
    EXPECT_THROW(codec.encode(), ShapeMismatchError);
    EXPECT_THROW(codec.decode(state), ShapeMismatchError);
}

TEST(RigidBodyStateTest, ActorStateSize) {
    fake::FakeActor actor("box", 1, ActorType::DYNAMIC, Pose());
    EXPECT_EQ(getActorState(actor).size(), KINEMATIC_DIM);
    EXPECT_THROW(setActorState(actor, vector_t::Zero(12)), ShapeMismatchError);
}

int main(int argc, char **argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
