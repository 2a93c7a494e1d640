#include <epsim_core/Throws.hpp>
#include <epsim_env/Observation.hpp>
#include <epsim_env/ObservationPipeline.hpp>
#include <gtest/gtest.h>

using namespace epsim;
using engine::FloatImage;
using engine::UintImage;

static vector_t makeVector(std::initializer_list<scalar_t> values) {
    vector_t out(values.size());
    long i = 0;
    for (auto value : values) {
        out(i++) = value;
    }
    return out;
}

TEST(ObservationDictTest, KeepsInsertionOrder) {
    ObservationDict dict;
    dict.set("zeta", makeVector({1.0}));
    dict.set("alpha", makeVector({2.0}));
    dict.child("nested").set("b", makeVector({3.0}));
    dict.set("zeta", makeVector({4.0}));

    const std::vector<std::string> expected = {"zeta", "alpha", "nested"};
    EXPECT_EQ(dict.keys(), expected);
    EXPECT_EQ(dict.size(), 3u);
    EXPECT_TRUE(dict.isDict("nested"));
    EXPECT_FALSE(dict.isDict("zeta"));
    EXPECT_DOUBLE_EQ(std::get<vector_t>(dict.leaf("zeta"))(0), 4.0);
}

TEST(ObservationDictTest, LookupErrors) {
    ObservationDict dict;
    dict.set("leaf", makeVector({1.0}));
    dict.child("nested");
    EXPECT_THROW(dict.leaf("missing"), LookupError);
    EXPECT_THROW(dict.leaf("nested"), LookupError);
    EXPECT_THROW(dict.dict("leaf"), LookupError);
    EXPECT_THROW(dict.child("leaf"), LookupError);
    EXPECT_THROW(dict.pop("missing"), LookupError);
}

TEST(ObservationDictTest, Pop) {
    ObservationDict dict;
    dict.set("a", makeVector({1.0}));
    dict.set("b", makeVector({2.0}));
    ObservationLeaf value = dict.pop("a");
    EXPECT_DOUBLE_EQ(std::get<vector_t>(value)(0), 1.0);
    EXPECT_FALSE(dict.contains("a"));
    EXPECT_EQ(dict.keys(), std::vector<std::string>{"b"});
}

TEST(FlattenTest, VisitsKeysInInsertionOrder) {
    ObservationDict dict;
    ObservationDict &agent = dict.child("agent");
    agent.set("qpos", makeVector({1.0, 2.0}));
    agent.set("qvel", makeVector({3.0, 4.0}));
    ObservationDict &extra = dict.child("extra");
    extra.set("goal", makeVector({5.0}));
    extra.set("empty", vector_t(0));
    extra.set("tcp", makeVector({6.0, 7.0}));

    const vector_t flat = flattenStateDict(dict);
    EXPECT_TRUE(flat.isApprox(makeVector({1.0, 2.0, 3.0, 4.0, 5.0, 6.0, 7.0})));

    // Same record, same order, every time
    EXPECT_TRUE(flattenStateDict(dict).isApprox(flat));
}

TEST(FlattenTest, EmptyRecord) {
    EXPECT_EQ(flattenStateDict(ObservationDict()).size(), 0);
}

TEST(FlattenTest, RejectsNonVectorLeaves) {
    ObservationDict dict;
    dict.set("image", FloatImage(2, 2, 3));
    EXPECT_THROW(flattenStateDict(dict), ShapeMismatchError);

    ObservationDict withMatrix;
    withMatrix.child("camera").set("intrinsic", matrix_t(matrix_t::Identity(3, 3)));
    EXPECT_THROW(flattenStateDict(withMatrix), ShapeMismatchError);
}

TEST(ObservationSpaceTest, BoxesFollowLeaves) {
    ObservationDict dict;
    dict.child("image").child("base_camera").set("rgb", FloatImage(4, 5, 3));
    dict.dict("image").dict("base_camera").set("actor_seg", UintImage(4, 5, 1));
    dict.dict("image").dict("base_camera").set("camera_intrinsic", matrix_t(matrix_t::Identity(3, 3)));
    dict.child("agent").set("qpos", makeVector({0.0, 0.0}));

    const ObservationSpace space = ObservationSpace::fromObservation(dict);
    ASSERT_EQ(space.size(), 4u);
    EXPECT_FALSE(space.isFlat());
    EXPECT_EQ(space.getBoxes()[0].first, "image/base_camera/rgb");

    const Box *rgb = space.find("image/base_camera/rgb");
    ASSERT_NE(rgb, nullptr);
    EXPECT_EQ(rgb->shape, (std::vector<long>{4, 5, 3}));
    EXPECT_EQ(rgb->dtype, ObservationDtype::FLOAT32);

    const Box *seg = space.find("image/base_camera/actor_seg");
    ASSERT_NE(seg, nullptr);
    EXPECT_EQ(seg->dtype, ObservationDtype::UINT32);

    const Box *qpos = space.find("agent/qpos");
    ASSERT_NE(qpos, nullptr);
    EXPECT_EQ(qpos->shape, (std::vector<long>{2}));
    EXPECT_EQ(qpos->dtype, ObservationDtype::FLOAT64);
    EXPECT_EQ(space.find("agent/qvel"), nullptr);

    EXPECT_TRUE(space.contains(dict));

    ObservationDict resized = dict;
    resized.dict("agent").set("qpos", makeVector({0.0, 0.0, 0.0}));
    EXPECT_FALSE(space.contains(resized));

    EXPECT_FALSE(space.contains(makeVector({1.0})));
}

TEST(ObservationSpaceTest, FlatObservation) {
    const ObservationSpace space = ObservationSpace::fromObservation(makeVector({1.0, 2.0, 3.0}));
    EXPECT_TRUE(space.isFlat());
    ASSERT_NE(space.find(""), nullptr);
    EXPECT_EQ(space.find("")->shape, (std::vector<long>{3}));
    EXPECT_TRUE(space.contains(makeVector({0.0, 0.0, 0.0})));
    EXPECT_FALSE(space.contains(makeVector({0.0})));
    EXPECT_FALSE(space.contains(ObservationDict()));
}

TEST(RobotSegmentationTest, KeepsOnlyRobotLinks) {
    // Raw actor ids {0, 1, 2, 5}, robot links {1, 2}
    UintImage actorSeg(2, 4, 1);
    const std::uint32_t ids[2][4] = {{0, 1, 2, 5}, {5, 2, 1, 0}};
    for (int r = 0; r < 2; ++r) {
        for (int c = 0; c < 4; ++c) {
            actorSeg.at(r, c, 0) = ids[r][c];
        }
    }

    const UintImage robotSeg = computeRobotSegmentation(actorSeg, {1, 2});
    EXPECT_EQ(robotSeg.height, actorSeg.height);
    EXPECT_EQ(robotSeg.width, actorSeg.width);
    EXPECT_EQ(robotSeg.channels, actorSeg.channels);
    for (int r = 0; r < 2; ++r) {
        for (int c = 0; c < 4; ++c) {
            const std::uint32_t raw = actorSeg.at(r, c, 0);
            if (raw == 1 || raw == 2) {
                EXPECT_EQ(robotSeg.at(r, c, 0), raw);
            } else {
                EXPECT_EQ(robotSeg.at(r, c, 0), 0u);
            }
        }
    }
}

TEST(RobotSegmentationTest, NoRobotLinks) {
    UintImage actorSeg(1, 3, 1, 7);
    const UintImage robotSeg = computeRobotSegmentation(actorSeg, {});
    for (auto value : robotSeg.data) {
        EXPECT_EQ(value, 0u);
    }
}

int main(int argc, char **argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
