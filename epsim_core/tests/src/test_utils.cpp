#include <cmath>

#include <epsim_core/Rotations.hpp>
#include <epsim_core/Throws.hpp>
#include <epsim_core/Utils.hpp>
#include <gtest/gtest.h>

using namespace epsim;

TEST(VvstackTest, EmptyVectorInput) {
    vector_t result = vvstack({});
    EXPECT_EQ(result.size(), 0);
}

TEST(VvstackTest, MixedEmptyAndNonEmptyVectors) {
    vector_t v1(2);
    v1 << 1.0, 2.0;
    vector_t v2(0);
    vector_t v3(2);
    v3 << 3.0, 4.0;
    vector_t result = vvstack({v1, v2, v3});
    vector_t expected(4);
    expected << 1.0, 2.0, 3.0, 4.0;
    EXPECT_EQ(result.size(), 4);
    EXPECT_TRUE(result.isApprox(expected));
}

TEST(MvstackTest, StacksRows) {
    matrix_t a = matrix_t::Ones(2, 4);
    matrix_t b = matrix_t::Zero(3, 4);
    matrix_t empty(0, 0);
    matrix_t result = mvstack({a, empty, b});
    EXPECT_EQ(result.rows(), 5);
    EXPECT_EQ(result.cols(), 4);
    EXPECT_EQ(result(1, 3), 1.0);
    EXPECT_EQ(result(2, 0), 0.0);
}

TEST(MvstackTest, ColumnMismatchThrows) {
    matrix_t a = matrix_t::Ones(2, 4);
    matrix_t b = matrix_t::Ones(2, 3);
    EXPECT_THROW(mvstack({a, b}), ShapeMismatchError);
}

TEST(RotationsTest, Pose2MatTransformsPoints) {
    quaternion_t q(angleaxis_t(M_PI / 2.0, vector3_t::UnitZ()));
    matrix4_t T = pose2mat(vector3_t(1.0, 0.0, 0.0), q);
    Eigen::Matrix<scalar_t, 4, 1> p(1.0, 0.0, 0.0, 1.0);
    Eigen::Matrix<scalar_t, 4, 1> out = T * p;
    EXPECT_NEAR(out(0), 1.0, 1e-12);
    EXPECT_NEAR(out(1), 1.0, 1e-12);
    EXPECT_NEAR(out(2), 0.0, 1e-12);
    EXPECT_NEAR(out(3), 1.0, 1e-12);
}

TEST(RotationsTest, WxyzRoundTrip) {
    vector4_t wxyz(0.5, 0.5, 0.5, 0.5);
    EXPECT_TRUE(quat2wxyz(wxyz2quat(wxyz)).isApprox(wxyz));
}

int main(int argc, char **argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
