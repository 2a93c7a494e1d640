#pragma once

#include <cstdint>

#include <Eigen/Dense>

namespace epsim {

/** Scalar type */
using scalar_t = double;

/** Vector type */
using vector_t = Eigen::Matrix<scalar_t, Eigen::Dynamic, 1>;

/** Matrix type */
using matrix_t = Eigen::Matrix<scalar_t, Eigen::Dynamic, Eigen::Dynamic>;

/** Vector with three elements */
using vector3_t = Eigen::Matrix<scalar_t, 3, 1>;

/** Vector with four elements */
using vector4_t = Eigen::Matrix<scalar_t, 4, 1>;

/** 3x3 matrix */
using matrix3_t = Eigen::Matrix<scalar_t, 3, 3>;

/** 4x4 matrix, homogeneous transforms */
using matrix4_t = Eigen::Matrix<scalar_t, 4, 4>;

/** Angle axis */
using angleaxis_t = Eigen::AngleAxis<scalar_t>;

/** Quaternion */
using quaternion_t = Eigen::Quaternion<scalar_t>;

/** Seed type, main and episode seeds */
using seed_t = std::uint32_t;

}  // namespace epsim
