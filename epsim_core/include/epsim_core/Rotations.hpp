#pragma once

#include <epsim_core/Types.hpp>

namespace epsim {

/**
 * @brief Convert a wxyz coefficient vector to a quaternion
 *
 * @param wxyz : quaternion coefficients, scalar first
 * @return quaternion_t : quaternion
 */
inline quaternion_t wxyz2quat(const vector4_t &wxyz) {
    return quaternion_t(wxyz(0), wxyz(1), wxyz(2), wxyz(3));
}

/**
 * @brief Convert a quaternion to a wxyz coefficient vector
 *
 * @param q : quaternion
 * @return vector4_t : quaternion coefficients, scalar first
 */
inline vector4_t quat2wxyz(const quaternion_t &q) {
    return vector4_t(q.w(), q.x(), q.y(), q.z());
}

/**
 * @brief Convert quaternion to a 3x3 rotation matrix
 *
 * @param q : quaternion
 * @return matrix3_t : rotation matrix
 */
inline matrix3_t quat2mat(const quaternion_t &q) {
    return q.normalized().toRotationMatrix();
}

/**
 * @brief Homogeneous transform from a position and an orientation
 *
 * @param position : translation
 * @param orientation : rotation
 * @return matrix4_t : 4x4 transformation matrix
 */
inline matrix4_t pose2mat(const vector3_t &position, const quaternion_t &orientation) {
    matrix4_t T = matrix4_t::Identity();
    T.topLeftCorner<3, 3>() = quat2mat(orientation);
    T.topRightCorner<3, 1>() = position;
    return T;
}

}  // namespace epsim
