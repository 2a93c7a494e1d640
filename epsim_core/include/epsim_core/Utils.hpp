#pragma once

#include <functional>
#include <vector>

#include <epsim_core/Types.hpp>

namespace epsim {

/**
 * @brief Stack column vectors on top of each other, empty vectors are skipped
 *
 * @param vectors : vectors to stack
 * @return vector_t : stacked vector
 */
vector_t vvstack(const std::vector<std::reference_wrapper<const vector_t>> &vectors);

/**
 * @brief Stack matrices with the same number of columns on top of each other, empty matrices are skipped
 *
 * @param matrices : matrices to stack
 * @return matrix_t : stacked matrix
 */
matrix_t mvstack(const std::vector<std::reference_wrapper<const matrix_t>> &matrices);

}  // namespace epsim
