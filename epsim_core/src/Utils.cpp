#include <epsim_core/Throws.hpp>
#include <epsim_core/Utils.hpp>

namespace epsim {

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
vector_t vvstack(const std::vector<std::reference_wrapper<const vector_t>> &vectors) {
    Eigen::Index totalRows = 0;
    for (const auto &vec : vectors) {
        totalRows += vec.get().rows();
    }

    vector_t result(totalRows);
    Eigen::Index currentRow = 0;
    for (const auto &vec : vectors) {
        const auto &v = vec.get();
        if (v.rows() == 0) {
            continue;
        }
        result.segment(currentRow, v.rows()) = v;
        currentRow += v.rows();
    }

    return result;
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
matrix_t mvstack(const std::vector<std::reference_wrapper<const matrix_t>> &matrices) {
    Eigen::Index totalRows = 0;
    Eigen::Index cols = -1;
    for (const auto &mat : matrices) {
        const auto &m = mat.get();
        if (m.rows() == 0) {
            continue;
        }
        if (cols != -1 && m.cols() != cols) {
            EPSIM_THROW_AS(ShapeMismatchError, "Cannot stack matrices with {} and {} columns", cols, m.cols());
        }
        cols = m.cols();
        totalRows += m.rows();
    }

    matrix_t result(totalRows, cols == -1 ? 0 : cols);
    Eigen::Index currentRow = 0;
    for (const auto &mat : matrices) {
        const auto &m = mat.get();
        if (m.rows() == 0) {
            continue;
        }
        result.middleRows(currentRow, m.rows()) = m;
        currentRow += m.rows();
    }

    return result;
}

}  // namespace epsim
