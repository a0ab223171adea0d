/**
 * @file SymmetricEigenSolver.cpp
 * @brief Eigen-backed implementation of IEigenSolver.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#include "spx/math/SymmetricEigenSolver.hpp"

#include <spx/core/Log.hpp>

#include <string>

namespace spx::math {

core::Expected<EigenDecomposition> SymmetricEigenSolver::eigh(const Eigen::MatrixXd &matrix) const
{
    if (matrix.rows() != matrix.cols() || matrix.rows() == 0) {
        return core::makeError(core::ErrorCode::kConfigError,
            "expected non-empty square matrix, got " + std::to_string(matrix.rows()) + "x" +
            std::to_string(matrix.cols()));
    }

    const core::f64 asymmetry = (matrix - matrix.transpose()).cwiseAbs().maxCoeff();
    if (asymmetry > _symmetryTolerance) {
        return core::makeError(core::ErrorCode::kNotSymmetric,
            "matrix is not symmetric (max |A - A^T| = " + std::to_string(asymmetry) + ")");
    }

    const Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(matrix);
    if (solver.info() != Eigen::Success) {
        core::Log::error("MATH", "SelfAdjointEigenSolver did not converge");
        return core::makeError(core::ErrorCode::kDecompositionFailed, "eigenvalue decomposition failed");
    }

    return EigenDecomposition{solver.eigenvalues(), solver.eigenvectors()};
}

} // namespace spx::math
