/**
 * @file SymmetricEigenSolver.hpp
 * @brief IEigenSolver backed by Eigen's SelfAdjointEigenSolver.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#pragma once

#ifndef SPX_MATH_SYMMETRICEIGENSOLVER_HPP
    #define SPX_MATH_SYMMETRICEIGENSOLVER_HPP

    #include "IEigenSolver.hpp"

    #include <spx/core/Constants.hpp>

namespace spx::math {

/**
 * @brief Dense symmetric eigensolver.
 *
 * Rejects non-square input with kConfigError and input whose largest
 * |A(i,j) - A(j,i)| exceeds the tolerance with kNotSymmetric.
 *
 * @code
 *   SymmetricEigenSolver solver;
 *   auto cov = covariance(data, CovarianceMode::kSample);
 *   auto eig = solver.eigh(*cov);
 * @endcode
 */
class SymmetricEigenSolver final : public IEigenSolver {
public:
    explicit SymmetricEigenSolver(core::f64 symmetryTolerance = core::kSymmetryTolerance) noexcept
        : _symmetryTolerance(symmetryTolerance) {}

    [[nodiscard]] core::Expected<EigenDecomposition> eigh(const Eigen::MatrixXd &matrix) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "SymmetricEigenSolver"; }

    [[nodiscard]] core::f64 symmetryTolerance() const noexcept { return _symmetryTolerance; }

private:
    core::f64 _symmetryTolerance;
};

} // namespace spx::math

#endif // SPX_MATH_SYMMETRICEIGENSOLVER_HPP
