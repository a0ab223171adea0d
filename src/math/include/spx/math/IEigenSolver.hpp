/**
 * @file IEigenSolver.hpp
 * @brief Abstract eigendecomposition capability for symmetric matrices.
 *
 * The covariance estimator produces a real-symmetric matrix; downstream
 * analyses (spatial filters, Riemannian classifiers) need its spectrum.
 * They depend on this interface rather than on a concrete linear algebra
 * backend, so any conforming solver can be substituted.
 *
 * Contract:
 *  - eigh() must not modify its input.
 *  - Eigenvalues are returned in ascending order.
 *  - Column i of vectors is the unit eigenvector of values(i).
 *
 * @see SymmetricEigenSolver
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#pragma once

#ifndef SPX_MATH_IEIGENSOLVER_HPP
    #define SPX_MATH_IEIGENSOLVER_HPP

    #include <spx/core/Expected.hpp>

    #include <Eigen/Dense>

    #include <string_view>

namespace spx::math {

/**
 * @brief Eigenvalues (ascending) and matching eigenvectors (columns).
 */
struct EigenDecomposition {
    Eigen::VectorXd values;
    Eigen::MatrixXd vectors;
};

class IEigenSolver {
public:
    virtual ~IEigenSolver() = default;

    IEigenSolver(const IEigenSolver &) = delete;
    IEigenSolver &operator=(const IEigenSolver &) = delete;
    IEigenSolver(IEigenSolver &&) = default;
    IEigenSolver &operator=(IEigenSolver &&) = default;

    /**
     * @brief Decomposes a real-symmetric matrix.
     * @param matrix Square symmetric matrix.
     * @return The decomposition, or an Error describing why it was refused.
     */
    [[nodiscard]] virtual core::Expected<EigenDecomposition> eigh(const Eigen::MatrixXd &matrix) const = 0;

    /**
     * @brief Returns a human-readable name for this backend.
     */
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

protected:
    IEigenSolver() = default;
};

} // namespace spx::math

#endif // SPX_MATH_IEIGENSOLVER_HPP
