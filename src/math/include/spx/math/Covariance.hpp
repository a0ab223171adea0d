/**
 * @file Covariance.hpp
 * @brief Spatial covariance of a channels x samples matrix.
 *
 * @f$ C = \frac{1}{d} X_c X_c^T @f$ where @f$ X_c @f$ is the matrix with
 * each channel's mean removed and d is N (population) or N - 1 (sample).
 * The result is written through a rank update of the lower triangle and
 * mirrored, so C(i, j) == C(j, i) holds exactly.
 *
 * @see IEigenSolver for the decomposition of the result
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#pragma once

#ifndef SPX_MATH_COVARIANCE_HPP
    #define SPX_MATH_COVARIANCE_HPP

    #include "SampleMatrix.hpp"

    #include <spx/core/Expected.hpp>

    #include <Eigen/Dense>

    #include <optional>
    #include <string_view>

namespace spx::math {

/**
 * @brief Divisor applied to the scatter matrix.
 */
enum class CovarianceMode : core::u8 {
    kPopulation, ///< divide by N
    kSample      ///< divide by N - 1
};

[[nodiscard]] constexpr std::string_view covarianceModeName(CovarianceMode mode) noexcept
{
    switch (mode) {
        case CovarianceMode::kPopulation: return "population";
        case CovarianceMode::kSample:     return "sample";
    }
    return "unknown";
}

/**
 * @brief Estimator settings and the orientation checks the caller opts into.
 */
struct CovarianceOptions {
    CovarianceMode mode = CovarianceMode::kSample;

    /// When set, the matrix must have exactly this many rows.
    std::optional<core::usize> channelCount;

    /// When true, a matrix with fewer samples (columns) than channels (rows)
    /// is treated as transposed and rejected.
    bool strictOrientation = false;
};

/**
 * @brief Covariance with default checks.
 * @param data Channels x samples.
 * @param mode Population or sample divisor.
 * @return Channels x channels covariance, or an Error (see the options overload).
 */
[[nodiscard]] core::Expected<Eigen::MatrixXd> covariance(SampleMatrixView data, CovarianceMode mode);

/**
 * @brief Covariance with explicit orientation checks.
 * @return kConfigError for zero channels or an orientation mismatch,
 *         kDegenerateInput when the divisor would be zero (N == 0, or
 *         N <= 1 in sample mode).
 */
[[nodiscard]] core::Expected<Eigen::MatrixXd> covariance(SampleMatrixView data, const CovarianceOptions &options);

/**
 * @brief Per-channel variance with the same divisor policy, computed
 *        without forming the covariance matrix.
 */
[[nodiscard]] core::Expected<Eigen::VectorXd> channelVariance(SampleMatrixView data, CovarianceMode mode);

} // namespace spx::math

#endif // SPX_MATH_COVARIANCE_HPP
