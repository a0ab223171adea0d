/**
 * @file SampleMatrix.hpp
 * @brief Channels x samples data model shared by the spectral and
 *        dispersion modules.
 *
 * Rows are channels and columns are time points, stored row-major so that
 * one channel's samples are contiguous.  Functions take a
 * SampleMatrixView and never modify it.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#pragma once

#ifndef SPX_MATH_SAMPLEMATRIX_HPP
    #define SPX_MATH_SAMPLEMATRIX_HPP

    #include <spx/core/Types.hpp>

    #include <Eigen/Dense>

namespace spx::math {

using SampleMatrix = Eigen::Matrix<core::f64, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

/**
 * @brief Read-only view accepted by every consumer of a sample matrix.
 *
 * Binding a column-major matrix is allowed; Eigen then evaluates a
 * row-major temporary for the duration of the call.
 */
using SampleMatrixView = Eigen::Ref<const SampleMatrix>;

} // namespace spx::math

#endif // SPX_MATH_SAMPLEMATRIX_HPP
