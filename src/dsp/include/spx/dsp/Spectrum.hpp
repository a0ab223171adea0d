/**
 * @file Spectrum.hpp
 * @brief Value types and small helpers shared by the spectral transforms.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#pragma once

#ifndef SPX_DSP_SPECTRUM_HPP
    #define SPX_DSP_SPECTRUM_HPP

    #include <spx/core/Types.hpp>

    #include <Eigen/Dense>

    #include <bit>
    #include <span>
    #include <vector>

namespace spx::dsp {

using core::Complex;

/**
 * @brief N complex values; index k maps to frequency k * fs / N.
 */
using Spectrum = std::vector<Complex>;

/**
 * @brief Time-frequency matrix: one column per frame, one row per bin.
 */
using Spectrogram = Eigen::MatrixXcd;

/**
 * @brief Returns true if @p n is a non-zero power of two.
 */
[[nodiscard]] constexpr bool isPowerOfTwo(core::usize n) noexcept
{
    return std::has_single_bit(n);
}

/**
 * @brief Base-2 logarithm of a power of two.
 */
[[nodiscard]] constexpr core::u32 log2Exact(core::usize n) noexcept
{
    return static_cast<core::u32>(std::countr_zero(n));
}

/**
 * @brief Lifts real samples to complex values with a zero imaginary part.
 */
[[nodiscard]] inline Spectrum toComplex(std::span<const core::f64> samples)
{
    return Spectrum(samples.begin(), samples.end());
}

} // namespace spx::dsp

#endif // SPX_DSP_SPECTRUM_HPP
