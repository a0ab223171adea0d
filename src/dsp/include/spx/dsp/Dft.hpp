/**
 * @file Dft.hpp
 * @brief Naive O(N^2) discrete Fourier transform and its inverse.
 *
 * Direct summation of X[k] = sum_n x[n] e^{-2 pi i k n / N}.  This is the
 * reference the FFT is checked against and the transform to call for
 * lengths that are not a power of two.  It deliberately shares no code with
 * the FFT engine.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#pragma once

#ifndef SPX_DSP_DFT_HPP
    #define SPX_DSP_DFT_HPP

    #include "Spectrum.hpp"

    #include <spx/core/Expected.hpp>

    #include <span>
    #include <vector>

namespace spx::dsp {

/**
 * @brief Forward DFT of complex samples.
 * @param samples Time-domain input, any length >= 1.
 * @return Spectrum of the same length, or kLengthError when empty.
 */
[[nodiscard]] core::Expected<Spectrum> dft(std::span<const Complex> samples);

/**
 * @brief Forward DFT of real samples.
 */
[[nodiscard]] core::Expected<Spectrum> dft(std::span<const core::f64> samples);

/**
 * @brief Inverse DFT, normalized by 1/N.
 * @param spectrum Frequency-domain input, any length >= 1.
 * @return Time-domain sequence of the same length, or kLengthError when empty.
 */
[[nodiscard]] core::Expected<Spectrum> idft(std::span<const Complex> spectrum);

/**
 * @brief Inverse DFT keeping only the real part of each output sample.
 *
 * Meant for spectra of real signals, whose inverse has a zero imaginary
 * part up to rounding.
 */
[[nodiscard]] core::Expected<std::vector<core::f64>> idftReal(std::span<const Complex> spectrum);

} // namespace spx::dsp

#endif // SPX_DSP_DFT_HPP
