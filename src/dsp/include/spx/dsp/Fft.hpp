/**
 * @file Fft.hpp
 * @brief One-shot radix-2 FFT entry points.
 *
 * The input length must be a power of two; any other length is rejected
 * with kLengthError and nothing is computed.  Callers that need other
 * lengths call dft() explicitly.
 *
 * @see FftPlan, Dft.hpp
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#pragma once

#ifndef SPX_DSP_FFT_HPP
    #define SPX_DSP_FFT_HPP

    #include "Spectrum.hpp"

    #include <spx/core/Expected.hpp>

    #include <span>

namespace spx::dsp {

/**
 * @brief Forward FFT of complex samples.
 * @param samples Power-of-two number of samples (not modified).
 * @return Spectrum of the same length, or kLengthError.
 */
[[nodiscard]] core::Expected<Spectrum> fft(std::span<const Complex> samples);

/**
 * @brief Forward FFT of real samples.
 */
[[nodiscard]] core::Expected<Spectrum> fft(std::span<const core::f64> samples);

} // namespace spx::dsp

#endif // SPX_DSP_FFT_HPP
