/**
 * @file STransform.hpp
 * @brief Forward Stockwell transform (S-transform) of a real signal.
 *
 * The transform is evaluated in the frequency domain.  For every voice
 * f in [1, N/2] the spectrum H is shifted by f, weighted by the Gaussian
 *
 * @f$ G_f(m) = e^{-2 \pi^2 m^2 / f^2} @f$
 *
 * (symmetric in m, so bin N - m carries the same weight as bin m) and
 * brought back to the time axis with an inverse DFT.  Voice 0 is the
 * signal mean repeated over every sample.
 *
 * R. G. Stockwell, L. Mansinha and R. P. Lowe, "Localization of the complex
 * spectrum: the S transform", IEEE Trans. Signal Processing 44(4), 1996.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#pragma once

#ifndef SPX_DSP_STRANSFORM_HPP
    #define SPX_DSP_STRANSFORM_HPP

    #include "Spectrum.hpp"

    #include <spx/core/Expected.hpp>

    #include <span>

namespace spx::dsp {

/**
 * @brief S-transform of a real signal.
 * @param samples Power-of-two number of samples.
 * @return (N/2 + 1) x N matrix, voice f in row f and time along the
 *         columns, or kLengthError for any other length.
 */
[[nodiscard]] core::Expected<Spectrogram> sTransform(std::span<const core::f64> samples);

} // namespace spx::dsp

#endif // SPX_DSP_STRANSFORM_HPP
