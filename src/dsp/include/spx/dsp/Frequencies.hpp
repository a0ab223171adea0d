/**
 * @file Frequencies.hpp
 * @brief Frequency axis of a spectrum.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#pragma once

#ifndef SPX_DSP_FREQUENCIES_HPP
    #define SPX_DSP_FREQUENCIES_HPP

    #include <spx/core/Expected.hpp>
    #include <spx/core/Types.hpp>

    #include <vector>

namespace spx::dsp {

/**
 * @brief Centre frequency in Hz of every bin of an @p n point spectrum.
 *
 * Bins 0 .. (n - 1) / 2 are the non-negative frequencies k * fs / n; the
 * remaining bins hold the negative frequencies (k - n) * fs / n.
 *
 * @return n frequencies, kLengthError for n == 0, kConfigError for
 *         sampleRate <= 0.
 */
[[nodiscard]] core::Expected<std::vector<core::f64>> fftFrequencies(core::usize n, core::f64 sampleRate);

/**
 * @brief The n / 2 + 1 non-negative bin frequencies of a real signal's spectrum.
 */
[[nodiscard]] core::Expected<std::vector<core::f64>> rfftFrequencies(core::usize n, core::f64 sampleRate);

} // namespace spx::dsp

#endif // SPX_DSP_FREQUENCIES_HPP
