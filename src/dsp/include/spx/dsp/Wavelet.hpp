/**
 * @file Wavelet.hpp
 * @brief Mother wavelets and the continuous wavelet transform.
 *
 * The transform is computed by direct summation in the time domain:
 *
 * @f$ W(a, b) = \frac{1}{\sqrt{a}} \sum_t x[t] \, \overline{\psi\left(\frac{t - b}{a}\right)} @f$
 *
 * for every scale a and every shift b in [0, N).  Cost is O(S N^2).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#pragma once

#ifndef SPX_DSP_WAVELET_HPP
    #define SPX_DSP_WAVELET_HPP

    #include "Spectrum.hpp"

    #include <spx/core/Constants.hpp>
    #include <spx/core/Expected.hpp>

    #include <Eigen/Dense>

    #include <span>
    #include <string_view>

namespace spx::dsp {

/**
 * @brief Scales x samples matrix of wavelet coefficients.
 */
using Scalogram = Eigen::MatrixXcd;

/**
 * @brief A mother wavelet psi(t) sampled at arbitrary real t.
 */
class IWavelet {
public:
    virtual ~IWavelet() = default;

    [[nodiscard]] virtual Complex evaluate(core::f64 t) const noexcept = 0;
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

/**
 * @brief psi(t) = e^{i omega0 t} e^{-t^2 / 2}.
 */
class MorletWavelet final : public IWavelet {
public:
    explicit MorletWavelet(core::f64 omega0 = core::kDefaultMorletOmega) noexcept : _omega0(omega0) {}

    [[nodiscard]] Complex evaluate(core::f64 t) const noexcept override;
    [[nodiscard]] std::string_view name() const noexcept override { return "Morlet"; }

    [[nodiscard]] core::f64 omega0() const noexcept { return _omega0; }

private:
    core::f64 _omega0;
};

/**
 * @brief Real Ricker wavelet psi(t) = (1 - (t/w)^2) e^{-(t/w)^2 / 2}.
 */
class MexicanHatWavelet final : public IWavelet {
public:
    explicit MexicanHatWavelet(core::f64 width = core::kDefaultMexicanHatWidth) noexcept : _width(width) {}

    [[nodiscard]] Complex evaluate(core::f64 t) const noexcept override;
    [[nodiscard]] std::string_view name() const noexcept override { return "MexicanHat"; }

    [[nodiscard]] core::f64 width() const noexcept { return _width; }

private:
    core::f64 _width;
};

/**
 * @brief Continuous wavelet transform of a real signal.
 * @param signal  Samples, at least one.
 * @param scales  Strictly positive scales, at least one.
 * @param wavelet Mother wavelet.
 * @return scales.size() x signal.size() coefficients, kLengthError for an
 *         empty signal, kConfigError for an empty or non-positive scale.
 */
[[nodiscard]] core::Expected<Scalogram> cwt(
    std::span<const core::f64> signal,
    std::span<const core::f64> scales,
    const IWavelet &wavelet);

} // namespace spx::dsp

#endif // SPX_DSP_WAVELET_HPP
