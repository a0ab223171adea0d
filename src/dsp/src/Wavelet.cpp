/**
 * @file Wavelet.cpp
 * @brief Implementation of the mother wavelets and the direct-sum CWT.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#include "spx/dsp/Wavelet.hpp"

#include <cmath>
#include <string>

namespace spx::dsp {

Complex MorletWavelet::evaluate(core::f64 t) const noexcept
{
    const core::f64 gaussian = std::exp(-0.5 * t * t);
    return std::polar(gaussian, _omega0 * t);
}

Complex MexicanHatWavelet::evaluate(core::f64 t) const noexcept
{
    const core::f64 u2 = (t / _width) * (t / _width);
    return {(1.0 - u2) * std::exp(-0.5 * u2), 0.0};
}

core::Expected<Scalogram> cwt(
    std::span<const core::f64> signal,
    std::span<const core::f64> scales,
    const IWavelet &wavelet)
{
    if (signal.empty())
        return core::makeError(core::ErrorCode::kLengthError, "CWT requires at least one sample, got 0");

    if (scales.empty())
        return core::makeError(core::ErrorCode::kConfigError, "CWT requires at least one scale");

    for (const core::f64 scale : scales) {
        if (!(scale > 0.0)) {
            return core::makeError(core::ErrorCode::kConfigError,
                "CWT scales must be positive, got " + std::to_string(scale));
        }
    }

    const auto n = static_cast<Eigen::Index>(signal.size());
    Scalogram coefficients(static_cast<Eigen::Index>(scales.size()), n);

    for (core::usize s = 0; s < scales.size(); ++s) {
        const core::f64 scale = scales[s];
        const core::f64 norm = 1.0 / std::sqrt(scale);

        for (Eigen::Index b = 0; b < n; ++b) {
            Complex sum{0.0, 0.0};
            for (Eigen::Index t = 0; t < n; ++t) {
                const core::f64 shifted = static_cast<core::f64>(t - b) / scale;
                sum += signal[static_cast<core::usize>(t)] * std::conj(wavelet.evaluate(shifted));
            }
            coefficients(static_cast<Eigen::Index>(s), b) = norm * sum;
        }
    }

    return coefficients;
}

} // namespace spx::dsp
