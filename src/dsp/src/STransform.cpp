/**
 * @file STransform.cpp
 * @brief Frequency-domain evaluation of the S-transform.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#include "spx/dsp/STransform.hpp"
#include "spx/dsp/Dft.hpp"
#include "spx/dsp/FftPlan.hpp"

#include <spx/core/Log.hpp>

#include <cmath>
#include <numbers>
#include <numeric>
#include <string>

namespace spx::dsp {

namespace {

core::f64 voiceGaussian(core::usize voice, core::usize m) noexcept
{
    const auto f = static_cast<core::f64>(voice);
    const auto x = static_cast<core::f64>(m);
    return std::exp(-2.0 * std::numbers::pi * std::numbers::pi * x * x / (f * f));
}

} // namespace

core::Expected<Spectrogram> sTransform(std::span<const core::f64> samples)
{
    const auto plan = SPX_TRY(FftPlan::create(samples.size()));
    const Spectrum spectrum = SPX_TRY(plan.execute(samples));

    const core::usize n = samples.size();
    const core::usize voices = n / 2 + 1;
    Spectrogram result(static_cast<Eigen::Index>(voices), static_cast<Eigen::Index>(n));

    const core::f64 mean = std::accumulate(samples.begin(), samples.end(), 0.0) / static_cast<core::f64>(n);
    result.row(0).setConstant(Complex(mean, 0.0));

    std::vector<core::f64> weights(n);
    Spectrum shifted(n);

    for (core::usize f = 1; f < voices; ++f) {
        weights[0] = voiceGaussian(f, 0);
        for (core::usize m = 1; m <= n / 2; ++m) {
            const core::f64 w = voiceGaussian(f, m);
            weights[m] = w;
            weights[n - m] = w;
        }

        for (core::usize i = 0; i < n; ++i)
            shifted[i] = spectrum[(i + f) % n] * weights[i];

        const Spectrum voice = SPX_TRY(idft(shifted));
        for (core::usize t = 0; t < n; ++t)
            result(static_cast<Eigen::Index>(f), static_cast<Eigen::Index>(t)) = voice[t];
    }

    if (core::Log::enabled(core::LogLevel::kDebug)) {
        core::Log::debug("DSP", "S-transform computed " + std::to_string(voices) + " voices over " +
            std::to_string(n) + " samples");
    }
    return result;
}

} // namespace spx::dsp
