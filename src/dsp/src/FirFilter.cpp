/**
 * @file FirFilter.cpp
 * @brief Direct-form FIR convolution.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#include "spx/dsp/FirFilter.hpp"

#include <spx/core/Log.hpp>

#include <string>

namespace spx::dsp {

core::Expected<FirFilter> FirFilter::create(std::vector<core::f64> coefficients)
{
    if (coefficients.empty())
        return core::makeError(core::ErrorCode::kConfigError, "FIR filter requires at least one coefficient");

    if (core::Log::enabled(core::LogLevel::kDebug))
        core::Log::debug("DSP", "FirFilter created with " + std::to_string(coefficients.size()) + " taps");
    return FirFilter(std::move(coefficients));
}

std::vector<core::f64> FirFilter::process(std::span<const core::f64> signal) const
{
    const core::usize taps = _coefficients.size();
    std::vector<core::f64> output(signal.size() + taps - 1, 0.0);

    for (core::usize i = 0; i < signal.size(); ++i) {
        const core::f64 x = signal[i];
        for (core::usize j = 0; j < taps; ++j)
            output[i + j] += _coefficients[j] * x;
    }
    return output;
}

} // namespace spx::dsp
