/**
 * @file Frequencies.cpp
 * @brief Implementation of the spectrum frequency axes.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#include "spx/dsp/Frequencies.hpp"

#include <string>

namespace spx::dsp {

namespace {

core::ExpectedVoid validateAxis(core::usize n, core::f64 sampleRate)
{
    if (n == 0)
        return core::makeError(core::ErrorCode::kLengthError, "frequency axis needs at least one bin");

    if (!(sampleRate > 0.0)) {
        return core::makeError(core::ErrorCode::kConfigError,
            "sampling rate must be positive, got " + std::to_string(sampleRate));
    }
    return {};
}

} // namespace

core::Expected<std::vector<core::f64>> fftFrequencies(core::usize n, core::f64 sampleRate)
{
    SPX_TRY_VOID(validateAxis(n, sampleRate));

    const core::f64 df = sampleRate / static_cast<core::f64>(n);
    const core::usize lastPositive = (n - 1) / 2;

    std::vector<core::f64> freqs(n);
    for (core::usize k = 0; k < n; ++k) {
        freqs[k] = k <= lastPositive
            ? static_cast<core::f64>(k) * df
            : -static_cast<core::f64>(n - k) * df;
    }
    return freqs;
}

core::Expected<std::vector<core::f64>> rfftFrequencies(core::usize n, core::f64 sampleRate)
{
    SPX_TRY_VOID(validateAxis(n, sampleRate));

    const core::f64 df = sampleRate / static_cast<core::f64>(n);

    std::vector<core::f64> freqs(n / 2 + 1);
    for (core::usize k = 0; k < freqs.size(); ++k)
        freqs[k] = static_cast<core::f64>(k) * df;
    return freqs;
}

} // namespace spx::dsp
