/**
 * @file Fft.cpp
 * @brief One-shot FFT wrappers over FftPlan.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#include "spx/dsp/Fft.hpp"
#include "spx/dsp/FftPlan.hpp"

namespace spx::dsp {

core::Expected<Spectrum> fft(std::span<const Complex> samples)
{
    const auto plan = SPX_TRY(FftPlan::create(samples.size()));
    return plan.execute(samples);
}

core::Expected<Spectrum> fft(std::span<const core::f64> samples)
{
    const auto plan = SPX_TRY(FftPlan::create(samples.size()));
    return plan.execute(samples);
}

} // namespace spx::dsp
