/**
 * @file Stft.cpp
 * @brief Implementation of the short-time Fourier transform.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#include "spx/dsp/Stft.hpp"
#include "spx/dsp/FftPlan.hpp"

#include <spx/core/Log.hpp>

#include <string>

namespace spx::dsp {

// ---- StftConfig -----------------------------------------------------------

StftConfig::Builder &StftConfig::Builder::frameSize(core::usize n) noexcept
{
    frameSize_ = n;
    return *this;
}

StftConfig::Builder &StftConfig::Builder::hopSize(core::isize n) noexcept
{
    hopSize_ = n;
    return *this;
}

core::Expected<StftConfig> StftConfig::Builder::build() const
{
    if (!isPowerOfTwo(frameSize_)) {
        return core::makeError(core::ErrorCode::kLengthError,
            "STFT frame size must be a power of two, got " + std::to_string(frameSize_));
    }

    if (hopSize_ <= 0) {
        return core::makeError(core::ErrorCode::kConfigError,
            "STFT hop size must be positive, got " + std::to_string(hopSize_));
    }

    return StftConfig(frameSize_, static_cast<core::usize>(hopSize_));
}

core::usize StftConfig::frameCount(core::usize sampleCount) const noexcept
{
    return stftFrameCount(sampleCount, frameSize_, hopSize_);
}

// ---- Transform ------------------------------------------------------------

core::Expected<Spectrogram> stft(
    std::span<const core::f64> samples,
    const StftConfig &config,
    std::span<const core::f64> window)
{
    const core::usize frameSize = config.frameSize();

    if (window.size() != frameSize) {
        return core::makeError(core::ErrorCode::kConfigError,
            "STFT window has " + std::to_string(window.size()) +
            " weights, frame size is " + std::to_string(frameSize));
    }

    const auto plan = SPX_TRY(FftPlan::create(frameSize));
    const core::usize frames = config.frameCount(samples.size());

    Spectrogram spectrogram(static_cast<Eigen::Index>(frameSize), static_cast<Eigen::Index>(frames));
    std::vector<core::f64> frame(frameSize);

    for (core::usize f = 0; f < frames; ++f) {
        const core::usize start = f * config.hopSize();
        for (core::usize i = 0; i < frameSize; ++i)
            frame[i] = samples[start + i] * window[i];

        const Spectrum column = SPX_TRY(plan.execute(std::span<const core::f64>(frame)));
        for (core::usize k = 0; k < frameSize; ++k)
            spectrogram(static_cast<Eigen::Index>(k), static_cast<Eigen::Index>(f)) = column[k];
    }

    const core::usize covered = frames == 0 ? 0 : (frames - 1) * config.hopSize() + frameSize;
    if (covered < samples.size()) {
        core::Log::debug("DSP", "STFT dropped " + std::to_string(samples.size() - covered) +
            " trailing samples");
    }

    return spectrogram;
}

core::Expected<Spectrogram> stft(
    std::span<const core::f64> samples,
    core::usize frameSize,
    core::isize hopSize,
    std::span<const core::f64> window)
{
    const auto config = SPX_TRY(StftConfig::builder().frameSize(frameSize).hopSize(hopSize).build());
    return stft(samples, config, window);
}

core::Expected<Spectrogram> stftChannel(
    math::SampleMatrixView matrix,
    core::usize channel,
    const StftConfig &config,
    std::span<const core::f64> window)
{
    if (channel >= static_cast<core::usize>(matrix.rows())) {
        return core::makeError(core::ErrorCode::kConfigError,
            "channel " + std::to_string(channel) + " out of range for " +
            std::to_string(matrix.rows()) + " channels");
    }

    // Rows of a row-major view are contiguous.
    const std::span<const core::f64> samples(
        matrix.row(static_cast<Eigen::Index>(channel)).data(),
        static_cast<core::usize>(matrix.cols()));
    return stft(samples, config, window);
}

core::Expected<std::vector<Spectrogram>> stftChannels(
    math::SampleMatrixView matrix,
    const StftConfig &config,
    std::span<const core::f64> window)
{
    std::vector<Spectrogram> result;
    result.reserve(static_cast<core::usize>(matrix.rows()));

    for (Eigen::Index ch = 0; ch < matrix.rows(); ++ch)
        result.push_back(SPX_TRY(stftChannel(matrix, static_cast<core::usize>(ch), config, window)));

    return result;
}

} // namespace spx::dsp
