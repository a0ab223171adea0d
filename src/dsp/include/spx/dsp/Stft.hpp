/**
 * @file Stft.hpp
 * @brief Short-time Fourier transform over fixed-size, hop-spaced frames.
 *
 * Frames start at 0, hop, 2 hop, ... and are kept only while they fit
 * entirely inside the signal: trailing samples that cannot fill a whole
 * frame are dropped, never zero-padded.  Each frame is multiplied by the
 * window and transformed with a single FftPlan shared by all frames.
 *
 * @code
 *   auto config = StftConfig::builder().frameSize(256).hopSize(64).build();
 *   auto window = sineWindow(256);
 *   auto spectrogram = stft(samples, *config, *window);
 * @endcode
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#pragma once

#ifndef SPX_DSP_STFT_HPP
    #define SPX_DSP_STFT_HPP

    #include "Spectrum.hpp"

    #include <spx/core/Constants.hpp>
    #include <spx/core/Expected.hpp>
    #include <spx/math/SampleMatrix.hpp>

    #include <span>
    #include <vector>

namespace spx::dsp {

/**
 * @brief Validated, immutable frame segmentation parameters.
 */
class StftConfig final {
public:
    /// @brief Fluent builder for StftConfig.
    class Builder {
    public:
        Builder &frameSize(core::usize n) noexcept;
        /// Values <= 0 are rejected by build().
        Builder &hopSize(core::isize n) noexcept;

        /**
         * @brief Validates the parameters.
         * @return The config, kLengthError if the frame size is not a power
         *         of two, or kConfigError if the hop size is not positive.
         */
        [[nodiscard]] core::Expected<StftConfig> build() const;

    private:
        core::usize frameSize_{core::kDefaultFrameSize};
        core::isize hopSize_{static_cast<core::isize>(core::kDefaultHopSize)};
    };

    [[nodiscard]] static Builder builder() { return Builder{}; }

    [[nodiscard]] core::usize frameSize() const noexcept { return frameSize_; }
    [[nodiscard]] core::usize hopSize()   const noexcept { return hopSize_; }

    /**
     * @brief Number of whole frames that fit in @p sampleCount samples.
     */
    [[nodiscard]] core::usize frameCount(core::usize sampleCount) const noexcept;

private:
    StftConfig(core::usize frameSize, core::usize hopSize) noexcept
        : frameSize_(frameSize), hopSize_(hopSize) {}

    core::usize frameSize_;
    core::usize hopSize_;
};

/**
 * @brief floor((L - frameSize) / hop) + 1 when L >= frameSize, else 0.
 *
 * Returns 0 for a zero frame or hop size.
 */
[[nodiscard]] constexpr core::usize stftFrameCount(
    core::usize sampleCount,
    core::usize frameSize,
    core::usize hopSize) noexcept
{
    if (frameSize == 0 || hopSize == 0 || sampleCount < frameSize)
        return 0;
    return (sampleCount - frameSize) / hopSize + 1;
}

/**
 * @brief STFT of one channel.
 * @param samples Real samples of a single channel.
 * @param config  Frame and hop sizes.
 * @param window  Exactly config.frameSize() weights.
 * @return frameSize x frameCount spectrogram (zero columns when the signal
 *         is shorter than one frame), or kConfigError on a window length
 *         mismatch.
 */
[[nodiscard]] core::Expected<Spectrogram> stft(
    std::span<const core::f64> samples,
    const StftConfig &config,
    std::span<const core::f64> window);

/**
 * @brief Convenience overload validating the raw frame and hop sizes.
 * @return kConfigError when @p hopSize <= 0.
 */
[[nodiscard]] core::Expected<Spectrogram> stft(
    std::span<const core::f64> samples,
    core::usize frameSize,
    core::isize hopSize,
    std::span<const core::f64> window);

/**
 * @brief STFT of row @p channel of a sample matrix.
 * @return The spectrogram, or kConfigError if the channel does not exist.
 */
[[nodiscard]] core::Expected<Spectrogram> stftChannel(
    math::SampleMatrixView matrix,
    core::usize channel,
    const StftConfig &config,
    std::span<const core::f64> window);

/**
 * @brief STFT of every row of a sample matrix, in channel order.
 */
[[nodiscard]] core::Expected<std::vector<Spectrogram>> stftChannels(
    math::SampleMatrixView matrix,
    const StftConfig &config,
    std::span<const core::f64> window);

} // namespace spx::dsp

#endif // SPX_DSP_STFT_HPP
