/**
 * @file Recording.hpp
 * @brief Sample matrix plus the metadata an ingestion backend supplies.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#pragma once

#ifndef SPX_SOURCE_RECORDING_HPP
    #define SPX_SOURCE_RECORDING_HPP

    #include <spx/core/Expected.hpp>
    #include <spx/math/SampleMatrix.hpp>

    #include <string>
    #include <string_view>
    #include <vector>

namespace spx::source {

/**
 * @brief Metadata describing a multichannel recording.
 *
 * Labels and units are optional; when present they hold one entry per
 * channel, in row order (e.g. {"Fp1", "Fp2"} and {"uV", "uV"}).
 */
struct RecordingInfo {
    core::usize channelCount = 0;
    core::f64 samplingRateHz = 0.0;
    std::vector<std::string> channelLabels;
    std::vector<std::string> units;
};

/**
 * @brief A loaded recording: channels x samples plus its metadata.
 */
struct Recording {
    math::SampleMatrix samples;
    RecordingInfo info;

    [[nodiscard]] core::usize channelCount() const noexcept { return static_cast<core::usize>(samples.rows()); }
    [[nodiscard]] core::usize sampleCount() const noexcept { return static_cast<core::usize>(samples.cols()); }

    /**
     * @brief Recording length in seconds.
     */
    [[nodiscard]] core::f64 duration() const noexcept;

    /**
     * @brief Copies one channel's samples.
     * @return The samples, or kConfigError if @p index is out of range.
     */
    [[nodiscard]] core::Expected<std::vector<core::f64>> channel(core::usize index) const;

    /**
     * @brief Row index of the channel labelled @p label.
     * @return The index, or kConfigError if no channel carries that label.
     */
    [[nodiscard]] core::Expected<core::usize> channelIndex(std::string_view label) const;
};

/**
 * @brief Checks that @p info describes @p samples.
 * @return kConfigError if the row count differs from channelCount (the
 *         matrix is probably transposed), if the sampling rate is not
 *         positive, or if labels/units do not have one entry per channel.
 */
[[nodiscard]] core::ExpectedVoid validate(const math::SampleMatrix &samples, const RecordingInfo &info);

} // namespace spx::source

#endif // SPX_SOURCE_RECORDING_HPP
