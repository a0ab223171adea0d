/**
 * @file Recording.cpp
 * @brief Implementation of Recording helpers and metadata validation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#include "spx/source/Recording.hpp"

#include <string>

namespace spx::source {

core::f64 Recording::duration() const noexcept
{
    if (info.samplingRateHz <= 0.0)
        return 0.0;
    return static_cast<core::f64>(sampleCount()) / info.samplingRateHz;
}

core::Expected<std::vector<core::f64>> Recording::channel(core::usize index) const
{
    if (index >= channelCount()) {
        return core::makeError(core::ErrorCode::kConfigError,
            "channel " + std::to_string(index) + " out of range for " +
            std::to_string(channelCount()) + " channels");
    }

    const auto row = samples.row(static_cast<Eigen::Index>(index));
    return std::vector<core::f64>(row.data(), row.data() + row.size());
}

core::Expected<core::usize> Recording::channelIndex(std::string_view label) const
{
    for (core::usize i = 0; i < info.channelLabels.size(); ++i) {
        if (info.channelLabels[i] == label)
            return i;
    }
    return core::makeError(core::ErrorCode::kConfigError, "no channel labelled '" + std::string(label) + "'");
}

core::ExpectedVoid validate(const math::SampleMatrix &samples, const RecordingInfo &info)
{
    const auto rows = static_cast<core::usize>(samples.rows());
    const auto cols = static_cast<core::usize>(samples.cols());

    if (rows != info.channelCount) {
        return core::makeError(core::ErrorCode::kConfigError,
            "metadata declares " + std::to_string(info.channelCount) + " channels but the matrix is " +
            std::to_string(rows) + "x" + std::to_string(cols) + " (rows must be channels)");
    }

    if (!(info.samplingRateHz > 0.0)) {
        return core::makeError(core::ErrorCode::kConfigError,
            "sampling rate must be positive, got " + std::to_string(info.samplingRateHz));
    }

    if (!info.channelLabels.empty() && info.channelLabels.size() != rows) {
        return core::makeError(core::ErrorCode::kConfigError,
            std::to_string(info.channelLabels.size()) + " labels for " + std::to_string(rows) + " channels");
    }

    if (!info.units.empty() && info.units.size() != rows) {
        return core::makeError(core::ErrorCode::kConfigError,
            std::to_string(info.units.size()) + " units for " + std::to_string(rows) + " channels");
    }
    return {};
}

} // namespace spx::source
