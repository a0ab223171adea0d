/**
 * @file MemorySource.cpp
 * @brief Implementation of the in-memory ingestion source.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#include "spx/source/MemorySource.hpp"

#include <spx/core/Log.hpp>

#include <string>
#include <utility>

namespace spx::source {

MemorySource::MemorySource(math::SampleMatrix samples, RecordingInfo info)
    : _samples(std::move(samples)), _info(std::move(info))
{
}

core::Expected<Recording> MemorySource::load()
{
    if (auto valid = validate(_samples, _info); !valid) {
        core::Log::warn("SRC", "MemorySource rejected recording: " + valid.error().message());
        return std::unexpected(valid.error());
    }

    ++_loadCount;
    core::Log::debug("SRC", "MemorySource loaded " + std::to_string(_samples.rows()) + " channels x " +
        std::to_string(_samples.cols()) + " samples");

    return Recording{.samples = _samples, .info = _info};
}

} // namespace spx::source
