/**
 * @file MemorySource.hpp
 * @brief ISampleSource serving a recording already held in memory.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#pragma once

#ifndef SPX_SOURCE_MEMORYSOURCE_HPP
    #define SPX_SOURCE_MEMORYSOURCE_HPP

    #include "ISampleSource.hpp"

namespace spx::source {

/**
 * @brief Hands out copies of a stored sample matrix and its metadata.
 *
 * The metadata is validated on every load(), so a mismatched matrix is
 * reported where it is consumed rather than where it was built.
 */
class MemorySource final : public ISampleSource {
public:
    MemorySource(math::SampleMatrix samples, RecordingInfo info);

    [[nodiscard]] core::Expected<Recording> load() override;
    [[nodiscard]] std::string_view name() const noexcept override { return "MemorySource"; }

    [[nodiscard]] core::usize loadCount() const noexcept { return _loadCount; }

private:
    math::SampleMatrix _samples;
    RecordingInfo _info;
    core::usize _loadCount = 0;
};

} // namespace spx::source

#endif // SPX_SOURCE_MEMORYSOURCE_HPP
