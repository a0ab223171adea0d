/**
 * @file ISampleSource.hpp
 * @brief Abstract ingestion backend supplying a Recording.
 *
 * File formats (BrainVision, EDF, BIDS layouts) and acquisition hardware
 * live outside this library.  They plug in by implementing this interface;
 * the spectral and covariance code only ever sees the resulting Recording.
 *
 * Contract:
 *  1. load() returns a Recording whose metadata matches its sample matrix
 *     (see validate()), or an Error.  No partial recordings.
 *  2. name() returns a stable, non-empty identifier for diagnostics.
 *
 * @see MemorySource
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#pragma once

#ifndef SPX_SOURCE_ISAMPLESOURCE_HPP
    #define SPX_SOURCE_ISAMPLESOURCE_HPP

    #include "Recording.hpp"

    #include <spx/core/Expected.hpp>

    #include <string_view>

namespace spx::source {

class ISampleSource {
public:
    virtual ~ISampleSource() = default;

    ISampleSource(const ISampleSource &) = delete;
    ISampleSource &operator=(const ISampleSource &) = delete;
    ISampleSource(ISampleSource &&) = default;
    ISampleSource &operator=(ISampleSource &&) = default;

    /**
     * @brief Produces the recording.
     */
    [[nodiscard]] virtual core::Expected<Recording> load() = 0;

    /**
     * @brief Returns a human-readable name for this source.
     */
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

protected:
    ISampleSource() = default;
};

} // namespace spx::source

#endif // SPX_SOURCE_ISAMPLESOURCE_HPP
