/**
 * @file FirFilter.hpp
 * @brief Finite impulse response filter applied as a full linear convolution.
 *
 * For M taps h and N samples x the output has N + M - 1 samples:
 *
 * @f$ y[k] = \sum_{j} h[j] \, x[k - j] @f$
 *
 * with x taken as zero outside [0, N).  The filter keeps no state between
 * calls; every call starts from a zero history.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#pragma once

#ifndef SPX_DSP_FIRFILTER_HPP
    #define SPX_DSP_FIRFILTER_HPP

    #include <spx/core/Expected.hpp>
    #include <spx/core/Types.hpp>

    #include <span>
    #include <utility>
    #include <vector>

namespace spx::dsp {

class FirFilter final {
public:
    /**
     * @brief Builds a filter from its taps.
     * @return The filter, or kConfigError when @p coefficients is empty.
     */
    [[nodiscard]] static core::Expected<FirFilter> create(std::vector<core::f64> coefficients);

    /**
     * @brief Convolves @p signal with the taps.
     * @return signal.size() + order() - 1 samples.
     */
    [[nodiscard]] std::vector<core::f64> process(std::span<const core::f64> signal) const;

    [[nodiscard]] core::usize order() const noexcept { return _coefficients.size(); }
    [[nodiscard]] std::span<const core::f64> coefficients() const noexcept { return _coefficients; }

private:
    explicit FirFilter(std::vector<core::f64> coefficients) noexcept
        : _coefficients(std::move(coefficients)) {}

    std::vector<core::f64> _coefficients;
};

} // namespace spx::dsp

#endif // SPX_DSP_FIRFILTER_HPP
