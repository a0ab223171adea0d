/**
 * @file Window.hpp
 * @brief Window functions applied to frames before spectral analysis.
 *
 * Every generator is a pure function of the window length L.  Two lengths
 * get a fixed policy shared by all shapes:
 *  - L == 0 is rejected with kConfigError;
 *  - L == 1 yields the single weight 1.0 (the closed formulas divide by
 *    L - 1 and are undefined there; 1.0 leaves a one-sample frame intact).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#pragma once

#ifndef SPX_DSP_WINDOW_HPP
    #define SPX_DSP_WINDOW_HPP

    #include <spx/core/Expected.hpp>
    #include <spx/core/Types.hpp>

    #include <string_view>
    #include <vector>

namespace spx::dsp {

/**
 * @brief Supported window shapes.
 */
enum class WindowShape : core::u8 {
    kSine,
    kHann
};

[[nodiscard]] constexpr std::string_view windowShapeName(WindowShape shape) noexcept
{
    switch (shape) {
        case WindowShape::kSine: return "Sine";
        case WindowShape::kHann: return "Hann";
    }
    return "Unknown";
}

/**
 * @brief Sine window w[n] = sin(pi n / (L - 1)), n = 0 .. L - 1.
 */
[[nodiscard]] core::Expected<std::vector<core::f64>> sineWindow(core::usize length);

/**
 * @brief Hann window w[n] = 0.5 (1 - cos(2 pi n / (L - 1))), n = 0 .. L - 1.
 */
[[nodiscard]] core::Expected<std::vector<core::f64>> hannWindow(core::usize length);

/**
 * @brief Dispatches to the generator for @p shape.
 */
[[nodiscard]] core::Expected<std::vector<core::f64>> makeWindow(WindowShape shape, core::usize length);

} // namespace spx::dsp

#endif // SPX_DSP_WINDOW_HPP
