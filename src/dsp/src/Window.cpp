/**
 * @file Window.cpp
 * @brief Implementation of the window generators.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#include "spx/dsp/Window.hpp"

#include <cmath>
#include <numbers>

namespace spx::dsp {

namespace {

template <typename Shape>
core::Expected<std::vector<core::f64>> generate(core::usize length, Shape &&shape)
{
    if (length == 0)
        return core::makeError(core::ErrorCode::kConfigError, "window length must be at least 1");

    if (length == 1)
        return std::vector<core::f64>{1.0};

    std::vector<core::f64> weights(length);
    const auto nMinus1 = static_cast<core::f64>(length - 1);
    for (core::usize i = 0; i < length; ++i)
        weights[i] = shape(static_cast<core::f64>(i) / nMinus1);
    return weights;
}

} // namespace

core::Expected<std::vector<core::f64>> sineWindow(core::usize length)
{
    return generate(length, [](core::f64 x) {
        return std::sin(std::numbers::pi * x);
    });
}

core::Expected<std::vector<core::f64>> hannWindow(core::usize length)
{
    return generate(length, [](core::f64 x) {
        return 0.5 * (1.0 - std::cos(2.0 * std::numbers::pi * x));
    });
}

core::Expected<std::vector<core::f64>> makeWindow(WindowShape shape, core::usize length)
{
    switch (shape) {
        case WindowShape::kSine: return sineWindow(length);
        case WindowShape::kHann: return hannWindow(length);
    }
    return core::makeError(core::ErrorCode::kConfigError, "unknown window shape");
}

} // namespace spx::dsp
