/**
 * @file FftPlan.cpp
 * @brief Table construction and butterfly stages of the radix-2 FFT.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#include "spx/dsp/FftPlan.hpp"

#include <spx/core/Assert.hpp>
#include <spx/core/Log.hpp>

#include <cmath>
#include <numbers>
#include <string>

namespace spx::dsp {

namespace {

core::Unexpected sizeMismatch(core::usize planSize, core::usize inputSize)
{
    return core::makeError(core::ErrorCode::kLengthError,
        "FftPlan of size " + std::to_string(planSize) +
        " cannot transform " + std::to_string(inputSize) + " samples");
}

} // namespace

FftPlan::FftPlan(core::usize size)
    : _size(size)
    , _log2Size(log2Exact(size))
    , _bitReversal(size, 0)
    , _twiddles(size / 2)
{
    // rev(i) is rev(i / 2) shifted right, with the low bit of i moved to the top.
    for (core::usize i = 1; i < _size; ++i) {
        _bitReversal[i] = (_bitReversal[i >> 1] >> 1) |
                          ((i & 1u) << (_log2Size - 1));
    }

    const core::f64 step = -2.0 * std::numbers::pi / static_cast<core::f64>(_size);
    for (core::usize k = 0; k < _twiddles.size(); ++k) {
        const core::f64 angle = step * static_cast<core::f64>(k);
        _twiddles[k] = Complex(std::cos(angle), std::sin(angle));
    }
}

core::Expected<FftPlan> FftPlan::create(core::usize size)
{
    if (!isPowerOfTwo(size)) {
        return core::makeError(core::ErrorCode::kLengthError,
            "FFT requires power-of-two length, got " + std::to_string(size));
    }

    if (core::Log::enabled(core::LogLevel::kDebug))
        core::Log::debug("DSP", "FftPlan created for " + std::to_string(size) + " points");
    return FftPlan(size);
}

core::Expected<Spectrum> FftPlan::execute(std::span<const Complex> input) const
{
    if (input.size() != _size)
        return sizeMismatch(_size, input.size());

    Spectrum data(_size);
    for (core::usize i = 0; i < _size; ++i)
        data[i] = input[_bitReversal[i]];

    butterflyStages(data);
    return data;
}

core::Expected<Spectrum> FftPlan::execute(std::span<const core::f64> input) const
{
    if (input.size() != _size)
        return sizeMismatch(_size, input.size());

    Spectrum data(_size);
    for (core::usize i = 0; i < _size; ++i)
        data[i] = Complex(input[_bitReversal[i]], 0.0);

    butterflyStages(data);
    return data;
}

void FftPlan::butterflyStages(Spectrum &data) const
{
    SPX_ASSERT(data.size() == _size);

    for (core::usize len = 2; len <= _size; len <<= 1) {
        const core::usize half = len / 2;
        const core::usize stride = _size / len;

        for (core::usize i = 0; i < _size; i += len) {
            for (core::usize k = 0; k < half; ++k) {
                const Complex u = data[i + k];
                const Complex v = data[i + k + half] * _twiddles[k * stride];
                data[i + k] = u + v;
                data[i + k + half] = u - v;
            }
        }
    }
}

} // namespace spx::dsp
