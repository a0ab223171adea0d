/**
 * @file Dft.cpp
 * @brief Implementation of the naive DFT / IDFT.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#include "spx/dsp/Dft.hpp"

#include <cmath>
#include <numbers>
#include <string>

namespace spx::dsp {

namespace {

/**
 * @brief Direct summation with e^{sign * 2 pi i k n / N}.
 *
 * The product k * n is reduced modulo N before it becomes an angle so that
 * the argument of cos/sin stays in [0, 2 pi) for long inputs.
 */
Spectrum directSum(std::span<const Complex> input, core::f64 sign)
{
    const core::usize n = input.size();
    const core::f64 step = sign * 2.0 * std::numbers::pi / static_cast<core::f64>(n);

    Spectrum output(n);
    for (core::usize k = 0; k < n; ++k) {
        Complex sum{0.0, 0.0};
        for (core::usize t = 0; t < n; ++t) {
            const core::f64 angle = step * static_cast<core::f64>((k * t) % n);
            sum += input[t] * Complex(std::cos(angle), std::sin(angle));
        }
        output[k] = sum;
    }
    return output;
}

core::Unexpected emptyInput(const char *what)
{
    return core::makeError(core::ErrorCode::kLengthError,
        std::string(what) + " requires at least one sample, got 0");
}

} // namespace

core::Expected<Spectrum> dft(std::span<const Complex> samples)
{
    if (samples.empty())
        return emptyInput("DFT");

    return directSum(samples, -1.0);
}

core::Expected<Spectrum> dft(std::span<const core::f64> samples)
{
    if (samples.empty())
        return emptyInput("DFT");

    const Spectrum lifted = toComplex(samples);
    return directSum(lifted, -1.0);
}

core::Expected<Spectrum> idft(std::span<const Complex> spectrum)
{
    if (spectrum.empty())
        return emptyInput("IDFT");

    Spectrum output = directSum(spectrum, 1.0);
    const auto scale = 1.0 / static_cast<core::f64>(output.size());
    for (auto &value : output)
        value *= scale;
    return output;
}

core::Expected<std::vector<core::f64>> idftReal(std::span<const Complex> spectrum)
{
    auto complexOut = idft(spectrum);
    if (!complexOut)
        return std::unexpected(complexOut.error());

    std::vector<core::f64> real(complexOut->size());
    for (core::usize i = 0; i < real.size(); ++i)
        real[i] = (*complexOut)[i].real();
    return real;
}

} // namespace spx::dsp
