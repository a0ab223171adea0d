/**
 * @file TestSTransform.cpp
 * @brief Unit tests for spx::dsp::sTransform().
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "helpers/SpectrumTestUtils.hpp"

#include <spx/dsp/STransform.hpp>

#include <cmath>
#include <numbers>
#include <vector>

using namespace spx;
using namespace spx::dsp;
using Catch::Matchers::WithinAbs;

namespace {

std::vector<double> offsetTone(std::size_t n, std::size_t bin, double offset)
{
    std::vector<double> out(n);
    for (std::size_t t = 0; t < n; ++t) {
        const double phase = 2.0 * std::numbers::pi * static_cast<double>(bin * t) / static_cast<double>(n);
        out[t] = offset + std::cos(phase);
    }
    return out;
}

} // namespace

TEST_CASE("sTransform rejects non power-of-two lengths", "[dsp][stransform]")
{
    SECTION("length 6")
    {
        auto result = sTransform(std::vector<double>(6, 1.0));
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code() == core::ErrorCode::kLengthError);
    }

    SECTION("empty")
    {
        auto result = sTransform(std::vector<double>{});
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code() == core::ErrorCode::kLengthError);
    }
}

TEST_CASE("sTransform shape and zero voice", "[dsp][stransform]")
{
    const auto signal = test::randomReal(32, 11u);
    auto st = sTransform(signal);
    REQUIRE(st.has_value());
    REQUIRE(st->rows() == 17);
    REQUIRE(st->cols() == 32);

    double mean = 0.0;
    for (double x : signal)
        mean += x;
    mean /= 32.0;

    for (Eigen::Index t = 0; t < st->cols(); ++t) {
        REQUIRE_THAT((*st)(0, t).real(), WithinAbs(mean, 1e-12));
        REQUIRE_THAT((*st)(0, t).imag(), WithinAbs(0.0, 1e-12));
    }
}

TEST_CASE("sTransform of a pure tone peaks at its voice", "[dsp][stransform]")
{
    constexpr std::size_t n = 64;
    constexpr std::size_t bin = 8;
    auto st = sTransform(offsetTone(n, bin, 3.0));
    REQUIRE(st.has_value());

    Eigen::Index peak = 0;
    double peakEnergy = -1.0;
    for (Eigen::Index f = 1; f < st->rows(); ++f) {
        const double energy = st->row(f).cwiseAbs2().sum();
        if (energy > peakEnergy) {
            peakEnergy = energy;
            peak = f;
        }
    }
    REQUIRE(peak == static_cast<Eigen::Index>(bin));

    // Half the tone amplitude, constant over time.
    for (Eigen::Index t = 0; t < st->cols(); ++t)
        REQUIRE_THAT(std::abs((*st)(peak, t)), WithinAbs(0.5, 1e-6));

    REQUIRE_THAT((*st)(0, 0).real(), WithinAbs(3.0, 1e-12));
}
