/**
 * @file TestStft.cpp
 * @brief Unit tests for spx::dsp::StftConfig and stft().
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "helpers/SpectrumTestUtils.hpp"

#include <spx/dsp/Fft.hpp>
#include <spx/dsp/Stft.hpp>
#include <spx/dsp/Window.hpp>

#include <cmath>
#include <numbers>

using namespace spx;
using namespace spx::dsp;
using Catch::Matchers::WithinAbs;

namespace {

std::vector<double> ramp(std::size_t n)
{
    std::vector<double> out(n);
    for (std::size_t i = 0; i < n; ++i)
        out[i] = static_cast<double>(i + 1);
    return out;
}

std::vector<double> ones(std::size_t n)
{
    return std::vector<double>(n, 1.0);
}

} // namespace

TEST_CASE("stftFrameCount", "[dsp][stft]")
{
    REQUIRE(stftFrameCount(10, 4, 2) == 4);
    REQUIRE(stftFrameCount(11, 4, 2) == 4);
    REQUIRE(stftFrameCount(12, 4, 2) == 5);
    REQUIRE(stftFrameCount(4, 4, 1) == 1);
    REQUIRE(stftFrameCount(3, 4, 1) == 0);
    REQUIRE(stftFrameCount(0, 4, 1) == 0);
    REQUIRE(stftFrameCount(100, 8, 0) == 0);

    static_assert(stftFrameCount(10, 4, 2) == 4);
}

TEST_CASE("StftConfig::Builder validates its parameters", "[dsp][stft][config]")
{
    SECTION("defaults are valid")
    {
        auto config = StftConfig::builder().build();
        REQUIRE(config.has_value());
        REQUIRE(config->frameSize() == core::kDefaultFrameSize);
        REQUIRE(config->hopSize() == core::kDefaultHopSize);
    }

    SECTION("explicit values are kept")
    {
        auto config = StftConfig::builder().frameSize(64).hopSize(16).build();
        REQUIRE(config.has_value());
        REQUIRE(config->frameSize() == 64);
        REQUIRE(config->hopSize() == 16);
        REQUIRE(config->frameCount(100) == 3);
    }

    SECTION("non power-of-two frame size is a length error")
    {
        auto config = StftConfig::builder().frameSize(6).hopSize(2).build();
        REQUIRE_FALSE(config.has_value());
        REQUIRE(config.error().code() == core::ErrorCode::kLengthError);
    }

    SECTION("zero frame size is a length error")
    {
        auto config = StftConfig::builder().frameSize(0).hopSize(2).build();
        REQUIRE_FALSE(config.has_value());
        REQUIRE(config.error().code() == core::ErrorCode::kLengthError);
    }

    SECTION("zero hop size is a config error")
    {
        auto config = StftConfig::builder().frameSize(4).hopSize(0).build();
        REQUIRE_FALSE(config.has_value());
        REQUIRE(config.error().code() == core::ErrorCode::kConfigError);
    }

    SECTION("negative hop size is a config error")
    {
        auto config = StftConfig::builder().frameSize(4).hopSize(-1).build();
        REQUIRE_FALSE(config.has_value());
        REQUIRE(config.error().code() == core::ErrorCode::kConfigError);
    }
}

TEST_CASE("stft frame count and shape", "[dsp][stft]")
{
    const auto window = ones(4);

    SECTION("L = 10, frame = 4, hop = 2 gives 4 frames")
    {
        auto spectrogram = stft(ramp(10), 4, 2, window);
        REQUIRE(spectrogram.has_value());
        REQUIRE(spectrogram->rows() == 4);
        REQUIRE(spectrogram->cols() == 4);
    }

    SECTION("signal shorter than one frame gives 0 frames")
    {
        auto spectrogram = stft(ramp(3), 4, 2, window);
        REQUIRE(spectrogram.has_value());
        REQUIRE(spectrogram->rows() == 4);
        REQUIRE(spectrogram->cols() == 0);
    }

    SECTION("empty signal gives 0 frames")
    {
        auto spectrogram = stft(std::vector<double>{}, 4, 1, window);
        REQUIRE(spectrogram.has_value());
        REQUIRE(spectrogram->cols() == 0);
    }
}

TEST_CASE("stft reports invalid parameters", "[dsp][stft]")
{
    const auto signal = ramp(32);

    SECTION("frame size not a power of two")
    {
        auto result = stft(signal, 6, 2, ones(6));
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code() == core::ErrorCode::kLengthError);
    }

    SECTION("zero hop")
    {
        auto result = stft(signal, 8, 0, ones(8));
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code() == core::ErrorCode::kConfigError);
    }

    SECTION("negative hop")
    {
        const int hop = -2;
        auto result = stft(ones(10), 4, hop, ones(4));
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code() == core::ErrorCode::kConfigError);
    }

    SECTION("window length differs from frame size")
    {
        auto result = stft(signal, 8, 4, ones(7));
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code() == core::ErrorCode::kConfigError);
    }
}

TEST_CASE("stft columns are FFTs of windowed frames", "[dsp][stft]")
{
    const auto signal = test::randomReal(40, 77u);
    auto window = sineWindow(8);
    REQUIRE(window.has_value());

    auto config = StftConfig::builder().frameSize(8).hopSize(3).build();
    REQUIRE(config.has_value());

    auto spectrogram = stft(signal, *config, *window);
    REQUIRE(spectrogram.has_value());
    REQUIRE(spectrogram->cols() == static_cast<Eigen::Index>(config->frameCount(signal.size())));
    REQUIRE(spectrogram->cols() == 11);

    for (Eigen::Index f = 0; f < spectrogram->cols(); ++f) {
        std::vector<double> frame(8);
        for (std::size_t i = 0; i < 8; ++i)
            frame[i] = signal[static_cast<std::size_t>(f) * 3 + i] * (*window)[i];

        auto expected = fft(frame);
        REQUIRE(expected.has_value());
        for (Eigen::Index k = 0; k < 8; ++k) {
            const Complex actual = (*spectrogram)(k, f);
            REQUIRE_THAT(actual.real(), WithinAbs((*expected)[static_cast<std::size_t>(k)].real(), 1e-12));
            REQUIRE_THAT(actual.imag(), WithinAbs((*expected)[static_cast<std::size_t>(k)].imag(), 1e-12));
        }
    }
}

TEST_CASE("stft drops trailing samples instead of padding", "[dsp][stft]")
{
    const auto window = ones(4);
    auto exact = stft(ramp(10), 4, 2, window);

    auto longer = ramp(11);
    longer[10] = 1.0e6;
    auto withTail = stft(longer, 4, 2, window);

    REQUIRE(exact.has_value());
    REQUIRE(withTail.has_value());
    REQUIRE(withTail->cols() == exact->cols());
    REQUIRE(withTail->isApprox(*exact));
}

TEST_CASE("stft of a pure tone peaks at the tone's bin", "[dsp][stft]")
{
    constexpr std::size_t frameSize = 64;
    constexpr double sampleRate = 256.0;
    constexpr double toneHz = 32.0;

    std::vector<double> tone(512);
    for (std::size_t t = 0; t < tone.size(); ++t)
        tone[t] = std::sin(2.0 * std::numbers::pi * toneHz * static_cast<double>(t) / sampleRate);

    auto window = hannWindow(frameSize);
    REQUIRE(window.has_value());

    auto spectrogram = stft(tone, frameSize, 32, *window);
    REQUIRE(spectrogram.has_value());

    const auto expectedBin = static_cast<Eigen::Index>(toneHz * frameSize / sampleRate);
    for (Eigen::Index f = 0; f < spectrogram->cols(); ++f) {
        Eigen::Index peak = 0;
        spectrogram->col(f).head(frameSize / 2).cwiseAbs().maxCoeff(&peak);
        REQUIRE(peak == expectedBin);
    }
}

TEST_CASE("stftChannel and stftChannels read rows of a sample matrix", "[dsp][stft]")
{
    math::SampleMatrix matrix(2, 10);
    for (Eigen::Index t = 0; t < 10; ++t) {
        matrix(0, t) = static_cast<double>(t + 1);
        matrix(1, t) = -static_cast<double>(t);
    }

    auto config = StftConfig::builder().frameSize(4).hopSize(2).build();
    REQUIRE(config.has_value());
    const auto window = ones(4);

    auto first = stftChannel(matrix, 0, *config, window);
    auto reference = stft(ramp(10), *config, window);
    REQUIRE(first.has_value());
    REQUIRE(reference.has_value());
    REQUIRE(first->isApprox(*reference));

    auto all = stftChannels(matrix, *config, window);
    REQUIRE(all.has_value());
    REQUIRE(all->size() == 2);
    REQUIRE((*all)[0].isApprox(*first));
    REQUIRE((*all)[1].cols() == 4);

    auto missing = stftChannel(matrix, 2, *config, window);
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error().code() == core::ErrorCode::kConfigError);
}
