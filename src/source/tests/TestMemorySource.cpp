/**
 * @file TestMemorySource.cpp
 * @brief Unit tests for spx::source::MemorySource and Recording.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <spx/math/Covariance.hpp>
#include <spx/source/MemorySource.hpp>

#include <memory>

using namespace spx;
using namespace spx::source;
using Catch::Matchers::WithinAbs;

namespace {

math::SampleMatrix twoChannels()
{
    math::SampleMatrix m(2, 4);
    m << 1, 2, 3, 4,
         8, 6, 4, 2;
    return m;
}

RecordingInfo twoChannelInfo()
{
    return RecordingInfo{
        .channelCount = 2,
        .samplingRateHz = 250.0,
        .channelLabels = {"Fp1", "Fp2"},
        .units = {"uV", "uV"},
    };
}

} // namespace

TEST_CASE("MemorySource loads a consistent recording", "[source][memory]")
{
    std::unique_ptr<ISampleSource> source = std::make_unique<MemorySource>(twoChannels(), twoChannelInfo());
    REQUIRE(source->name() == "MemorySource");

    auto recording = source->load();
    REQUIRE(recording.has_value());
    REQUIRE(recording->channelCount() == 2);
    REQUIRE(recording->sampleCount() == 4);
    REQUIRE(recording->info.channelLabels[1] == "Fp2");
    REQUIRE_THAT(recording->duration(), WithinAbs(4.0 / 250.0, 1e-12));
}

TEST_CASE("MemorySource hands out independent copies", "[source][memory]")
{
    MemorySource source(twoChannels(), twoChannelInfo());

    auto first = source.load();
    REQUIRE(first.has_value());
    first->samples(0, 0) = -100.0;

    auto second = source.load();
    REQUIRE(second.has_value());
    REQUIRE(second->samples(0, 0) == 1.0);
    REQUIRE(source.loadCount() == 2);
}

TEST_CASE("MemorySource rejects inconsistent metadata", "[source][memory]")
{
    SECTION("transposed matrix")
    {
        const math::SampleMatrix transposed = twoChannels().transpose();
        MemorySource source(transposed, twoChannelInfo());
        auto recording = source.load();
        REQUIRE_FALSE(recording.has_value());
        REQUIRE(recording.error().code() == core::ErrorCode::kConfigError);
        REQUIRE(source.loadCount() == 0);
    }

    SECTION("non-positive sampling rate")
    {
        auto info = twoChannelInfo();
        info.samplingRateHz = 0.0;
        MemorySource source(twoChannels(), info);
        REQUIRE_FALSE(source.load().has_value());
    }

    SECTION("label count mismatch")
    {
        auto info = twoChannelInfo();
        info.channelLabels = {"Cz"};
        MemorySource source(twoChannels(), info);
        auto recording = source.load();
        REQUIRE_FALSE(recording.has_value());
        REQUIRE(recording.error().code() == core::ErrorCode::kConfigError);
    }

    SECTION("unit count mismatch")
    {
        auto info = twoChannelInfo();
        info.units = {"uV", "uV", "uV"};
        MemorySource source(twoChannels(), info);
        REQUIRE_FALSE(source.load().has_value());
    }

    SECTION("labels and units are optional")
    {
        auto info = twoChannelInfo();
        info.channelLabels.clear();
        info.units.clear();
        MemorySource source(twoChannels(), info);
        REQUIRE(source.load().has_value());
    }
}

TEST_CASE("Recording channel accessors", "[source][recording]")
{
    const Recording recording{.samples = twoChannels(), .info = twoChannelInfo()};

    auto second = recording.channel(1);
    REQUIRE(second.has_value());
    REQUIRE(*second == std::vector<double>{8.0, 6.0, 4.0, 2.0});

    auto outOfRange = recording.channel(2);
    REQUIRE_FALSE(outOfRange.has_value());
    REQUIRE(outOfRange.error().code() == core::ErrorCode::kConfigError);

    auto index = recording.channelIndex("Fp2");
    REQUIRE(index.has_value());
    REQUIRE(*index == 1);

    auto unknown = recording.channelIndex("O1");
    REQUIRE_FALSE(unknown.has_value());
    REQUIRE(unknown.error().code() == core::ErrorCode::kConfigError);
}

TEST_CASE("loaded recordings feed the covariance estimator", "[source][memory]")
{
    MemorySource source(twoChannels(), twoChannelInfo());
    auto recording = source.load();
    REQUIRE(recording.has_value());

    math::CovarianceOptions options;
    options.mode = math::CovarianceMode::kSample;
    options.channelCount = recording->info.channelCount;

    auto cov = math::covariance(recording->samples, options);
    REQUIRE(cov.has_value());
    REQUIRE_THAT((*cov)(0, 0), WithinAbs(5.0 / 3.0, 1e-12));
    REQUIRE_THAT((*cov)(1, 1), WithinAbs(20.0 / 3.0, 1e-12));
    REQUIRE_THAT((*cov)(0, 1), WithinAbs(-10.0 / 3.0, 1e-12));
}
