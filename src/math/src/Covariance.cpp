/**
 * @file Covariance.cpp
 * @brief Implementation of the covariance estimator.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#include "spx/math/Covariance.hpp"

#include <string>

namespace spx::math {

namespace {

core::ExpectedVoid validateShape(SampleMatrixView data, const CovarianceOptions &options)
{
    const auto channels = static_cast<core::usize>(data.rows());
    const auto samples = static_cast<core::usize>(data.cols());

    if (channels == 0)
        return core::makeError(core::ErrorCode::kConfigError, "covariance requires at least one channel");

    if (options.channelCount && *options.channelCount != channels) {
        return core::makeError(core::ErrorCode::kConfigError,
            "expected " + std::to_string(*options.channelCount) + " channels (rows), got " +
            std::to_string(channels) + "x" + std::to_string(samples));
    }

    if (options.strictOrientation && samples < channels) {
        return core::makeError(core::ErrorCode::kConfigError,
            "matrix has fewer samples than channels (" + std::to_string(channels) + "x" +
            std::to_string(samples) + "), rows must be channels");
    }
    return {};
}

core::Expected<core::f64> divisor(core::usize samples, CovarianceMode mode)
{
    const core::usize offset = mode == CovarianceMode::kSample ? 1 : 0;

    if (samples <= offset) {
        return core::makeError(core::ErrorCode::kDegenerateInput,
            std::string(covarianceModeName(mode)) + " covariance needs more than " +
            std::to_string(offset) + " samples, got " + std::to_string(samples));
    }
    return static_cast<core::f64>(samples - offset);
}

} // namespace

core::Expected<Eigen::MatrixXd> covariance(SampleMatrixView data, CovarianceMode mode)
{
    return covariance(data, CovarianceOptions{.mode = mode});
}

core::Expected<Eigen::MatrixXd> covariance(SampleMatrixView data, const CovarianceOptions &options)
{
    SPX_TRY_VOID(validateShape(data, options));
    const core::f64 d = SPX_TRY(divisor(static_cast<core::usize>(data.cols()), options.mode));

    const Eigen::VectorXd mean = data.rowwise().mean();
    const Eigen::MatrixXd centered = data.colwise() - mean;

    const Eigen::Index p = data.rows();
    Eigen::MatrixXd lower = Eigen::MatrixXd::Zero(p, p);
    lower.selfadjointView<Eigen::Lower>().rankUpdate(centered, 1.0 / d);

    // Mirroring the lower triangle makes the result symmetric bit for bit.
    Eigen::MatrixXd cov = lower.selfadjointView<Eigen::Lower>();
    return cov;
}

core::Expected<Eigen::VectorXd> channelVariance(SampleMatrixView data, CovarianceMode mode)
{
    SPX_TRY_VOID(validateShape(data, CovarianceOptions{.mode = mode}));
    const core::f64 d = SPX_TRY(divisor(static_cast<core::usize>(data.cols()), mode));

    const Eigen::VectorXd mean = data.rowwise().mean();
    Eigen::VectorXd variance = (data.colwise() - mean).rowwise().squaredNorm() / d;
    return variance;
}

} // namespace spx::math
