// File: src/calibration/temperature_calibrator.cpp
#include "calibration/temperature_calibrator.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace kte {

namespace {

// log(1 + e^x) without overflow
double Softplus(double x) {
    return std::max(x, 0.0) + std::log1p(std::exp(-std::abs(x)));
}

const double kInvGoldenRatio = (std::sqrt(5.0) - 1.0) / 2.0;

} // namespace

std::vector<std::string> TemperatureCalibrator::Config::GetValidationErrors() const {
    std::vector<std::string> errors;
    if (!std::isfinite(min_temperature) || min_temperature <= 0.0) {
        errors.push_back("min_temperature must be greater than 0");
    }
    if (!std::isfinite(max_temperature) || !(max_temperature > min_temperature)) {
        errors.push_back("max_temperature must be greater than min_temperature");
    }
    if (max_iterations == 0) {
        errors.push_back("max_iterations must be greater than 0");
    }
    if (!std::isfinite(tolerance) || tolerance <= 0.0) {
        errors.push_back("tolerance must be greater than 0");
    }
    if (ece_bins == 0) {
        errors.push_back("ece_bins must be greater than 0");
    }
    return errors;
}

TemperatureCalibrator::TemperatureCalibrator()
    : TemperatureCalibrator(Config())
{
}

TemperatureCalibrator::TemperatureCalibrator(const Config& config)
    : config_(config)
{
    auto errors = config_.GetValidationErrors();
    if (!errors.empty()) {
        throw ConfigurationError::FromMessages("Invalid calibration configuration", errors);
    }
}

// ============================================================================
// Fitting
// ============================================================================

TemperatureCalibrator::Fit TemperatureCalibrator::FitTemperature(
    const std::vector<double>& logits,
    const std::vector<int>& labels
) const {
    ValidateInput(logits, labels);

    Fit fit;
    fit.sample_count = labels.size();
    fit.positive_count = static_cast<size_t>(std::count(labels.begin(), labels.end(), 1));
    if (fit.positive_count == 0 || fit.positive_count == labels.size()) {
        throw DegenerateCalibrationInput(
            "Calibration labels contain a single class; temperature is undefined");
    }

    auto nll_at_beta = [&](double beta) {
        return NegativeLogLikelihood(logits, labels, 1.0 / beta);
    };

    // Golden-section search over beta = 1/T
    double lo = 1.0 / config_.max_temperature;
    double hi = 1.0 / config_.min_temperature;
    double x1 = hi - kInvGoldenRatio * (hi - lo);
    double x2 = lo + kInvGoldenRatio * (hi - lo);
    double f1 = nll_at_beta(x1);
    double f2 = nll_at_beta(x2);

    size_t iteration = 0;
    while (iteration < config_.max_iterations && (hi - lo) > config_.tolerance * (1.0 + hi)) {
        if (f1 <= f2) {
            hi = x2;
            x2 = x1;
            f2 = f1;
            x1 = hi - kInvGoldenRatio * (hi - lo);
            f1 = nll_at_beta(x1);
        } else {
            lo = x1;
            x1 = x2;
            f1 = f2;
            x2 = lo + kInvGoldenRatio * (hi - lo);
            f2 = nll_at_beta(x2);
        }
        ++iteration;
    }

    // The optimum of a convex function on an interval may sit on an endpoint
    double beta = (lo + hi) / 2.0;
    double best = nll_at_beta(beta);
    const double endpoints[] = {1.0 / config_.max_temperature, 1.0 / config_.min_temperature};
    for (double endpoint : endpoints) {
        double value = nll_at_beta(endpoint);
        if (value < best) {
            best = value;
            beta = endpoint;
        }
    }

    fit.temperature = std::clamp(1.0 / beta, config_.min_temperature, config_.max_temperature);
    fit.iterations = iteration;
    fit.at_bound = fit.temperature <= config_.min_temperature * (1.0 + 1e-6) ||
                   fit.temperature >= config_.max_temperature * (1.0 - 1e-6);

    fit.nll_before = NegativeLogLikelihood(logits, labels, 1.0);
    fit.nll_after = NegativeLogLikelihood(logits, labels, fit.temperature);
    fit.ece_before = ExpectedCalibrationError(Scaled(logits, 1.0), labels, config_.ece_bins);
    fit.ece_after = ExpectedCalibrationError(Scaled(logits, fit.temperature), labels, config_.ece_bins);
    return fit;
}

// ============================================================================
// Metrics
// ============================================================================

double TemperatureCalibrator::NegativeLogLikelihood(const std::vector<double>& logits,
                                                    const std::vector<int>& labels,
                                                    double temperature) {
    if (logits.empty()) {
        return 0.0;
    }
    double total = 0.0;
    for (size_t i = 0; i < logits.size(); ++i) {
        double z = logits[i] / temperature;
        // -log(sigmoid(z)) = softplus(-z); -log(1 - sigmoid(z)) = softplus(z)
        total += labels[i] == 1 ? Softplus(-z) : Softplus(z);
    }
    return total / static_cast<double>(logits.size());
}

double TemperatureCalibrator::ExpectedCalibrationError(const std::vector<double>& probabilities,
                                                       const std::vector<int>& labels,
                                                       size_t bins) {
    if (probabilities.empty() || bins == 0) {
        return 0.0;
    }

    std::vector<double> confidence_sum(bins, 0.0);
    std::vector<double> accuracy_sum(bins, 0.0);
    std::vector<size_t> counts(bins, 0);

    for (size_t i = 0; i < probabilities.size(); ++i) {
        double p = probabilities[i];
        double confidence = std::max(p, 1.0 - p);
        int predicted = p >= 0.5 ? 1 : 0;

        // Confidence lies in [0.5, 1]; bins partition [0, 1] as usual
        size_t bin = std::min(bins - 1, static_cast<size_t>(confidence * bins));
        confidence_sum[bin] += confidence;
        accuracy_sum[bin] += predicted == labels[i] ? 1.0 : 0.0;
        ++counts[bin];
    }

    double ece = 0.0;
    double n = static_cast<double>(probabilities.size());
    for (size_t b = 0; b < bins; ++b) {
        if (counts[b] == 0) {
            continue;
        }
        double avg_confidence = confidence_sum[b] / counts[b];
        double avg_accuracy = accuracy_sum[b] / counts[b];
        ece += std::abs(avg_confidence - avg_accuracy) * (counts[b] / n);
    }
    return ece;
}

double TemperatureCalibrator::Sigmoid(double z) {
    if (z >= 0.0) {
        return 1.0 / (1.0 + std::exp(-z));
    }
    double e = std::exp(z);
    return e / (1.0 + e);
}

double TemperatureCalibrator::Logit(double p, double epsilon) {
    double clamped = std::clamp(p, epsilon, 1.0 - epsilon);
    return std::log(clamped / (1.0 - clamped));
}

// ============================================================================
// Helpers
// ============================================================================

void TemperatureCalibrator::ValidateInput(const std::vector<double>& logits,
                                          const std::vector<int>& labels) {
    if (logits.size() != labels.size()) {
        std::ostringstream oss;
        oss << "logits and labels must have the same length (" << logits.size()
            << " != " << labels.size() << ")";
        throw ValidationError(oss.str());
    }
    if (logits.empty()) {
        throw ValidationError("calibration requires at least one (logit, label) pair");
    }
    for (size_t i = 0; i < logits.size(); ++i) {
        if (!std::isfinite(logits[i])) {
            throw ValidationError("logit at index " + std::to_string(i) + " is not finite");
        }
        if (labels[i] != 0 && labels[i] != 1) {
            throw ValidationError("label at index " + std::to_string(i) + " must be 0 or 1");
        }
    }
}

std::vector<double> TemperatureCalibrator::Scaled(const std::vector<double>& logits,
                                                  double temperature) {
    std::vector<double> probabilities;
    probabilities.reserve(logits.size());
    for (double z : logits) {
        probabilities.push_back(Sigmoid(z / temperature));
    }
    return probabilities;
}

} // namespace kte
