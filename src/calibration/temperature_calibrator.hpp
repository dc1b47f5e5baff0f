// File: src/calibration/temperature_calibrator.hpp
#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace kte {

/// TemperatureCalibrator: Fits a temperature for binary logits
///
/// Calibrated probability: sigmoid(z / T). The fitted T minimises the mean
/// negative log-likelihood of the labels. The NLL is convex in β = 1/T, so a
/// golden-section search over β ∈ [1/max_temperature, 1/min_temperature]
/// finds the constrained optimum. Perfectly separable data drives T toward
/// min_temperature and the fit stops there with a finite value.
///
/// Stateless apart from configuration; thread-safe.
class TemperatureCalibrator {
public:
    /// Configuration for fitting
    struct Config {
        Config() = default;
        double min_temperature{0.05};
        double max_temperature{20.0};
        size_t max_iterations{200};
        double tolerance{1e-9};
        size_t ece_bins{10};

        std::vector<std::string> GetValidationErrors() const;
    };

    /// Outcome of a fit
    struct Fit {
        double temperature{1.0};
        size_t sample_count{0};
        size_t positive_count{0};
        double nll_before{0.0};  // at T = 1
        double nll_after{0.0};
        double ece_before{0.0};
        double ece_after{0.0};
        bool at_bound{false};    // optimum hit min or max temperature
        size_t iterations{0};
    };

    /// @throws ConfigurationError if the configuration is invalid
    TemperatureCalibrator();
    explicit TemperatureCalibrator(const Config& config);

    /// Fit a temperature to (logit, label) pairs
    /// @param logits Raw model logits
    /// @param labels Observed outcomes, each 0 or 1
    /// @throws ValidationError on empty input, length mismatch, non-finite
    ///         logits or labels other than 0/1
    /// @throws DegenerateCalibrationInput if all labels are the same class
    Fit FitTemperature(const std::vector<double>& logits, const std::vector<int>& labels) const;

    /// Mean binary negative log-likelihood of sigmoid(z / T)
    static double NegativeLogLikelihood(const std::vector<double>& logits,
                                        const std::vector<int>& labels,
                                        double temperature);

    /// Expected calibration error of binary predictions
    /// Confidence is max(p, 1 - p); accuracy is (p >= 0.5) == label.
    static double ExpectedCalibrationError(const std::vector<double>& probabilities,
                                           const std::vector<int>& labels,
                                           size_t bins);

    static double Sigmoid(double z);

    /// log(p / (1 - p)) with p clamped away from 0 and 1
    static double Logit(double p, double epsilon = 1e-12);

    const Config& GetConfig() const { return config_; }

private:
    Config config_;

    static void ValidateInput(const std::vector<double>& logits, const std::vector<int>& labels);
    static std::vector<double> Scaled(const std::vector<double>& logits, double temperature);
};

} // namespace kte
