// File: src/core/errors.hpp
#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace kte {

/// Base class of every error the engine reports to its caller
class EngineError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Inconsistent configuration or concept parameters (e.g. slip + guess >= 1).
/// Fatal to the operation that hit it; never silently clamped.
class ConfigurationError : public EngineError {
public:
    using EngineError::EngineError;

    /// Build one error from a list of validation messages
    static ConfigurationError FromMessages(const std::string& context,
                                           const std::vector<std::string>& messages);
};

/// Out-of-range or malformed caller input, rejected before any mutation
class ValidationError : public EngineError {
public:
    using EngineError::EngineError;
};

/// A store did not answer within its timeout
class DependencyTimeout : public EngineError {
public:
    using EngineError::EngineError;
};

/// Calibration labels contain a single class, so no temperature is defined
class DegenerateCalibrationInput : public EngineError {
public:
    using EngineError::EngineError;
};

inline ConfigurationError ConfigurationError::FromMessages(
    const std::string& context,
    const std::vector<std::string>& messages) {
    std::string text = context;
    for (size_t i = 0; i < messages.size(); ++i) {
        text += (i == 0 ? ": " : "; ");
        text += messages[i];
    }
    return ConfigurationError(text);
}

} // namespace kte
