// File: include/config/engine_config.hpp
//
// YAML Configuration Support for the knowledge-tracing engine
// Every tunable constant of the engine is loaded from one YAML document

#ifndef KTE_ENGINE_CONFIG_HPP
#define KTE_ENGINE_CONFIG_HPP

#include "calibration/temperature_calibrator.hpp"
#include "cognitive/cognitive_estimator.hpp"
#include "core/types.hpp"
#include "fairness/fairness_monitor.hpp"
#include "pacing/exam_config.hpp"
#include "pacing/time_allocator.hpp"
#include "tracing/mastery_updater.hpp"
#include "tracing/transfer_learner.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kte {

/// Configuration structure for the engine and its command-line driver
struct EngineConfig {
    // === Engine Settings ===
    struct Engine {
        std::string default_exam = "JEE_Mains";
        std::string default_subject = "generic";
        std::string default_group = "all";
        int64_t store_timeout_ms = 50;       // per store call
        size_t lock_stripes = 64;            // per-key lock table size
        size_t parameter_cache_size = 1024;  // last-known parameters kept for timeouts
        bool verbose = false;
    } engine;

    // === Mastery Tracing ===
    struct Tracing {
        // Parameters of concepts absent from the parameter store
        double default_prior = 0.25;
        double default_learn_rate = 0.3;
        double default_slip_rate = 0.1;
        double default_guess_rate = 0.2;
        double default_forgetting_rate = 0.0;

        MasteryUpdater::Config updater;
    } tracing;

    // === Transfer Learning ===
    TransferLearner::Config transfer;

    /// source -> (target -> weight)
    std::map<std::string, std::map<std::string, double>> transfer_graph;

    // === Cognitive Load & Stress ===
    CognitiveEstimator::Config cognitive;

    // === Time Allocation ===
    TimeAllocator::Config pacing;

    /// Per-exam caps and scoring; starts with the built-in exams
    std::vector<ExamConfiguration> exams = ExamRegistry::BuiltinExams();

    // === Calibration ===
    TemperatureCalibrator::Config calibration;

    // === Fairness ===
    FairnessMonitor::Config fairness;

    // === Storage ===
    struct Storage {
        std::string backend = "memory";  // memory | sqlite
        std::string db_path = "kte.db";
        bool enable_wal = true;
        std::string synchronous = "NORMAL";
        int busy_timeout_ms = 5000;
    } storage;

    /// Load configuration from YAML file
    /// @param filepath Path to YAML configuration file
    /// @return EngineConfig if successful, std::nullopt on error
    static std::optional<EngineConfig> LoadFromFile(const std::string& filepath);

    /// Load configuration from YAML string
    /// @param yaml_content YAML content as string
    /// @return EngineConfig if successful, std::nullopt on error
    static std::optional<EngineConfig> LoadFromString(const std::string& yaml_content);

    /// Save configuration to YAML file
    /// @return true if successful, false on error
    bool SaveToFile(const std::string& filepath) const;

    /// Convert to YAML string (loads back to an equal configuration)
    std::string ToYamlString() const;

    /// Validate configuration values
    bool Validate() const;

    /// Get validation errors (if any)
    std::vector<std::string> GetValidationErrors() const;

    /// Parameters used for a concept the parameter store does not know
    ConceptParameters DefaultParameters(const std::string& concept_id) const;

    /// Create default configuration
    static EngineConfig Default();
};

} // namespace kte

#endif // KTE_ENGINE_CONFIG_HPP
