// File: examples/calibration_fairness.cpp
//
// Calibration and fairness example for the knowledge-tracing engine.
// Demonstrates:
// - Simulating two student groups through the interaction pipeline
// - Fitting a per-exam temperature from the event log
// - Group fairness reports and recommendations
// - Persisting calibration and fairness state to SQLite

#include "config/engine_config.hpp"
#include "core/errors.hpp"
#include "engine/tracing_engine.hpp"
#include "storage/sqlite_store.hpp"
#include <cstdio>
#include <iomanip>
#include <iostream>
#include <random>

using namespace kte;

/// Print a fairness report
void PrintReport(const FairnessReport& report) {
    std::cout << "  " << report.exam_code << "/" << report.subject << "\n";
    for (const auto& group : report.groups) {
        std::cout << "    " << std::left << std::setw(8) << group.group << std::right
                  << group.average << " over " << group.sample_count << " samples\n";
    }
    std::cout << "    Disparity: " << report.disparity << (report.flagged ? " (flagged)" : "") << "\n";
    for (const auto& recommendation : report.recommendations) {
        std::cout << "    - " << recommendation << "\n";
    }
}

int main(int argc, char** argv) {
    std::string db_path = argc > 1 ? argv[1] : "calibration_fairness_example.db";

    std::cout << "=== Calibration and Fairness Example ===\n\n";

    EngineConfig config = EngineConfig::Default();
    config.storage.backend = "sqlite";
    config.storage.db_path = db_path;
    config.fairness.min_samples = 10;

    try {
        SqliteStore::Config store_config;
        store_config.db_path = db_path;
        SqliteStore store(store_config);
        TracingEngine engine(config, store, store, store, &store);

        // Step 1: Simulate two groups with different answer rates
        std::cout << "Step 1: Simulating answers for two groups...\n";
        std::mt19937 gen(7);
        std::uniform_real_distribution<double> coin(0.0, 1.0);

        struct Group {
            const char* name;
            double success_rate;
        };
        const Group groups[] = {{"urban", 0.8}, {"rural", 0.55}};

        size_t answered = 0;
        for (const auto& group : groups) {
            for (int student = 0; student < 10; ++student) {
                std::string student_id = std::string(group.name) + "_" + std::to_string(student);
                for (int question = 0; question < 8; ++question) {
                    InteractionRequest request;
                    request.student_id = student_id;
                    request.question_id = "q" + std::to_string(question);
                    request.concept_ids = {question % 2 ? "organic" : "thermodynamics"};
                    request.correct = coin(gen) < group.success_rate;
                    request.response_time_ms = 50000;
                    request.context.exam_code = "NEET";
                    request.context.subject = "chemistry";
                    request.context.group = group.name;
                    engine.ProcessInteraction(request);
                    ++answered;
                }
            }
        }
        std::cout << "  Processed " << answered << " answers, " << store.EventCount()
                  << " events in the log\n\n";

        // Step 2: Fit a temperature from the log
        std::cout << "Step 2: Fitting calibration from the event log...\n";
        std::cout << std::fixed << std::setprecision(4);
        CalibrationEntry entry = engine.FitCalibrationFromLog("NEET", "chemistry");
        std::cout << "  Temperature: " << entry.temperature << " over " << entry.sample_count
                  << " samples\n";
        std::cout << "  NLL " << entry.nll_before << " -> " << entry.nll_after << "\n";
        std::cout << "  ECE " << entry.ece_before << " -> " << entry.ece_after << "\n";
        for (double raw : {0.2, 0.5, 0.8}) {
            std::cout << "  P=" << raw << " calibrates to "
                      << engine.ApplyCalibration("NEET", "chemistry", raw) << "\n";
        }
        std::cout << "\n";

        // Step 3: Fairness report
        std::cout << "Step 3: Fairness report...\n";
        PrintReport(engine.GetFairnessReport("NEET", "chemistry"));
        std::cout << "\n";

        // Step 4: Persist
        std::cout << "Step 4: Persisting snapshots to " << db_path << "...\n";
        std::cout << "  " << (engine.PersistSnapshots() ? "Saved" : "Save failed") << "\n\n";
    } catch (const EngineError& e) {
        std::cerr << "Example failed: " << e.what() << std::endl;
        return 1;
    }

    for (const std::string& suffix : {"", "-wal", "-shm"}) {
        std::remove((db_path + suffix).c_str());
    }

    std::cout << "=== Example completed successfully ===\n";

    return 0;
}
