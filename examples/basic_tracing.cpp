// File: examples/basic_tracing.cpp
//
// Basic usage example for the knowledge-tracing engine.
// Demonstrates:
// - Configuring concept parameters and a transfer graph
// - Processing answers with behavioural signals
// - Reading back knowledge states
// - Allocating time for the next question on desktop and mobile

#include "config/engine_config.hpp"
#include "engine/tracing_engine.hpp"
#include "storage/memory_store.hpp"
#include <iomanip>
#include <iostream>
#include <vector>

using namespace kte;

/// Build an answer for one student on one concept
InteractionRequest MakeAnswer(const std::string& student, const std::string& concept_id,
                              bool correct, int64_t response_ms) {
    InteractionRequest request;
    request.student_id = student;
    request.question_id = concept_id + "_" + std::to_string(response_ms);
    request.concept_ids = {concept_id};
    request.correct = correct;
    request.response_time_ms = response_ms;
    request.context.exam_code = "JEE_Mains";
    request.context.subject = "physics";
    request.context.signals.expected_time_ms = 60000;
    return request;
}

int main() {
    std::cout << "=== Knowledge Tracing Basic Example ===\n\n";

    // Step 1: Configure the engine
    std::cout << "Step 1: Configuring the engine...\n";
    EngineConfig config = EngineConfig::Default();
    config.transfer_graph["kinematics"]["dynamics"] = 0.6;
    config.transfer_graph["dynamics"]["work_energy"] = 0.5;

    MemoryStore store;
    TracingEngine engine(config, store, store, store, &store);
    std::cout << "  Transfer edges: " << engine.GetTransferGraph().GetEdgeCount() << "\n";
    std::cout << "  Default exam: " << config.engine.default_exam << "\n\n";

    // Step 2: Store parameters for one concept
    std::cout << "Step 2: Storing concept parameters...\n";
    ConceptParameters kinematics = config.DefaultParameters("kinematics");
    kinematics.learn_rate = 0.35;
    kinematics.slip_rate = 0.08;
    kinematics.guess_rate = 0.2;
    if (store.PutParameters(kinematics, std::chrono::milliseconds(100)) != StoreStatus::OK) {
        std::cerr << "Failed to store parameters for kinematics\n";
        return 1;
    }
    std::cout << "  kinematics: learn " << kinematics.learn_rate << ", slip " << kinematics.slip_rate
              << ", guess " << kinematics.guess_rate << "\n\n";

    // Step 3: Process a short answer sequence
    std::cout << "Step 3: Processing answers...\n";
    std::vector<std::pair<bool, int64_t>> answers = {
        {true, 52000}, {false, 75000}, {true, 48000}, {true, 41000}, {true, 39000},
    };

    std::cout << std::fixed << std::setprecision(4);
    for (const auto& [correct, response_ms] : answers) {
        auto result = engine.ProcessInteraction(MakeAnswer("asha", "kinematics", correct, response_ms));
        const MasteryOutcome& outcome = result.outcomes.front();
        std::cout << "  " << (correct ? "correct  " : "incorrect") << " " << response_ms << " ms: "
                  << outcome.previous_mastery << " -> " << outcome.new_mastery
                  << " (stress " << result.assessment.stress << ")\n";
        for (const auto& transfer : outcome.transfers) {
            std::cout << "      transfer to " << transfer.concept_id << ": "
                      << transfer.previous_mastery << " -> " << transfer.new_mastery << "\n";
        }
    }
    std::cout << "\n";

    // Step 4: Read the stored states
    std::cout << "Step 4: Knowledge states...\n";
    for (const char* concept_id : {"kinematics", "dynamics", "work_energy"}) {
        auto state = engine.GetMastery("asha", concept_id);
        if (state.Ok()) {
            std::cout << "  " << std::left << std::setw(12) << concept_id << std::right
                      << state.value->mastery_probability << " (practice "
                      << state.value->practice_count << ")\n";
        } else {
            std::cout << "  " << std::left << std::setw(12) << concept_id << std::right
                      << "no state\n";
        }
    }
    std::cout << "\n";

    // Step 5: Allocate time for the next question
    std::cout << "Step 5: Allocating time for the next question...\n";
    QuestionMetadata question;
    question.question_id = "dyn_01";
    question.concept_id = "dynamics";
    question.difficulty = 0.8;
    question.base_time_ms = 90000;
    question.solution_steps = 4;
    question.prerequisite_ids = {"kinematics"};

    InteractionContext desktop;
    InteractionContext mobile;
    mobile.signals.device.type = DeviceType::MOBILE;
    mobile.signals.device.screen = ScreenClass::SMALL;
    mobile.signals.device.network = NetworkQuality::MEDIUM;

    for (const char* exam : {"NEET", "JEE_Mains", "JEE_Advanced"}) {
        auto on_desktop = engine.AllocateTime("asha", question, exam, desktop);
        auto on_mobile = engine.AllocateTime("asha", question, exam, mobile);
        std::cout << "  " << std::left << std::setw(13) << exam << std::right
                  << "desktop " << on_desktop.FinalTimeMs() << " ms, mobile "
                  << on_mobile.FinalTimeMs() << " ms (cap "
                  << on_desktop.allocation.time_cap_ms << " ms)\n";
    }
    std::cout << "\n";

    // Step 6: Engine statistics
    std::cout << "Step 6: Engine statistics:\n";
    auto stats = engine.GetStats();
    std::cout << "  Interactions: " << stats.interactions << "\n";
    std::cout << "  Mastery updates: " << stats.mastery_updates << "\n";
    std::cout << "  Transfer updates: " << stats.transfer_updates << "\n";
    std::cout << "  Time allocations: " << stats.time_allocations << "\n";
    std::cout << "  Events logged: " << store.EventCount() << "\n\n";

    std::cout << "=== Example completed successfully ===\n";

    return 0;
}
