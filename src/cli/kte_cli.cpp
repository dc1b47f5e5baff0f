// File: src/cli/kte_cli.cpp
//
// Command-line driver of the knowledge-tracing engine
//
// Features:
// - Answer ingestion through the full interaction pipeline
// - Time allocation for the next question
// - Calibration fitting from inline samples or from the event log
// - Fairness sampling and reports
// - Snapshot persistence of calibration and fairness state

#include "cli/kte_cli.hpp"
#include "core/errors.hpp"
#include <iomanip>
#include <iostream>
#include <sstream>

namespace kte {

// ============================================================================
// Parsing helpers
// ============================================================================

double ParseNumber(const std::string& token, const char* what) {
    try {
        size_t consumed = 0;
        double value = std::stod(token, &consumed);
        if (consumed != token.size()) {
            throw ValidationError(std::string(what) + ": trailing characters in '" + token + "'");
        }
        return value;
    } catch (const std::logic_error&) {
        throw ValidationError(std::string(what) + ": '" + token + "' is not a number");
    }
}

bool ParseOutcome(const std::string& token) {
    if (token == "1" || token == "true" || token == "correct" || token == "y") {
        return true;
    }
    if (token == "0" || token == "false" || token == "incorrect" || token == "n") {
        return false;
    }
    throw ValidationError("outcome must be correct or incorrect, got '" + token + "'");
}

std::vector<std::string> SplitList(const std::string& text) {
    std::vector<std::string> parts;
    std::istringstream iss(text);
    std::string part;
    while (std::getline(iss, part, ',')) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

// ============================================================================
// KteCli
// ============================================================================

KteCli::KteCli(const EngineConfig& config, std::ostream& out)
    : config_(config), out_(out), verbose_(config.engine.verbose) {

    if (config_.storage.backend == "sqlite") {
        SqliteStore::Config store_config;
        store_config.db_path = config_.storage.db_path;
        store_config.enable_wal = config_.storage.enable_wal;
        store_config.synchronous = config_.storage.synchronous;
        store_config.busy_timeout_ms = config_.storage.busy_timeout_ms;
        sqlite_ = std::make_unique<SqliteStore>(store_config);

        parameter_store_ = sqlite_.get();
        state_store_ = sqlite_.get();
        event_log_ = sqlite_.get();
        snapshot_store_ = sqlite_.get();
    } else {
        memory_ = std::make_unique<MemoryStore>();

        parameter_store_ = memory_.get();
        state_store_ = memory_.get();
        event_log_ = memory_.get();
        snapshot_store_ = memory_.get();
    }

    engine_ = std::make_unique<TracingEngine>(config_, *parameter_store_, *state_store_,
                                              *event_log_, snapshot_store_);

    // A durable backend carries calibration and fairness state across sessions
    if (sqlite_ && !engine_->RestoreSnapshots()) {
        std::cerr << "[KteCli] Warning: could not restore snapshots from "
                  << config_.storage.db_path << std::endl;
    }
}

KteCli::~KteCli() = default;

void KteCli::Run(std::istream& in) {
    out_ << "Knowledge-tracing engine (" << config_.storage.backend << " storage, default exam "
         << config_.engine.default_exam << ")\n";
    out_ << "Type '/help' for available commands.\n\n";

    std::string line;
    while (running_) {
        out_ << prompt_ << std::flush;
        if (!std::getline(in, line)) {
            break;
        }
        ProcessCommand(line);
    }

    if (sqlite_) {
        Save();
    }
}

void KteCli::ProcessCommand(const std::string& input) {
    std::istringstream iss(input);
    std::string command;
    iss >> command;
    if (command.empty()) return;

    if (command[0] != '/') {
        out_ << "Commands start with '/'. Type '/help' for available commands.\n";
        return;
    }

    std::vector<std::string> args;
    std::string token;
    while (iss >> token) {
        args.push_back(token);
    }

    ++commands_;
    try {
        HandleCommand(command.substr(1), args);
    } catch (const EngineError& e) {
        ++errors_;
        out_ << "Error: " << e.what() << "\n";
    }
}

void KteCli::HandleCommand(const std::string& command, const std::vector<std::string>& args) {
    if (command == "help") {
        ShowHelp();
    } else if (command == "answer") {
        Answer(args);
    } else if (command == "time") {
        AllocateTime(args);
    } else if (command == "mastery") {
        ShowMastery(args);
    } else if (command == "params") {
        SetParameters(args);
    } else if (command == "sample") {
        RecordSample(args);
    } else if (command == "fairness") {
        ShowFairness(args);
    } else if (command == "fit") {
        Fit(args);
    } else if (command == "fitlog") {
        FitFromLog(args);
    } else if (command == "calibrate") {
        Calibrate(args);
    } else if (command == "stats") {
        ShowStatistics();
    } else if (command == "save") {
        Save();
    } else if (command == "load") {
        Load();
    } else if (command == "config") {
        ShowConfig();
    } else if (command == "verbose") {
        verbose_ = !verbose_;
        out_ << "Verbose mode: " << (verbose_ ? "ON" : "OFF") << "\n";
    } else if (command == "quit" || command == "exit") {
        running_ = false;
    } else {
        out_ << "Unknown command: /" << command << "\n";
        out_ << "Type '/help' for available commands.\n";
    }
}

void KteCli::ShowHelp() {
    out_ << R"(
Available Commands:
===================

Tracing:
  /answer <student> <c1[,c2..]> <correct|incorrect> [ms] [exam] [subject] [group] [device]
                      Apply one answer and log it
  /mastery <student> <concept>
                      Show the stored knowledge state
  /params <concept> <prior> <learn> <slip> <guess> [forgetting]
                      Store the parameters of a concept

Pacing:
  /time <student> <concept> <difficulty> <base_ms> [exam] [device]
                      Allocate time for the next question

Calibration:
  /fit <exam> <subject> <logit:label> ...
                      Fit a temperature from inline samples
  /fitlog <exam> <subject>
                      Fit a temperature from the event log
  /calibrate <exam> <subject> <probability>
                      Apply the fitted temperature

Fairness:
  /sample <exam> <subject> <group> <outcome>
                      Record one outcome in [0,1] for a group
  /fairness <exam> <subject>
                      Show group averages, disparity and recommendations

Session:
  /stats              Show engine counters
  /config             Print the active configuration as YAML
  /save               Persist calibration and fairness state
  /load               Restore calibration and fairness state
  /verbose            Toggle verbose output
  /help               Show this help
  /quit               Exit the program

Examples:
  /answer s1 kinematics correct 42000 JEE_Mains physics urban mobile
  /time s1 kinematics 0.8 120000 NEET
  /fit JEE_Mains physics 2.0:1 1.5:1 -0.3:0 0.8:0

)";
}

// ============================================================================
// Tracing
// ============================================================================

void KteCli::Answer(const std::vector<std::string>& args) {
    RequireArgs(args, 3, "/answer <student> <c1[,c2..]> <correct|incorrect> [ms] [exam] "
                         "[subject] [group] [device]");

    InteractionRequest request;
    request.student_id = args[0];
    request.concept_ids = SplitList(args[1]);
    request.correct = ParseOutcome(args[2]);
    if (args.size() > 3) {
        request.response_time_ms = static_cast<int64_t>(ParseNumber(args[3], "response time"));
    }
    request.context.exam_code = ArgOr(args, 4, "");
    request.context.subject = ArgOr(args, 5, "");
    request.context.group = ArgOr(args, 6, "");
    if (args.size() > 7) {
        try {
            request.context.signals.device.type = ParseDeviceType(args[7]);
        } catch (const std::invalid_argument& e) {
            throw ValidationError(e.what());
        }
    }

    InteractionResult result = engine_->ProcessInteraction(request);

    out_ << std::fixed << std::setprecision(4);
    for (const auto& outcome : result.outcomes) {
        out_ << outcome.concept_id << ": " << outcome.previous_mastery << " -> "
             << outcome.new_mastery << " (P(correct) " << outcome.predicted_correct
             << ", practice " << outcome.practice_count << ")";
        if (outcome.entered_recovery) {
            out_ << " [entered recovery]";
        } else if (outcome.recovery) {
            out_ << " [recovery]";
        }
        out_ << "\n";
        for (const auto& transfer : outcome.transfers) {
            out_ << "  transfer " << transfer.concept_id << " (w=" << transfer.weight << "): "
                 << transfer.previous_mastery << " -> " << transfer.new_mastery << "\n";
        }
        if (verbose_) {
            for (const auto& note : outcome.degradations) {
                out_ << "  degraded: " << note << "\n";
            }
        }
    }
    out_ << "stress " << result.assessment.stress << ", load " << result.assessment.total_load
         << ", score " << std::setprecision(1) << result.score;
    if (result.event_id > 0) {
        out_ << ", event #" << result.event_id;
    }
    if (result.degraded) {
        out_ << " (degraded)";
    }
    out_ << "\n";
    if (verbose_) {
        for (const auto& recommendation : result.assessment.recommendations) {
            out_ << "  - " << recommendation << "\n";
        }
    }
}

void KteCli::ShowMastery(const std::vector<std::string>& args) {
    RequireArgs(args, 2, "/mastery <student> <concept>");

    auto result = engine_->GetMastery(args[0], args[1]);
    if (result.status == StoreStatus::NOT_FOUND) {
        out_ << "No state for " << args[0] << "/" << args[1] << "\n";
        return;
    }
    const KnowledgeState& state = Require(result, "knowledge state");

    out_ << std::fixed << std::setprecision(4);
    out_ << state.student_id << "/" << state.concept_id << "\n";
    out_ << "  Mastery: " << state.mastery_probability << "\n";
    out_ << "  Practice count: " << state.practice_count << "\n";
    out_ << "  Consecutive incorrect: " << state.consecutive_incorrect << "\n";
    out_ << "  Recovery: " << (state.in_recovery ? "yes" : "no") << "\n";
    out_ << "  Last practiced: " << state.last_practiced.ToString() << "\n";
}

void KteCli::SetParameters(const std::vector<std::string>& args) {
    RequireArgs(args, 5, "/params <concept> <prior> <learn> <slip> <guess> [forgetting]");

    ConceptParameters params = config_.DefaultParameters(args[0]);
    params.initial_mastery = ParseNumber(args[1], "prior");
    params.learn_rate = ParseNumber(args[2], "learn rate");
    params.slip_rate = ParseNumber(args[3], "slip rate");
    params.guess_rate = ParseNumber(args[4], "guess rate");
    if (args.size() > 5) {
        params.forgetting_rate = ParseNumber(args[5], "forgetting rate");
    }

    auto errors = params.GetValidationErrors();
    if (!errors.empty()) {
        throw ConfigurationError::FromMessages("Invalid parameters for '" + args[0] + "'", errors);
    }

    StoreStatus status = parameter_store_->PutParameters(
        params, std::chrono::milliseconds(config_.storage.busy_timeout_ms));
    if (status != StoreStatus::OK) {
        throw EngineError(std::string("storing parameters failed: ") + ToString(status));
    }
    out_ << "Stored parameters for " << args[0] << "\n";
}

// ============================================================================
// Pacing
// ============================================================================

void KteCli::AllocateTime(const std::vector<std::string>& args) {
    RequireArgs(args, 4, "/time <student> <concept> <difficulty> <base_ms> [exam] [device]");

    QuestionMetadata question;
    question.question_id = "cli";
    question.concept_id = args[1];
    question.difficulty = ParseNumber(args[2], "difficulty");
    question.base_time_ms = static_cast<int64_t>(ParseNumber(args[3], "base time"));

    std::string exam_code = ArgOr(args, 4, config_.engine.default_exam);

    InteractionContext context;
    if (args.size() > 5) {
        try {
            context.signals.device.type = ParseDeviceType(args[5]);
        } catch (const std::invalid_argument& e) {
            throw ValidationError(e.what());
        }
    }

    TimeAllocation result = engine_->AllocateTime(args[0], question, exam_code, context);
    const auto& allocation = result.allocation;

    out_ << "Allocated " << allocation.final_time_ms << " ms for " << allocation.exam_code
         << " (cap " << allocation.time_cap_ms << " ms" << (allocation.capped ? ", capped" : "")
         << ")\n";
    out_ << std::fixed << std::setprecision(3);
    out_ << "  factor " << allocation.factor << " (raw " << allocation.raw_factor
         << "), mastery " << result.mastery << "\n";
    if (verbose_) {
        for (const auto& entry : allocation.breakdown) {
            out_ << "  " << entry.first << ": " << entry.second << "\n";
        }
    }
}

// ============================================================================
// Calibration
// ============================================================================

void KteCli::Fit(const std::vector<std::string>& args) {
    RequireArgs(args, 3, "/fit <exam> <subject> <logit:label> ...");

    std::vector<double> logits;
    std::vector<int> labels;
    for (size_t i = 2; i < args.size(); ++i) {
        size_t colon = args[i].find(':');
        if (colon == std::string::npos) {
            throw ValidationError("sample '" + args[i] + "' is not logit:label");
        }
        logits.push_back(ParseNumber(args[i].substr(0, colon), "logit"));
        double label = ParseNumber(args[i].substr(colon + 1), "label");
        if (label != 0.0 && label != 1.0) {
            throw ValidationError("label must be 0 or 1, got '" + args[i].substr(colon + 1) + "'");
        }
        labels.push_back(static_cast<int>(label));
    }

    PrintCalibration(engine_->FitCalibration(args[0], args[1], logits, labels));
}

void KteCli::FitFromLog(const std::vector<std::string>& args) {
    RequireArgs(args, 2, "/fitlog <exam> <subject>");
    PrintCalibration(engine_->FitCalibrationFromLog(args[0], args[1]));
}

void KteCli::Calibrate(const std::vector<std::string>& args) {
    RequireArgs(args, 3, "/calibrate <exam> <subject> <probability>");

    double raw = ParseNumber(args[2], "probability");
    double calibrated = engine_->ApplyCalibration(args[0], args[1], raw);
    out_ << std::fixed << std::setprecision(4);
    out_ << "Calibrated " << raw << " -> " << calibrated << " (T="
         << engine_->GetCalibrationTable().GetTemperature(args[0], args[1]) << ")\n";
}

void KteCli::PrintCalibration(const CalibrationEntry& entry) {
    out_ << std::fixed << std::setprecision(4);
    out_ << "Temperature for " << entry.exam_code << "/" << entry.subject << ": "
         << entry.temperature << " over " << entry.sample_count << " samples\n";
    out_ << "  NLL " << entry.nll_before << " -> " << entry.nll_after << "\n";
    out_ << "  ECE " << entry.ece_before << " -> " << entry.ece_after << "\n";
}

// ============================================================================
// Fairness
// ============================================================================

void KteCli::RecordSample(const std::vector<std::string>& args) {
    RequireArgs(args, 4, "/sample <exam> <subject> <group> <outcome>");
    engine_->RecordFairnessSample(args[0], args[1], args[2], ParseNumber(args[3], "outcome"));
    out_ << "Recorded\n";
}

void KteCli::ShowFairness(const std::vector<std::string>& args) {
    std::string exam_code = ArgOr(args, 0, "");
    std::string subject = ArgOr(args, 1, "");

    FairnessReport report = engine_->GetFairnessReport(exam_code, subject);

    out_ << "Fairness " << report.exam_code << "/" << report.subject << "\n";
    out_ << std::fixed << std::setprecision(4);
    if (report.groups.empty()) {
        out_ << "  No samples\n";
    }
    for (const auto& group : report.groups) {
        out_ << "  " << std::left << std::setw(16) << group.group << std::right
             << group.average << " (" << group.sample_count << " samples"
             << (group.included ? "" : ", excluded") << ")\n";
    }
    out_ << "  Disparity: " << report.disparity << (report.flagged ? " [FLAGGED]" : "") << "\n";
    for (const auto& recommendation : report.recommendations) {
        out_ << "  - " << recommendation << "\n";
    }
}

// ============================================================================
// Session
// ============================================================================

void KteCli::ShowStatistics() {
    EngineStats stats = engine_->GetStats();

    out_ << "\nEngine Statistics\n";
    out_ << "=================\n\n";

    out_ << "Activity:\n";
    out_ << "  Interactions: " << stats.interactions << "\n";
    out_ << "  Mastery updates: " << stats.mastery_updates << "\n";
    out_ << "  Transfer updates: " << stats.transfer_updates << "\n";
    out_ << "  Time allocations: " << stats.time_allocations << "\n";
    out_ << "  Events appended: " << stats.events_appended << "\n";
    out_ << "  Recoveries entered: " << stats.recoveries_entered << "\n";
    out_ << "  Calibration fits: " << stats.calibration_fits << "\n";
    out_ << "  Fairness samples: " << stats.fairness_samples << "\n\n";

    out_ << "Degradation:\n";
    out_ << "  Parameter timeouts: " << stats.parameter_timeouts << "\n";
    out_ << "  State read timeouts: " << stats.state_read_timeouts << "\n";
    out_ << "  State write timeouts: " << stats.state_write_timeouts << "\n";
    out_ << "  Event timeouts: " << stats.event_timeouts << "\n";
    out_ << "  Store failures: " << stats.store_failures << "\n";
    out_ << "  Last-known fallbacks: " << stats.last_known_fallbacks << "\n";
    out_ << "  Default fallbacks: " << stats.default_fallbacks << "\n\n";

    out_ << "Storage:\n";
    out_ << "  Backend: " << config_.storage.backend << "\n";
    if (sqlite_) {
        out_ << "  Database: " << config_.storage.db_path << "\n";
        out_ << "  SQL errors: " << sqlite_->GetErrorCount() << "\n";
    }
    out_ << "  Knowledge states: " << state_store_->StateCount() << "\n";
    out_ << "  Events: " << event_log_->EventCount() << "\n\n";
}

void KteCli::Save() {
    if (engine_->PersistSnapshots()) {
        out_ << "Saved calibration and fairness state\n";
    } else {
        ++errors_;
        out_ << "Save failed\n";
    }
}

void KteCli::Load() {
    if (engine_->RestoreSnapshots()) {
        out_ << "Restored " << engine_->GetCalibrationTable().Size() << " calibration entries\n";
    } else {
        ++errors_;
        out_ << "Load failed\n";
    }
}

void KteCli::ShowConfig() {
    out_ << config_.ToYamlString();
}

// ============================================================================
// Utilities
// ============================================================================

void KteCli::RequireArgs(const std::vector<std::string>& args, size_t count, const char* usage) {
    if (args.size() < count) {
        throw ValidationError(std::string("usage: ") + usage);
    }
}

std::string KteCli::ArgOr(const std::vector<std::string>& args, size_t index,
                          const std::string& fallback) {
    return index < args.size() ? args[index] : fallback;
}

} // namespace kte
