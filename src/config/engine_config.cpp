// File: src/config/engine_config.cpp
//
// YAML Configuration Implementation for the knowledge-tracing engine

#include "config/engine_config.hpp"
#include <yaml.h>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace kte {

// Helper function to read string from YAML scalar
static std::string GetScalarValue(yaml_event_t* event) {
    return std::string(reinterpret_cast<char*>(event->data.scalar.value),
                       event->data.scalar.length);
}

// Helper to convert string to bool
static bool ParseBool(const std::string& value) {
    return (value == "true" || value == "True" || value == "TRUE" ||
            value == "yes" || value == "Yes" || value == "YES" ||
            value == "1" || value == "on" || value == "On" || value == "ON");
}

// Whole-string numeric parsing; trailing garbage is an error
static double ParseDouble(const std::string& value) {
    size_t consumed = 0;
    double result = std::stod(value, &consumed);
    if (consumed != value.size()) {
        throw std::invalid_argument("not a number: '" + value + "'");
    }
    return result;
}

static int64_t ParseInt(const std::string& value) {
    size_t consumed = 0;
    long long result = std::stoll(value, &consumed);
    if (consumed != value.size()) {
        throw std::invalid_argument("not an integer: '" + value + "'");
    }
    return static_cast<int64_t>(result);
}

static size_t ParseSize(const std::string& value) {
    int64_t result = ParseInt(value);
    if (result < 0) {
        throw std::out_of_range("negative count: '" + value + "'");
    }
    return static_cast<size_t>(result);
}

static std::string JoinPath(const std::vector<std::string>& path) {
    std::string joined;
    for (const auto& part : path) {
        if (!joined.empty()) {
            joined += ".";
        }
        joined += part;
    }
    return joined;
}

namespace {

// Applies (path, scalar) pairs from the event stream to an EngineConfig
class ConfigBuilder {
public:
    explicit ConfigBuilder(EngineConfig& config) : config_(config) {}

    void Apply(const std::vector<std::string>& path, const std::string& value) {
        bool known = false;
        if (path.size() == 2) {
            known = ApplySection(path[0], path[1], value);
        } else if (path.size() == 3 && path[0] == "transfer_graph") {
            config_.transfer_graph[path[1]][path[2]] = ParseDouble(value);
            known = true;
        } else if (path.size() >= 3 && path[0] == "exams") {
            known = ApplyExam(path, value);
        }
        if (!known) {
            std::cerr << "Ignoring unknown configuration key: " << JoinPath(path) << std::endl;
        }
    }

    void StartList(const std::vector<std::string>& path) {
        if (path.size() == 3 && path[0] == "exams" && path[2] == "question_types") {
            Exam(path[1]).question_types.clear();
        }
    }

    void AppendToList(const std::vector<std::string>& path, const std::string& value) {
        if (path.size() == 3 && path[0] == "exams" && path[2] == "question_types") {
            Exam(path[1]).question_types.push_back(value);
            return;
        }
        std::cerr << "Ignoring unknown configuration list: " << JoinPath(path) << std::endl;
    }

private:
    EngineConfig& config_;

    ExamConfiguration& Exam(const std::string& code) {
        for (auto& exam : config_.exams) {
            if (exam.exam_code == code) {
                return exam;
            }
        }
        ExamConfiguration exam;
        exam.exam_code = code;
        config_.exams.push_back(exam);
        return config_.exams.back();
    }

    bool ApplyExam(const std::vector<std::string>& path, const std::string& value) {
        ExamConfiguration& exam = Exam(path[1]);
        const std::string& key = path[2];

        if (path.size() == 4 && key == "subject_weightings") {
            exam.subject_weightings[path[3]] = ParseDouble(value);
            return true;
        }
        if (path.size() != 3) return false;

        if (key == "time_cap_ms") exam.time_cap_ms = ParseInt(value);
        else if (key == "difficulty_factor") exam.difficulty_factor = ParseDouble(value);
        else if (key == "correct_score") exam.scoring.correct_score = ParseDouble(value);
        else if (key == "incorrect_score") exam.scoring.incorrect_score = ParseDouble(value);
        else return false;
        return true;
    }

    bool ApplySection(const std::string& section, const std::string& key, const std::string& value) {
        if (section == "engine") {
            auto& e = config_.engine;
            if (key == "default_exam") e.default_exam = value;
            else if (key == "default_subject") e.default_subject = value;
            else if (key == "default_group") e.default_group = value;
            else if (key == "store_timeout_ms") e.store_timeout_ms = ParseInt(value);
            else if (key == "lock_stripes") e.lock_stripes = ParseSize(value);
            else if (key == "parameter_cache_size") e.parameter_cache_size = ParseSize(value);
            else if (key == "verbose") e.verbose = ParseBool(value);
            else return false;
        }
        else if (section == "tracing") {
            auto& t = config_.tracing;
            auto& u = config_.tracing.updater;
            if (key == "default_prior") t.default_prior = ParseDouble(value);
            else if (key == "default_learn_rate") t.default_learn_rate = ParseDouble(value);
            else if (key == "default_slip_rate") t.default_slip_rate = ParseDouble(value);
            else if (key == "default_guess_rate") t.default_guess_rate = ParseDouble(value);
            else if (key == "default_forgetting_rate") t.default_forgetting_rate = ParseDouble(value);
            else if (key == "epsilon") u.epsilon = ParseDouble(value);
            else if (key == "recovery_floor") u.recovery_floor = ParseDouble(value);
            else if (key == "recovery_streak") u.recovery_streak = static_cast<uint32_t>(ParseSize(value));
            else if (key == "stress_slip_scale") u.stress_slip_scale = ParseDouble(value);
            else if (key == "stress_guess_scale") u.stress_guess_scale = ParseDouble(value);
            else if (key == "identifiability_margin") u.identifiability_margin = ParseDouble(value);
            else if (key == "forgetting_grace_hours") u.forgetting_grace_hours = ParseDouble(value);
            else return false;
        }
        else if (section == "transfer") {
            auto& t = config_.transfer;
            if (key == "transfer_factor") t.transfer_factor = ParseDouble(value);
            else if (key == "min_delta") t.min_delta = ParseDouble(value);
            else if (key == "seed_from_related") t.seed_from_related = ParseBool(value);
            else if (key == "seed_factor") t.seed_factor = ParseDouble(value);
            else if (key == "seed_cap") t.seed_cap = ParseDouble(value);
            else return false;
        }
        else if (section == "cognitive") {
            return ApplyCognitive(key, value);
        }
        else if (section == "pacing") {
            auto& p = config_.pacing;
            if (key == "min_factor") p.min_factor = ParseDouble(value);
            else if (key == "max_factor") p.max_factor = ParseDouble(value);
            else if (key == "stress_weight") p.stress_weight = ParseDouble(value);
            else if (key == "fatigue_weight") p.fatigue_weight = ParseDouble(value);
            else if (key == "mastery_weight") p.mastery_weight = ParseDouble(value);
            else if (key == "min_difficulty") p.min_difficulty = ParseDouble(value);
            else if (key == "session_rate_per_hour") p.session_rate_per_hour = ParseDouble(value);
            else if (key == "max_session_bonus") p.max_session_bonus = ParseDouble(value);
            else if (key == "small_screen_factor") p.small_screen_factor = ParseDouble(value);
            else if (key == "medium_network_factor") p.medium_network_factor = ParseDouble(value);
            else if (key == "low_network_factor") p.low_network_factor = ParseDouble(value);
            else if (key == "overload_factor") p.overload_factor = ParseDouble(value);
            else if (key == "recovery_factor") p.recovery_factor = ParseDouble(value);
            else return false;
        }
        else if (section == "calibration") {
            auto& c = config_.calibration;
            if (key == "min_temperature") c.min_temperature = ParseDouble(value);
            else if (key == "max_temperature") c.max_temperature = ParseDouble(value);
            else if (key == "max_iterations") c.max_iterations = ParseSize(value);
            else if (key == "tolerance") c.tolerance = ParseDouble(value);
            else if (key == "ece_bins") c.ece_bins = ParseSize(value);
            else return false;
        }
        else if (section == "fairness") {
            auto& f = config_.fairness;
            if (key == "disparity_threshold") f.disparity_threshold = ParseDouble(value);
            else if (key == "severe_disparity_threshold") f.severe_disparity_threshold = ParseDouble(value);
            else if (key == "min_samples") f.min_samples = ParseSize(value);
            else if (key == "default_exam") f.default_exam = value;
            else if (key == "default_subject") f.default_subject = value;
            else return false;
        }
        else if (section == "storage") {
            auto& s = config_.storage;
            if (key == "backend") s.backend = value;
            else if (key == "db_path") s.db_path = value;
            else if (key == "enable_wal") s.enable_wal = ParseBool(value);
            else if (key == "synchronous") s.synchronous = value;
            else if (key == "busy_timeout_ms") s.busy_timeout_ms = static_cast<int>(ParseInt(value));
            else return false;
        }
        else {
            return false;
        }
        return true;
    }

    bool ApplyCognitive(const std::string& key, const std::string& value) {
        auto& c = config_.cognitive;
        if (key == "window_size") c.window_size = ParseSize(value);
        else if (key == "rt_var_mild") c.rt_var_mild = ParseDouble(value);
        else if (key == "rt_var_moderate") c.rt_var_moderate = ParseDouble(value);
        else if (key == "rt_var_high") c.rt_var_high = ParseDouble(value);
        else if (key == "slow_ratio_mild") c.slow_ratio_mild = ParseDouble(value);
        else if (key == "slow_ratio_high") c.slow_ratio_high = ParseDouble(value);
        else if (key == "error_streak_mild") c.error_streak_mild = static_cast<uint32_t>(ParseSize(value));
        else if (key == "error_streak_high") c.error_streak_high = static_cast<uint32_t>(ParseSize(value));
        else if (key == "hesitation_mild_ms") c.hesitation_mild_ms = ParseDouble(value);
        else if (key == "hesitation_high_ms") c.hesitation_high_ms = ParseDouble(value);
        else if (key == "keystroke_threshold") c.keystroke_threshold = ParseDouble(value);
        else if (key == "fatigue_threshold") c.fatigue_threshold = ParseDouble(value);
        else if (key == "fatigue_saturation_minutes") c.fatigue_saturation_minutes = ParseDouble(value);
        else if (key == "steps_weight") c.steps_weight = ParseDouble(value);
        else if (key == "novelty_weight") c.novelty_weight = ParseDouble(value);
        else if (key == "prerequisite_weight") c.prerequisite_weight = ParseDouble(value);
        else if (key == "max_solution_steps") c.max_solution_steps = static_cast<uint32_t>(ParseSize(value));
        else if (key == "time_pressure_weight") c.time_pressure_weight = ParseDouble(value);
        else if (key == "interface_weight") c.interface_weight = ParseDouble(value);
        else if (key == "distraction_weight") c.distraction_weight = ParseDouble(value);
        else if (key == "presentation_weight") c.presentation_weight = ParseDouble(value);
        else if (key == "stress_weight") c.stress_weight = ParseDouble(value);
        else if (key == "network_weight") c.network_weight = ParseDouble(value);
        else if (key == "mobile_time_pressure_multiplier") c.mobile_time_pressure_multiplier = ParseDouble(value);
        else if (key == "mobile_interface_multiplier") c.mobile_interface_multiplier = ParseDouble(value);
        else if (key == "mobile_distraction_multiplier") c.mobile_distraction_multiplier = ParseDouble(value);
        else if (key == "mobile_presentation_multiplier") c.mobile_presentation_multiplier = ParseDouble(value);
        else if (key == "mobile_base_friction") c.mobile_base_friction = ParseDouble(value);
        else if (key == "tablet_base_friction") c.tablet_base_friction = ParseDouble(value);
        else if (key == "small_screen_friction") c.small_screen_friction = ParseDouble(value);
        else if (key == "intrinsic_share") c.intrinsic_share = ParseDouble(value);
        else if (key == "overload_threshold") c.overload_threshold = ParseDouble(value);
        else return false;
        return true;
    }
};

// One open mapping or sequence of the event stream
struct Frame {
    std::string name;
    bool is_sequence{false};
    bool expecting_key{true};
    std::string pending_key;
};

std::vector<std::string> PathOf(const std::vector<Frame>& stack, const std::string& leaf) {
    std::vector<std::string> path;
    for (size_t i = 1; i < stack.size(); ++i) {
        path.push_back(stack[i].name);
    }
    if (!leaf.empty()) {
        path.push_back(leaf);
    }
    return path;
}

} // namespace

std::optional<EngineConfig> EngineConfig::LoadFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open config file: " << filepath << std::endl;
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return LoadFromString(buffer.str());
}

std::optional<EngineConfig> EngineConfig::LoadFromString(const std::string& yaml_content) {
    yaml_parser_t parser;
    yaml_event_t event;

    if (!yaml_parser_initialize(&parser)) {
        std::cerr << "Failed to initialize YAML parser" << std::endl;
        return std::nullopt;
    }

    yaml_parser_set_input_string(&parser,
        reinterpret_cast<const unsigned char*>(yaml_content.c_str()),
        yaml_content.size());

    EngineConfig config = Default();
    ConfigBuilder builder(config);
    std::vector<Frame> stack;

    bool done = false;
    bool failed = false;
    while (!done) {
        if (!yaml_parser_parse(&parser, &event)) {
            std::cerr << "YAML parse error";
            if (parser.problem) {
                std::cerr << ": " << parser.problem << " at line " << (parser.problem_mark.line + 1);
            }
            std::cerr << std::endl;
            yaml_parser_delete(&parser);
            return std::nullopt;
        }

        try {
            switch (event.type) {
                case YAML_MAPPING_START_EVENT:
                case YAML_SEQUENCE_START_EVENT: {
                    Frame frame;
                    frame.is_sequence = event.type == YAML_SEQUENCE_START_EVENT;
                    if (!stack.empty()) {
                        frame.name = stack.back().pending_key;
                    }
                    stack.push_back(frame);
                    if (frame.is_sequence) {
                        builder.StartList(PathOf(stack, ""));
                    }
                    break;
                }

                case YAML_MAPPING_END_EVENT:
                case YAML_SEQUENCE_END_EVENT:
                    stack.pop_back();
                    if (!stack.empty()) {
                        stack.back().expecting_key = true;
                        stack.back().pending_key.clear();
                    }
                    break;

                case YAML_SCALAR_EVENT: {
                    std::string value = GetScalarValue(&event);
                    if (stack.empty()) {
                        break;  // bare scalar document
                    }
                    Frame& top = stack.back();
                    if (top.is_sequence) {
                        builder.AppendToList(PathOf(stack, ""), value);
                    } else if (top.expecting_key) {
                        top.pending_key = value;
                        top.expecting_key = false;
                    } else {
                        builder.Apply(PathOf(stack, top.pending_key), value);
                        top.expecting_key = true;
                        top.pending_key.clear();
                    }
                    break;
                }

                case YAML_STREAM_END_EVENT:
                case YAML_DOCUMENT_END_EVENT:
                    done = true;
                    break;

                default:
                    break;
            }
        } catch (const std::logic_error& e) {
            // std::invalid_argument and std::out_of_range from numeric parsing
            std::cerr << "Invalid configuration value";
            if (!stack.empty() && !stack.back().pending_key.empty()) {
                std::cerr << " for '" << JoinPath(PathOf(stack, stack.back().pending_key)) << "'";
            }
            std::cerr << ": " << e.what() << std::endl;
            failed = true;
            done = true;
        }

        yaml_event_delete(&event);
    }

    yaml_parser_delete(&parser);

    if (failed) {
        return std::nullopt;
    }

    // Validate configuration
    if (!config.Validate()) {
        std::cerr << "Configuration validation failed:" << std::endl;
        for (const auto& error : config.GetValidationErrors()) {
            std::cerr << "  - " << error << std::endl;
        }
        return std::nullopt;
    }

    return config;
}

bool EngineConfig::SaveToFile(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open file for writing: " << filepath << std::endl;
        return false;
    }

    file << ToYamlString();
    return file.good();
}

std::string EngineConfig::ToYamlString() const {
    std::ostringstream ss;
    ss << std::setprecision(15);
    auto b = [](bool v) { return v ? "true" : "false"; };

    ss << "# Knowledge-tracing engine configuration\n";
    ss << "# Auto-generated configuration file\n\n";

    ss << "engine:\n";
    ss << "  default_exam: \"" << engine.default_exam << "\"\n";
    ss << "  default_subject: \"" << engine.default_subject << "\"\n";
    ss << "  default_group: \"" << engine.default_group << "\"\n";
    ss << "  store_timeout_ms: " << engine.store_timeout_ms << "\n";
    ss << "  lock_stripes: " << engine.lock_stripes << "\n";
    ss << "  parameter_cache_size: " << engine.parameter_cache_size << "\n";
    ss << "  verbose: " << b(engine.verbose) << "\n\n";

    const auto& u = tracing.updater;
    ss << "tracing:\n";
    ss << "  default_prior: " << tracing.default_prior << "\n";
    ss << "  default_learn_rate: " << tracing.default_learn_rate << "\n";
    ss << "  default_slip_rate: " << tracing.default_slip_rate << "\n";
    ss << "  default_guess_rate: " << tracing.default_guess_rate << "\n";
    ss << "  default_forgetting_rate: " << tracing.default_forgetting_rate << "\n";
    ss << "  epsilon: " << u.epsilon << "\n";
    ss << "  recovery_floor: " << u.recovery_floor << "\n";
    ss << "  recovery_streak: " << u.recovery_streak << "\n";
    ss << "  stress_slip_scale: " << u.stress_slip_scale << "\n";
    ss << "  stress_guess_scale: " << u.stress_guess_scale << "\n";
    ss << "  identifiability_margin: " << u.identifiability_margin << "\n";
    ss << "  forgetting_grace_hours: " << u.forgetting_grace_hours << "\n\n";

    ss << "transfer:\n";
    ss << "  transfer_factor: " << transfer.transfer_factor << "\n";
    ss << "  min_delta: " << transfer.min_delta << "\n";
    ss << "  seed_from_related: " << b(transfer.seed_from_related) << "\n";
    ss << "  seed_factor: " << transfer.seed_factor << "\n";
    ss << "  seed_cap: " << transfer.seed_cap << "\n\n";

    if (transfer_graph.empty()) {
        ss << "transfer_graph: {}\n\n";
    } else {
        ss << "transfer_graph:\n";
        for (const auto& [source, targets] : transfer_graph) {
            ss << "  \"" << source << "\":\n";
            for (const auto& [target, weight] : targets) {
                ss << "    \"" << target << "\": " << weight << "\n";
            }
        }
        ss << "\n";
    }

    const auto& c = cognitive;
    ss << "cognitive:\n";
    ss << "  window_size: " << c.window_size << "\n";
    ss << "  rt_var_mild: " << c.rt_var_mild << "\n";
    ss << "  rt_var_moderate: " << c.rt_var_moderate << "\n";
    ss << "  rt_var_high: " << c.rt_var_high << "\n";
    ss << "  slow_ratio_mild: " << c.slow_ratio_mild << "\n";
    ss << "  slow_ratio_high: " << c.slow_ratio_high << "\n";
    ss << "  error_streak_mild: " << c.error_streak_mild << "\n";
    ss << "  error_streak_high: " << c.error_streak_high << "\n";
    ss << "  hesitation_mild_ms: " << c.hesitation_mild_ms << "\n";
    ss << "  hesitation_high_ms: " << c.hesitation_high_ms << "\n";
    ss << "  keystroke_threshold: " << c.keystroke_threshold << "\n";
    ss << "  fatigue_threshold: " << c.fatigue_threshold << "\n";
    ss << "  fatigue_saturation_minutes: " << c.fatigue_saturation_minutes << "\n";
    ss << "  steps_weight: " << c.steps_weight << "\n";
    ss << "  novelty_weight: " << c.novelty_weight << "\n";
    ss << "  prerequisite_weight: " << c.prerequisite_weight << "\n";
    ss << "  max_solution_steps: " << c.max_solution_steps << "\n";
    ss << "  time_pressure_weight: " << c.time_pressure_weight << "\n";
    ss << "  interface_weight: " << c.interface_weight << "\n";
    ss << "  distraction_weight: " << c.distraction_weight << "\n";
    ss << "  presentation_weight: " << c.presentation_weight << "\n";
    ss << "  stress_weight: " << c.stress_weight << "\n";
    ss << "  network_weight: " << c.network_weight << "\n";
    ss << "  mobile_time_pressure_multiplier: " << c.mobile_time_pressure_multiplier << "\n";
    ss << "  mobile_interface_multiplier: " << c.mobile_interface_multiplier << "\n";
    ss << "  mobile_distraction_multiplier: " << c.mobile_distraction_multiplier << "\n";
    ss << "  mobile_presentation_multiplier: " << c.mobile_presentation_multiplier << "\n";
    ss << "  mobile_base_friction: " << c.mobile_base_friction << "\n";
    ss << "  tablet_base_friction: " << c.tablet_base_friction << "\n";
    ss << "  small_screen_friction: " << c.small_screen_friction << "\n";
    ss << "  intrinsic_share: " << c.intrinsic_share << "\n";
    ss << "  overload_threshold: " << c.overload_threshold << "\n\n";

    const auto& p = pacing;
    ss << "pacing:\n";
    ss << "  min_factor: " << p.min_factor << "\n";
    ss << "  max_factor: " << p.max_factor << "\n";
    ss << "  stress_weight: " << p.stress_weight << "\n";
    ss << "  fatigue_weight: " << p.fatigue_weight << "\n";
    ss << "  mastery_weight: " << p.mastery_weight << "\n";
    ss << "  min_difficulty: " << p.min_difficulty << "\n";
    ss << "  session_rate_per_hour: " << p.session_rate_per_hour << "\n";
    ss << "  max_session_bonus: " << p.max_session_bonus << "\n";
    ss << "  small_screen_factor: " << p.small_screen_factor << "\n";
    ss << "  medium_network_factor: " << p.medium_network_factor << "\n";
    ss << "  low_network_factor: " << p.low_network_factor << "\n";
    ss << "  overload_factor: " << p.overload_factor << "\n";
    ss << "  recovery_factor: " << p.recovery_factor << "\n\n";

    ss << "exams:\n";
    for (const auto& exam : exams) {
        ss << "  \"" << exam.exam_code << "\":\n";
        ss << "    time_cap_ms: " << exam.time_cap_ms << "\n";
        ss << "    difficulty_factor: " << exam.difficulty_factor << "\n";
        ss << "    correct_score: " << exam.scoring.correct_score << "\n";
        ss << "    incorrect_score: " << exam.scoring.incorrect_score << "\n";
        ss << "    question_types: [";
        for (size_t i = 0; i < exam.question_types.size(); ++i) {
            ss << (i ? ", " : "") << "\"" << exam.question_types[i] << "\"";
        }
        ss << "]\n";
        if (!exam.subject_weightings.empty()) {
            ss << "    subject_weightings:\n";
            for (const auto& [subject, weight] : exam.subject_weightings) {
                ss << "      \"" << subject << "\": " << weight << "\n";
            }
        }
    }
    ss << "\n";

    ss << "calibration:\n";
    ss << "  min_temperature: " << calibration.min_temperature << "\n";
    ss << "  max_temperature: " << calibration.max_temperature << "\n";
    ss << "  max_iterations: " << calibration.max_iterations << "\n";
    ss << "  tolerance: " << calibration.tolerance << "\n";
    ss << "  ece_bins: " << calibration.ece_bins << "\n\n";

    ss << "fairness:\n";
    ss << "  disparity_threshold: " << fairness.disparity_threshold << "\n";
    ss << "  severe_disparity_threshold: " << fairness.severe_disparity_threshold << "\n";
    ss << "  min_samples: " << fairness.min_samples << "\n";
    ss << "  default_exam: \"" << fairness.default_exam << "\"\n";
    ss << "  default_subject: \"" << fairness.default_subject << "\"\n\n";

    ss << "storage:\n";
    ss << "  backend: \"" << storage.backend << "\"\n";
    ss << "  db_path: \"" << storage.db_path << "\"\n";
    ss << "  enable_wal: " << b(storage.enable_wal) << "\n";
    ss << "  synchronous: \"" << storage.synchronous << "\"\n";
    ss << "  busy_timeout_ms: " << storage.busy_timeout_ms << "\n";

    return ss.str();
}

bool EngineConfig::Validate() const {
    return GetValidationErrors().empty();
}

std::vector<std::string> EngineConfig::GetValidationErrors() const {
    std::vector<std::string> errors;
    auto append = [&errors](const std::string& prefix, const std::vector<std::string>& found) {
        for (const auto& error : found) {
            errors.push_back(prefix + ": " + error);
        }
    };

    // Engine
    if (engine.store_timeout_ms <= 0) {
        errors.push_back("engine: store_timeout_ms must be greater than 0");
    }
    if (engine.lock_stripes == 0) {
        errors.push_back("engine: lock_stripes must be greater than 0");
    }
    if (engine.parameter_cache_size == 0) {
        errors.push_back("engine: parameter_cache_size must be greater than 0");
    }
    if (engine.default_group.empty()) {
        errors.push_back("engine: default_group must be non-empty");
    }

    // Tracing
    if (!std::isfinite(tracing.default_prior) || tracing.default_prior < 0.0 ||
        tracing.default_prior > 1.0) {
        errors.push_back("tracing: default_prior must be between 0.0 and 1.0");
    }
    append("tracing", DefaultParameters("default").GetValidationErrors());
    append("tracing", tracing.updater.GetValidationErrors());

    append("transfer", transfer.GetValidationErrors());
    for (const auto& [source, targets] : transfer_graph) {
        for (const auto& [target, weight] : targets) {
            if (source == target) {
                errors.push_back("transfer_graph: self-loop on '" + source + "'");
            }
            if (!std::isfinite(weight) || weight < 0.0 || weight > 1.0) {
                errors.push_back("transfer_graph: weight " + source + " -> " + target +
                                 " must be between 0.0 and 1.0");
            }
        }
    }

    append("cognitive", cognitive.GetValidationErrors());
    append("pacing", pacing.GetValidationErrors());

    // Exams
    bool default_found = false;
    for (const auto& exam : exams) {
        append("exams", exam.GetValidationErrors());
        if (exam.exam_code == engine.default_exam) {
            default_found = true;
        }
    }
    if (!default_found) {
        errors.push_back("engine: default_exam '" + engine.default_exam + "' is not a configured exam");
    }

    append("calibration", calibration.GetValidationErrors());
    append("fairness", fairness.GetValidationErrors());

    // Storage
    if (storage.backend != "memory" && storage.backend != "sqlite") {
        errors.push_back("storage: backend must be one of: memory, sqlite");
    }
    if (storage.backend == "sqlite" && storage.db_path.empty()) {
        errors.push_back("storage: db_path is required for the sqlite backend");
    }
    if (storage.synchronous != "FULL" && storage.synchronous != "NORMAL" && storage.synchronous != "OFF") {
        errors.push_back("storage: synchronous must be one of: FULL, NORMAL, OFF");
    }
    if (storage.busy_timeout_ms < 0) {
        errors.push_back("storage: busy_timeout_ms must be non-negative");
    }

    return errors;
}

ConceptParameters EngineConfig::DefaultParameters(const std::string& concept_id) const {
    ConceptParameters params;
    params.concept_id = concept_id;
    params.learn_rate = tracing.default_learn_rate;
    params.slip_rate = tracing.default_slip_rate;
    params.guess_rate = tracing.default_guess_rate;
    params.forgetting_rate = tracing.default_forgetting_rate;
    params.initial_mastery = tracing.default_prior;
    return params;
}

EngineConfig EngineConfig::Default() {
    return EngineConfig{};  // Uses default member initializers
}

} // namespace kte
