// File: src/pacing/exam_config.cpp
#include "pacing/exam_config.hpp"
#include "core/errors.hpp"
#include <cmath>

namespace kte {

std::vector<std::string> ExamConfiguration::GetValidationErrors() const {
    std::vector<std::string> errors;
    if (exam_code.empty()) {
        errors.push_back("exam_code must be non-empty");
    }
    if (time_cap_ms <= 0) {
        errors.push_back("time_cap_ms of '" + exam_code + "' must be greater than 0");
    }
    if (!std::isfinite(difficulty_factor) || difficulty_factor <= 0.0) {
        errors.push_back("difficulty_factor of '" + exam_code + "' must be greater than 0");
    }
    for (const auto& [subject, weight] : subject_weightings) {
        if (!std::isfinite(weight) || weight < 0.0) {
            errors.push_back("subject weighting '" + subject + "' must be non-negative");
        }
    }
    return errors;
}

// ============================================================================
// ExamRegistry
// ============================================================================

ExamRegistry::ExamRegistry()
    : ExamRegistry(BuiltinExams(), "JEE_Mains")
{
}

ExamRegistry::ExamRegistry(std::vector<ExamConfiguration> exams, const std::string& default_exam)
    : default_exam_(default_exam)
{
    for (const auto& exam : exams) {
        Register(exam);
    }
    if (exams_.find(default_exam_) == exams_.end()) {
        throw ConfigurationError("Default exam '" + default_exam_ + "' is not configured");
    }
}

std::vector<ExamConfiguration> ExamRegistry::BuiltinExams() {
    ExamConfiguration jee_mains;
    jee_mains.exam_code = "JEE_Mains";
    jee_mains.time_cap_ms = 180000;
    jee_mains.difficulty_factor = 1.0;
    jee_mains.scoring = ScoringScheme{4.0, -1.0};
    jee_mains.question_types = {"mcq", "integer"};
    jee_mains.subject_weightings = {{"physics", 0.35}, {"chemistry", 0.35}, {"math", 0.30}};

    ExamConfiguration neet;
    neet.exam_code = "NEET";
    neet.time_cap_ms = 90000;
    neet.difficulty_factor = 0.9;
    neet.scoring = ScoringScheme{4.0, -1.0};
    neet.question_types = {"mcq"};
    neet.subject_weightings = {{"physics", 0.25}, {"chemistry", 0.25}, {"biology", 0.50}};

    ExamConfiguration jee_advanced;
    jee_advanced.exam_code = "JEE_Advanced";
    jee_advanced.time_cap_ms = 240000;
    jee_advanced.difficulty_factor = 1.4;
    jee_advanced.scoring = ScoringScheme{4.0, -2.0};
    jee_advanced.question_types = {"mcq", "integer", "matrix"};
    jee_advanced.subject_weightings = {{"physics", 0.33}, {"chemistry", 0.33}, {"math", 0.34}};

    return {jee_mains, neet, jee_advanced};
}

void ExamRegistry::Register(const ExamConfiguration& exam) {
    auto errors = exam.GetValidationErrors();
    if (!errors.empty()) {
        throw ConfigurationError::FromMessages("Invalid exam configuration", errors);
    }
    exams_[exam.exam_code] = exam;
}

std::optional<ExamConfiguration> ExamRegistry::Find(const std::string& exam_code) const {
    auto it = exams_.find(exam_code);
    if (it == exams_.end()) {
        return std::nullopt;
    }
    return it->second;
}

const ExamConfiguration& ExamRegistry::Resolve(const std::string& exam_code) const {
    auto it = exams_.find(exam_code);
    if (it != exams_.end()) {
        return it->second;
    }
    return exams_.at(default_exam_);
}

bool ExamRegistry::Contains(const std::string& exam_code) const {
    return exams_.find(exam_code) != exams_.end();
}

std::vector<std::string> ExamRegistry::GetExamCodes() const {
    std::vector<std::string> codes;
    codes.reserve(exams_.size());
    for (const auto& entry : exams_) {
        codes.push_back(entry.first);
    }
    return codes;
}

} // namespace kte
