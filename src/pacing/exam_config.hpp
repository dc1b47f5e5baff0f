// File: src/pacing/exam_config.hpp
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kte {

/// Marks awarded per answer
struct ScoringScheme {
    double correct_score{4.0};
    double incorrect_score{-1.0};

    double Score(bool correct) const { return correct ? correct_score : incorrect_score; }
};

/// Per-exam settings supplied by the administrative configuration
struct ExamConfiguration {
    std::string exam_code;

    /// Hard per-question maximum; the time allocator never exceeds it
    int64_t time_cap_ms{180000};

    /// Relative difficulty of the exam's questions (1.0 = baseline)
    double difficulty_factor{1.0};

    ScoringScheme scoring;
    std::vector<std::string> question_types;
    std::map<std::string, double> subject_weightings;

    std::vector<std::string> GetValidationErrors() const;
};

/// ExamRegistry: Lookup of exam configurations by exam code
///
/// Unknown codes resolve to the configured default exam so that every
/// request has a hard time cap.
class ExamRegistry {
public:
    /// Registry holding the built-in NEET, JEE_Mains and JEE_Advanced exams
    ExamRegistry();

    /// Registry with the given exams and default code
    /// @throws ConfigurationError if an exam is invalid or the default is missing
    ExamRegistry(std::vector<ExamConfiguration> exams, const std::string& default_exam);

    /// Built-in exams (caps: NEET 90 s, JEE_Mains 180 s, JEE_Advanced 240 s)
    static std::vector<ExamConfiguration> BuiltinExams();

    /// Add or replace an exam
    /// @throws ConfigurationError if the exam is invalid
    void Register(const ExamConfiguration& exam);

    /// Exact lookup
    std::optional<ExamConfiguration> Find(const std::string& exam_code) const;

    /// Lookup falling back to the default exam
    const ExamConfiguration& Resolve(const std::string& exam_code) const;

    bool Contains(const std::string& exam_code) const;
    const std::string& GetDefaultExam() const { return default_exam_; }
    std::vector<std::string> GetExamCodes() const;

private:
    std::map<std::string, ExamConfiguration> exams_;
    std::string default_exam_;
};

} // namespace kte
