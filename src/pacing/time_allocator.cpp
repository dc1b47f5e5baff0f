// File: src/pacing/time_allocator.cpp
#include "pacing/time_allocator.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cmath>

namespace kte {

std::vector<std::string> TimeAllocator::Config::GetValidationErrors() const {
    std::vector<std::string> errors;
    auto non_negative = [](double value) { return std::isfinite(value) && value >= 0.0; };
    auto at_least_one = [](double value) { return std::isfinite(value) && value >= 1.0; };

    if (!std::isfinite(min_factor) || min_factor <= 0.0) {
        errors.push_back("min_factor must be greater than 0");
    }
    if (!std::isfinite(max_factor) || max_factor < min_factor) {
        errors.push_back("max_factor must be >= min_factor");
    }
    if (!non_negative(stress_weight) || !non_negative(fatigue_weight)) {
        errors.push_back("stress_weight and fatigue_weight must be non-negative");
    }
    if (!std::isfinite(mastery_weight) || mastery_weight < 0.0 || mastery_weight >= 1.0) {
        errors.push_back("mastery_weight must be in [0, 1)");
    }
    if (!std::isfinite(min_difficulty) || min_difficulty <= 0.0) {
        errors.push_back("min_difficulty must be greater than 0");
    }
    if (!non_negative(session_rate_per_hour) || !non_negative(max_session_bonus)) {
        errors.push_back("session adjustments must be non-negative");
    }
    if (!at_least_one(small_screen_factor) || !at_least_one(medium_network_factor) ||
        !at_least_one(low_network_factor) || !at_least_one(overload_factor) ||
        !at_least_one(recovery_factor)) {
        errors.push_back("context factors must be >= 1");
    }
    return errors;
}

TimeAllocator::TimeAllocator()
    : TimeAllocator(Config())
{
}

TimeAllocator::TimeAllocator(const Config& config)
    : config_(config)
{
    auto errors = config_.GetValidationErrors();
    if (!errors.empty()) {
        throw ConfigurationError::FromMessages("Invalid time allocator configuration", errors);
    }
}

TimeAllocator::Allocation TimeAllocator::Allocate(const Request& request,
                                                  const ExamConfiguration& exam) const {
    ValidateRequest(request);

    double stress_factor = 1.0 + request.stress * config_.stress_weight;
    double fatigue_factor = 1.0 + request.fatigue * config_.fatigue_weight;
    double mastery_factor = 1.0 - request.mastery * config_.mastery_weight;
    double difficulty_factor = std::max(config_.min_difficulty, request.difficulty) *
                               exam.difficulty_factor;
    double session_hours = request.session_elapsed_ms / 3600000.0;
    double session_factor = 1.0 + std::min(config_.max_session_bonus,
                                           session_hours * config_.session_rate_per_hour);
    double mobile_factor = MobileFactor(request.device);
    double overload_factor = request.overload_risk ? config_.overload_factor : 1.0;
    double recovery_factor = request.recovery ? config_.recovery_factor : 1.0;

    Allocation allocation;
    allocation.student_id = request.student_id;
    allocation.question_id = request.question_id;
    allocation.exam_code = exam.exam_code;
    allocation.time_cap_ms = exam.time_cap_ms;

    allocation.raw_factor = stress_factor * fatigue_factor * mastery_factor * difficulty_factor *
                            session_factor * mobile_factor * overload_factor * recovery_factor;
    allocation.factor = std::clamp(allocation.raw_factor, config_.min_factor, config_.max_factor);

    double computed = std::floor(static_cast<double>(request.base_time_ms) * allocation.factor);

    // Hard cap last
    allocation.capped = computed > static_cast<double>(exam.time_cap_ms);
    allocation.final_time_ms = allocation.capped ? exam.time_cap_ms : static_cast<int64_t>(computed);

    allocation.breakdown = {
        {"stress_factor", stress_factor},
        {"fatigue_factor", fatigue_factor},
        {"mastery_factor", mastery_factor},
        {"difficulty_factor", difficulty_factor},
        {"exam_difficulty_factor", exam.difficulty_factor},
        {"session_factor", session_factor},
        {"mobile_factor", mobile_factor},
        {"overload_factor", overload_factor},
        {"recovery_factor", recovery_factor},
        {"raw_factor", allocation.raw_factor},
        {"clamped_factor", allocation.factor},
        {"computed_time_ms", computed},
        {"max_allowed_time_ms", static_cast<double>(exam.time_cap_ms)},
    };

    return allocation;
}

double TimeAllocator::MobileFactor(const DeviceProfile& device) const {
    if (!device.IsMobile()) {
        return 1.0;
    }

    double factor = 1.0;
    if (device.screen == ScreenClass::SMALL) {
        factor *= config_.small_screen_factor;
    }
    if (device.network == NetworkQuality::LOW) {
        factor *= config_.low_network_factor;
    } else if (device.network == NetworkQuality::MEDIUM) {
        factor *= config_.medium_network_factor;
    }
    return factor;
}

void TimeAllocator::ValidateRequest(const Request& request) {
    auto in_unit = [](double v) { return std::isfinite(v) && v >= 0.0 && v <= 1.0; };

    if (request.base_time_ms <= 0) {
        throw ValidationError("base_time_ms must be greater than 0");
    }
    if (!in_unit(request.stress)) {
        throw ValidationError("stress must be in [0, 1]");
    }
    if (!in_unit(request.fatigue)) {
        throw ValidationError("fatigue must be in [0, 1]");
    }
    if (!in_unit(request.mastery)) {
        throw ValidationError("mastery must be in [0, 1]");
    }
    if (!std::isfinite(request.difficulty) || request.difficulty < 0.0) {
        throw ValidationError("difficulty must be finite and >= 0");
    }
    if (request.session_elapsed_ms < 0) {
        throw ValidationError("session_elapsed_ms must be >= 0");
    }
}

} // namespace kte
