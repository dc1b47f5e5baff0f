// File: src/core/types.cpp
#include "core/types.hpp"
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <cmath>

namespace kte {

// Timestamp implementations

Timestamp Timestamp::Now() {
    return Timestamp(ClockType::now());
}

Timestamp Timestamp::FromMicros(int64_t micros) {
    TimePoint tp{std::chrono::duration_cast<ClockType::duration>(Duration(micros))};
    return Timestamp(tp);
}

int64_t Timestamp::ToMicros() const {
    auto duration = time_point_.time_since_epoch();
    return std::chrono::duration_cast<Duration>(duration).count();
}

std::string Timestamp::ToString() const {
    auto micros = ToMicros();
    auto seconds = micros / 1000000;
    auto remaining_micros = micros % 1000000;

    std::ostringstream oss;
    oss << "Timestamp(" << seconds << "."
        << std::setw(6) << std::setfill('0') << remaining_micros << "s)";
    return oss.str();
}

// Enum implementations

const char* ToString(DeviceType type) {
    switch (type) {
        case DeviceType::DESKTOP: return "desktop";
        case DeviceType::MOBILE: return "mobile";
        case DeviceType::TABLET: return "tablet";
        default: return "unknown";
    }
}

DeviceType ParseDeviceType(const std::string& str) {
    if (str == "desktop") return DeviceType::DESKTOP;
    if (str == "mobile") return DeviceType::MOBILE;
    if (str == "tablet") return DeviceType::TABLET;
    throw std::invalid_argument("Unknown DeviceType: " + str);
}

const char* ToString(ScreenClass screen) {
    switch (screen) {
        case ScreenClass::SMALL: return "small";
        case ScreenClass::MEDIUM: return "medium";
        case ScreenClass::LARGE: return "large";
        default: return "unknown";
    }
}

ScreenClass ParseScreenClass(const std::string& str) {
    if (str == "small") return ScreenClass::SMALL;
    if (str == "medium") return ScreenClass::MEDIUM;
    if (str == "large") return ScreenClass::LARGE;
    throw std::invalid_argument("Unknown ScreenClass: " + str);
}

const char* ToString(NetworkQuality quality) {
    switch (quality) {
        case NetworkQuality::HIGH: return "high";
        case NetworkQuality::MEDIUM: return "medium";
        case NetworkQuality::LOW: return "low";
        default: return "unknown";
    }
}

NetworkQuality ParseNetworkQuality(const std::string& str) {
    if (str == "high") return NetworkQuality::HIGH;
    if (str == "medium") return NetworkQuality::MEDIUM;
    if (str == "low") return NetworkQuality::LOW;
    throw std::invalid_argument("Unknown NetworkQuality: " + str);
}

// ConceptParameters

namespace {

bool IsProbability(double value) {
    return std::isfinite(value) && value >= 0.0 && value <= 1.0;
}

std::string Describe(const char* name, double value) {
    std::ostringstream oss;
    oss << name << " must be in [0, 1], got " << value;
    return oss.str();
}

} // namespace

std::vector<std::string> ConceptParameters::GetValidationErrors() const {
    std::vector<std::string> errors;

    if (!IsProbability(learn_rate)) errors.push_back(Describe("learn_rate", learn_rate));
    if (!IsProbability(slip_rate)) errors.push_back(Describe("slip_rate", slip_rate));
    if (!IsProbability(guess_rate)) errors.push_back(Describe("guess_rate", guess_rate));
    if (!IsProbability(initial_mastery)) errors.push_back(Describe("initial_mastery", initial_mastery));
    if (!IsProbability(forgetting_rate)) errors.push_back(Describe("forgetting_rate", forgetting_rate));

    // Identifiability: a mastered student must be more likely to answer
    // correctly than an unmastered one
    if (IsProbability(slip_rate) && IsProbability(guess_rate) && slip_rate + guess_rate >= 1.0) {
        std::ostringstream oss;
        oss << "slip_rate + guess_rate must be < 1 (slip=" << slip_rate
            << ", guess=" << guess_rate << ")";
        errors.push_back(oss.str());
    }

    return errors;
}

// KnowledgeState

KnowledgeState KnowledgeState::Initial(const std::string& student_id,
                                       const std::string& concept_id,
                                       double prior) {
    KnowledgeState state;
    state.student_id = student_id;
    state.concept_id = concept_id;
    state.mastery_probability = Clamp01(prior);
    return state;
}

} // namespace kte
