// File: src/core/types.hpp
#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <chrono>
#include <vector>
#include <iosfwd>

namespace kte {

// Timestamp: Microsecond-precision wall-clock time point
// Wall clock (not steady) because last-practice times are persisted and
// compared across process restarts. A zero timestamp means "never".
class Timestamp {
public:
    using ClockType = std::chrono::system_clock;
    using TimePoint = ClockType::time_point;
    using Duration = std::chrono::microseconds;

    // Create timestamp for current time
    static Timestamp Now();

    // Create timestamp from microseconds since epoch
    static Timestamp FromMicros(int64_t micros);

    // Default constructor creates zero timestamp
    Timestamp() : time_point_(TimePoint{}) {}

    // Get microseconds since epoch
    int64_t ToMicros() const;

    // True for the default-constructed (never set) timestamp
    bool IsZero() const { return ToMicros() == 0; }

    // Get duration since another timestamp
    Duration operator-(const Timestamp& other) const {
        return std::chrono::duration_cast<Duration>(time_point_ - other.time_point_);
    }

    Timestamp operator+(Duration d) const { return Timestamp(time_point_ + d); }

    // Comparison operators
    bool operator<(const Timestamp& other) const { return time_point_ < other.time_point_; }
    bool operator>(const Timestamp& other) const { return time_point_ > other.time_point_; }
    bool operator<=(const Timestamp& other) const { return time_point_ <= other.time_point_; }
    bool operator>=(const Timestamp& other) const { return time_point_ >= other.time_point_; }
    bool operator==(const Timestamp& other) const { return time_point_ == other.time_point_; }
    bool operator!=(const Timestamp& other) const { return time_point_ != other.time_point_; }

    // String conversion
    std::string ToString() const;

private:
    explicit Timestamp(TimePoint tp) : time_point_(tp) {}
    TimePoint time_point_;
};

// DeviceType: Device the learner answers on
enum class DeviceType : uint8_t {
    DESKTOP = 0,
    MOBILE = 1,
    TABLET = 2,
};

// ScreenClass: Coarse screen size bucket reported by the client
enum class ScreenClass : uint8_t {
    SMALL = 0,
    MEDIUM = 1,
    LARGE = 2,
};

// NetworkQuality: Coarse bandwidth/latency bucket reported by the client
enum class NetworkQuality : uint8_t {
    HIGH = 0,
    MEDIUM = 1,
    LOW = 2,
};

const char* ToString(DeviceType type);
DeviceType ParseDeviceType(const std::string& str);

const char* ToString(ScreenClass screen);
ScreenClass ParseScreenClass(const std::string& str);

const char* ToString(NetworkQuality quality);
NetworkQuality ParseNetworkQuality(const std::string& str);

// DeviceProfile: Device/network context of a single interaction
struct DeviceProfile {
    DeviceType type{DeviceType::DESKTOP};
    ScreenClass screen{ScreenClass::LARGE};
    NetworkQuality network{NetworkQuality::HIGH};

    bool IsMobile() const { return type == DeviceType::MOBILE; }
};

// StateKey: (student, concept) identity of a knowledge state
struct StateKey {
    std::string student_id;
    std::string concept_id;

    bool operator==(const StateKey& other) const {
        return student_id == other.student_id && concept_id == other.concept_id;
    }
    bool operator!=(const StateKey& other) const { return !(*this == other); }
    bool operator<(const StateKey& other) const {
        if (student_id != other.student_id) return student_id < other.student_id;
        return concept_id < other.concept_id;
    }

    std::string ToString() const { return student_id + "/" + concept_id; }

    struct Hash {
        size_t operator()(const StateKey& key) const {
            size_t h1 = std::hash<std::string>()(key.student_id);
            size_t h2 = std::hash<std::string>()(key.concept_id);
            return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
        }
    };
};

// ConceptParameters: BKT parameters of one concept
// Owned by the parameter store; the live update path only reads them.
struct ConceptParameters {
    std::string concept_id;
    double learn_rate{0.3};
    double slip_rate{0.1};
    double guess_rate{0.2};
    double forgetting_rate{0.0};   // per day
    double initial_mastery{0.25};  // prior for lazily created states

    // Empty when the parameters are usable for an update
    std::vector<std::string> GetValidationErrors() const;
    bool IsValid() const { return GetValidationErrors().empty(); }
};

// KnowledgeState: Mastery of one concept by one student
struct KnowledgeState {
    std::string student_id;
    std::string concept_id;
    double mastery_probability{0.25};
    uint64_t practice_count{0};
    Timestamp last_practiced;
    uint32_t consecutive_incorrect{0};
    bool in_recovery{false};

    StateKey Key() const { return StateKey{student_id, concept_id}; }

    // Fresh state for a first interaction
    static KnowledgeState Initial(const std::string& student_id,
                                  const std::string& concept_id,
                                  double prior);
};

// QuestionMetadata: Plain description of a question supplied by the caller
struct QuestionMetadata {
    std::string question_id;
    std::string concept_id;
    std::string subject;
    double difficulty{0.5};       // >= 0, 1.0 is "hard"
    int64_t base_time_ms{60000};  // expected solving time, > 0
    uint32_t solution_steps{1};
    std::vector<std::string> prerequisite_ids;
};

// InteractionEvent: One answered question, as logged
// Events are appended once and only ever read afterwards.
struct InteractionEvent {
    uint64_t event_id{0};
    std::string student_id;
    std::vector<std::string> concept_ids;
    bool correct{false};
    int64_t response_time_ms{0};
    std::string exam_code;
    std::string subject;
    std::string group;
    DeviceProfile device;
    double stress{0.0};
    double intrinsic_load{0.0};
    double extraneous_load{0.0};
    double total_load{0.0};
    double predicted_correct{0.5};  // P(correct) before the observation
    double mastery_before{0.0};
    double mastery_after{0.0};
    double score{0.0};
    Timestamp recorded_at;
};

// Clamp helper shared by the numeric modules
inline double Clamp01(double value) {
    return value < 0.0 ? 0.0 : (value > 1.0 ? 1.0 : value);
}

} // namespace kte

namespace std {
    template<>
    struct hash<kte::StateKey> {
        size_t operator()(const kte::StateKey& key) const {
            return kte::StateKey::Hash()(key);
        }
    };
}
