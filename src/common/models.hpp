#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "common/enums.hpp"

namespace camwatch {

using Timestamp = std::chrono::system_clock::time_point;

struct Device {
    std::string id;
    std::string address;
    std::string displayName;
};

struct LivenessRecord {
    std::string deviceId;
    LivenessStatus status = LivenessStatus::Unknown;
    int consecutiveFailures = 0;
    int consecutiveSuccesses = 0;
    Timestamp lastChangedAt;
    Timestamp lastCheckedAt;
};

inline bool operator==(const LivenessRecord &a, const LivenessRecord &b)
{
    return a.deviceId == b.deviceId
        && a.status == b.status
        && a.consecutiveFailures == b.consecutiveFailures
        && a.consecutiveSuccesses == b.consecutiveSuccesses
        && a.lastChangedAt == b.lastChangedAt
        && a.lastCheckedAt == b.lastCheckedAt;
}

inline bool operator!=(const LivenessRecord &a, const LivenessRecord &b)
{
    return !(a == b);
}

// Keyed by device id. Persisted as one unit after every cycle.
using MonitorState = std::map<std::string, LivenessRecord>;

struct TransitionEvent {
    std::string deviceId;
    LivenessStatus fromStatus = LivenessStatus::Unknown;
    LivenessStatus toStatus = LivenessStatus::Unknown;
    Timestamp occurredAt;
};

struct Subscriber {
    std::int64_t chatId = 0;
    Timestamp addedAt;
};

struct Thresholds {
    int up = 1;
    int down = 1;
};

} // namespace camwatch
