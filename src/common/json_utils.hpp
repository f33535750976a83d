#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace camwatch {

inline std::string toIso8601Utc(Timestamp timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

inline std::int64_t toEpochMillis(Timestamp timestamp)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               timestamp.time_since_epoch())
        .count();
}

inline Timestamp fromEpochMillis(std::int64_t value)
{
    return Timestamp{std::chrono::duration_cast<Timestamp::duration>(
        std::chrono::milliseconds{value})};
}

inline std::string toStatusString(LivenessStatus status)
{
    switch (status) {
    case LivenessStatus::Unknown:
        return "UNKNOWN";
    case LivenessStatus::Up:
        return "UP";
    case LivenessStatus::Down:
        return "DOWN";
    }
    return "UNKNOWN";
}

inline LivenessStatus parseStatusString(const std::string &value)
{
    if (value == "UP") {
        return LivenessStatus::Up;
    }
    if (value == "DOWN") {
        return LivenessStatus::Down;
    }
    return LivenessStatus::Unknown;
}

inline void to_json(nlohmann::json &j, const LivenessStatus &status)
{
    j = toStatusString(status);
}

inline void to_json(nlohmann::json &j, const Device &device)
{
    j = nlohmann::json{
        {"id", device.id},
        {"name", device.displayName},
        {"host", device.address}
    };
}

inline void to_json(nlohmann::json &j, const LivenessRecord &record)
{
    j = nlohmann::json{
        {"deviceId", record.deviceId},
        {"status", record.status},
        {"consecutiveFailures", record.consecutiveFailures},
        {"consecutiveSuccesses", record.consecutiveSuccesses},
        {"lastChangedAt", toIso8601Utc(record.lastChangedAt)},
        {"lastCheckedAt", toIso8601Utc(record.lastCheckedAt)}
    };
}

inline void to_json(nlohmann::json &j, const TransitionEvent &event)
{
    j = nlohmann::json{
        {"deviceId", event.deviceId},
        {"from", event.fromStatus},
        {"to", event.toStatus},
        {"occurredAt", toIso8601Utc(event.occurredAt)}
    };
}

inline void to_json(nlohmann::json &j, const Subscriber &subscriber)
{
    j = nlohmann::json{
        {"chatId", subscriber.chatId},
        {"addedAt", toIso8601Utc(subscriber.addedAt)}
    };
}

} // namespace camwatch
