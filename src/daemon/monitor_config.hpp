#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace camwatch {

// Raised for any invalid configuration. Fatal at startup, never thrown once
// the scheduler is running.
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct MonitorConfig {
    std::vector<Device> devices;
    int pollIntervalSeconds = 0;
    int upThreshold = 0;
    int downThreshold = 0;
    int probeTimeoutSeconds = 0;

    std::string senderName = "CCTV Ping Monitor";
    // Minutes after local midnight; unset disables the daily summary.
    std::optional<int> dailySummaryMinutes;
    std::string dataDir;
};

// Parses and validates a configuration document.
MonitorConfig parseConfig(const nlohmann::json &doc);

// Reads a JSON file and hands it to parseConfig(). Unreadable files and
// JSON syntax errors are reported as ConfigurationError too.
MonitorConfig loadConfigFile(const std::string &path);

void validateConfig(const MonitorConfig &config);

// "HH:MM" -> minutes after midnight.
std::optional<int> parseTimeOfDay(const std::string &value);

// CAMWATCH_DATA_DIR, else $HOME/.local/share/camwatch.
std::string defaultDataDir();

} // namespace camwatch
