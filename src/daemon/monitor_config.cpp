#include "daemon/monitor_config.hpp"

#include <cctype>
#include <exception>
#include <fstream>
#include <set>

#include <QtGlobal>

#include "common/address_utils.hpp"
#include "common/logging.hpp"

namespace camwatch {

namespace {

int requirePositiveInt(const nlohmann::json &doc, const char *key, int minimum)
{
    auto it = doc.find(key);
    if (it == doc.end()) {
        throw ConfigurationError(std::string("missing required field '") + key + "'");
    }
    if (!it->is_number_integer()) {
        throw ConfigurationError(std::string("field '") + key + "' must be an integer");
    }
    const auto value = it->get<long long>();
    if (value < minimum || value > 86400) {
        throw ConfigurationError(std::string("field '") + key + "' must be between "
                                 + std::to_string(minimum) + " and 86400");
    }
    return static_cast<int>(value);
}

std::string optionalString(const nlohmann::json &doc, const char *key)
{
    auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) {
        return {};
    }
    if (!it->is_string()) {
        throw ConfigurationError(std::string("field '") + key + "' must be a string");
    }
    return it->get<std::string>();
}

Device parseCamera(const nlohmann::json &entry, std::size_t index)
{
    const std::string where = "cameras[" + std::to_string(index) + "]";
    if (!entry.is_object()) {
        throw ConfigurationError(where + " must be an object");
    }

    Device device;
    try {
        device.displayName = optionalString(entry, "name");
        device.address = optionalString(entry, "host");
        device.id = optionalString(entry, "id");
    } catch (const ConfigurationError &ex) {
        throw ConfigurationError(where + ": " + ex.what());
    }

    if (device.displayName.empty()) {
        throw ConfigurationError(where + " has no name");
    }
    if (device.id.empty()) {
        device.id = device.displayName;
    }
    return device;
}

} // namespace

std::optional<int> parseTimeOfDay(const std::string &value)
{
    if (value.size() != 5 || value[2] != ':') {
        return std::nullopt;
    }
    for (std::size_t i : {0, 1, 3, 4}) {
        if (!std::isdigit(static_cast<unsigned char>(value[i]))) {
            return std::nullopt;
        }
    }
    int hours = 0;
    int minutes = 0;
    try {
        hours = std::stoi(value.substr(0, 2));
        minutes = std::stoi(value.substr(3, 2));
    } catch (const std::exception &) {
        return std::nullopt;
    }
    if (hours < 0 || hours > 23 || minutes < 0 || minutes > 59) {
        return std::nullopt;
    }
    return hours * 60 + minutes;
}

std::string defaultDataDir()
{
    const QString overrideDir = qEnvironmentVariable("CAMWATCH_DATA_DIR");
    if (!overrideDir.isEmpty()) {
        return overrideDir.toStdString();
    }
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return ".local/share/camwatch";
    }
    return (home + QStringLiteral("/.local/share/camwatch")).toStdString();
}

MonitorConfig parseConfig(const nlohmann::json &doc)
{
    if (!doc.is_object()) {
        throw ConfigurationError("configuration must be a JSON object");
    }

    MonitorConfig config;
    config.pollIntervalSeconds = requirePositiveInt(doc, "pollIntervalSeconds", 1);
    config.upThreshold = requirePositiveInt(doc, "upThreshold", 1);
    config.downThreshold = requirePositiveInt(doc, "downThreshold", 1);
    config.probeTimeoutSeconds = requirePositiveInt(doc, "probeTimeoutSeconds", 1);

    const std::string sender = optionalString(doc, "senderName");
    if (!sender.empty()) {
        config.senderName = sender;
    }

    const std::string summaryTime = optionalString(doc, "dailySummaryTime");
    if (!summaryTime.empty()) {
        config.dailySummaryMinutes = parseTimeOfDay(summaryTime);
        if (!config.dailySummaryMinutes) {
            throw ConfigurationError("dailySummaryTime '" + summaryTime
                                     + "' is not HH:MM");
        }
    }

    config.dataDir = optionalString(doc, "dataDir");
    if (config.dataDir.empty()) {
        config.dataDir = defaultDataDir();
    }

    auto cameras = doc.find("cameras");
    if (cameras == doc.end() || !cameras->is_array()) {
        throw ConfigurationError("field 'cameras' must be an array");
    }
    for (std::size_t i = 0; i < cameras->size(); ++i) {
        config.devices.push_back(parseCamera(cameras->at(i), i));
    }

    validateConfig(config);
    return config;
}

MonitorConfig loadConfigFile(const std::string &path)
{
    std::ifstream in(path);
    if (!in) {
        throw ConfigurationError("cannot read configuration file " + path);
    }

    nlohmann::json doc;
    try {
        in >> doc;
    } catch (const nlohmann::json::parse_error &ex) {
        throw ConfigurationError("configuration file " + path
                                 + " is not valid JSON: " + ex.what());
    }

    MonitorConfig config = parseConfig(doc);
    CWLOG_INFO(QStringLiteral("MonitorConfig"),
               QStringLiteral("loadConfigFile"),
               QStringLiteral("config_loaded"),
               (nlohmann::json{{"path", path},
                               {"cameras", config.devices.size()},
                               {"pollIntervalSeconds", config.pollIntervalSeconds},
                               {"upThreshold", config.upThreshold},
                               {"downThreshold", config.downThreshold},
                               {"probeTimeoutSeconds", config.probeTimeoutSeconds}}));
    return config;
}

void validateConfig(const MonitorConfig &config)
{
    if (config.pollIntervalSeconds <= 0) {
        throw ConfigurationError("pollIntervalSeconds must be positive");
    }
    if (config.probeTimeoutSeconds <= 0) {
        throw ConfigurationError("probeTimeoutSeconds must be positive");
    }
    if (config.upThreshold < 1 || config.downThreshold < 1) {
        throw ConfigurationError("upThreshold and downThreshold must be at least 1");
    }
    if (config.devices.empty()) {
        throw ConfigurationError("no cameras configured");
    }

    std::set<std::string> ids;
    for (const auto &device : config.devices) {
        if (device.id.empty()) {
            throw ConfigurationError("camera '" + device.displayName + "' has an empty id");
        }
        if (!ids.insert(device.id).second) {
            throw ConfigurationError("duplicate camera id '" + device.id + "'");
        }
        if (!parseProbeTarget(device.address)) {
            throw ConfigurationError("camera '" + device.id + "' has malformed address '"
                                     + device.address + "'");
        }
    }
}

} // namespace camwatch
