#include "common/address_utils.hpp"

#include <QHostAddress>
#include <QString>

#include <algorithm>
#include <cctype>
#include <exception>

namespace camwatch {

namespace {

constexpr std::size_t kMaxHostnameLength = 253;
constexpr std::size_t kMaxLabelLength = 63;

bool isIpv6Literal(const std::string &value)
{
    QHostAddress address;
    if (!address.setAddress(QString::fromStdString(value))) {
        return false;
    }
    return address.protocol() == QAbstractSocket::IPv6Protocol;
}

std::optional<int> parsePort(const std::string &value)
{
    if (value.empty() || value.size() > 5) {
        return std::nullopt;
    }
    if (!std::all_of(value.begin(), value.end(), [](unsigned char c) {
            return std::isdigit(c) != 0;
        })) {
        return std::nullopt;
    }
    int port = 0;
    try {
        port = std::stoi(value);
    } catch (const std::exception &) {
        return std::nullopt;
    }
    if (port < 1 || port > 65535) {
        return std::nullopt;
    }
    return port;
}

} // namespace

bool isValidHostname(const std::string &fqdn)
{
    // "cam.example." is the fully qualified spelling of "cam.example".
    std::string host = fqdn;
    if (host.size() > 1 && host.back() == '.') {
        host.pop_back();
    }
    if (host.empty() || host.size() > kMaxHostnameLength) {
        return false;
    }

    bool allNumeric = true;
    std::size_t start = 0;
    while (start <= host.size()) {
        const std::size_t dot = host.find('.', start);
        const std::size_t end = dot == std::string::npos ? host.size() : dot;
        const std::string label = host.substr(start, end - start);
        if (label.empty() || label.size() > kMaxLabelLength) {
            return false;
        }
        if (label.front() == '-' || label.back() == '-') {
            return false;
        }
        for (unsigned char c : label) {
            if (!std::isalnum(c) && c != '-') {
                return false;
            }
            if (!std::isdigit(c)) {
                allNumeric = false;
            }
        }
        if (dot == std::string::npos) {
            break;
        }
        start = dot + 1;
    }

    // Dotted numbers must be a real IPv4 address, not "300.1.1.1".
    if (allNumeric) {
        QHostAddress address;
        return address.setAddress(QString::fromStdString(host))
            && address.protocol() == QAbstractSocket::IPv4Protocol;
    }
    return true;
}

std::optional<ProbeTarget> parseProbeTarget(const std::string &address)
{
    if (address.empty()) {
        return std::nullopt;
    }
    if (std::any_of(address.begin(), address.end(), [](unsigned char c) {
            return std::isspace(c) != 0;
        })) {
        return std::nullopt;
    }

    ProbeTarget target;

    if (address.front() == '[') {
        const std::size_t close = address.find(']');
        if (close == std::string::npos) {
            return std::nullopt;
        }
        target.host = address.substr(1, close - 1);
        if (!isIpv6Literal(target.host)) {
            return std::nullopt;
        }
        const std::string rest = address.substr(close + 1);
        if (rest.empty()) {
            return target;
        }
        if (rest.front() != ':') {
            return std::nullopt;
        }
        const auto port = parsePort(rest.substr(1));
        if (!port) {
            return std::nullopt;
        }
        target.port = *port;
        return target;
    }

    const auto colons = std::count(address.begin(), address.end(), ':');
    if (colons > 1) {
        if (!isIpv6Literal(address)) {
            return std::nullopt;
        }
        target.host = address;
        return target;
    }

    if (colons == 1) {
        const std::size_t colon = address.find(':');
        target.host = address.substr(0, colon);
        const auto port = parsePort(address.substr(colon + 1));
        if (!port) {
            return std::nullopt;
        }
        target.port = *port;
    } else {
        target.host = address;
    }

    if (!isValidHostname(target.host)) {
        return std::nullopt;
    }
    return target;
}

} // namespace camwatch
