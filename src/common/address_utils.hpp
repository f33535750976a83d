#pragma once

#include <optional>
#include <string>

namespace camwatch {

// Where a probe goes. A zero port means an ICMP echo; otherwise a TCP connect.
struct ProbeTarget {
    std::string host;
    int port = 0;
};

// Accepts "host", "host:port", "[v6]", "[v6]:port" and a bare IPv6 literal.
// Returns nullopt for anything that is not a usable address.
std::optional<ProbeTarget> parseProbeTarget(const std::string &address);

bool isValidHostname(const std::string &host);

} // namespace camwatch
