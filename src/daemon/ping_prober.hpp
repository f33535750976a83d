#pragma once

#include <chrono>
#include <string>

#include "daemon/prober.hpp"

namespace camwatch {

// Probes "host" with one ICMP echo through the system ping binary, and
// "host:port" with a TCP connect (RTSP cameras usually answer on 554).
class PingProber : public Prober {
public:
    bool probe(const std::string &address, std::chrono::milliseconds timeout) override;

private:
    bool pingHost(const std::string &host, std::chrono::milliseconds timeout);
    bool connectTcp(const std::string &host, int port, std::chrono::milliseconds timeout);
};

} // namespace camwatch
