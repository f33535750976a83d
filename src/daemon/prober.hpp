#pragma once

#include <chrono>
#include <string>

namespace camwatch {

// Reachability check for one device address. Implementations must be safe to
// call from several threads at once; the engine probes devices concurrently.
// Any exception is treated by the caller as "unreachable".
class Prober {
public:
    virtual ~Prober() = default;

    virtual bool probe(const std::string &address, std::chrono::milliseconds timeout) = 0;
};

} // namespace camwatch
