#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"
#include "daemon/device_registry.hpp"
#include "daemon/prober.hpp"

namespace camwatch {

struct ProbeOutcome {
    bool reachable = false;
    bool timedOut = false;
    std::string error;
};

struct CycleResult {
    MonitorState state;
    std::vector<TransitionEvent> events;
    int reachableCount = 0;
    int unreachableCount = 0;
    int timedOutCount = 0;
};

struct Observation {
    LivenessRecord record;
    std::optional<TransitionEvent> event;
};

// One debounce step for a single device. Pure: no probing, no I/O.
Observation applyProbeResult(const LivenessRecord &record,
                             bool reachable,
                             const Thresholds &thresholds,
                             Timestamp now);

/**
 * LivenessEngine runs one polling cycle:
 * - probes every device concurrently, bounded by the probe timeout
 * - feeds each result through applyProbeResult()
 * - returns the complete new state and the transitions it produced
 *
 * It holds no state between cycles; the caller passes the previous state in.
 * Probes get the full probe timeout; the cycle waits a short grace period
 * beyond it before calling a probe hung. Hung probe threads are tracked and
 * the destructor waits (bounded) for them.
 */
class LivenessEngine {
public:
    LivenessEngine(std::shared_ptr<Prober> prober,
                   Thresholds thresholds,
                   std::chrono::milliseconds probeTimeout);
    ~LivenessEngine();

    LivenessEngine(const LivenessEngine &) = delete;
    LivenessEngine &operator=(const LivenessEngine &) = delete;

    CycleResult runCycle(const DeviceRegistry &devices,
                         const MonitorState &current,
                         Timestamp now);

    const Thresholds &thresholds() const
    {
        return m_thresholds;
    }

    std::chrono::milliseconds probeTimeout() const
    {
        return m_probeTimeout;
    }

    // How long a cycle waits for its probes.
    std::chrono::milliseconds joinTimeout() const;

    // Blocks until no probe thread is running or the timeout passes.
    // Returns true when all probe threads have finished.
    bool waitForProbes(std::chrono::milliseconds timeout);

    int runningProbes() const;

private:
    struct Workers {
        mutable std::mutex mutex;
        std::condition_variable idle;
        int running = 0;
    };

    std::vector<ProbeOutcome> probeAll(const std::vector<Device> &devices);

    std::shared_ptr<Workers> m_workers = std::make_shared<Workers>();
    std::shared_ptr<Prober> m_prober;
    Thresholds m_thresholds;
    std::chrono::milliseconds m_probeTimeout;
};

} // namespace camwatch
