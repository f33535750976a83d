#include "daemon/liveness_engine.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <system_error>
#include <thread>
#include <utility>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace camwatch {

namespace {

// A probe that honours its timeout still needs time to clean up (killing a
// ping child, closing a socket) before its result arrives.
constexpr std::chrono::milliseconds kJoinGraceMax{1000};
constexpr std::chrono::milliseconds kShutdownWait{3000};

void transition(Observation &observation, LivenessStatus to, Timestamp now)
{
    LivenessRecord &record = observation.record;

    TransitionEvent event;
    event.deviceId = record.deviceId;
    event.fromStatus = record.status;
    event.toStatus = to;
    event.occurredAt = now;
    observation.event = event;

    record.status = to;
    record.consecutiveFailures = 0;
    record.consecutiveSuccesses = 0;
    record.lastChangedAt = now;
}

LivenessRecord freshRecord(const std::string &deviceId, Timestamp now)
{
    LivenessRecord record;
    record.deviceId = deviceId;
    record.status = LivenessStatus::Unknown;
    record.lastChangedAt = now;
    record.lastCheckedAt = now;
    return record;
}

} // namespace

Observation applyProbeResult(const LivenessRecord &record,
                             bool reachable,
                             const Thresholds &thresholds,
                             Timestamp now)
{
    Observation observation{record, std::nullopt};
    LivenessRecord &next = observation.record;
    next.lastCheckedAt = now;

    if (reachable) {
        next.consecutiveSuccesses += 1;
        next.consecutiveFailures = 0;
        if (next.status != LivenessStatus::Up
            && next.consecutiveSuccesses >= thresholds.up) {
            transition(observation, LivenessStatus::Up, now);
        }
    } else {
        next.consecutiveFailures += 1;
        next.consecutiveSuccesses = 0;
        if (next.status != LivenessStatus::Down
            && next.consecutiveFailures >= thresholds.down) {
            transition(observation, LivenessStatus::Down, now);
        }
    }

    return observation;
}

LivenessEngine::LivenessEngine(std::shared_ptr<Prober> prober,
                               Thresholds thresholds,
                               std::chrono::milliseconds probeTimeout)
    : m_prober(std::move(prober))
    , m_thresholds(thresholds)
    , m_probeTimeout(probeTimeout)
{
}

LivenessEngine::~LivenessEngine()
{
    if (!waitForProbes(kShutdownWait)) {
        CWLOG_WARN(QStringLiteral("LivenessEngine"),
                   QStringLiteral("~LivenessEngine"),
                   QStringLiteral("probe_threads_abandoned"),
                   (nlohmann::json{{"running", runningProbes()},
                                   {"waitedMs", kShutdownWait.count()}}));
    }
}

std::chrono::milliseconds LivenessEngine::joinTimeout() const
{
    return m_probeTimeout + std::min(m_probeTimeout / 2, kJoinGraceMax);
}

bool LivenessEngine::waitForProbes(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(m_workers->mutex);
    return m_workers->idle.wait_for(lock, timeout, [this]() { return m_workers->running == 0; });
}

int LivenessEngine::runningProbes() const
{
    std::lock_guard<std::mutex> lock(m_workers->mutex);
    return m_workers->running;
}

CycleResult LivenessEngine::runCycle(const DeviceRegistry &devices,
                                     const MonitorState &current,
                                     Timestamp now)
{
    const auto &list = devices.devices();
    const std::vector<ProbeOutcome> outcomes = probeAll(list);

    // Everything below runs after the join, in registry order, so the result
    // does not depend on which probe finished first.
    CycleResult result;
    for (std::size_t i = 0; i < list.size(); ++i) {
        const Device &device = list[i];
        const ProbeOutcome &outcome = outcomes[i];

        if (outcome.timedOut) {
            ++result.timedOutCount;
            CWLOG_WARN(QStringLiteral("LivenessEngine"),
                       QStringLiteral("runCycle"),
                       QStringLiteral("probe_timeout"),
                       (nlohmann::json{{"deviceId", device.id},
                                       {"address", device.address},
                                       {"timeoutMs", joinTimeout().count()}}));
        } else if (!outcome.error.empty()) {
            CWLOG_WARN(QStringLiteral("LivenessEngine"),
                       QStringLiteral("runCycle"),
                       QStringLiteral("probe_error"),
                       (nlohmann::json{{"deviceId", device.id},
                                       {"address", device.address},
                                       {"error", outcome.error}}));
        }

        if (outcome.reachable) {
            ++result.reachableCount;
        } else {
            ++result.unreachableCount;
        }

        auto it = current.find(device.id);
        const LivenessRecord previous = it != current.end()
            ? it->second
            : freshRecord(device.id, now);

        Observation observation =
            applyProbeResult(previous, outcome.reachable, m_thresholds, now);

        CWLOG_DEBUG(QStringLiteral("LivenessEngine"),
                    QStringLiteral("runCycle"),
                    QStringLiteral("probe_result"),
                    (nlohmann::json{{"reachable", outcome.reachable},
                                    {"record", observation.record}}));

        if (observation.event) {
            CWLOG_INFO(QStringLiteral("LivenessEngine"),
                       QStringLiteral("runCycle"),
                       QStringLiteral("status_transition"),
                       (nlohmann::json{{"event", *observation.event}}));
            result.events.push_back(*observation.event);
        }
        result.state.emplace(device.id, std::move(observation.record));
    }

    return result;
}

std::vector<ProbeOutcome> LivenessEngine::probeAll(const std::vector<Device> &devices)
{
    std::vector<ProbeOutcome> outcomes(devices.size());
    std::vector<std::future<ProbeOutcome>> futures;
    futures.reserve(devices.size());

    // Workers are detached and keep the prober and their promise alive on
    // their own, so a probe that hangs past the deadline cannot stall the
    // cycle. The running count lets the destructor wait for stragglers.
    for (std::size_t i = 0; i < devices.size(); ++i) {
        auto promise = std::make_shared<std::promise<ProbeOutcome>>();
        futures.push_back(promise->get_future());

        {
            std::lock_guard<std::mutex> lock(m_workers->mutex);
            ++m_workers->running;
        }
        try {
            std::thread([workers = m_workers,
                         prober = m_prober,
                         promise,
                         address = devices[i].address,
                         timeout = m_probeTimeout]() mutable {
                ProbeOutcome outcome;
                try {
                    outcome.reachable = prober->probe(address, timeout);
                } catch (const std::exception &ex) {
                    outcome.reachable = false;
                    outcome.error = ex.what();
                }
                promise->set_value(std::move(outcome));
                prober.reset();
                promise.reset();

                std::lock_guard<std::mutex> lock(workers->mutex);
                if (--workers->running == 0) {
                    workers->idle.notify_all();
                }
            }).detach();
        } catch (const std::system_error &ex) {
            {
                std::lock_guard<std::mutex> lock(m_workers->mutex);
                --m_workers->running;
            }
            ProbeOutcome failed;
            failed.error = std::string("cannot start probe thread: ") + ex.what();
            promise->set_value(std::move(failed));
        }
    }

    const auto deadline = std::chrono::steady_clock::now() + joinTimeout();
    for (std::size_t i = 0; i < futures.size(); ++i) {
        if (futures[i].wait_until(deadline) == std::future_status::ready) {
            outcomes[i] = futures[i].get();
        } else {
            outcomes[i].reachable = false;
            outcomes[i].timedOut = true;
        }
    }

    return outcomes;
}

} // namespace camwatch
