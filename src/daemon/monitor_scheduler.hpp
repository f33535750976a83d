#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <QDateTime>
#include <QtGlobal>

#include "common/models.hpp"
#include "daemon/device_registry.hpp"
#include "daemon/liveness_engine.hpp"
#include "daemon/notification_dispatcher.hpp"
#include "daemon/state_store.hpp"
#include "daemon/subscriber_registry.hpp"

namespace camwatch {

struct CycleReport {
    std::uint64_t cycle = 0;
    Timestamp startedAt;
    std::chrono::milliseconds duration{0};
    int transitions = 0;
    int reachable = 0;
    int unreachable = 0;
    bool persisted = false;
    std::string persistError;
    DispatchReport dispatch;
    bool summarySent = false;
};

/**
 * MonitorScheduler drives the liveness cycle on a background thread:
 * - one cycle per interval, never two at once
 * - state saved after every cycle, before notifications go out
 * - stop() lets the running cycle finish, save included
 *
 * The previous cycle's state lives in memory, so a failed save does not lose
 * debounce progress; it is retried implicitly by the next cycle's save.
 */
class MonitorScheduler {
public:
    using LocalClock = std::function<QDateTime()>;

    MonitorScheduler(DeviceRegistry devices,
                     std::chrono::milliseconds interval,
                     std::unique_ptr<LivenessEngine> engine,
                     std::unique_ptr<StateStore> store,
                     std::shared_ptr<SubscriberRegistry> subscribers,
                     std::unique_ptr<NotificationDispatcher> dispatcher);
    ~MonitorScheduler();

    MonitorScheduler(const MonitorScheduler &) = delete;
    MonitorScheduler &operator=(const MonitorScheduler &) = delete;

    void start();
    void stop();
    SchedulerState state() const;

    // Runs one cycle on the calling thread. Waits for an in-flight cycle first.
    CycleReport runCycleNow();

    MonitorState currentState() const;
    const DeviceRegistry &devices() const
    {
        return m_devices;
    }

    // Called on the scheduler thread after every cycle.
    void setCycleObserver(std::function<void(const CycleReport &)> observer);

    // Minutes after local midnight; nullopt disables the daily summary.
    // Call after setLocalClock(): starting past today's time skips today.
    void setDailySummaryTime(std::optional<int> minutesAfterMidnight);

    // Local wall clock used for the daily summary. Defaults to the system clock.
    void setLocalClock(LocalClock clock);

    // Sends one message to every subscriber, outside the cycle.
    DispatchReport broadcast(const std::string &text);

private:
    void loop();
    bool maybeSendSummary();

    DeviceRegistry m_devices;
    std::chrono::milliseconds m_interval;
    std::unique_ptr<LivenessEngine> m_engine;
    std::unique_ptr<StateStore> m_store;
    std::shared_ptr<SubscriberRegistry> m_subscribers;
    std::unique_ptr<NotificationDispatcher> m_dispatcher;

    std::mutex m_cycleMutex;
    std::uint64_t m_cycleCount = 0;

    mutable std::mutex m_stateMutex;
    MonitorState m_state;

    std::mutex m_wakeMutex;
    std::condition_variable m_wake;
    bool m_stopRequested = false;
    std::atomic<SchedulerState> m_schedulerState{SchedulerState::Stopped};
    std::thread m_thread;

    std::mutex m_observerMutex;
    std::function<void(const CycleReport &)> m_observer;

    LocalClock m_localClock;
    std::optional<int> m_summaryMinutes;
    qint64 m_lastSummaryDay = 0;
};

} // namespace camwatch
