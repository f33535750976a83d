#include "daemon/monitor_scheduler.hpp"

#include <utility>

#include <QDateTime>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace camwatch {

namespace {

// Whole milliseconds, the resolution the state store keeps.
Timestamp cycleTimestamp()
{
    return std::chrono::time_point_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
}

int localMinuteOfDay(const QDateTime &local)
{
    return local.time().hour() * 60 + local.time().minute();
}

} // namespace

MonitorScheduler::MonitorScheduler(DeviceRegistry devices,
                                   std::chrono::milliseconds interval,
                                   std::unique_ptr<LivenessEngine> engine,
                                   std::unique_ptr<StateStore> store,
                                   std::shared_ptr<SubscriberRegistry> subscribers,
                                   std::unique_ptr<NotificationDispatcher> dispatcher)
    : m_devices(std::move(devices))
    , m_interval(interval)
    , m_engine(std::move(engine))
    , m_store(std::move(store))
    , m_subscribers(std::move(subscribers))
    , m_dispatcher(std::move(dispatcher))
    , m_localClock([]() { return QDateTime::currentDateTime(); })
{
    std::string error;
    const MonitorState loaded = m_store->load(&error);
    if (!error.empty()) {
        CWLOG_WARN(QStringLiteral("MonitorScheduler"),
                   QStringLiteral("MonitorScheduler"),
                   QStringLiteral("state_reset"),
                   (nlohmann::json{{"reason", error}}));
    }

    m_state = m_devices.prune(loaded);
    CWLOG_INFO(QStringLiteral("MonitorScheduler"),
               QStringLiteral("MonitorScheduler"),
               QStringLiteral("state_restored"),
               (nlohmann::json{{"records", m_state.size()},
                               {"dropped", loaded.size() - m_state.size()}}));
}

MonitorScheduler::~MonitorScheduler()
{
    stop();
}

void MonitorScheduler::start()
{
    SchedulerState expected = SchedulerState::Stopped;
    if (!m_schedulerState.compare_exchange_strong(expected, SchedulerState::Running)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_wakeMutex);
        m_stopRequested = false;
    }
    m_thread = std::thread(&MonitorScheduler::loop, this);

    CWLOG_INFO(QStringLiteral("MonitorScheduler"),
               QStringLiteral("start"),
               QStringLiteral("scheduler_started"),
               (nlohmann::json{{"intervalMs", m_interval.count()},
                               {"devices", m_devices.size()}}));
}

void MonitorScheduler::stop()
{
    SchedulerState expected = SchedulerState::Running;
    if (!m_schedulerState.compare_exchange_strong(expected, SchedulerState::Stopping)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_wakeMutex);
        m_stopRequested = true;
    }
    m_wake.notify_all();

    // The loop only checks for stop between cycles, so this waits for the
    // in-flight cycle, save included.
    if (m_thread.joinable()) {
        m_thread.join();
    }

    m_schedulerState = SchedulerState::Stopped;
    CWLOG_INFO(QStringLiteral("MonitorScheduler"),
               QStringLiteral("stop"),
               QStringLiteral("scheduler_stopped"),
               (nlohmann::json{{"cycles", m_cycleCount}}));
}

SchedulerState MonitorScheduler::state() const
{
    return m_schedulerState.load();
}

void MonitorScheduler::loop()
{
    auto nextTick = std::chrono::steady_clock::now();
    while (true) {
        {
            std::unique_lock<std::mutex> lock(m_wakeMutex);
            m_wake.wait_until(lock, nextTick, [this]() { return m_stopRequested; });
            if (m_stopRequested) {
                break;
            }
        }

        const auto started = std::chrono::steady_clock::now();
        runCycleNow();

        // An overrun cycle is followed immediately by the next one; missed
        // ticks are not replayed.
        nextTick = started + m_interval;
        const auto now = std::chrono::steady_clock::now();
        if (nextTick < now) {
            CWLOG_WARN(QStringLiteral("MonitorScheduler"),
                       QStringLiteral("loop"),
                       QStringLiteral("cycle_overran_interval"),
                       (nlohmann::json{{"intervalMs", m_interval.count()}}));
            nextTick = now;
        }
    }
}

CycleReport MonitorScheduler::runCycleNow()
{
    std::lock_guard<std::mutex> cycleLock(m_cycleMutex);

    CycleReport report;
    report.cycle = ++m_cycleCount;
    logging::CorrelationScope corr(QStringLiteral("cycle-%1").arg(report.cycle));

    const auto steadyStart = std::chrono::steady_clock::now();
    report.startedAt = cycleTimestamp();

    MonitorState previous;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        previous = m_state;
    }

    CycleResult result = m_engine->runCycle(m_devices, previous, report.startedAt);
    report.transitions = static_cast<int>(result.events.size());
    report.reachable = result.reachableCount;
    report.unreachable = result.unreachableCount;

    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_state = result.state;
    }

    // Persist first: delivery outcome must never decide what is on disk.
    std::string saveError;
    report.persisted = m_store->save(result.state, &saveError);
    if (!report.persisted) {
        report.persistError = saveError;
    }

    if (!result.events.empty()) {
        std::string listError;
        const auto subscribers = m_subscribers->list(&listError);
        if (!listError.empty()) {
            CWLOG_ERROR(QStringLiteral("MonitorScheduler"),
                        QStringLiteral("runCycleNow"),
                        QStringLiteral("subscribers_unavailable"),
                        (nlohmann::json{{"events", result.events.size()},
                                        {"error", listError}}));
        }
        report.dispatch = m_dispatcher->dispatch(result.events, m_devices, subscribers);
    }

    report.summarySent = maybeSendSummary();
    report.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - steadyStart);

    CWLOG_INFO(QStringLiteral("MonitorScheduler"),
               QStringLiteral("runCycleNow"),
               QStringLiteral("cycle_complete"),
               (nlohmann::json{{"cycle", report.cycle},
                               {"durationMs", report.duration.count()},
                               {"reachable", report.reachable},
                               {"unreachable", report.unreachable},
                               {"transitions", report.transitions},
                               {"persisted", report.persisted},
                               {"delivered", report.dispatch.delivered},
                               {"deliveryFailures", report.dispatch.failed}}));

    std::function<void(const CycleReport &)> observer;
    {
        std::lock_guard<std::mutex> lock(m_observerMutex);
        observer = m_observer;
    }
    if (observer) {
        observer(report);
    }
    return report;
}

MonitorState MonitorScheduler::currentState() const
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_state;
}

void MonitorScheduler::setCycleObserver(std::function<void(const CycleReport &)> observer)
{
    std::lock_guard<std::mutex> lock(m_observerMutex);
    m_observer = std::move(observer);
}

void MonitorScheduler::setDailySummaryTime(std::optional<int> minutes)
{
    std::lock_guard<std::mutex> cycleLock(m_cycleMutex);
    m_summaryMinutes = minutes;
    if (!m_summaryMinutes) {
        return;
    }

    // Starting after today's summary time skips today's summary.
    const QDateTime now = m_localClock();
    const qint64 today = now.date().toJulianDay();
    m_lastSummaryDay = localMinuteOfDay(now) >= *m_summaryMinutes ? today : today - 1;
}

void MonitorScheduler::setLocalClock(LocalClock clock)
{
    std::lock_guard<std::mutex> cycleLock(m_cycleMutex);
    m_localClock = std::move(clock);
}

DispatchReport MonitorScheduler::broadcast(const std::string &text)
{
    std::string listError;
    const auto subscribers = m_subscribers->list(&listError);
    if (!listError.empty()) {
        CWLOG_ERROR(QStringLiteral("MonitorScheduler"),
                    QStringLiteral("broadcast"),
                    QStringLiteral("subscribers_unavailable"),
                    (nlohmann::json{{"error", listError}}));
    }
    return m_dispatcher->broadcast(text, subscribers);
}

bool MonitorScheduler::maybeSendSummary()
{
    if (!m_summaryMinutes) {
        return false;
    }

    const QDateTime now = m_localClock();
    const qint64 today = now.date().toJulianDay();
    if (today == m_lastSummaryDay || localMinuteOfDay(now) < *m_summaryMinutes) {
        return false;
    }

    // Without the subscriber list the day stays open and the next cycle retries.
    std::string listError;
    const auto subscribers = m_subscribers->list(&listError);
    if (!listError.empty()) {
        CWLOG_ERROR(QStringLiteral("MonitorScheduler"),
                    QStringLiteral("maybeSendSummary"),
                    QStringLiteral("daily_summary_deferred"),
                    (nlohmann::json{{"day", now.date().toString(Qt::ISODate).toStdString()},
                                    {"error", listError}}));
        return false;
    }
    m_lastSummaryDay = today;

    MonitorState snapshot;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        snapshot = m_state;
    }
    m_dispatcher->dispatchSummary(m_devices, snapshot, subscribers);
    return true;
}

} // namespace camwatch
