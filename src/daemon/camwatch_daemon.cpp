#include "daemon/camwatch_daemon.hpp"

#include <chrono>
#include <utility>

#include <QDebug>
#include <QDir>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "daemon/device_registry.hpp"
#include "daemon/liveness_engine.hpp"
#include "daemon/log_notifier.hpp"
#include "daemon/notification_dispatcher.hpp"
#include "daemon/ping_prober.hpp"
#include "daemon/state_store.hpp"
#include "daemon/telegram_client.hpp"

#include "common/camwatch_version.hpp"

namespace camwatch {

namespace {

std::string dataFile(const std::string &dataDir, const char *name)
{
    return QDir(QString::fromStdString(dataDir)).filePath(QString::fromLatin1(name)).toStdString();
}

} // namespace

CamwatchDaemon::CamwatchDaemon(MonitorConfig config, QString telegramToken, QObject *parent)
    : QObject(parent)
    , m_config(std::move(config))
{
    if (!QDir().mkpath(QString::fromStdString(m_config.dataDir))) {
        qWarning() << "camwatch: cannot create data directory"
                   << QString::fromStdString(m_config.dataDir);
    }

    m_subscribers = std::make_shared<SubscriberRegistry>(dataFile(m_config.dataDir, "subscribers.db"));
    m_commands = std::make_shared<CommandHandler>(m_subscribers, [this]() {
        return formatStatusReport(m_scheduler->devices(), m_scheduler->currentState());
    });

    if (!telegramToken.isEmpty()) {
        m_telegram = std::make_shared<TelegramClient>(telegramToken, m_commands);
        m_notifier = m_telegram;
    } else {
        CWLOG_WARN(QStringLiteral("CamwatchDaemon"),
                   QStringLiteral("CamwatchDaemon"),
                   QStringLiteral("telegram_disabled"),
                   (nlohmann::json{{"reason", "CAMWATCH_TELEGRAM_TOKEN not set"}}));
        m_notifier = std::make_shared<LogNotifier>();
    }

    Thresholds thresholds;
    thresholds.up = m_config.upThreshold;
    thresholds.down = m_config.downThreshold;

    auto prober = std::make_shared<PingProber>();
    const std::chrono::milliseconds probeTimeout = std::chrono::seconds(m_config.probeTimeoutSeconds);
    auto engine = std::make_unique<LivenessEngine>(prober, thresholds, probeTimeout);

    m_scheduler = std::make_unique<MonitorScheduler>(
        DeviceRegistry(m_config.devices),
        std::chrono::seconds(m_config.pollIntervalSeconds),
        std::move(engine),
        std::make_unique<StateStore>(dataFile(m_config.dataDir, "state.db")),
        m_subscribers,
        std::make_unique<NotificationDispatcher>(m_notifier, m_config.senderName));
    m_scheduler->setDailySummaryTime(m_config.dailySummaryMinutes);

    m_commands->setPinger(prober, DeviceRegistry(m_config.devices), probeTimeout);
    m_commands->setBroadcaster([this](const std::string &text) {
        return m_scheduler->broadcast(text);
    });
}

CamwatchDaemon::~CamwatchDaemon()
{
    stop();
    // The scheduler holds the notifier; it must go before the client.
    m_scheduler.reset();
}

void CamwatchDaemon::start()
{
    qInfo() << "camwatch: daemon starting (version" << CAMWATCH_VERSION << ")";
    CWLOG_INFO(QStringLiteral("CamwatchDaemon"),
               QStringLiteral("start"),
               QStringLiteral("daemon_start"),
               (nlohmann::json{{"version", CAMWATCH_VERSION},
                               {"cameras", m_config.devices},
                               {"pollIntervalSeconds", m_config.pollIntervalSeconds},
                               {"upThreshold", m_config.upThreshold},
                               {"downThreshold", m_config.downThreshold},
                               {"probeTimeoutSeconds", m_config.probeTimeoutSeconds},
                               {"dataDir", m_config.dataDir},
                               {"telegram", m_telegram != nullptr}}));

    if (m_telegram) {
        m_telegram->startPolling();
    }
    m_scheduler->start();
}

void CamwatchDaemon::stop()
{
    if (m_telegram) {
        m_telegram->stopPolling();
    }
    if (m_scheduler && m_scheduler->state() != SchedulerState::Stopped) {
        m_scheduler->stop();
        CWLOG_INFO(QStringLiteral("CamwatchDaemon"),
                   QStringLiteral("stop"),
                   QStringLiteral("daemon_stopped"),
                   nlohmann::json::object());
    }
}

CycleReport CamwatchDaemon::runOnce()
{
    return m_scheduler->runCycleNow();
}

} // namespace camwatch
