#pragma once

#include <memory>

#include <QObject>
#include <QString>

#include "daemon/command_handler.hpp"
#include "daemon/monitor_config.hpp"
#include "daemon/monitor_scheduler.hpp"
#include "daemon/notifier.hpp"
#include "daemon/subscriber_registry.hpp"

namespace camwatch {

class TelegramClient;

/**
 * CamwatchDaemon wires a validated configuration into running components:
 * - ping prober, liveness engine and state store under the scheduler
 * - subscriber registry shared by the scheduler and the command handler
 * - Telegram client when a bot token is given, log-only notifier otherwise
 *
 * It is owned from main() and lives on the Qt main thread.
 */
class CamwatchDaemon : public QObject
{
    Q_OBJECT
public:
    CamwatchDaemon(MonitorConfig config, QString telegramToken, QObject *parent = nullptr);
    ~CamwatchDaemon() override;

    void start();
    void stop();

    // Single synchronous cycle without starting the scheduler thread.
    CycleReport runOnce();

    const MonitorConfig &config() const
    {
        return m_config;
    }

private:
    MonitorConfig m_config;
    std::shared_ptr<SubscriberRegistry> m_subscribers;
    std::shared_ptr<CommandHandler> m_commands;
    std::shared_ptr<TelegramClient> m_telegram;
    std::shared_ptr<Notifier> m_notifier;
    std::unique_ptr<MonitorScheduler> m_scheduler;
};

} // namespace camwatch
