#include "daemon/notification_dispatcher.hpp"

#include <exception>
#include <utility>

#include <QDateTime>
#include <QString>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace camwatch {

namespace {

std::string escapeHtml(const std::string &value)
{
    return QString::fromStdString(value).toHtmlEscaped().toStdString();
}

std::string joinNames(const std::vector<std::string> &names)
{
    std::string joined;
    for (const auto &name : names) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += escapeHtml(name);
    }
    return joined;
}

} // namespace

std::string formatLocalTime(Timestamp timestamp)
{
    return QDateTime::fromMSecsSinceEpoch(toEpochMillis(timestamp))
        .toString(QStringLiteral("yyyy-MM-dd HH:mm:ss"))
        .toStdString();
}

NotificationDispatcher::NotificationDispatcher(std::shared_ptr<Notifier> notifier,
                                               std::string senderName)
    : m_notifier(std::move(notifier))
    , m_senderName(std::move(senderName))
{
}

std::string NotificationDispatcher::formatTransition(const TransitionEvent &event,
                                                     const DeviceRegistry &devices) const
{
    const Device *device = devices.find(event.deviceId);
    const std::string name = escapeHtml(device ? device->displayName : event.deviceId);
    const std::string host = escapeHtml(device ? device->address : std::string("?"));

    std::string body;
    if (event.toStatus == LivenessStatus::Down) {
        body = "❌ ALERT CCTV <b>" + name + "</b> DOWN";
    } else {
        body = "📷 <b>" + name + "</b> is back UP ✅";
    }
    body += "\nHost: <code>" + host + "</code>";
    body += "\nPrevious: " + toStatusString(event.fromStatus);
    body += "\nTime: " + formatLocalTime(event.occurredAt);

    return "🛰️ " + escapeHtml(m_senderName) + "\n\n" + body;
}

std::string NotificationDispatcher::formatSummary(const DeviceRegistry &devices,
                                                  const MonitorState &state,
                                                  Timestamp now) const
{
    std::vector<std::string> down;
    std::vector<std::string> unknown;
    for (const auto &device : devices.devices()) {
        auto it = state.find(device.id);
        const LivenessStatus status = it != state.end()
            ? it->second.status
            : LivenessStatus::Unknown;
        if (status == LivenessStatus::Down) {
            down.push_back(device.displayName);
        } else if (status == LivenessStatus::Unknown) {
            unknown.push_back(device.displayName);
        }
    }

    std::string body = "🫀 <b>Daily Heartbeat</b>: " + formatLocalTime(now);
    body += "\nMonitor active. Total cameras: " + std::to_string(devices.size());
    if (!down.empty()) {
        body += "\n❌ DOWN: " + joinNames(down);
    }
    if (!unknown.empty()) {
        body += "\n❔ UNKNOWN: " + joinNames(unknown);
    }
    if (down.empty() && unknown.empty()) {
        body += "\n✅ All cameras UP.";
    }

    return "🛰️ " + escapeHtml(m_senderName) + "\n\n" + body;
}

DispatchReport NotificationDispatcher::dispatch(const std::vector<TransitionEvent> &events,
                                                const DeviceRegistry &devices,
                                                const std::vector<Subscriber> &subscribers)
{
    DispatchReport report;
    for (const auto &event : events) {
        ++report.events;
        deliver(formatTransition(event, devices), subscribers, report);
    }

    if (report.events > 0) {
        CWLOG_INFO(QStringLiteral("NotificationDispatcher"),
                   QStringLiteral("dispatch"),
                   QStringLiteral("events_dispatched"),
                   (nlohmann::json{{"events", report.events},
                                   {"subscribers", subscribers.size()},
                                   {"delivered", report.delivered},
                                   {"failed", report.failed}}));
    }
    return report;
}

DispatchReport NotificationDispatcher::dispatchSummary(const DeviceRegistry &devices,
                                                       const MonitorState &state,
                                                       const std::vector<Subscriber> &subscribers)
{
    DispatchReport report;
    if (subscribers.empty()) {
        return report;
    }

    deliver(formatSummary(devices, state, std::chrono::system_clock::now()),
            subscribers, report);
    CWLOG_INFO(QStringLiteral("NotificationDispatcher"),
               QStringLiteral("dispatchSummary"),
               QStringLiteral("daily_summary_sent"),
               (nlohmann::json{{"delivered", report.delivered}, {"failed", report.failed}}));
    return report;
}

DispatchReport NotificationDispatcher::broadcast(const std::string &text,
                                                const std::vector<Subscriber> &subscribers)
{
    DispatchReport report;
    deliver("🛰️ " + escapeHtml(m_senderName) + "\n\n" + text, subscribers, report);
    CWLOG_INFO(QStringLiteral("NotificationDispatcher"),
               QStringLiteral("broadcast"),
               QStringLiteral("broadcast_sent"),
               (nlohmann::json{{"subscribers", subscribers.size()},
                               {"delivered", report.delivered},
                               {"failed", report.failed}}));
    return report;
}

void NotificationDispatcher::deliver(const std::string &message,
                                     const std::vector<Subscriber> &subscribers,
                                     DispatchReport &report)
{
    for (const auto &subscriber : subscribers) {
        ++report.attempted;

        std::string error;
        bool delivered = false;
        try {
            delivered = m_notifier->notify(subscriber.chatId, message, &error);
        } catch (const std::exception &ex) {
            delivered = false;
            error = ex.what();
        }

        if (delivered) {
            ++report.delivered;
            continue;
        }

        ++report.failed;
        CWLOG_WARN(QStringLiteral("NotificationDispatcher"),
                   QStringLiteral("deliver"),
                   QStringLiteral("delivery_failed"),
                   (nlohmann::json{{"chatId", subscriber.chatId}, {"error", error}}));
    }
}

} // namespace camwatch
