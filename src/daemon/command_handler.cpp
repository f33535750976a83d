#include "daemon/command_handler.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <utility>

#include <QString>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace camwatch {

namespace {

constexpr const char *kStorageErrorReply =
    "⚠️ Subscription storage is unavailable right now. Please try again later.";

std::string toLower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string escapeHtml(const std::string &value)
{
    return QString::fromStdString(value).toHtmlEscaped().toStdString();
}

bool isSpace(unsigned char c)
{
    return std::isspace(c) != 0;
}

std::string helpText(bool subscribed)
{
    std::string text = "ℹ️ <b>Commands</b>\n\n";
    if (subscribed) {
        text += "/status - Show the status of every camera\n"
                "/ping [name] - Ping one camera now\n"
                "/testalert - Send a test message to every subscriber\n"
                "/stop - Stop receiving alerts\n";
    } else {
        text += "/start - Receive camera alerts\n";
    }
    text += "/help - Show this help\n";
    return text;
}

} // namespace

std::string commandName(const std::string &text)
{
    const auto begin = std::find_if(text.begin(), text.end(), [](unsigned char c) {
        return !std::isspace(c);
    });
    const auto end = std::find_if(begin, text.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
    std::string token(begin, end);
    if (token.empty() || token.front() != '/') {
        return {};
    }
    const auto at = token.find('@');
    if (at != std::string::npos) {
        token.erase(at);
    }
    return toLower(token);
}

std::string commandArgument(const std::string &text)
{
    auto it = std::find_if_not(text.begin(), text.end(), isSpace);
    it = std::find_if(it, text.end(), isSpace);
    it = std::find_if_not(it, text.end(), isSpace);

    auto last = text.end();
    while (last != it && isSpace(static_cast<unsigned char>(*(last - 1)))) {
        --last;
    }
    return std::string(it, last);
}

std::string formatStatusReport(const DeviceRegistry &devices, const MonitorState &state)
{
    if (devices.empty()) {
        return "No cameras configured.";
    }

    std::string report;
    for (const auto &device : devices.devices()) {
        auto it = state.find(device.id);
        const LivenessStatus status = it != state.end()
            ? it->second.status
            : LivenessStatus::Unknown;

        const char *emoji = "❔";
        if (status == LivenessStatus::Up) {
            emoji = "✅";
        } else if (status == LivenessStatus::Down) {
            emoji = "❌";
        }

        if (!report.empty()) {
            report += "\n";
        }
        report += std::string(emoji) + " <b>"
            + escapeHtml(device.displayName)
            + "</b>: " + toStatusString(status);
    }
    return report;
}

CommandHandler::CommandHandler(std::shared_ptr<SubscriberRegistry> subscribers,
                               StatusProvider statusProvider)
    : m_subscribers(std::move(subscribers))
    , m_statusProvider(std::move(statusProvider))
{
}

void CommandHandler::setPinger(std::shared_ptr<Prober> prober,
                               DeviceRegistry devices,
                               std::chrono::milliseconds timeout)
{
    m_prober = std::move(prober);
    m_devices = std::move(devices);
    m_probeTimeout = timeout;
}

void CommandHandler::setBroadcaster(Broadcaster broadcaster)
{
    m_broadcaster = std::move(broadcaster);
}

std::string CommandHandler::handle(std::int64_t chatId, const std::string &text)
{
    const std::string command = commandName(text);
    CWLOG_DEBUG(QStringLiteral("CommandHandler"),
                QStringLiteral("handle"),
                QStringLiteral("command_received"),
                (nlohmann::json{{"chatId", chatId}, {"command", command}}));

    if (command == "/start") {
        return handleStart(chatId);
    }
    if (command == "/stop") {
        return handleStop(chatId);
    }
    if (command == "/status") {
        return handleStatus(chatId);
    }
    if (command == "/ping") {
        return handlePing(chatId, commandArgument(text));
    }
    if (command == "/testalert") {
        return handleTestAlert(chatId);
    }
    if (command == "/help") {
        return helpText(m_subscribers->contains(chatId));
    }
    return "Unknown command. Type /help for the list of commands.";
}

std::string CommandHandler::handleStart(std::int64_t chatId)
{
    switch (m_subscribers->add(chatId)) {
    case AddResult::Added:
        return "✅ Subscribed. You will be alerted when a camera goes DOWN or comes back UP.";
    case AddResult::AlreadyPresent:
        return "✅ You are already subscribed. Type /help for commands.";
    case AddResult::StorageError:
        break;
    }
    return kStorageErrorReply;
}

std::string CommandHandler::handleStop(std::int64_t chatId)
{
    switch (m_subscribers->remove(chatId)) {
    case RemoveResult::Removed:
        return "⏹️ Unsubscribed. You will no longer receive alerts.";
    case RemoveResult::NotPresent:
        return "ℹ️ You are not subscribed.";
    case RemoveResult::StorageError:
        break;
    }
    return kStorageErrorReply;
}

std::string CommandHandler::handleStatus(std::int64_t chatId)
{
    if (!m_subscribers->contains(chatId)) {
        return "🚫 Subscribe with /start to see camera status.";
    }
    return m_statusProvider();
}

std::string CommandHandler::handlePing(std::int64_t chatId, const std::string &argument)
{
    if (!m_subscribers->contains(chatId)) {
        return "🚫 Subscribe with /start to ping cameras.";
    }
    if (!m_prober) {
        return "Ping is not available.";
    }

    if (argument.empty()) {
        std::string names;
        for (const auto &device : m_devices.devices()) {
            names += "\n• " + escapeHtml(device.displayName);
        }
        return "Usage: /ping &lt;camera name&gt;\n\nCameras:" + names;
    }

    const QString wanted = QString::fromStdString(argument);
    const auto &devices = m_devices.devices();
    auto it = std::find_if(devices.begin(), devices.end(), [&wanted](const Device &device) {
        return QString::fromStdString(device.displayName).compare(wanted, Qt::CaseInsensitive) == 0
            || QString::fromStdString(device.id).compare(wanted, Qt::CaseInsensitive) == 0;
    });
    if (it == devices.end()) {
        return "❌ Camera not found. Type /ping to list cameras.";
    }

    bool reachable = false;
    try {
        reachable = m_prober->probe(it->address, m_probeTimeout);
    } catch (const std::exception &ex) {
        CWLOG_WARN(QStringLiteral("CommandHandler"),
                   QStringLiteral("handlePing"),
                   QStringLiteral("probe_error"),
                   (nlohmann::json{{"device", *it}, {"error", ex.what()}}));
    }

    CWLOG_INFO(QStringLiteral("CommandHandler"),
               QStringLiteral("handlePing"),
               QStringLiteral("manual_ping"),
               (nlohmann::json{{"chatId", chatId}, {"device", *it}, {"reachable", reachable}}));
    return std::string(reachable ? "✅" : "❌") + " <b>" + escapeHtml(it->displayName) + "</b>: "
        + (reachable ? "UP" : "DOWN");
}

std::string CommandHandler::handleTestAlert(std::int64_t chatId)
{
    if (!m_subscribers->contains(chatId)) {
        return "🚫 Subscribe with /start to send a test alert.";
    }
    if (!m_broadcaster) {
        return "Test alerts are not available.";
    }

    const DispatchReport report =
        m_broadcaster("🔔 Test alert from the bot. The Telegram path is OK.");
    return "🔔 Test alert sent to " + std::to_string(report.delivered) + " of "
        + std::to_string(report.attempted) + " subscribers.";
}

} // namespace camwatch
