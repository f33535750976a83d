#include "daemon/telegram_client.hpp"

#include <algorithm>
#include <utility>

#include <QEventLoop>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#include <QUrlQuery>

#include "common/logging.hpp"

namespace camwatch {

namespace {

constexpr int kSendTimeoutMs = 15000;
constexpr int kLongPollSeconds = 25;
constexpr int kPollTransferTimeoutMs = (kLongPollSeconds + 10) * 1000;
constexpr int kPollRetryDelayMs = 5000;

QString apiBaseUrl()
{
    const QString overrideBase = qEnvironmentVariable("CAMWATCH_TELEGRAM_API");
    if (!overrideBase.isEmpty()) {
        return overrideBase;
    }
    return QStringLiteral("https://api.telegram.org");
}

QNetworkRequest jsonRequest(const QUrl &url, int timeoutMs)
{
    QNetworkRequest request(url);
    request.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
    request.setTransferTimeout(timeoutMs);
    return request;
}

nlohmann::json sendMessageBody(std::int64_t chatId, const std::string &text)
{
    return nlohmann::json{
        {"chat_id", chatId},
        {"text", text},
        {"parse_mode", "HTML"},
        {"disable_web_page_preview", true}
    };
}

// Returns an empty string when the Bot API accepted the call.
std::string replyError(QNetworkReply *reply)
{
    const QByteArray payload = reply->readAll();
    nlohmann::json body = nlohmann::json::parse(payload.toStdString(), nullptr, false);
    if (!body.is_discarded() && body.is_object() && body.value("ok", false)) {
        return {};
    }
    if (!body.is_discarded() && body.is_object() && body.contains("description")
        && body.at("description").is_string()) {
        return body.at("description").get<std::string>();
    }
    if (reply->error() != QNetworkReply::NoError) {
        return reply->errorString().toStdString();
    }
    return "unexpected Bot API response";
}

} // namespace

TelegramClient::TelegramClient(QString token,
                               std::shared_ptr<CommandHandler> handler,
                               QObject *parent)
    : QObject(parent)
    , m_token(std::move(token))
    , m_apiBase(apiBaseUrl())
    , m_handler(std::move(handler))
{
}

TelegramClient::~TelegramClient()
{
    stopPolling();
}

QUrl TelegramClient::methodUrl(const QString &method) const
{
    return QUrl(m_apiBase + QStringLiteral("/bot") + m_token + QStringLiteral("/") + method);
}

bool TelegramClient::notify(std::int64_t chatId, const std::string &message, std::string *error)
{
    // Runs on the scheduler thread; nothing here may touch m_network.
    QNetworkAccessManager manager;
    const QByteArray body = QByteArray::fromStdString(sendMessageBody(chatId, message).dump());
    std::unique_ptr<QNetworkReply> reply(
        manager.post(jsonRequest(methodUrl(QStringLiteral("sendMessage")), kSendTimeoutMs), body));

    if (!reply->isFinished()) {
        QEventLoop loop;
        connect(reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);
        loop.exec();
    }

    const std::string failure = replyError(reply.get());
    if (failure.empty()) {
        return true;
    }
    if (error) {
        *error = failure;
    }
    return false;
}

void TelegramClient::startPolling()
{
    if (m_polling) {
        return;
    }
    m_polling = true;
    CWLOG_INFO(QStringLiteral("TelegramClient"),
               QStringLiteral("startPolling"),
               QStringLiteral("command_polling_started"),
               nlohmann::json::object());
    poll();
}

void TelegramClient::stopPolling()
{
    m_polling = false;
    if (m_pendingPoll) {
        m_pendingPoll->abort();
    }
}

void TelegramClient::poll()
{
    if (!m_polling || m_pendingPoll) {
        return;
    }

    QUrl url = methodUrl(QStringLiteral("getUpdates"));
    QUrlQuery query;
    query.addQueryItem(QStringLiteral("timeout"), QString::number(kLongPollSeconds));
    query.addQueryItem(QStringLiteral("offset"), QString::number(m_offset));
    query.addQueryItem(QStringLiteral("allowed_updates"), QStringLiteral("[\"message\"]"));
    url.setQuery(query);

    QNetworkRequest request(url);
    request.setTransferTimeout(kPollTransferTimeoutMs);
    QNetworkReply *reply = m_network.get(request);
    m_pendingPoll = reply;
    connect(reply, &QNetworkReply::finished, this, [this, reply]() {
        handlePollReply(reply);
    });
}

void TelegramClient::handlePollReply(QNetworkReply *reply)
{
    reply->deleteLater();
    m_pendingPoll.clear();
    if (!m_polling) {
        return;
    }

    const QByteArray payload = reply->readAll();
    const nlohmann::json body = nlohmann::json::parse(payload.toStdString(), nullptr, false);
    if (reply->error() != QNetworkReply::NoError || !body.is_object()
        || !body.value("ok", false)) {
        CWLOG_WARN(QStringLiteral("TelegramClient"),
                   QStringLiteral("handlePollReply"),
                   QStringLiteral("poll_failed"),
                   (nlohmann::json{{"error", reply->errorString().toStdString()},
                                   {"retryMs", kPollRetryDelayMs}}));
        QTimer::singleShot(kPollRetryDelayMs, this, &TelegramClient::poll);
        return;
    }

    const auto messages = parseUpdates(body, &m_offset);
    for (const auto &message : messages) {
        const std::string answer = m_handler->handle(message.chatId, message.text);
        if (!answer.empty()) {
            sendReply(message.chatId, answer);
        }
    }

    QTimer::singleShot(0, this, &TelegramClient::poll);
}

void TelegramClient::sendReply(std::int64_t chatId, const std::string &text)
{
    const QByteArray body = QByteArray::fromStdString(sendMessageBody(chatId, text).dump());
    QNetworkReply *reply =
        m_network.post(jsonRequest(methodUrl(QStringLiteral("sendMessage")), kSendTimeoutMs), body);
    connect(reply, &QNetworkReply::finished, this, [reply, chatId]() {
        reply->deleteLater();
        const std::string failure = replyError(reply);
        if (!failure.empty()) {
            CWLOG_WARN(QStringLiteral("TelegramClient"),
                       QStringLiteral("sendReply"),
                       QStringLiteral("reply_failed"),
                       (nlohmann::json{{"chatId", chatId}, {"error", failure}}));
        }
    });
}

std::vector<InboundMessage> TelegramClient::parseUpdates(const nlohmann::json &response,
                                                         qint64 *nextOffset)
{
    std::vector<InboundMessage> messages;
    if (!response.is_object() || !response.contains("result")
        || !response.at("result").is_array()) {
        return messages;
    }

    for (const auto &update : response.at("result")) {
        if (!update.is_object() || !update.contains("update_id")
            || !update.at("update_id").is_number_integer()) {
            continue;
        }
        const qint64 updateId = update.at("update_id").get<qint64>();
        if (nextOffset) {
            *nextOffset = std::max(*nextOffset, updateId + 1);
        }

        auto message = update.find("message");
        if (message == update.end() || !message->is_object()) {
            continue;
        }
        auto text = message->find("text");
        auto chat = message->find("chat");
        if (text == message->end() || !text->is_string()
            || chat == message->end() || !chat->is_object()
            || !chat->contains("id") || !chat->at("id").is_number_integer()) {
            continue;
        }

        InboundMessage inbound;
        inbound.updateId = updateId;
        inbound.chatId = chat->at("id").get<std::int64_t>();
        inbound.text = text->get<std::string>();
        messages.push_back(std::move(inbound));
    }
    return messages;
}

} // namespace camwatch
