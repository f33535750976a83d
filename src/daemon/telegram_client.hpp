#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <QNetworkAccessManager>
#include <QObject>
#include <QPointer>
#include <QString>
#include <QUrl>

#include <nlohmann/json.hpp>

#include "daemon/command_handler.hpp"
#include "daemon/notifier.hpp"

class QNetworkReply;

namespace camwatch {

struct InboundMessage {
    qint64 updateId = 0;
    std::int64_t chatId = 0;
    std::string text;
};

/**
 * TelegramClient talks to the Telegram Bot API.
 *
 * notify() is synchronous and may be called from any thread; it uses its own
 * network manager and event loop per call. Command polling (getUpdates long
 * poll) runs asynchronously on the thread that owns the client.
 */
class TelegramClient : public QObject, public Notifier
{
    Q_OBJECT
public:
    TelegramClient(QString token,
                   std::shared_ptr<CommandHandler> handler,
                   QObject *parent = nullptr);
    ~TelegramClient() override;

    bool notify(std::int64_t chatId, const std::string &message, std::string *error) override;

    void startPolling();
    void stopPolling();

    // Extracts text messages from a getUpdates response. *nextOffset is set
    // past the highest update id seen, including updates without text.
    static std::vector<InboundMessage> parseUpdates(const nlohmann::json &response,
                                                    qint64 *nextOffset);

private slots:
    void poll();

private:
    void handlePollReply(QNetworkReply *reply);
    void sendReply(std::int64_t chatId, const std::string &text);
    QUrl methodUrl(const QString &method) const;

    QString m_token;
    QString m_apiBase;
    std::shared_ptr<CommandHandler> m_handler;
    QNetworkAccessManager m_network;
    QPointer<QNetworkReply> m_pendingPoll;
    qint64 m_offset = 0;
    bool m_polling = false;
};

} // namespace camwatch
