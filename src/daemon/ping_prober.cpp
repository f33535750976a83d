#include "daemon/ping_prober.hpp"

#include <algorithm>

#include <QStringList>
#include <QTcpSocket>

#include <nlohmann/json.hpp>

#include "common/address_utils.hpp"
#include "common/logging.hpp"
#include "common/process_utils.hpp"

namespace camwatch {

bool PingProber::probe(const std::string &address, std::chrono::milliseconds timeout)
{
    const auto target = parseProbeTarget(address);
    if (!target) {
        CWLOG_WARN(QStringLiteral("PingProber"),
                   QStringLiteral("probe"),
                   QStringLiteral("unparseable_address"),
                   (nlohmann::json{{"address", address}}));
        return false;
    }

    if (target->port > 0) {
        return connectTcp(target->host, target->port, timeout);
    }
    return pingHost(target->host, timeout);
}

bool PingProber::pingHost(const std::string &host, std::chrono::milliseconds timeout)
{
    // ping -W only takes whole seconds; round up and let runProcess enforce
    // the exact bound.
    const auto waitSeconds = std::max<long long>(1, (timeout.count() + 999) / 1000);
    const QStringList args = {
        QStringLiteral("-c"), QStringLiteral("1"),
        QStringLiteral("-W"), QString::number(waitSeconds),
        QString::fromStdString(host),
    };

    const ProcessResult result = runProcess(QStringLiteral("ping"), args, timeout);
    return result.finished && result.exitCode == 0;
}

bool PingProber::connectTcp(const std::string &host, int port, std::chrono::milliseconds timeout)
{
    QTcpSocket socket;
    socket.connectToHost(QString::fromStdString(host), static_cast<quint16>(port));
    const bool connected = socket.waitForConnected(static_cast<int>(timeout.count()));
    if (connected) {
        socket.abort();
    } else {
        CWLOG_DEBUG(QStringLiteral("PingProber"),
                    QStringLiteral("connectTcp"),
                    QStringLiteral("tcp_connect_failed"),
                    (nlohmann::json{{"host", host},
                                    {"port", port},
                                    {"error", socket.errorString().toStdString()}}));
    }
    return connected;
}

} // namespace camwatch
