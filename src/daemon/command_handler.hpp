#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "common/models.hpp"
#include "daemon/device_registry.hpp"
#include "daemon/notification_dispatcher.hpp"
#include "daemon/prober.hpp"
#include "daemon/subscriber_registry.hpp"

namespace camwatch {

// Chat commands, independent of the transport that delivered them.
// /start subscribes, /stop unsubscribes, /status lists cameras, /help lists commands.
// Subscribers may also /ping one camera on demand and send a /testalert to everyone.
class CommandHandler {
public:
    using StatusProvider = std::function<std::string()>;
    using Broadcaster = std::function<DispatchReport(const std::string &)>;

    CommandHandler(std::shared_ptr<SubscriberRegistry> subscribers, StatusProvider statusProvider);

    // Enables /ping. The result is only reported back; it does not feed the
    // debounce state.
    void setPinger(std::shared_ptr<Prober> prober,
                   DeviceRegistry devices,
                   std::chrono::milliseconds timeout);

    // Enables /testalert.
    void setBroadcaster(Broadcaster broadcaster);

    // Returns the reply text (HTML) for one inbound message.
    std::string handle(std::int64_t chatId, const std::string &text);

private:
    std::string handleStart(std::int64_t chatId);
    std::string handleStop(std::int64_t chatId);
    std::string handleStatus(std::int64_t chatId);
    std::string handlePing(std::int64_t chatId, const std::string &argument);
    std::string handleTestAlert(std::int64_t chatId);

    std::shared_ptr<SubscriberRegistry> m_subscribers;
    StatusProvider m_statusProvider;

    std::shared_ptr<Prober> m_prober;
    DeviceRegistry m_devices;
    std::chrono::milliseconds m_probeTimeout{0};

    Broadcaster m_broadcaster;
};

// "/start@camwatch_bot now" -> "/start"
std::string commandName(const std::string &text);

// "/ping  Front Gate " -> "Front Gate"
std::string commandArgument(const std::string &text);

// One line per device: emoji, bold name, status.
std::string formatStatusReport(const DeviceRegistry &devices, const MonitorState &state);

} // namespace camwatch
