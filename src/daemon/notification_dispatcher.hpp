#pragma once

#include <memory>
#include <string>
#include <vector>

#include "common/models.hpp"
#include "daemon/device_registry.hpp"
#include "daemon/notifier.hpp"

namespace camwatch {

struct DispatchReport {
    int events = 0;
    int attempted = 0;
    int delivered = 0;
    int failed = 0;
};

/**
 * NotificationDispatcher turns transition events into chat messages.
 * Each event is formatted once and sent once to each subscriber; a failed
 * delivery is logged and counted, never retried.
 */
class NotificationDispatcher {
public:
    NotificationDispatcher(std::shared_ptr<Notifier> notifier, std::string senderName);

    DispatchReport dispatch(const std::vector<TransitionEvent> &events,
                            const DeviceRegistry &devices,
                            const std::vector<Subscriber> &subscribers);

    // Daily heartbeat with the overall camera status.
    DispatchReport dispatchSummary(const DeviceRegistry &devices,
                                   const MonitorState &state,
                                   const std::vector<Subscriber> &subscribers);

    // Free-form message under the sender header, e.g. a delivery test.
    DispatchReport broadcast(const std::string &text,
                             const std::vector<Subscriber> &subscribers);

    std::string formatTransition(const TransitionEvent &event,
                                 const DeviceRegistry &devices) const;
    std::string formatSummary(const DeviceRegistry &devices,
                              const MonitorState &state,
                              Timestamp now) const;

private:
    void deliver(const std::string &message,
                 const std::vector<Subscriber> &subscribers,
                 DispatchReport &report);

    std::shared_ptr<Notifier> m_notifier;
    std::string m_senderName;
};

// "yyyy-MM-dd HH:mm:ss" in local time.
std::string formatLocalTime(Timestamp timestamp);

} // namespace camwatch
