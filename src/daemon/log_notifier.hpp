#pragma once

#include "daemon/notifier.hpp"

namespace camwatch {

// Dry-run delivery used when no bot token is configured: messages only go to the log.
class LogNotifier : public Notifier {
public:
    bool notify(std::int64_t chatId, const std::string &message, std::string *error) override;
};

} // namespace camwatch
