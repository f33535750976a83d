#include "daemon/log_notifier.hpp"

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace camwatch {

bool LogNotifier::notify(std::int64_t chatId, const std::string &message, std::string *error)
{
    Q_UNUSED(error);
    CWLOG_INFO(QStringLiteral("LogNotifier"),
               QStringLiteral("notify"),
               QStringLiteral("notification"),
               (nlohmann::json{{"chatId", chatId}, {"message", message}}));
    return true;
}

} // namespace camwatch
