#pragma once

#include <cstdint>
#include <string>

namespace camwatch {

// Delivers one message to one chat. Called from the scheduler thread.
// Returns false and fills *error when the message was not delivered.
class Notifier {
public:
    virtual ~Notifier() = default;

    virtual bool notify(std::int64_t chatId, const std::string &message, std::string *error) = 0;
};

} // namespace camwatch
