#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace camwatch {

// SubscriberRegistry is the durable set of chats that receive notifications.
// It is shared between the command path and the scheduler thread; every call
// takes the registry mutex, and every mutation is committed before returning.
class SubscriberRegistry {
public:
    explicit SubscriberRegistry(std::string path);
    ~SubscriberRegistry();

    // Ordered by chat id. On a storage failure returns empty and sets *error.
    std::vector<Subscriber> list(std::string *error = nullptr) const;

    AddResult add(std::int64_t chatId, std::string *error = nullptr);
    RemoveResult remove(std::int64_t chatId, std::string *error = nullptr);
    bool contains(std::int64_t chatId) const;

    const std::string &path() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
    mutable std::mutex m_mutex;
};

} // namespace camwatch
