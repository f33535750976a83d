#pragma once

#include <memory>
#include <string>

#include "common/models.hpp"

namespace camwatch {

// StateStore persists the MonitorState aggregate in a SQLite database.
// save() replaces every record inside one transaction, so a reader only ever
// sees the state of a complete cycle. Failures are reported, never thrown.
class StateStore {
public:
    explicit StateStore(std::string path);
    ~StateStore();

    // Missing database: empty state, no error. Corrupt database: empty state,
    // *error set, damaged file moved to <path>.corrupt. Any other failure
    // (e.g. locked by another process): empty state, *error set, file kept.
    // Never writes to the database.
    MonitorState load(std::string *error = nullptr);

    bool save(const MonitorState &state, std::string *error = nullptr);

    const std::string &path() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace camwatch
