#pragma once

#include <chrono>

#include <QString>
#include <QStringList>

namespace camwatch {

struct ProcessResult {
    bool started = false;
    bool finished = false;
    int exitCode = -1;
};

// Runs a program to completion, killing it when it outlives the timeout.
// Safe to call from any thread.
ProcessResult runProcess(const QString &program,
                         const QStringList &arguments,
                         std::chrono::milliseconds timeout);

} // namespace camwatch
