#include "common/process_utils.hpp"

#include <QProcess>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace camwatch {

namespace {

constexpr int kStartTimeoutMs = 1000;
constexpr int kKillWaitMs = 500;

} // namespace

ProcessResult runProcess(const QString &program,
                         const QStringList &arguments,
                         std::chrono::milliseconds timeout)
{
    ProcessResult result;

    QProcess proc;
    proc.setProcessChannelMode(QProcess::MergedChannels);
    proc.setStandardOutputFile(QProcess::nullDevice());
    proc.start(program, arguments);
    if (!proc.waitForStarted(kStartTimeoutMs)) {
        CWLOG_WARN(QStringLiteral("ProcessUtils"),
                   QStringLiteral("runProcess"),
                   QStringLiteral("process_start_failed"),
                   (nlohmann::json{{"program", program.toStdString()},
                                   {"error", proc.errorString().toStdString()}}));
        return result;
    }
    result.started = true;

    if (!proc.waitForFinished(static_cast<int>(timeout.count()))) {
        proc.kill();
        proc.waitForFinished(kKillWaitMs);
        CWLOG_DEBUG(QStringLiteral("ProcessUtils"),
                    QStringLiteral("runProcess"),
                    QStringLiteral("process_timeout_killed"),
                    (nlohmann::json{{"program", program.toStdString()},
                                    {"timeoutMs", timeout.count()}}));
        return result;
    }

    result.finished = proc.exitStatus() == QProcess::NormalExit;
    result.exitCode = proc.exitCode();
    return result;
}

} // namespace camwatch
