#include <csignal>
#include <utility>

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QTimer>

#include <nlohmann/json.hpp>

#include "common/camwatch_version.hpp"
#include "common/logging.hpp"
#include "daemon/camwatch_daemon.hpp"
#include "daemon/monitor_config.hpp"

namespace {

volatile std::sig_atomic_t g_stopRequested = 0;

void requestStop(int)
{
    g_stopRequested = 1;
}

QString configPath(const QCommandLineParser &parser, const QCommandLineOption &option)
{
    if (parser.isSet(option)) {
        return parser.value(option);
    }
    const QString fromEnv = qEnvironmentVariable("CAMWATCH_CONFIG");
    if (!fromEnv.isEmpty()) {
        return fromEnv;
    }
    return QStringLiteral("camwatch.json");
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("camwatch-daemon"));
    QCoreApplication::setApplicationVersion(QStringLiteral(CAMWATCH_VERSION));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("CCTV camera liveness monitor"));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption configOption(QStringList{QStringLiteral("c"), QStringLiteral("config")},
                                          QStringLiteral("Configuration file."),
                                          QStringLiteral("path"));
    const QCommandLineOption traceOption(QStringLiteral("trace"),
                                         QStringLiteral("Write debug events and echo logs to stderr."));
    const QCommandLineOption onceOption(QStringLiteral("once"),
                                        QStringLiteral("Run a single cycle and exit."));
    parser.addOption(configOption);
    parser.addOption(traceOption);
    parser.addOption(onceOption);
    parser.process(app);

    const bool trace = parser.isSet(traceOption)
        || qEnvironmentVariableIntValue("CAMWATCH_TRACE") == 1;
    camwatch::logging::initLogging(QStringLiteral("camwatch-daemon"), trace);

    const QString path = configPath(parser, configOption);
    camwatch::MonitorConfig config;
    try {
        config = camwatch::loadConfigFile(path.toStdString());
    } catch (const camwatch::ConfigurationError &ex) {
        CWLOG_ERROR(QStringLiteral("main"),
                    QStringLiteral("main"),
                    QStringLiteral("config_invalid"),
                    (nlohmann::json{{"path", path.toStdString()}, {"error", ex.what()}}));
        qCritical().noquote() << "camwatch: invalid configuration" << path << ":" << ex.what();
        return 1;
    }

    camwatch::CamwatchDaemon daemon(std::move(config),
                                    qEnvironmentVariable("CAMWATCH_TELEGRAM_TOKEN"));

    if (parser.isSet(onceOption)) {
        const camwatch::CycleReport report = daemon.runOnce();
        qInfo().noquote() << "camwatch: cycle" << report.cycle
                          << "reachable" << report.reachable
                          << "unreachable" << report.unreachable
                          << "transitions" << report.transitions;
        return report.persisted ? 0 : 2;
    }

    std::signal(SIGINT, requestStop);
    std::signal(SIGTERM, requestStop);

    QTimer signalPoll;
    QObject::connect(&signalPoll, &QTimer::timeout, &app, []() {
        if (g_stopRequested) {
            QCoreApplication::quit();
        }
    });
    signalPoll.start(200);

    daemon.start();
    const int rc = app.exec();

    qInfo() << "camwatch: stopping";
    daemon.stop();
    return rc;
}
