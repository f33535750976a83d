#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <chrono>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "daemon/command_handler.hpp"
#include "daemon/device_registry.hpp"
#include "daemon/subscriber_registry.hpp"

namespace {

class FixedProber : public camwatch::Prober
{
public:
    bool probe(const std::string &address, std::chrono::milliseconds timeout) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        probed.push_back(address);
        lastTimeout = timeout;
        if (address == "broken.local") {
            throw std::runtime_error("no route");
        }
        return reachable.count(address) > 0;
    }

    std::set<std::string> reachable;
    std::vector<std::string> probed;
    std::chrono::milliseconds lastTimeout{0};

private:
    std::mutex m_mutex;
};

camwatch::DeviceRegistry pingTargets()
{
    return camwatch::DeviceRegistry({
        {"gate", "10.0.0.21", "Front Gate"},
        {"yard", "10.0.0.22", "Yard & Dock"},
        {"roof", "broken.local", "Roof"},
    });
}

} // namespace

class CommandHandlerTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void init();
    void testCommandName();
    void testStartSubscribesOnce();
    void testStopUnsubscribes();
    void testStatusRequiresSubscription();
    void testHelpDependsOnSubscription();
    void testUnknownCommand();
    void testStorageErrorReply();
    void testStatusReportFormat();
    void testCommandArgument();
    void testPingRequiresSubscription();
    void testPingListsCamerasWithoutArgument();
    void testPingProbesNamedCamera();
    void testTestAlertBroadcasts();

private:
    QTemporaryDir m_tempDir;
    std::shared_ptr<camwatch::SubscriberRegistry> m_subscribers;
    std::unique_ptr<camwatch::CommandHandler> m_handler;
    int m_testIndex = 0;
};

void CommandHandlerTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    qputenv("CAMWATCH_LOG_DIR", m_tempDir.path().toUtf8());
}

void CommandHandlerTests::init()
{
    ++m_testIndex;
    m_subscribers = std::make_shared<camwatch::SubscriberRegistry>(
        (m_tempDir.path() + QStringLiteral("/subscribers-%1.db").arg(m_testIndex)).toStdString());
    m_handler = std::make_unique<camwatch::CommandHandler>(m_subscribers, []() {
        return std::string("STATUS-REPORT");
    });
}

void CommandHandlerTests::testCommandName()
{
    QCOMPARE(QString::fromStdString(camwatch::commandName("/start")), QStringLiteral("/start"));
    QCOMPARE(QString::fromStdString(camwatch::commandName("  /Status@camwatch_bot extra")),
             QStringLiteral("/status"));
    QCOMPARE(QString::fromStdString(camwatch::commandName("hello")), QString());
    QCOMPARE(QString::fromStdString(camwatch::commandName("")), QString());
}

void CommandHandlerTests::testStartSubscribesOnce()
{
    const QString first = QString::fromStdString(m_handler->handle(11, "/start"));
    QVERIFY(first.contains(QStringLiteral("Subscribed")));
    QVERIFY(m_subscribers->contains(11));

    const QString second = QString::fromStdString(m_handler->handle(11, "/start@camwatch_bot"));
    QVERIFY(second.contains(QStringLiteral("already subscribed")));
    QCOMPARE(static_cast<int>(m_subscribers->list().size()), 1);
}

void CommandHandlerTests::testStopUnsubscribes()
{
    QVERIFY(QString::fromStdString(m_handler->handle(11, "/stop"))
                .contains(QStringLiteral("not subscribed")));

    m_handler->handle(11, "/start");
    QVERIFY(QString::fromStdString(m_handler->handle(11, "/stop"))
                .contains(QStringLiteral("Unsubscribed")));
    QVERIFY(!m_subscribers->contains(11));
}

void CommandHandlerTests::testStatusRequiresSubscription()
{
    const QString denied = QString::fromStdString(m_handler->handle(5, "/status"));
    QVERIFY(denied.contains(QStringLiteral("/start")));
    QVERIFY(!denied.contains(QStringLiteral("STATUS-REPORT")));

    m_handler->handle(5, "/start");
    QCOMPARE(QString::fromStdString(m_handler->handle(5, "/status")), QStringLiteral("STATUS-REPORT"));
}

void CommandHandlerTests::testHelpDependsOnSubscription()
{
    const QString before = QString::fromStdString(m_handler->handle(8, "/help"));
    QVERIFY(before.contains(QStringLiteral("/start")));
    QVERIFY(!before.contains(QStringLiteral("/stop")));
    QVERIFY(before.contains(QStringLiteral("/help")));

    m_handler->handle(8, "/start");
    const QString after = QString::fromStdString(m_handler->handle(8, "/help"));
    QVERIFY(after.contains(QStringLiteral("/status")));
    QVERIFY(after.contains(QStringLiteral("/stop")));
}

void CommandHandlerTests::testUnknownCommand()
{
    QVERIFY(QString::fromStdString(m_handler->handle(1, "/reboot"))
                .contains(QStringLiteral("/help")));
    QVERIFY(QString::fromStdString(m_handler->handle(1, "good morning"))
                .contains(QStringLiteral("Unknown command")));
    QVERIFY(!m_subscribers->contains(1));
}

void CommandHandlerTests::testStorageErrorReply()
{
    const QString blocked = m_tempDir.path() + QStringLiteral("/blocked.db");
    QVERIFY(QDir().mkpath(blocked));

    auto broken = std::make_shared<camwatch::SubscriberRegistry>(blocked.toStdString());
    camwatch::CommandHandler handler(broken, []() { return std::string(); });
    QVERIFY(QString::fromStdString(handler.handle(3, "/start"))
                .contains(QStringLiteral("storage is unavailable")));
    QVERIFY(QString::fromStdString(handler.handle(3, "/stop"))
                .contains(QStringLiteral("storage is unavailable")));
}

void CommandHandlerTests::testStatusReportFormat()
{
    const camwatch::DeviceRegistry devices({
        {"gate", "10.0.0.21", "Front Gate"},
        {"yard", "10.0.0.22", "Yard & Dock"},
        {"roof", "10.0.0.23", "Roof"},
    });

    camwatch::MonitorState state;
    camwatch::LivenessRecord gate;
    gate.deviceId = "gate";
    gate.status = camwatch::LivenessStatus::Up;
    state.emplace("gate", gate);
    camwatch::LivenessRecord yard;
    yard.deviceId = "yard";
    yard.status = camwatch::LivenessStatus::Down;
    state.emplace("yard", yard);

    const QStringList lines =
        QString::fromStdString(camwatch::formatStatusReport(devices, state)).split(QLatin1Char('\n'));
    QCOMPARE(lines.size(), 3);
    QCOMPARE(lines[0], QStringLiteral("✅ <b>Front Gate</b>: UP"));
    QCOMPARE(lines[1], QStringLiteral("❌ <b>Yard &amp; Dock</b>: DOWN"));
    QCOMPARE(lines[2], QStringLiteral("❔ <b>Roof</b>: UNKNOWN"));

    QCOMPARE(QString::fromStdString(camwatch::formatStatusReport(camwatch::DeviceRegistry(), {})),
             QStringLiteral("No cameras configured."));
}

void CommandHandlerTests::testCommandArgument()
{
    QCOMPARE(QString::fromStdString(camwatch::commandArgument("/ping  Front Gate  ")),
             QStringLiteral("Front Gate"));
    QCOMPARE(QString::fromStdString(camwatch::commandArgument("/ping@camwatch_bot yard")),
             QStringLiteral("yard"));
    QCOMPARE(QString::fromStdString(camwatch::commandArgument("/ping")), QString());
    QCOMPARE(QString::fromStdString(camwatch::commandArgument("/ping   ")), QString());
}

void CommandHandlerTests::testPingRequiresSubscription()
{
    auto prober = std::make_shared<FixedProber>();
    m_handler->setPinger(prober, pingTargets(), std::chrono::milliseconds(1500));

    QVERIFY(QString::fromStdString(m_handler->handle(21, "/ping Front Gate"))
                .contains(QStringLiteral("/start")));
    QVERIFY(prober->probed.empty());
}

void CommandHandlerTests::testPingListsCamerasWithoutArgument()
{
    auto prober = std::make_shared<FixedProber>();
    m_handler->setPinger(prober, pingTargets(), std::chrono::milliseconds(1500));
    m_handler->handle(22, "/start");

    const QString reply = QString::fromStdString(m_handler->handle(22, "/ping"));
    QVERIFY(reply.contains(QStringLiteral("Usage")));
    QVERIFY(reply.contains(QStringLiteral("Front Gate")));
    QVERIFY(reply.contains(QStringLiteral("Yard &amp; Dock")));
    QVERIFY(prober->probed.empty());
}

void CommandHandlerTests::testPingProbesNamedCamera()
{
    auto prober = std::make_shared<FixedProber>();
    prober->reachable.insert("10.0.0.21");
    m_handler->setPinger(prober, pingTargets(), std::chrono::milliseconds(1500));
    m_handler->handle(23, "/start");

    QCOMPARE(QString::fromStdString(m_handler->handle(23, "/ping front gate")),
             QStringLiteral("✅ <b>Front Gate</b>: UP"));
    QVERIFY(prober->lastTimeout == std::chrono::milliseconds(1500));
    // the id works too
    QCOMPARE(QString::fromStdString(m_handler->handle(23, "/ping yard")),
             QStringLiteral("❌ <b>Yard &amp; Dock</b>: DOWN"));
    QCOMPARE(QString::fromStdString(m_handler->handle(23, "/ping Roof")),
             QStringLiteral("❌ <b>Roof</b>: DOWN"));
    QVERIFY(QString::fromStdString(m_handler->handle(23, "/ping Garage"))
                .contains(QStringLiteral("not found")));
    QCOMPARE(static_cast<int>(prober->probed.size()), 3);
}

void CommandHandlerTests::testTestAlertBroadcasts()
{
    std::vector<std::string> broadcasts;
    m_handler->setBroadcaster([&broadcasts](const std::string &text) {
        broadcasts.push_back(text);
        camwatch::DispatchReport report;
        report.attempted = 3;
        report.delivered = 2;
        report.failed = 1;
        return report;
    });

    QVERIFY(QString::fromStdString(m_handler->handle(24, "/testalert"))
                .contains(QStringLiteral("/start")));
    QVERIFY(broadcasts.empty());

    m_handler->handle(24, "/start");
    const QString reply = QString::fromStdString(m_handler->handle(24, "/testalert"));
    QCOMPARE(static_cast<int>(broadcasts.size()), 1);
    QVERIFY(QString::fromStdString(broadcasts[0]).contains(QStringLiteral("Test alert")));
    QVERIFY(reply.contains(QStringLiteral("2 of 3")));

    const QString help = QString::fromStdString(m_handler->handle(24, "/help"));
    QVERIFY(help.contains(QStringLiteral("/ping")));
    QVERIFY(help.contains(QStringLiteral("/testalert")));
}

QTEST_MAIN(CommandHandlerTests)
#include "test_command_handler.moc"
