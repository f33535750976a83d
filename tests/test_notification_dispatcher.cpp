#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "common/models.hpp"
#include "daemon/device_registry.hpp"
#include "daemon/notification_dispatcher.hpp"

namespace {

struct SentMessage {
    std::int64_t chatId;
    std::string text;
};

class RecordingNotifier : public camwatch::Notifier
{
public:
    bool notify(std::int64_t chatId, const std::string &message, std::string *error) override
    {
        if (chatId == failingChat) {
            if (error) {
                *error = "chat not found";
            }
            return false;
        }
        if (chatId == throwingChat) {
            throw std::runtime_error("transport down");
        }
        sent.push_back({chatId, message});
        return true;
    }

    std::vector<SentMessage> sent;
    std::int64_t failingChat = 0;
    std::int64_t throwingChat = 0;
};

std::vector<camwatch::Subscriber> subscribers(std::initializer_list<std::int64_t> ids)
{
    std::vector<camwatch::Subscriber> result;
    for (auto id : ids) {
        camwatch::Subscriber subscriber;
        subscriber.chatId = id;
        result.push_back(subscriber);
    }
    return result;
}

camwatch::TransitionEvent event(const std::string &id,
                                camwatch::LivenessStatus from,
                                camwatch::LivenessStatus to)
{
    camwatch::TransitionEvent transition;
    transition.deviceId = id;
    transition.fromStatus = from;
    transition.toStatus = to;
    transition.occurredAt = std::chrono::system_clock::now();
    return transition;
}

camwatch::DeviceRegistry cameras()
{
    return camwatch::DeviceRegistry({
        {"gate", "10.0.0.21", "Front <Gate>"},
        {"yard", "yard-cam.local:554", "Yard"},
    });
}

} // namespace

class NotificationDispatcherTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void testEachEventReachesEachSubscriberOnce();
    void testNoEventsNoMessages();
    void testFailedDeliveryDoesNotStopOthers();
    void testDownMessageFormat();
    void testUpMessageFormat();
    void testSummaryListsProblemCameras();
    void testSummaryAllUp();
    void testSummarySkippedWithoutSubscribers();
    void testBroadcastCarriesSenderHeader();

private:
    QTemporaryDir m_tempDir;
};

void NotificationDispatcherTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    qputenv("CAMWATCH_LOG_DIR", m_tempDir.path().toUtf8());
}

void NotificationDispatcherTests::testEachEventReachesEachSubscriberOnce()
{
    auto notifier = std::make_shared<RecordingNotifier>();
    camwatch::NotificationDispatcher dispatcher(notifier, "CCTV Ping Monitor");

    const std::vector<camwatch::TransitionEvent> events = {
        event("gate", camwatch::LivenessStatus::Unknown, camwatch::LivenessStatus::Up),
        event("yard", camwatch::LivenessStatus::Up, camwatch::LivenessStatus::Down),
    };
    const auto report = dispatcher.dispatch(events, cameras(), subscribers({1, 2, 3}));

    QCOMPARE(report.events, 2);
    QCOMPARE(report.attempted, 6);
    QCOMPARE(report.delivered, 6);
    QCOMPARE(report.failed, 0);
    QCOMPARE(static_cast<int>(notifier->sent.size()), 6);

    for (std::int64_t chat : {1, 2, 3}) {
        int count = 0;
        for (const auto &message : notifier->sent) {
            if (message.chatId == chat) {
                ++count;
            }
        }
        QCOMPARE(count, 2);
    }
}

void NotificationDispatcherTests::testNoEventsNoMessages()
{
    auto notifier = std::make_shared<RecordingNotifier>();
    camwatch::NotificationDispatcher dispatcher(notifier, "CCTV Ping Monitor");

    const auto report = dispatcher.dispatch({}, cameras(), subscribers({1, 2}));
    QCOMPARE(report.attempted, 0);
    QVERIFY(notifier->sent.empty());
}

void NotificationDispatcherTests::testFailedDeliveryDoesNotStopOthers()
{
    auto notifier = std::make_shared<RecordingNotifier>();
    notifier->failingChat = 2;
    notifier->throwingChat = 3;
    camwatch::NotificationDispatcher dispatcher(notifier, "CCTV Ping Monitor");

    const auto report = dispatcher.dispatch(
        {event("gate", camwatch::LivenessStatus::Up, camwatch::LivenessStatus::Down)},
        cameras(),
        subscribers({1, 2, 3, 4}));

    QCOMPARE(report.attempted, 4);
    QCOMPARE(report.delivered, 2);
    QCOMPARE(report.failed, 2);
    QCOMPARE(static_cast<int>(notifier->sent.size()), 2);
    QCOMPARE(notifier->sent[0].chatId, static_cast<std::int64_t>(1));
    QCOMPARE(notifier->sent[1].chatId, static_cast<std::int64_t>(4));
}

void NotificationDispatcherTests::testDownMessageFormat()
{
    camwatch::NotificationDispatcher dispatcher(std::make_shared<RecordingNotifier>(), "Site A");
    auto down = event("gate", camwatch::LivenessStatus::Up, camwatch::LivenessStatus::Down);
    const QString text = QString::fromStdString(dispatcher.formatTransition(down, cameras()));

    QVERIFY(text.startsWith(QStringLiteral("🛰️ Site A\n\n")));
    QVERIFY(text.contains(QStringLiteral("❌ ALERT CCTV <b>Front &lt;Gate&gt;</b> DOWN")));
    QVERIFY(text.contains(QStringLiteral("Host: <code>10.0.0.21</code>")));
    QVERIFY(text.contains(QStringLiteral("Previous: UP")));
    QVERIFY(text.contains(QString::fromStdString("Time: " + camwatch::formatLocalTime(down.occurredAt))));
}

void NotificationDispatcherTests::testUpMessageFormat()
{
    camwatch::NotificationDispatcher dispatcher(std::make_shared<RecordingNotifier>(), "Site A");
    const QString text = QString::fromStdString(dispatcher.formatTransition(
        event("yard", camwatch::LivenessStatus::Unknown, camwatch::LivenessStatus::Up), cameras()));

    QVERIFY(text.contains(QStringLiteral("📷 <b>Yard</b> is back UP ✅")));
    QVERIFY(text.contains(QStringLiteral("Host: <code>yard-cam.local:554</code>")));
    QVERIFY(text.contains(QStringLiteral("Previous: UNKNOWN")));
}

void NotificationDispatcherTests::testSummaryListsProblemCameras()
{
    camwatch::NotificationDispatcher dispatcher(std::make_shared<RecordingNotifier>(), "Site A");

    camwatch::MonitorState state;
    camwatch::LivenessRecord gate;
    gate.deviceId = "gate";
    gate.status = camwatch::LivenessStatus::Down;
    state.emplace("gate", gate);

    const QString text = QString::fromStdString(
        dispatcher.formatSummary(cameras(), state, std::chrono::system_clock::now()));
    QVERIFY(text.contains(QStringLiteral("Daily Heartbeat")));
    QVERIFY(text.contains(QStringLiteral("Total cameras: 2")));
    QVERIFY(text.contains(QStringLiteral("❌ DOWN: Front &lt;Gate&gt;")));
    // yard has no record yet
    QVERIFY(text.contains(QStringLiteral("❔ UNKNOWN: Yard")));
    QVERIFY(!text.contains(QStringLiteral("All cameras UP")));
}

void NotificationDispatcherTests::testSummaryAllUp()
{
    auto notifier = std::make_shared<RecordingNotifier>();
    camwatch::NotificationDispatcher dispatcher(notifier, "Site A");

    camwatch::MonitorState state;
    for (const auto &id : {"gate", "yard"}) {
        camwatch::LivenessRecord record;
        record.deviceId = id;
        record.status = camwatch::LivenessStatus::Up;
        state.emplace(id, record);
    }

    const auto report = dispatcher.dispatchSummary(cameras(), state, subscribers({9}));
    QCOMPARE(report.delivered, 1);
    QCOMPARE(static_cast<int>(notifier->sent.size()), 1);
    QVERIFY(QString::fromStdString(notifier->sent[0].text)
                .contains(QStringLiteral("✅ All cameras UP.")));
}

void NotificationDispatcherTests::testSummarySkippedWithoutSubscribers()
{
    auto notifier = std::make_shared<RecordingNotifier>();
    camwatch::NotificationDispatcher dispatcher(notifier, "Site A");

    const auto report = dispatcher.dispatchSummary(cameras(), {}, {});
    QCOMPARE(report.attempted, 0);
    QVERIFY(notifier->sent.empty());
}

void NotificationDispatcherTests::testBroadcastCarriesSenderHeader()
{
    auto notifier = std::make_shared<RecordingNotifier>();
    notifier->failingChat = 5;
    camwatch::NotificationDispatcher dispatcher(notifier, "Site <A>");

    const auto report = dispatcher.broadcast("🔔 Test alert", subscribers({4, 5, 6}));
    QCOMPARE(report.attempted, 3);
    QCOMPARE(report.delivered, 2);
    QCOMPARE(report.failed, 1);
    QCOMPARE(static_cast<int>(notifier->sent.size()), 2);
    QCOMPARE(QString::fromStdString(notifier->sent[0].text),
             QStringLiteral("🛰️ Site &lt;A&gt;\n\n🔔 Test alert"));
}

QTEST_MAIN(NotificationDispatcherTests)
#include "test_notification_dispatcher.moc"
