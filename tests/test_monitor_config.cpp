#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>

#include <nlohmann/json.hpp>

#include "daemon/monitor_config.hpp"

namespace {

template <typename Fn>
bool throwsConfigurationError(Fn fn)
{
    try {
        fn();
    } catch (const camwatch::ConfigurationError &) {
        return true;
    }
    return false;
}

} // namespace

class MonitorConfigTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void testParsesFullDocument();
    void testDefaults();
    void testRejectsMalformedFields_data();
    void testRejectsMalformedFields();
    void testTimeOfDay();
    void testLoadConfigFile();
    void testLoadRejectsBadJson();

private:
    nlohmann::json validDocument() const;

    QTemporaryDir m_tempDir;
};

void MonitorConfigTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    qputenv("CAMWATCH_LOG_DIR", m_tempDir.path().toUtf8());
    qputenv("CAMWATCH_DATA_DIR", (m_tempDir.path() + "/data").toUtf8());
}

nlohmann::json MonitorConfigTests::validDocument() const
{
    return nlohmann::json{
        {"pollIntervalSeconds", 10},
        {"upThreshold", 2},
        {"downThreshold", 3},
        {"probeTimeoutSeconds", 2},
        {"senderName", "Site A"},
        {"dailySummaryTime", "08:30"},
        {"dataDir", "/var/lib/camwatch"},
        {"cameras", nlohmann::json::array({
            {{"id", "gate"}, {"name", "Front Gate"}, {"host", "10.0.0.21"}},
            {{"name", "Yard"}, {"host", "yard-cam.local:554"}}
        })}
    };
}

void MonitorConfigTests::testParsesFullDocument()
{
    const camwatch::MonitorConfig config = camwatch::parseConfig(validDocument());
    QCOMPARE(config.pollIntervalSeconds, 10);
    QCOMPARE(config.upThreshold, 2);
    QCOMPARE(config.downThreshold, 3);
    QCOMPARE(config.probeTimeoutSeconds, 2);
    QCOMPARE(QString::fromStdString(config.senderName), QStringLiteral("Site A"));
    QVERIFY(config.dailySummaryMinutes.has_value());
    QCOMPARE(*config.dailySummaryMinutes, 8 * 60 + 30);
    QCOMPARE(QString::fromStdString(config.dataDir), QStringLiteral("/var/lib/camwatch"));

    QCOMPARE(static_cast<int>(config.devices.size()), 2);
    QCOMPARE(QString::fromStdString(config.devices[0].id), QStringLiteral("gate"));
    QCOMPARE(QString::fromStdString(config.devices[0].displayName), QStringLiteral("Front Gate"));
    // id falls back to the name
    QCOMPARE(QString::fromStdString(config.devices[1].id), QStringLiteral("Yard"));
    QCOMPARE(QString::fromStdString(config.devices[1].address), QStringLiteral("yard-cam.local:554"));
}

void MonitorConfigTests::testDefaults()
{
    nlohmann::json doc = validDocument();
    doc.erase("senderName");
    doc.erase("dailySummaryTime");
    doc.erase("dataDir");

    const camwatch::MonitorConfig config = camwatch::parseConfig(doc);
    QCOMPARE(QString::fromStdString(config.senderName), QStringLiteral("CCTV Ping Monitor"));
    QVERIFY(!config.dailySummaryMinutes.has_value());
    QCOMPARE(QString::fromStdString(config.dataDir), m_tempDir.path() + "/data");
}

void MonitorConfigTests::testRejectsMalformedFields_data()
{
    QTest::addColumn<QString>("patch");

    QTest::newRow("zero interval") << QString::fromUtf8(R"({"pollIntervalSeconds": 0})");
    QTest::newRow("negative timeout") << QString::fromUtf8(R"({"probeTimeoutSeconds": -1})");
    QTest::newRow("zero up threshold") << QString::fromUtf8(R"({"upThreshold": 0})");
    QTest::newRow("zero down threshold") << QString::fromUtf8(R"({"downThreshold": 0})");
    QTest::newRow("string interval") << QString::fromUtf8(R"({"pollIntervalSeconds": "10"})");
    QTest::newRow("missing interval") << QString::fromUtf8(R"({"pollIntervalSeconds": null})");
    QTest::newRow("bad summary time") << QString::fromUtf8(R"({"dailySummaryTime": "25:00"})");
    QTest::newRow("summary not HH:MM") << QString::fromUtf8(R"({"dailySummaryTime": "8:00"})");
    QTest::newRow("empty cameras") << QString::fromUtf8(R"({"cameras": []})");
    QTest::newRow("cameras not array") << QString::fromUtf8(R"({"cameras": {}})");
    QTest::newRow("duplicate ids")
        << QString::fromUtf8(R"({"cameras": [{"id": "a", "name": "A", "host": "10.0.0.1"},
                           {"id": "a", "name": "B", "host": "10.0.0.2"}]})");
    QTest::newRow("malformed address")
        << QString::fromUtf8(R"({"cameras": [{"name": "A", "host": "not a host"}]})");
    QTest::newRow("missing address") << QString::fromUtf8(R"({"cameras": [{"name": "A"}]})");
    QTest::newRow("missing name") << QString::fromUtf8(R"({"cameras": [{"host": "10.0.0.1"}]})");
}

void MonitorConfigTests::testRejectsMalformedFields()
{
    QFETCH(QString, patch);

    // merge_patch deletes keys patched to null
    nlohmann::json doc = validDocument();
    doc.merge_patch(nlohmann::json::parse(patch.toStdString()));
    QVERIFY(throwsConfigurationError([&doc]() { camwatch::parseConfig(doc); }));
}

void MonitorConfigTests::testTimeOfDay()
{
    QCOMPARE(*camwatch::parseTimeOfDay("00:00"), 0);
    QCOMPARE(*camwatch::parseTimeOfDay("23:59"), 23 * 60 + 59);
    QVERIFY(!camwatch::parseTimeOfDay("24:00").has_value());
    QVERIFY(!camwatch::parseTimeOfDay("12:60").has_value());
    QVERIFY(!camwatch::parseTimeOfDay("12-00").has_value());
    QVERIFY(!camwatch::parseTimeOfDay("").has_value());
    QVERIFY(!camwatch::parseTimeOfDay("+8:00").has_value());
    QVERIFY(!camwatch::parseTimeOfDay(" 8:00").has_value());
    QVERIFY(!camwatch::parseTimeOfDay("08:+5").has_value());
    QVERIFY(!camwatch::parseTimeOfDay("-1:00").has_value());
}

void MonitorConfigTests::testLoadConfigFile()
{
    const QString path = m_tempDir.path() + "/camwatch.json";
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
    file.write(QByteArray::fromStdString(validDocument().dump(2)));
    file.close();

    const camwatch::MonitorConfig config = camwatch::loadConfigFile(path.toStdString());
    QCOMPARE(static_cast<int>(config.devices.size()), 2);

    const std::string missing = (m_tempDir.path() + "/missing.json").toStdString();
    QVERIFY(throwsConfigurationError([&missing]() { camwatch::loadConfigFile(missing); }));
}

void MonitorConfigTests::testLoadRejectsBadJson()
{
    const QString path = m_tempDir.path() + "/broken.json";
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
    file.write("{ \"pollIntervalSeconds\": 10, ");
    file.close();

    const std::string broken = path.toStdString();
    QVERIFY(throwsConfigurationError([&broken]() { camwatch::loadConfigFile(broken); }));
}

QTEST_MAIN(MonitorConfigTests)
#include "test_monitor_config.moc"
