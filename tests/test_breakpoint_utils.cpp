#include <QJsonArray>
#include <QJsonObject>
#include <QtTest/QTest>

#include "snapdbg/breakpoint_utils.hpp"

using namespace snapdbg;

class TestBreakpointUtils : public QObject {
    Q_OBJECT
private slots:
    void testParseAndValidateLocation() {
        const QJsonObject location = parseAndValidateLocation("index.js:26");
        QCOMPARE(location.value("path").toString(), QString("index.js"));
        QCOMPARE(location.value("line").toInt(), 26);

        const QJsonObject maxLine = parseAndValidateLocation("a/b/Main.java:2147483647");
        QCOMPARE(maxLine.value("path").toString(), QString("a/b/Main.java"));
        QCOMPARE(maxLine.value("line").toDouble(), 2147483647.0);
    }

    void testParseAndValidateLocationRejects_data() {
        QTest::addColumn<QString>("input");

        QTest::newRow("no line") << "index.js";
        QTest::newRow("empty line") << "index.js:";
        QTest::newRow("zero line") << "index.js:0";
        QTest::newRow("leading zero") << "index.js:012";
        QTest::newRow("negative") << "index.js:-1";
        QTest::newRow("no path") << ":10";
        QTest::newRow("two colons") << "a:b:10";
        QTest::newRow("too big") << "index.js:2147483648";
    }

    void testParseAndValidateLocationRejects() {
        QFETCH(QString, input);
        QVERIFY(parseAndValidateLocation(input).isEmpty());
    }

    void testTransformLocationToFileLine() {
        QCOMPARE(transformLocationToFileLine({{"path", "index.js"}, {"line", 26}}),
            QString("index.js:26"));
        QVERIFY(transformLocationToFileLine({{"path", "index.js"}}).isNull());
        QVERIFY(transformLocationToFileLine({{"line", 26}}).isNull());
    }

    void testConvertUnixMsecToRfc3339() {
        QCOMPARE(convertUnixMsecToRfc3339(1649962215426), QString("2022-04-14T18:50:15.426000Z"));
        QCOMPARE(convertUnixMsecToRfc3339(0), QString("1970-01-01T00:00:00.000000Z"));
    }

    void testNormalizeBreakpointDefaults() {
        const QJsonObject bp = normalizeBreakpoint(
            {{"location", QJsonObject{{"path", "index.js"}, {"line", 26}}}}, "b-1");

        QCOMPARE(bp.value("id").toString(), QString("b-1"));
        QCOMPARE(bp.value("action").toString(), QString("CAPTURE"));
        QCOMPARE(bp.value("isFinalState").toBool(true), false);
        QCOMPARE(bp.value("createTimeUnixMsec").toInt(-1), 0);
        QCOMPARE(bp.value("createTime").toString(), QString("1970-01-01T00:00:00.000000Z"));
        QVERIFY(!bp.contains("finalTimeUnixMsec"));
        QVERIFY(!bp.contains("finalTime"));
        QCOMPARE(bp.value("userEmail").toString(), QString("unknown"));
    }

    void testNormalizeBreakpointKeepsExistingFields() {
        const QJsonObject bp = normalizeBreakpoint({
            {"id", "b-2"},
            {"action", "CAPTURE"},
            {"isFinalState", true},
            {"createTimeUnixMsec", 1649962215426.0},
            {"finalTimeUnixMsec", 1649962230637.0},
            {"userEmail", "foo@bar.com"},
            {"location", QJsonObject{{"path", "index.js"}, {"line", 26}}},
        }, "ignored");

        QCOMPARE(bp.value("id").toString(), QString("b-2"));
        QCOMPARE(bp.value("createTime").toString(), QString("2022-04-14T18:50:15.426000Z"));
        QCOMPARE(bp.value("finalTime").toString(), QString("2022-04-14T18:50:30.637000Z"));
        QCOMPARE(bp.value("userEmail").toString(), QString("foo@bar.com"));
    }

    void testNormalizeBreakpointRejectsIncomplete() {
        QVERIFY(normalizeBreakpoint({{"location", QJsonObject{{"path", "a"}, {"line", 1}}}}).isEmpty());
        QVERIFY(normalizeBreakpoint({{"id", "b-1"}}).isEmpty());
        QVERIFY(normalizeBreakpoint({{"id", "b-1"}, {"location", QJsonObject{{"path", "a"}}}})
                    .isEmpty());
    }

    void testNormalizeLogpointRebuildsMessage() {
        const QJsonObject bp = normalizeBreakpoint({
            {"id", "b-3"},
            {"action", "LOG"},
            {"logMessageFormat", "a=$0, b=$1, cost=$$5"},
            {"expressions", QJsonArray{"a", "b"}},
            {"location", QJsonObject{{"path", "index.js"}, {"line", 26}}},
        });

        QCOMPARE(bp.value("logMessageFormatString").toString(), QString("a={a}, b={b}, cost=$5"));
        QCOMPARE(bp.value("logLevel").toString(), QString("INFO"));
    }

    void testSnapshotState() {
        const QJsonObject expired{{"isError", true}, {"refersTo", "BREAKPOINT_AGE"}};
        const QJsonObject failed{{"isError", true}, {"refersTo", "BREAKPOINT_SOURCE_LOCATION"}};

        QCOMPARE(snapshotState({{"isFinalState", false}}), QString("ACTIVE"));
        QCOMPARE(snapshotState({{"isFinalState", true}}), QString("COMPLETED"));
        QCOMPARE(snapshotState({{"isFinalState", true}, {"status", expired}}), QString("EXPIRED"));
        QCOMPARE(snapshotState({{"isFinalState", true}, {"status", failed}}), QString("FAILED"));
        QCOMPARE(logpointState({{"isFinalState", false}}), QString("ACTIVE"));
        QCOMPARE(logpointState({{"isFinalState", true}, {"status", expired}}), QString("EXPIRED"));
        QCOMPARE(logpointState({{"isFinalState", true}, {"status", failed}}), QString("FAILED"));
    }

    void testLogLevel() {
        LogLevel level = LogLevel::Info;
        QVERIFY(parseLogLevel("warning", &level));
        QCOMPARE(logLevelName(level), QString("WARNING"));
        QVERIFY(parseLogLevel("error", &level));
        QCOMPARE(logLevelName(level), QString("ERROR"));
        QVERIFY(!parseLogLevel("ERROR", &level));
        QVERIFY(!parseLogLevel("debug", &level));
        QCOMPARE(logLevelName(level), QString("ERROR"));
    }
};

QTEST_APPLESS_MAIN(TestBreakpointUtils)
#include "test_breakpoint_utils.moc"
