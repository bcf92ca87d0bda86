#include <QJsonArray>
#include <QJsonObject>
#include <QtTest/QTest>

#include "snapdbg/status_message.hpp"

using namespace snapdbg;

namespace {

QJsonObject withStatus(const QJsonObject& status) {
    return {{"status", status}};
}

}  // namespace

class TestStatusMessage : public QObject {
    Q_OBJECT
private slots:
    void testIsError() {
        QVERIFY(!StatusMessage({}).isError());
        QVERIFY(!StatusMessage(withStatus({})).isError());
        QVERIFY(!StatusMessage(withStatus({{"isError", false}})).isError());
        QVERIFY(StatusMessage(withStatus({{"isError", true}})).isError());
    }

    void testRefersTo() {
        QVERIFY(StatusMessage({}).refersTo().isEmpty());
        QVERIFY(StatusMessage(withStatus({})).refersTo().isEmpty());
        QCOMPARE(StatusMessage(withStatus({{"refersTo", "BREAKPOINT_AGE"}})).refersTo(),
            QString("BREAKPOINT_AGE"));
    }

    void testParsedMessage_data() {
        QTest::addColumn<QString>("format");
        QTest::addColumn<QStringList>("parameters");
        QTest::addColumn<QString>("expected");

        QTest::newRow("no parameters") << "A simple message" << QStringList{} << "A simple message";
        QTest::newRow("one parameter")
            << "Calc took $0 seconds" << QStringList{"30"} << "Calc took 30 seconds";
        QTest::newRow("multiple parameters")
            << "A $0 $1 simple message $0" << QStringList{"not", "so"}
            << "A not so simple message not";
        QTest::newRow("escaped dollar")
            << "A $$20 simple message$0" << QStringList{"!"} << "A $20 simple message!";
        QTest::newRow("dollars in parameters")
            << "A $0 $1 simple message $2" << QStringList{"$1", "weird", "$0"}
            << "A $1 weird simple message $0";
        QTest::newRow("trailing dollar") << "A simple message $" << QStringList{}
                                         << "A simple message $";
        QTest::newRow("missing parameter") << "A simple $0 message" << QStringList{}
                                           << "A simple $0 message";
    }

    void testParsedMessage() {
        QFETCH(QString, format);
        QFETCH(QStringList, parameters);
        QFETCH(QString, expected);

        QJsonObject description{{"format", format}};
        if (!parameters.isEmpty()) {
            description.insert("parameters", QJsonArray::fromStringList(parameters));
        }
        const StatusMessage message(withStatus({{"description", description}}));

        QVERIFY(message.hasMessage());
        QCOMPARE(message.parsedMessage(), expected);
    }

    void testNoMessageWithoutFormat() {
        QVERIFY(!StatusMessage({}).hasMessage());
        QVERIFY(!StatusMessage(withStatus({})).hasMessage());
        QVERIFY(!StatusMessage(withStatus({{"description", QJsonObject{}}})).hasMessage());

        const StatusMessage errorOnly(withStatus({{"isError", true}, {"refersTo", "UNSPECIFIED"}}));
        QVERIFY(!errorOnly.hasMessage());
        QVERIFY(errorOnly.isError());
    }
};

QTEST_APPLESS_MAIN(TestStatusMessage)
#include "test_status_message.moc"
