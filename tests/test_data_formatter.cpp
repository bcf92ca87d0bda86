#include <QJsonObject>
#include <QtTest/QTest>

#include "snapdbg/data_formatter.hpp"

using namespace snapdbg;

class TestDataFormatter : public QObject {
    Q_OBJECT
private slots:
    void testBuildTable() {
        const QString table = DataFormatter().buildTable(
            {"Name", "ID"},
            {{"first", "1"}, {"s", "12345"}});

        QCOMPARE(table,
            QString("Name   ID   \n"
                    "-----  -----\n"
                    "first  1    \n"
                    "s      12345\n"));
    }

    void testBuildTableWithoutRows() {
        QCOMPARE(DataFormatter().buildTable({"Function", "Location"}, {}),
            QString("Function  Location\n"
                    "--------  --------\n"));
    }

    void testDisplayListCompact() {
        DisplayValue object = DisplayValue::emptyComposite();
        object.setMember("b", DisplayValue::fromScalar(2));
        object.setMember("a", DisplayValue::fromScalar(QString("x \"quoted\"")));
        const DisplayList list{
            {"obj", object},
            {"empty", DisplayValue::emptyComposite()},
            {"none", DisplayValue::fromScalar(QJsonValue())},
        };

        QCOMPARE(DataFormatter().toJsonString(list, false),
            QString("[{\"obj\": {\"b\": 2, \"a\": \"x \\\"quoted\\\"\"}}, {\"empty\": {}}, "
                    "{\"none\": null}]"));
    }

    void testDisplayListPretty() {
        DisplayValue inner = DisplayValue::emptyComposite();
        inner.setMember("x", DisplayValue::fromScalar(true));
        DisplayValue outer = DisplayValue::emptyComposite();
        outer.setMember("inner", inner);
        outer.setMember("n", DisplayValue::fromScalar(1.5));
        const DisplayList list{{"v", outer}, {"s", DisplayValue::fromScalar(QString("t"))}};

        QCOMPARE(DataFormatter().toJsonString(list, true),
            QString("[\n"
                    "  {\n"
                    "    \"v\": {\n"
                    "      \"inner\": {\n"
                    "        \"x\": true\n"
                    "      },\n"
                    "      \"n\": 1.5\n"
                    "    }\n"
                    "  },\n"
                    "  {\n"
                    "    \"s\": \"t\"\n"
                    "  }\n"
                    "]"));
    }

    void testEmptyDisplayList() {
        QCOMPARE(DataFormatter().toJsonString(DisplayList{}, true), QString("[]"));
    }

    void testRawDocument() {
        const QJsonObject document{{"b", 1}, {"a", "x"}};
        QCOMPARE(DataFormatter().toJsonString(document, false), QString("{\"a\":\"x\",\"b\":1}"));
    }
};

QTEST_APPLESS_MAIN(TestDataFormatter)
#include "test_data_formatter.moc"
