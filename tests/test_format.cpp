#include "core.h"
#include "jsonsyntax.h"
#include <QTest>
#include <QJsonObject>
#include <QJsonArray>
#include <cmath>
#include <limits>

using namespace jnx;

class TestFormat : public QObject {
    Q_OBJECT

private slots:
    // ── Scalars ──

    void quotePlain()   { QCOMPARE(fmt::quoteString("abc"), QStringLiteral("\"abc\"")); }
    void quoteEscapes() { QCOMPARE(fmt::quoteString("a\"b\\c\n"), QStringLiteral("\"a\\\"b\\\\c\\n\"")); }
    void quoteControl() { QCOMPARE(fmt::quoteString(QString(QChar(0x01))), QStringLiteral("\"\\u0001\"")); }
    void quoteUnicode() { QCOMPARE(fmt::quoteString(QStringLiteral("é")), QStringLiteral("\"é\"")); }

    void numbers() {
        QCOMPARE(fmt::fmtNumber(3.0),   QStringLiteral("3"));
        QCOMPARE(fmt::fmtNumber(-2.5),  QStringLiteral("-2.5"));
        QCOMPARE(fmt::fmtNumber(0.1),   QStringLiteral("0.1"));
        QCOMPARE(fmt::fmtNumber(-0.0),  QStringLiteral("0"));
        QCOMPARE(fmt::fmtNumber(1e20),  QStringLiteral("100000000000000000000"));
        QCOMPARE(fmt::fmtNumber(std::numeric_limits<double>::quiet_NaN()), QStringLiteral("null"));
        QCOMPARE(fmt::fmtNumber(std::numeric_limits<double>::infinity()), QStringLiteral("null"));
    }

    void scalarKinds() {
        QCOMPARE(fmt::fmtScalar(QJsonValue(true)), QStringLiteral("true"));
        QCOMPARE(fmt::fmtScalar(QJsonValue(QJsonValue::Null)), QStringLiteral("null"));
        QCOMPARE(fmt::fmtScalar(QJsonValue(QStringLiteral("x"))), QStringLiteral("\"x\""));
        QCOMPARE(fmt::fmtScalar(QJsonValue(qint64(9007199254740993LL))),
                 QStringLiteral("9007199254740993"));
    }

    void int64Extremes() {
        QCOMPARE(fmt::fmtScalar(QJsonValue(std::numeric_limits<qint64>::max())),
                 QStringLiteral("9223372036854775807"));
        QCOMPARE(fmt::fmtScalar(QJsonValue(std::numeric_limits<qint64>::min())),
                 QStringLiteral("-9223372036854775808"));
        QCOMPARE(fmt::fmtScalar(QJsonValue(qint64(9100000000000000001LL))),
                 QStringLiteral("9100000000000000001"));
        QCOMPARE(fmt::fmtScalar(QJsonValue(1e20)), QStringLiteral("100000000000000000000"));
        QCOMPARE(fmt::fmtScalar(QJsonValue(2.0)), QStringLiteral("2"));
    }

    // ── Canonical ──

    void canonicalNested() {
        QJsonObject o;
        o["b"] = QJsonArray{1, QJsonObject{{"c", QJsonValue(QJsonValue::Null)}}};
        o["a"] = "x";
        QCOMPARE(fmt::canonical(o),
                 QStringLiteral("{\n"
                                "  \"a\": \"x\",\n"
                                "  \"b\": [\n"
                                "    1,\n"
                                "    {\n"
                                "      \"c\": null\n"
                                "    }\n"
                                "  ]\n"
                                "}"));
    }

    void canonicalEmptyContainers() {
        QCOMPARE(fmt::canonical(QJsonObject()), QStringLiteral("{}"));
        QCOMPARE(fmt::canonical(QJsonArray()),  QStringLiteral("[]"));
        QCOMPARE(fmt::canonical(QJsonObject{{"e", QJsonArray()}}),
                 QStringLiteral("{\n  \"e\": []\n}"));
    }

    void canonicalScalar() {
        QCOMPARE(fmt::canonical(QJsonValue(42)), QStringLiteral("42"));
    }

    void canonicalIndentOptions() {
        FormatOptions four;
        four.indentWidth = 4;
        QCOMPARE(fmt::canonical(QJsonArray{1}, four), QStringLiteral("[\n    1\n]"));

        FormatOptions tabs;
        tabs.insertSpaces = false;
        QCOMPARE(fmt::canonical(QJsonArray{1}, tabs), QStringLiteral("[\n\t1\n]"));
    }

    // ── Styles ──

    void compactStyle() {
        QJsonObject o{{"a", 1}, {"b", QJsonArray{true, false}}};
        QCOMPARE(fmt::serialize(o, JsonStyle::compact()),
                 QStringLiteral("{\"a\":1,\"b\":[true,false]}"));

        JsonStyle spaced = JsonStyle::compact();
        spaced.colon = QStringLiteral(": ");
        spaced.comma = QStringLiteral(", ");
        QCOMPARE(fmt::serialize(o, spaced),
                 QStringLiteral("{\"a\": 1, \"b\": [true, false]}"));
    }

    void prettyWithBaseIndent() {
        JsonStyle s = JsonStyle::canonical();
        s.base = QStringLiteral("    ");
        QCOMPARE(fmt::serialize(QJsonObject{{"k", 1}}, s),
                 QStringLiteral("{\n      \"k\": 1\n    }"));
    }

    void membersKeepOrder() {
        QVector<QPair<QString, QJsonValue>> members{{"z", 1}, {"a", 2}};
        QCOMPARE(fmt::serializeMembers(members, JsonStyle::canonical()),
                 QStringLiteral("{\n  \"z\": 1,\n  \"a\": 2\n}"));
    }

    void treeKeepsWrittenOrder() {
        auto r = jnx::JsonSyntax::parse(R"({"z":[1,{"y":true,"b":null}],"a":"s"})");
        QVERIFY(r.ok);
        QCOMPARE(fmt::serialize(r.root, JsonStyle::compact()),
                 QStringLiteral(R"({"z":[1,{"y":true,"b":null}],"a":"s"})"));
        QCOMPARE(fmt::canonical(r.root),
                 QStringLiteral("{\n"
                                "  \"z\": [\n"
                                "    1,\n"
                                "    {\n"
                                "      \"y\": true,\n"
                                "      \"b\": null\n"
                                "    }\n"
                                "  ],\n"
                                "  \"a\": \"s\"\n"
                                "}"));
    }

    void treeSkipsShadowedDuplicates() {
        auto r = jnx::JsonSyntax::parse(R"({"k":1,"j":2,"k":3})");
        QVERIFY(r.ok);
        QCOMPARE(fmt::serialize(r.root, JsonStyle::compact()), QStringLiteral(R"({"j":2,"k":3})"));
    }

    // ── Display path ──

    void pathRoot()  { QCOMPARE(fmt::formatPath({}), QStringLiteral("$")); }
    void pathMixed() {
        JsonPath p{QString("customer"), 0, QString("name")};
        QCOMPARE(fmt::formatPath(p), QStringLiteral("$[\"customer\"][0][\"name\"]"));
    }
    void pathQuotedKey() {
        QCOMPARE(fmt::formatPath(JsonPath{QString("a\"b")}), QStringLiteral("$[\"a\\\"b\"]"));
    }
    void pathNumericKey() {
        JsonPath p{QString("0")};
        QCOMPARE(fmt::formatPath(p), QStringLiteral("$[\"0\"]"));
    }

    // ── Path JSON form ──

    void pathJsonRoundTrip() {
        JsonPath p{QString("a"), 3};
        auto back = pathFromJson(pathToJson(p));
        QVERIFY(back.has_value());
        QVERIFY(pathsEqual(*back, p));
    }

    void pathJsonRejectsBadSegments() {
        QVERIFY(!pathFromJson(QJsonArray{1.5}).has_value());
        QVERIFY(!pathFromJson(QJsonArray{-1}).has_value());
        QVERIFY(!pathFromJson(QJsonArray{true}).has_value());
    }

    void keyAndIndexDiffer() {
        QVERIFY(!pathsEqual(JsonPath{QString("0")}, JsonPath{0}));
        QVERIFY(pathsEqual(JsonPath{}, JsonPath{}));
    }
};

QTEST_GUILESS_MAIN(TestFormat)
#include "test_format.moc"
