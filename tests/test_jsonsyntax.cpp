#include "jsonsyntax.h"
#include <QTest>
#include <QJsonObject>
#include <QJsonArray>

using jnx::JsonPath;
using jnx::JsonSyntax;
using jnx::SyntaxKind;
using jnx::SyntaxNode;

class TestJsonSyntax : public QObject {
    Q_OBJECT

private slots:
    // -- Scalars --

    void trueLiteral()  { auto r = JsonSyntax::parse("true");  QVERIFY(r.ok); QCOMPARE(r.root.kind, SyntaxKind::Boolean); }
    void nullLiteral()  { auto r = JsonSyntax::parse("null");  QVERIFY(r.ok); QCOMPARE(r.root.kind, SyntaxKind::Null); }
    void integer()      { auto r = JsonSyntax::parse("-42");   QVERIFY(r.ok); QCOMPARE(r.root.scalar.toInteger(), -42LL); }
    void fraction()     { auto r = JsonSyntax::parse("2.5e1"); QVERIFY(r.ok); QCOMPARE(r.root.scalar.toDouble(), 25.0); }
    void bigInteger()   { auto r = JsonSyntax::parse("9007199254740993"); QVERIFY(r.ok); QCOMPARE(r.root.scalar.toInteger(), 9007199254740993LL); }

    void stringEscapes() {
        auto r = JsonSyntax::parse(R"("a\"b\\c\né\/")");
        QVERIFY(r.ok);
        QCOMPARE(r.root.scalar.toString(), QStringLiteral("a\"b\\c\né/"));
    }

    void surrogatePair() {
        auto r = JsonSyntax::parse(R"("\ud83d\ude00")");
        QVERIFY(r.ok);
        QCOMPARE(r.root.scalar.toString(), QString::fromUtf8("\xF0\x9F\x98\x80"));
    }

    // -- Offsets --

    void propertyOffsets() {
        QString text = R"({ "a" : 1, "bb": [true, null] })";
        auto r = JsonSyntax::parse(text);
        QVERIFY(r.ok);
        QCOMPARE(r.root.offset, 0);
        QCOMPARE(r.root.length, (int)text.size());
        QCOMPARE((int)r.root.children.size(), 2);

        const SyntaxNode& a = r.root.children[0];
        QCOMPARE(a.kind, SyntaxKind::Property);
        QCOMPARE(text.mid(a.offset, a.length), QStringLiteral("\"a\" : 1"));
        QCOMPARE(text[a.colonOffset], QChar(':'));
        QCOMPARE(a.keyText(), QStringLiteral("a"));

        const SyntaxNode* one = a.valueNode();
        QVERIFY(one);
        QCOMPARE(text.mid(one->offset, one->length), QStringLiteral("1"));

        const SyntaxNode& arr = *r.root.children[1].valueNode();
        QCOMPARE(text.mid(arr.offset, arr.length), QStringLiteral("[true, null]"));
        QCOMPARE(text.mid(arr.children[1].offset, arr.children[1].length), QStringLiteral("null"));
    }

    void stringOffsetsIncludeQuotes() {
        QString text = R"(["x\ty"])";
        auto r = JsonSyntax::parse(text);
        QVERIFY(r.ok);
        const SyntaxNode& s = r.root.children[0];
        QCOMPARE(text.mid(s.offset, s.length), QStringLiteral("\"x\\ty\""));
    }

    // -- Errors --

    void emptyInput() {
        auto r = JsonSyntax::parse("   ");
        QVERIFY(!r.ok);
        QVERIFY(r.error.contains("empty"));
    }

    void trailingGarbage() {
        auto r = JsonSyntax::parse("{} x");
        QVERIFY(!r.ok);
        QCOMPARE(r.errorPos, 3);
    }

    void missingColon() {
        auto r = JsonSyntax::parse(R"({"a" 1})");
        QVERIFY(!r.ok);
        QVERIFY(r.error.contains("':'"));
        QCOMPARE(r.errorPos, 5);
    }

    void unterminatedString() {
        auto r = JsonSyntax::parse(R"({"a": "abc)");
        QVERIFY(!r.ok);
        QVERIFY(r.error.contains("unterminated"));
        QCOMPARE(r.errorPos, 6);
    }

    void leadingZeroRejected()   { QVERIFY(!JsonSyntax::parse("01").ok); }
    void bareWordRejected()      { QVERIFY(!JsonSyntax::parse("hello").ok); }
    void singleQuotesRejected()  { QVERIFY(!JsonSyntax::parse("'a'").ok); }
    void trailingCommaRejected() { QVERIFY(!JsonSyntax::parse("[1,2,]").ok); }

    void trailingCommaOption() {
        jnx::JsonParseOptions opts;
        opts.allowTrailingComma = true;
        auto r = JsonSyntax::parse("[1,2,]", opts);
        QVERIFY(r.ok);
        QCOMPARE((int)r.root.children.size(), 2);
    }

    void commentsOnlyInDocuments() {
        QString text = "{\n  // port\n  \"p\": 1 /* default */\n}";
        QVERIFY(!JsonSyntax::parse(text).ok);
        auto r = JsonSyntax::parseDocument(text);
        QVERIFY(r.ok);
        QCOMPARE(JsonSyntax::toValue(r.root).toObject().value("p").toInt(), 1);
    }

    void unterminatedComment() {
        auto r = JsonSyntax::parseDocument("[1 /* open");
        QVERIFY(!r.ok);
        QVERIFY(r.error.contains("comment"));
    }

    void validateMessage() {
        QVERIFY(JsonSyntax::validate("[1]").isEmpty());
        QVERIFY(JsonSyntax::validate("[1").contains("position"));
    }

    // -- Paths --

    void findNested() {
        auto r = JsonSyntax::parse(R"({"a":{"b":[10,20,{"c":"x"}]}})");
        QVERIFY(r.ok);
        const SyntaxNode* n = JsonSyntax::findAtPath(r.root, JsonPath{QString("a"), QString("b"), 2, QString("c")});
        QVERIFY(n);
        QCOMPARE(n->scalar.toString(), QStringLiteral("x"));
        QVERIFY(JsonSyntax::findAtPath(r.root, {}) == &r.root);
    }

    void findMisses() {
        auto r = JsonSyntax::parse(R"({"a":[1,2]})");
        QVERIFY(r.ok);
        QVERIFY(!JsonSyntax::findAtPath(r.root, JsonPath{QString("b")}));
        QVERIFY(!JsonSyntax::findAtPath(r.root, JsonPath{QString("a"), 2}));
        QVERIFY(!JsonSyntax::findAtPath(r.root, JsonPath{QString("a"), QString("0")}));
        QVERIFY(!JsonSyntax::findAtPath(r.root, JsonPath{0}));
    }

    void duplicateKeyLastWins() {
        auto r = JsonSyntax::parse(R"({"k":1,"k":2})");
        QVERIFY(r.ok);
        const SyntaxNode* n = JsonSyntax::findAtPath(r.root, JsonPath{QString("k")});
        QVERIFY(n);
        QCOMPARE(n->scalar.toInteger(), 2LL);
        QCOMPARE(JsonSyntax::toValue(r.root).toObject().value("k").toInt(), 2);
    }

    void fromValueBuildsDetachedTree() {
        SyntaxNode n = JsonSyntax::fromValue(QJsonObject{{"b", QJsonArray{1, "x"}}, {"a", QJsonValue(QJsonValue::Null)}});
        QCOMPARE(n.kind, SyntaxKind::Object);
        QCOMPARE((int)n.children.size(), 2);
        QCOMPARE(n.children[0].keyText(), QStringLiteral("a"));
        QCOMPARE(n.children[0].valueNode()->kind, SyntaxKind::Null);
        const SyntaxNode* b = JsonSyntax::findAtPath(n, JsonPath{QString("b"), 1});
        QVERIFY(b);
        QCOMPARE(b->kind, SyntaxKind::String);
        QCOMPARE(b->scalar.toString(), QStringLiteral("x"));
    }

    void setPropertyReplacesOrAppends() {
        auto r = JsonSyntax::parse(R"({"z":1,"k":0,"k":2})");
        QVERIFY(r.ok);
        JsonSyntax::setProperty(r.root, "k", JsonSyntax::fromValue(QJsonValue(true)));
        JsonSyntax::setProperty(r.root, "new", JsonSyntax::fromValue(QJsonValue(5)));
        QCOMPARE((int)r.root.children.size(), 4);
        QCOMPARE(r.root.children[1].valueNode()->scalar.toInteger(), 0LL);
        QCOMPARE(r.root.children[2].valueNode()->scalar, QJsonValue(true));
        QCOMPARE(r.root.children[3].keyText(), QStringLiteral("new"));
        QVERIFY(!JsonSyntax::isEffective(r.root, r.root.children[1]));
        QVERIFY(JsonSyntax::isEffective(r.root, r.root.children[2]));
    }

    void toValueRoundTrip() {
        auto r = JsonSyntax::parse(R"({"n":null,"l":[1,"two",false],"o":{}})");
        QVERIFY(r.ok);
        QJsonObject o = JsonSyntax::toValue(r.root).toObject();
        QVERIFY(o.value("n").isNull());
        QCOMPARE(o.value("l").toArray(), (QJsonArray{1, "two", false}));
        QVERIFY(o.value("o").toObject().isEmpty());
    }
};

QTEST_GUILESS_MAIN(TestJsonSyntax)
#include "test_jsonsyntax.moc"
