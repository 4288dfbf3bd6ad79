#include "jsonsyntax.h"
#include <QJsonObject>
#include <QJsonArray>

namespace jnx {

// ── JSON Scanner ───────────────────────────────────────────────────────
//
// Recursive descent over RFC 8259 JSON:
//
//   value    = object | array | string | number | 'true' | 'false' | 'null'
//   object   = '{' [ property (',' property)* ] '}'
//   property = string ':' value
//   array    = '[' [ value (',' value)* ] ']'
//
// Whitespace and (optionally) comments between tokens are trivia: they are
// skipped but never discarded from the source, because nodes only record
// offsets into the original text.

class JsonScanner {
public:
    JsonScanner(const QString& input, const JsonParseOptions& opts)
        : m_input(input), m_opts(opts) {}

    JsonParseResult parse() {
        JsonParseResult r;
        if (!atEnd() && peek() == QChar(0xFEFF))
            advance();
        if (!skipTrivia())
            return error();
        if (atEnd()) {
            m_errorPos = m_pos;
            m_error = QStringLiteral("empty document");
            return error();
        }
        if (!parseValue(r.root, 0))
            return error();
        if (!skipTrivia())
            return error();
        if (!atEnd()) {
            fail(QStringLiteral("unexpected '%1'").arg(peek()));
            return error();
        }
        r.ok = true;
        return r;
    }

private:
    static constexpr int kMaxDepth = 512;

    const QString& m_input;
    JsonParseOptions m_opts;
    int m_pos = 0;
    QString m_error;
    int m_errorPos = 0;

    // ── Helpers ──

    bool atEnd() const { return m_pos >= m_input.size(); }

    QChar peek(int ahead = 0) const {
        int p = m_pos + ahead;
        return p < m_input.size() ? m_input[p] : QChar('\0');
    }

    void advance() { m_pos++; }

    JsonParseResult error() const {
        JsonParseResult r;
        r.error = m_error;
        r.errorPos = m_errorPos;
        return r;
    }

    bool fail(const QString& msg) {
        m_error = msg;
        m_errorPos = m_pos;
        return false;
    }

    static bool isJsonSpace(QChar ch) {
        return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r';
    }

    static bool isDigit(QChar ch) { return ch >= '0' && ch <= '9'; }

    bool skipTrivia() {
        for (;;) {
            while (!atEnd() && isJsonSpace(peek()))
                advance();
            if (!m_opts.allowComments || peek() != '/')
                return true;
            if (peek(1) == '/') {
                while (!atEnd() && peek() != '\n')
                    advance();
            } else if (peek(1) == '*') {
                int start = m_pos;
                m_pos += 2;
                while (!atEnd() && !(peek() == '*' && peek(1) == '/'))
                    advance();
                if (atEnd()) {
                    m_pos = start;
                    return fail(QStringLiteral("unterminated comment"));
                }
                m_pos += 2;
            } else {
                return true;
            }
        }
    }

    bool expect(QChar ch) {
        if (peek() != ch) {
            if (atEnd())
                return fail(QStringLiteral("expected '%1' but reached end of input").arg(ch));
            return fail(QStringLiteral("expected '%1'").arg(ch));
        }
        advance();
        return true;
    }

    // ── Values ──

    bool parseValue(SyntaxNode& out, int depth) {
        if (depth > kMaxDepth)
            return fail(QStringLiteral("nesting too deep"));
        if (atEnd())
            return fail(QStringLiteral("unexpected end of input"));

        QChar ch = peek();
        if (ch == '{') return parseObject(out, depth);
        if (ch == '[') return parseArray(out, depth);
        if (ch == '"') return parseString(out);
        if (ch == '-' || isDigit(ch)) return parseNumber(out);
        if (ch.isLetter()) return parseLiteral(out);
        return fail(QStringLiteral("unexpected '%1'").arg(ch));
    }

    bool parseObject(SyntaxNode& out, int depth) {
        out.kind = SyntaxKind::Object;
        out.offset = m_pos;
        advance(); // skip '{'
        if (!skipTrivia()) return false;

        if (peek() != '}') {
            for (;;) {
                if (peek() != '"')
                    return fail(QStringLiteral("expected property name"));

                SyntaxNode prop;
                prop.kind = SyntaxKind::Property;
                prop.offset = m_pos;
                prop.children.resize(2);
                if (!parseString(prop.children[0])) return false;
                if (!skipTrivia()) return false;
                prop.colonOffset = m_pos;
                if (!expect(':')) return false;
                if (!skipTrivia()) return false;
                if (!parseValue(prop.children[1], depth + 1)) return false;
                prop.length = prop.children[1].end() - prop.offset;
                out.children.push_back(std::move(prop));

                if (!skipTrivia()) return false;
                if (peek() == ',') {
                    advance();
                    if (!skipTrivia()) return false;
                    if (peek() == '}' && m_opts.allowTrailingComma) break;
                    continue;
                }
                if (peek() == '}') break;
                return fail(atEnd() ? QStringLiteral("unterminated object")
                                    : QStringLiteral("expected ',' or '}'"));
            }
        }
        advance(); // skip '}'
        out.length = m_pos - out.offset;
        return true;
    }

    bool parseArray(SyntaxNode& out, int depth) {
        out.kind = SyntaxKind::Array;
        out.offset = m_pos;
        advance(); // skip '['
        if (!skipTrivia()) return false;

        if (peek() != ']') {
            for (;;) {
                SyntaxNode elem;
                if (!parseValue(elem, depth + 1)) return false;
                out.children.push_back(std::move(elem));

                if (!skipTrivia()) return false;
                if (peek() == ',') {
                    advance();
                    if (!skipTrivia()) return false;
                    if (peek() == ']' && m_opts.allowTrailingComma) break;
                    continue;
                }
                if (peek() == ']') break;
                return fail(atEnd() ? QStringLiteral("unterminated array")
                                    : QStringLiteral("expected ',' or ']'"));
            }
        }
        advance(); // skip ']'
        out.length = m_pos - out.offset;
        return true;
    }

    bool parseHex4(ushort& unit) {
        unit = 0;
        for (int i = 0; i < 4; i++) {
            QChar c = peek();
            int d;
            if (c >= '0' && c <= '9')      d = c.unicode() - '0';
            else if (c >= 'a' && c <= 'f') d = c.unicode() - 'a' + 10;
            else if (c >= 'A' && c <= 'F') d = c.unicode() - 'A' + 10;
            else return fail(QStringLiteral("invalid unicode escape"));
            unit = ushort(unit * 16 + d);
            advance();
        }
        return true;
    }

    bool parseString(SyntaxNode& out) {
        out.kind = SyntaxKind::String;
        out.offset = m_pos;
        advance(); // skip '"'

        QString decoded;
        for (;;) {
            if (atEnd()) {
                m_pos = out.offset;
                return fail(QStringLiteral("unterminated string"));
            }
            QChar c = peek();
            if (c == '"') break;
            if (c.unicode() < 0x20)
                return fail(QStringLiteral("control character in string"));
            if (c != '\\') {
                decoded += c;
                advance();
                continue;
            }
            advance(); // skip '\'
            QChar e = peek();
            switch (e.unicode()) {
            case '"':  decoded += QChar('"');  break;
            case '\\': decoded += QChar('\\'); break;
            case '/':  decoded += QChar('/');  break;
            case 'b':  decoded += QChar('\b'); break;
            case 'f':  decoded += QChar('\f'); break;
            case 'n':  decoded += QChar('\n'); break;
            case 'r':  decoded += QChar('\r'); break;
            case 't':  decoded += QChar('\t'); break;
            case 'u': {
                advance();
                ushort unit = 0;
                if (!parseHex4(unit)) return false;
                decoded += QChar(unit);
                continue;
            }
            default:
                return fail(QStringLiteral("invalid escape sequence"));
            }
            advance();
        }
        advance(); // skip closing '"'
        out.length = m_pos - out.offset;
        out.scalar = decoded;
        return true;
    }

    // -?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][+-]?[0-9]+)?
    bool parseNumber(SyntaxNode& out) {
        out.kind = SyntaxKind::Number;
        out.offset = m_pos;
        bool integral = true;

        if (peek() == '-') advance();
        if (peek() == '0') {
            advance();
        } else if (isDigit(peek())) {
            while (isDigit(peek())) advance();
        } else {
            return fail(QStringLiteral("expected digit"));
        }
        if (peek() == '.') {
            integral = false;
            advance();
            if (!isDigit(peek()))
                return fail(QStringLiteral("expected digit after '.'"));
            while (isDigit(peek())) advance();
        }
        if (peek() == 'e' || peek() == 'E') {
            integral = false;
            advance();
            if (peek() == '+' || peek() == '-') advance();
            if (!isDigit(peek()))
                return fail(QStringLiteral("expected exponent digits"));
            while (isDigit(peek())) advance();
        }

        out.length = m_pos - out.offset;
        QString text = m_input.mid(out.offset, out.length);
        bool ok = false;
        if (integral) {
            qint64 i = text.toLongLong(&ok);
            if (ok) {
                out.scalar = QJsonValue(i);
                return true;
            }
        }
        double d = text.toDouble(&ok);
        if (!ok) {
            m_pos = out.offset;
            return fail(QStringLiteral("number out of range"));
        }
        out.scalar = d;
        return true;
    }

    bool parseLiteral(SyntaxNode& out) {
        int start = m_pos;
        while (!atEnd() && peek().isLetter())
            advance();
        QStringView word = QStringView(m_input).mid(start, m_pos - start);

        out.offset = start;
        out.length = m_pos - start;
        if (word == u"true") {
            out.kind = SyntaxKind::Boolean;
            out.scalar = true;
        } else if (word == u"false") {
            out.kind = SyntaxKind::Boolean;
            out.scalar = false;
        } else if (word == u"null") {
            out.kind = SyntaxKind::Null;
            out.scalar = QJsonValue(QJsonValue::Null);
        } else {
            m_pos = start;
            return fail(QStringLiteral("unexpected '%1'").arg(word.toString()));
        }
        return true;
    }
};

// ── Public API ─────────────────────────────────────────────────────────

JsonParseResult JsonSyntax::parse(const QString& text, const JsonParseOptions& opts)
{
    JsonScanner scanner(text, opts);
    return scanner.parse();
}

JsonParseResult JsonSyntax::parseDocument(const QString& text)
{
    JsonParseOptions opts;
    opts.allowComments = true;
    return parse(text, opts);
}

QString JsonSyntax::validate(const QString& text)
{
    auto r = parse(text);
    if (r.ok) return {};
    return QStringLiteral("%1 at position %2").arg(r.error).arg(r.errorPos);
}

// Last occurrence wins, matching how duplicate keys load into a value.
const SyntaxNode* JsonSyntax::findProperty(const SyntaxNode& object, const QString& key)
{
    if (object.kind != SyntaxKind::Object) return nullptr;
    for (auto it = object.children.rbegin(); it != object.children.rend(); ++it) {
        if (it->keyText() == key)
            return &*it;
    }
    return nullptr;
}

const SyntaxNode* JsonSyntax::findAtPath(const SyntaxNode& root, const JsonPath& path)
{
    const SyntaxNode* cur = &root;
    for (const auto& seg : path) {
        if (isKey(seg)) {
            const SyntaxNode* prop = findProperty(*cur, std::get<QString>(seg));
            if (!prop) return nullptr;
            cur = prop->valueNode();
        } else {
            int idx = std::get<int>(seg);
            if (cur->kind != SyntaxKind::Array) return nullptr;
            if (idx < 0 || idx >= (int)cur->children.size()) return nullptr;
            cur = &cur->children[idx];
        }
        if (!cur) return nullptr;
    }
    return cur;
}

QJsonValue JsonSyntax::toValue(const SyntaxNode& node)
{
    switch (node.kind) {
    case SyntaxKind::Object: {
        QJsonObject o;
        for (const auto& prop : node.children) {
            if (auto* v = prop.valueNode())
                o[prop.keyText()] = toValue(*v);
        }
        return o;
    }
    case SyntaxKind::Array: {
        QJsonArray a;
        for (const auto& elem : node.children)
            a.append(toValue(elem));
        return a;
    }
    case SyntaxKind::Property: {
        auto* v = node.valueNode();
        return v ? toValue(*v) : QJsonValue();
    }
    case SyntaxKind::Null:
        return QJsonValue(QJsonValue::Null);
    default:
        return node.scalar;
    }
}

SyntaxNode JsonSyntax::fromValue(const QJsonValue& value)
{
    SyntaxNode n;
    switch (value.type()) {
    case QJsonValue::Object: {
        n.kind = SyntaxKind::Object;
        const QJsonObject o = value.toObject();
        for (auto it = o.begin(); it != o.end(); ++it)
            setProperty(n, it.key(), fromValue(it.value()));
        break;
    }
    case QJsonValue::Array: {
        n.kind = SyntaxKind::Array;
        for (const auto& elem : value.toArray())
            n.children.push_back(fromValue(elem));
        break;
    }
    case QJsonValue::Bool:
        n.kind = SyntaxKind::Boolean;
        n.scalar = value;
        break;
    case QJsonValue::Double:
        n.kind = SyntaxKind::Number;
        n.scalar = value;
        break;
    case QJsonValue::String:
        n.kind = SyntaxKind::String;
        n.scalar = value;
        break;
    default:
        n.kind = SyntaxKind::Null;
        n.scalar = QJsonValue(QJsonValue::Null);
        break;
    }
    return n;
}

void JsonSyntax::setProperty(SyntaxNode& object, const QString& key, SyntaxNode value)
{
    for (auto it = object.children.rbegin(); it != object.children.rend(); ++it) {
        if (it->keyText() == key && it->children.size() > 1) {
            it->children[1] = std::move(value);
            return;
        }
    }
    SyntaxNode prop;
    prop.kind = SyntaxKind::Property;
    prop.children.resize(2);
    prop.children[0].kind = SyntaxKind::String;
    prop.children[0].scalar = key;
    prop.children[1] = std::move(value);
    object.children.push_back(std::move(prop));
}

} // namespace jnx
