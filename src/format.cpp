#include "core.h"
#include "jsonsyntax.h"
#include <QStringList>
#include <QLocale>
#include <cmath>
#include <limits>

namespace jnx::fmt {

// ── Scalars ──

QString quoteString(const QString& s) {
    QString out;
    out.reserve(s.size() + 2);
    out += QChar('"');
    for (QChar c : s) {
        switch (c.unicode()) {
        case '"':  out += QStringLiteral("\\\""); break;
        case '\\': out += QStringLiteral("\\\\"); break;
        case '\b': out += QStringLiteral("\\b");  break;
        case '\f': out += QStringLiteral("\\f");  break;
        case '\n': out += QStringLiteral("\\n");  break;
        case '\r': out += QStringLiteral("\\r");  break;
        case '\t': out += QStringLiteral("\\t");  break;
        default:
            if (c.unicode() < 0x20)
                out += QStringLiteral("\\u%1").arg(c.unicode(), 4, 16, QChar('0'));
            else
                out += c;
        }
    }
    out += QChar('"');
    return out;
}

// Shortest round-trip form; integral values print without a fraction.
QString fmtNumber(double v) {
    if (!std::isfinite(v)) return QStringLiteral("null");
    if (v == 0) return QStringLiteral("0");
    if (v == std::trunc(v) && std::fabs(v) < 1e21)
        return QString::number(v, 'f', 0);
    return QString::number(v, 'g', QLocale::FloatingPointShortest);
}

QString fmtScalar(const QJsonValue& v) {
    switch (v.type()) {
    case QJsonValue::Bool:
        return v.toBool() ? QStringLiteral("true") : QStringLiteral("false");
    case QJsonValue::Double: {
        // Integers keep their exact digits across the whole qint64 range
        const qint64 none = std::numeric_limits<qint64>::min();
        const qint64 i = v.toInteger(none);
        if (i != none) return QString::number(i);
        return fmtNumber(v.toDouble());
    }
    case QJsonValue::String:
        return quoteString(v.toString());
    default:
        return QStringLiteral("null");
    }
}

// ── Composite serialization ──

static QString indentAt(const JsonStyle& style, int level) {
    QString s = style.base;
    for (int i = 0; i < level; i++) s += style.unit;
    return s;
}

static QString joinMembers(const QStringList& items, QChar open, QChar close,
                           const JsonStyle& style, int level) {
    if (items.isEmpty()) return QString(open) + close;
    if (!style.pretty)
        return open + items.join(style.comma) + close;
    QString inner = indentAt(style, level + 1);
    return open + QStringLiteral("\n") + inner
         + items.join(QStringLiteral(",\n") + inner)
         + QStringLiteral("\n") + indentAt(style, level) + close;
}

static QString serializeAt(const SyntaxNode& n, const JsonStyle& style, int level) {
    switch (n.kind) {
    case SyntaxKind::Object: {
        QStringList items;
        for (const auto& prop : n.children) {
            if (!JsonSyntax::isEffective(n, prop)) continue;
            items << quoteString(prop.keyText()) + style.colon
                     + serializeAt(*prop.valueNode(), style, level + 1);
        }
        return joinMembers(items, '{', '}', style, level);
    }
    case SyntaxKind::Array: {
        QStringList items;
        for (const auto& elem : n.children)
            items << serializeAt(elem, style, level + 1);
        return joinMembers(items, '[', ']', style, level);
    }
    case SyntaxKind::Property: {
        auto* v = n.valueNode();
        return v ? serializeAt(*v, style, level) : QStringLiteral("null");
    }
    case SyntaxKind::Null:
        return QStringLiteral("null");
    default:
        return fmtScalar(n.scalar);
    }
}

QString serialize(const SyntaxNode& node, const JsonStyle& style) {
    return serializeAt(node, style, 0);
}

QString canonical(const SyntaxNode& node, const FormatOptions& opts) {
    return serialize(node, JsonStyle::canonical(opts));
}

QString serialize(const QJsonValue& v, const JsonStyle& style) {
    return serialize(JsonSyntax::fromValue(v), style);
}

QString serializeMembers(const QVector<QPair<QString, QJsonValue>>& members,
                         const JsonStyle& style) {
    SyntaxNode object;
    object.kind = SyntaxKind::Object;
    for (const auto& m : members)
        JsonSyntax::setProperty(object, m.first, JsonSyntax::fromValue(m.second));
    return serialize(object, style);
}

QString canonical(const QJsonValue& v, const FormatOptions& opts) {
    return serialize(v, JsonStyle::canonical(opts));
}

// ── Display path: $["customer"][0] ──

QString formatPath(const JsonPath& path) {
    if (path.isEmpty()) return QStringLiteral("$");
    QStringList segs;
    for (const auto& seg : path) {
        if (isIndex(seg)) segs << QString::number(std::get<int>(seg));
        else              segs << quoteString(std::get<QString>(seg));
    }
    return QStringLiteral("$[") + segs.join(QStringLiteral("][")) + QStringLiteral("]");
}

} // namespace jnx::fmt
