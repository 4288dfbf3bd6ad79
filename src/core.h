#pragma once
#include <QString>
#include <QVector>
#include <QPair>
#include <QJsonValue>
#include <QJsonObject>
#include <QJsonArray>
#include <cstdint>
#include <limits>
#include <optional>
#include <variant>

namespace jnx {

// ── Field type enum ──

enum class FieldType : uint8_t {
    String, Number, Boolean, Null,
    Array, Object
};

// ── Field type metadata table (single source of truth) ──

struct FieldTypeMeta {
    FieldType type;
    bool      composite;  // content lives in child nodes
};

inline constexpr FieldTypeMeta kFieldTypeMeta[] = {
    // type              composite
    {FieldType::String,  false},
    {FieldType::Number,  false},
    {FieldType::Boolean, false},
    {FieldType::Null,    false},
    {FieldType::Array,   true},
    {FieldType::Object,  true},
};

inline constexpr const FieldTypeMeta* fieldTypeMeta(FieldType t) {
    for (const auto& m : kFieldTypeMeta)
        if (m.type == t) return &m;
    return nullptr;
}

inline constexpr bool isComposite(FieldType t) {
    auto* m = fieldTypeMeta(t);
    return m && m->composite;
}

inline FieldType fieldTypeOf(const QJsonValue& v) {
    switch (v.type()) {
    case QJsonValue::Bool:   return FieldType::Boolean;
    case QJsonValue::Double: return FieldType::Number;
    case QJsonValue::String: return FieldType::String;
    case QJsonValue::Array:  return FieldType::Array;
    case QJsonValue::Object: return FieldType::Object;
    default:                 return FieldType::Null;
    }
}

// ── Path ──

using PathSegment = std::variant<QString, int>;
using JsonPath    = QVector<PathSegment>;

inline bool isKey(const PathSegment& s)   { return std::holds_alternative<QString>(s); }
inline bool isIndex(const PathSegment& s) { return std::holds_alternative<int>(s); }

// Element-wise comparison; a key "0" never equals index 0.
inline bool pathsEqual(const JsonPath& a, const JsonPath& b) {
    if (a.size() != b.size()) return false;
    for (int i = 0; i < a.size(); i++)
        if (a[i] != b[i]) return false;
    return true;
}

inline QJsonArray pathToJson(const JsonPath& path) {
    QJsonArray arr;
    for (const auto& seg : path) {
        if (isIndex(seg)) arr.append(std::get<int>(seg));
        else              arr.append(std::get<QString>(seg));
    }
    return arr;
}

// Non-integral numbers and non-scalar segments make the path invalid.
inline std::optional<JsonPath> pathFromJson(const QJsonArray& arr) {
    JsonPath path;
    for (const auto& v : arr) {
        if (v.isString()) {
            path.append(v.toString());
        } else if (v.isDouble()) {
            double d = v.toDouble();
            if (d < 0 || d > std::numeric_limits<int>::max()) return std::nullopt;
            int i = static_cast<int>(d);
            if (i != d) return std::nullopt;
            path.append(i);
        } else {
            return std::nullopt;
        }
    }
    return path;
}

// ── Field ──

struct Field {
    std::optional<QString> key;
    QJsonValue             value;     // Undefined for composite fields
    FieldType              type = FieldType::Null;

    bool hasKey() const { return key.has_value() && !key->isEmpty(); }

    static Field scalar(const QJsonValue& v) {
        return Field{std::nullopt, v, fieldTypeOf(v)};
    }
    static Field keyed(const QString& k, const QJsonValue& v) {
        FieldType t = fieldTypeOf(v);
        return Field{k, isComposite(t) ? QJsonValue(QJsonValue::Undefined) : v, t};
    }
};

// ── Node ──

struct Node {
    JsonPath       path;
    QVector<Field> text;

    bool isRoot() const { return path.isEmpty(); }
};

// ── EditedValue ──

struct EditedValue {
    bool                               single = false;
    QJsonValue                         value;    // single-value mode
    QVector<QPair<QString, QJsonValue>> fields;  // mapping mode, row order

    bool isEmpty() const { return !single && fields.isEmpty(); }

    int indexOf(const QString& key) const {
        for (int i = 0; i < fields.size(); i++)
            if (fields[i].first == key) return i;
        return -1;
    }

    bool operator==(const EditedValue& o) const {
        return single == o.single && value == o.value && fields == o.fields;
    }
};

// ── Serialization style ──

struct FormatOptions {
    int  indentWidth  = 2;
    bool insertSpaces = true;

    QString indentUnit() const {
        return insertSpaces ? QString(indentWidth, QChar(' ')) : QStringLiteral("\t");
    }
};

struct JsonStyle {
    bool    pretty = true;
    QString unit   = QStringLiteral("  ");  // one nesting level
    QString base;                           // indentation of the enclosing line
    QString colon  = QStringLiteral(": ");
    QString comma  = QStringLiteral(",");   // compact mode only

    static JsonStyle canonical(const FormatOptions& opts = {}) {
        JsonStyle s;
        s.unit = opts.indentUnit();
        return s;
    }
    static JsonStyle compact() {
        JsonStyle s;
        s.pretty = false;
        s.colon  = QStringLiteral(":");
        return s;
    }
};

// ── Format function forward declarations ──

namespace fmt {
    QString quoteString(const QString& s);
    QString fmtNumber(double v);
    QString fmtScalar(const QJsonValue& v);
    QString serialize(const QJsonValue& v, const JsonStyle& style);
    QString serializeMembers(const QVector<QPair<QString, QJsonValue>>& members,
                             const JsonStyle& style);
    QString canonical(const QJsonValue& v, const FormatOptions& opts = {});
    QString formatPath(const JsonPath& path);
} // namespace fmt

} // namespace jnx
