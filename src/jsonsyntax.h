#pragma once
#include "core.h"
#include <QString>
#include <QJsonValue>
#include <vector>

namespace jnx {

// ── Concrete JSON parse tree ──
//
// Every node keeps the offset and length (in QChar units) of its source text,
// so edits can be computed against the original bytes instead of a
// reserialized document.

enum class SyntaxKind : uint8_t {
    Object, Array, Property,
    String, Number, Boolean, Null
};

struct SyntaxNode {
    SyntaxKind kind        = SyntaxKind::Null;
    int        offset      = 0;
    int        length      = 0;
    int        colonOffset = -1;       // Property only
    QJsonValue scalar;                 // String (decoded), Number, Boolean
    std::vector<SyntaxNode> children;  // Object: properties, Property: {key, value}, Array: elements

    int  end() const { return offset + length; }
    bool isContainer() const { return kind == SyntaxKind::Object || kind == SyntaxKind::Array; }

    const SyntaxNode* keyNode() const {
        return kind == SyntaxKind::Property && !children.empty() ? &children[0] : nullptr;
    }
    const SyntaxNode* valueNode() const {
        return kind == SyntaxKind::Property && children.size() > 1 ? &children[1] : nullptr;
    }
    QString keyText() const {
        auto* k = keyNode();
        return k ? k->scalar.toString() : QString();
    }
};

struct JsonParseOptions {
    bool allowComments      = false;
    bool allowTrailingComma = false;
};

struct JsonParseResult {
    bool       ok = false;
    SyntaxNode root;
    QString    error;
    int        errorPos = -1;
};

class JsonSyntax {
public:
    static JsonParseResult parse(const QString& text, const JsonParseOptions& opts = {});
    // Lenient parse for stored documents: comments are kept as trivia.
    static JsonParseResult parseDocument(const QString& text);
    static QString validate(const QString& text);

    static const SyntaxNode* findAtPath(const SyntaxNode& root, const JsonPath& path);
    static const SyntaxNode* findProperty(const SyntaxNode& object, const QString& key);
    static QJsonValue toValue(const SyntaxNode& node);

    // Detached tree for a logical value. Offsets are zero; object members
    // follow QJsonObject order.
    static SyntaxNode fromValue(const QJsonValue& value);

    // Replace the value of the effective `key` member, or append a member.
    static void setProperty(SyntaxNode& object, const QString& key, SyntaxNode value);

    // False for an earlier duplicate hidden by a later member of the same key
    static bool isEffective(const SyntaxNode& object, const SyntaxNode& prop) {
        return findProperty(object, prop.keyText()) == &prop;
    }
};

// Serialization that keeps member order as written
namespace fmt {
    QString serialize(const SyntaxNode& node, const JsonStyle& style);
    QString canonical(const SyntaxNode& node, const FormatOptions& opts = {});
} // namespace fmt

} // namespace jnx
