#pragma once
#include "core.h"
#include "jsonsyntax.h"
#include <QString>
#include <QVector>

namespace jnx {

// Replace `length` chars at `offset` of the original text with `content`.
struct TextEdit {
    int     offset = 0;
    int     length = 0;
    QString content;

    bool operator==(const TextEdit& o) const {
        return offset == o.offset && length == o.length && content == o.content;
    }
};

struct PatchResult {
    bool    ok = false;
    QString text;    // original text when !ok
    QString error;
};

class JsonPatcher {
public:
    // Empty path: canonical serialization of `value` replaces the document.
    // Otherwise only the text of the addressed value changes.
    static PatchResult setValue(const QString& document, const JsonPath& path,
                                const QJsonValue& value, const FormatOptions& opts = {});
    // Object members of `value` are written in the order they appear in it.
    static PatchResult setValue(const QString& document, const JsonPath& path,
                                const SyntaxNode& value, const FormatOptions& opts = {});

    static bool computeEdits(const QString& document, const SyntaxNode& root,
                             const JsonPath& path, const SyntaxNode& value,
                             const FormatOptions& opts, QVector<TextEdit>* edits,
                             QString* error);

    // Edits must not overlap; offsets refer to the original text.
    static QString applyEdits(const QString& text, QVector<TextEdit> edits);
};

} // namespace jnx
