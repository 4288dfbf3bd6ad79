#include "patcher.h"
#include <QDebug>
#include <algorithm>
#include <limits>

namespace jnx {

namespace {

// Key (empty for array elements) and new value of each inserted member
using Members = QVector<QPair<QString, const SyntaxNode*>>;

// ── Edit context ──

struct PatchContext {
    const QString&      text;
    const FormatOptions& opts;
    QVector<TextEdit>   edits;

    QStringView span(const SyntaxNode& n) const {
        return QStringView(text).mid(n.offset, n.length);
    }

    bool spansLines(const SyntaxNode& n) const {
        return span(n).contains(QChar('\n'));
    }

    // Leading whitespace of the line containing `offset`
    QString lineIndent(int offset) const {
        int start = offset > 0 ? text.lastIndexOf(QChar('\n'), offset - 1) + 1 : 0;
        int end = start;
        while (end < offset && (text[end] == ' ' || text[end] == '\t'))
            end++;
        return text.mid(start, end - start);
    }

    // Separator text between two tokens, if it is plain inline whitespace
    std::optional<QString> inlineGap(int from, int to) const {
        if (from < 0 || to < from) return std::nullopt;
        QStringView gap = QStringView(text).mid(from, to - from);
        if (gap.contains(QChar('\n')) || gap.contains(QChar('/'))) return std::nullopt;
        return gap.toString();
    }

    // Copy colon and comma spacing from existing siblings
    void sampleSeparators(const SyntaxNode* container, JsonStyle& style) const {
        if (!container) return;
        if (container->kind == SyntaxKind::Object && !container->children.empty()) {
            const SyntaxNode& p = container->children.front();
            auto* key = p.keyNode();
            auto* val = p.valueNode();
            auto before = inlineGap(key->end(), p.colonOffset);
            auto after  = inlineGap(p.colonOffset + 1, val->offset);
            if (before && after)
                style.colon = *before + QChar(':') + *after;
        }
        if (container->children.size() > 1) {
            auto gap = inlineGap(container->children[0].end(), container->children[1].offset);
            if (gap) style.comma = *gap;
        }
    }

    JsonStyle baseStyle(bool pretty) const {
        JsonStyle s = pretty ? JsonStyle::canonical(opts) : JsonStyle::compact();
        s.unit = opts.indentUnit();
        return s;
    }

    // ── Diff ──

    void diff(const SyntaxNode& old, const SyntaxNode& nv, const SyntaxNode* parent) {
        if (old.kind == SyntaxKind::Object && nv.kind == SyntaxKind::Object) {
            diffObject(old, nv, parent);
        } else if (old.kind == SyntaxKind::Array && nv.kind == SyntaxKind::Array) {
            diffArray(old, nv, parent);
        } else if (!sameScalar(old, nv)) {
            replace(old, nv, parent);
        }
    }

    // Integral values compare exactly over the qint64 range, so `1.0` == `1`
    static bool sameNumber(const QJsonValue& a, const QJsonValue& b) {
        const qint64 none = std::numeric_limits<qint64>::min();
        const qint64 ia = a.toInteger(none), ib = b.toInteger(none);
        if (ia != none || ib != none) return ia == ib;
        return a.toDouble() == b.toDouble();
    }

    static bool sameScalar(const SyntaxNode& old, const SyntaxNode& nv) {
        if (old.kind != nv.kind) return false;
        switch (old.kind) {
        case SyntaxKind::String:
            return nv.scalar.toString() == old.scalar.toString();
        case SyntaxKind::Boolean:
            return nv.scalar.toBool() == old.scalar.toBool();
        case SyntaxKind::Null:
            return true;
        case SyntaxKind::Number:
            return sameNumber(old.scalar, nv.scalar);
        default:
            return false;
        }
    }

    void replace(const SyntaxNode& old, const SyntaxNode& nv, const SyntaxNode* parent) {
        JsonStyle style = baseStyle(spansLines(old) || (parent && spansLines(*parent)));
        style.base = lineIndent(old.offset);
        sampleSeparators(parent, style);
        if (old.isContainer())
            sampleSeparators(&old, style);
        edits.append({old.offset, old.length, fmt::serialize(nv, style)});
    }

    void diffObject(const SyntaxNode& old, const SyntaxNode& nv, const SyntaxNode* parent) {
        const int n = (int)old.children.size();
        QVector<bool> removed(n, false);
        for (int i = 0; i < n; i++) {
            const SyntaxNode& prop = old.children[i];
            const SyntaxNode* next = JsonSyntax::findProperty(nv, prop.keyText());
            if (!next) {
                removed[i] = true;
            } else if (JsonSyntax::isEffective(old, prop)) {
                // Earlier duplicates of a kept key are shadowed and left alone
                diff(*prop.valueNode(), *next->valueNode(), &old);
            }
        }
        // New members keep the order they have in the new value
        Members added;
        for (const auto& prop : nv.children) {
            if (!JsonSyntax::isEffective(nv, prop)) continue;
            if (!JsonSyntax::findProperty(old, prop.keyText()))
                added.append({prop.keyText(), prop.valueNode()});
        }
        rewriteMembers(old, parent, removed, added);
    }

    void diffArray(const SyntaxNode& old, const SyntaxNode& nv, const SyntaxNode* parent) {
        const int n = (int)old.children.size();
        const int m = (int)nv.children.size();
        const int common = qMin(n, m);
        for (int i = 0; i < common; i++)
            diff(old.children[i], nv.children[i], &old);

        QVector<bool> removed(n, false);
        for (int i = common; i < n; i++)
            removed[i] = true;
        Members added;
        for (int i = common; i < m; i++)
            added.append({QString(), &nv.children[i]});
        rewriteMembers(old, parent, removed, added);
    }

    // ── Member removal and insertion ──

    void rewriteMembers(const SyntaxNode& container, const SyntaxNode* parent,
                        const QVector<bool>& removed, const Members& added) {
        const auto& kids = container.children;
        const int n = (int)kids.size();
        int lastKept = -1;
        for (int i = 0; i < n; i++)
            if (!removed[i]) lastKept = i;
        bool anyRemoved = removed.contains(true);
        if (!anyRemoved && added.isEmpty()) return;

        bool pretty = spansLines(container)
            || (n == 0 && parent && spansLines(*parent));
        QString closeIndent  = lineIndent(container.offset);
        QString memberIndent = n > 0 ? lineIndent(kids[lastKept >= 0 ? lastKept : n - 1].offset)
                                     : closeIndent + opts.indentUnit();
        if (n > 0 && memberIndent == closeIndent && pretty)
            memberIndent += opts.indentUnit();

        JsonStyle style = baseStyle(pretty);
        style.base = memberIndent;
        sampleSeparators(&container, style);
        if (n == 0) sampleSeparators(parent, style);

        QStringList members;
        for (const auto& m : added) {
            QString v = fmt::serialize(*m.second, style);
            members << (container.kind == SyntaxKind::Object
                        ? fmt::quoteString(m.first) + style.colon + v : v);
        }

        const int innerStart = container.offset + 1;
        const int innerEnd   = container.end() - 1;

        // Nothing survives: rebuild the inside of the brackets
        if (lastKept < 0) {
            QString inner;
            if (!members.isEmpty()) {
                inner = pretty
                    ? QStringLiteral("\n") + memberIndent
                      + members.join(QStringLiteral(",\n") + memberIndent)
                      + QStringLiteral("\n") + closeIndent
                    : members.join(style.comma);
            }
            edits.append({innerStart, innerEnd - innerStart, inner});
            return;
        }

        QString sep = pretty ? QStringLiteral(",\n") + memberIndent : style.comma;
        QString insertion;
        for (const auto& m : members)
            insertion += sep + m;

        bool tailHandled = false;
        for (int i = 0; i < n; ) {
            if (!removed[i]) { i++; continue; }
            int a = i;
            while (i < n && removed[i]) i++;
            int b = i - 1;
            if (b < n - 1) {
                edits.append({kids[a].offset, kids[b + 1].offset - kids[a].offset, {}});
            } else {
                // Tail run: drop the separator after the last kept member too
                int from = kids[a - 1].end();
                edits.append({from, kids[b].end() - from, insertion});
                tailHandled = true;
            }
        }
        if (!tailHandled && !insertion.isEmpty())
            edits.append({kids[lastKept].end(), 0, insertion});
    }
};

} // namespace

// ── Public API ─────────────────────────────────────────────────────────

bool JsonPatcher::computeEdits(const QString& document, const SyntaxNode& root,
                               const JsonPath& path, const SyntaxNode& value,
                               const FormatOptions& opts, QVector<TextEdit>* edits,
                               QString* error)
{
    auto fail = [&](const QString& msg) {
        if (error) *error = msg;
        return false;
    };

    PatchContext ctx{document, opts, {}};

    if (path.isEmpty()) {
        ctx.diff(root, value, nullptr);
        if (edits) *edits = ctx.edits;
        return true;
    }

    JsonPath parentPath = path.mid(0, path.size() - 1);
    const SyntaxNode* parent = JsonSyntax::findAtPath(root, parentPath);
    if (!parent)
        return fail(QStringLiteral("path %1 does not exist").arg(fmt::formatPath(parentPath)));

    const SyntaxNode* grandparent = parentPath.isEmpty() ? nullptr
        : JsonSyntax::findAtPath(root, parentPath.mid(0, parentPath.size() - 1));

    const PathSegment& last = path.last();
    if (isKey(last)) {
        if (parent->kind != SyntaxKind::Object)
            return fail(QStringLiteral("%1 is not an object").arg(fmt::formatPath(parentPath)));
        const QString& key = std::get<QString>(last);
        if (auto* prop = JsonSyntax::findProperty(*parent, key)) {
            ctx.diff(*prop->valueNode(), value, parent);
        } else {
            QVector<bool> removed((int)parent->children.size(), false);
            ctx.rewriteMembers(*parent, grandparent, removed, {{key, &value}});
        }
    } else {
        int idx = std::get<int>(last);
        if (parent->kind != SyntaxKind::Array)
            return fail(QStringLiteral("%1 is not an array").arg(fmt::formatPath(parentPath)));
        const int n = (int)parent->children.size();
        if (idx >= 0 && idx < n) {
            ctx.diff(parent->children[idx], value, parent);
        } else if (idx == n) {
            QVector<bool> removed(n, false);
            ctx.rewriteMembers(*parent, grandparent, removed, {{QString(), &value}});
        } else {
            return fail(QStringLiteral("index %1 out of range at %2")
                        .arg(idx).arg(fmt::formatPath(parentPath)));
        }
    }

    if (edits) *edits = ctx.edits;
    return true;
}

QString JsonPatcher::applyEdits(const QString& text, QVector<TextEdit> edits)
{
    // Back to front so earlier offsets stay valid; at a shared offset the
    // longer edit goes first so an insertion is not swallowed by a deletion.
    std::stable_sort(edits.begin(), edits.end(), [](const TextEdit& a, const TextEdit& b) {
        if (a.offset != b.offset) return a.offset > b.offset;
        return a.length > b.length;
    });

    QString out = text;
    int limit = text.size();
    for (const auto& e : edits) {
        if (e.offset < 0 || e.offset + e.length > limit) {
            qWarning() << "JsonPatcher: Skipping overlapping edit at" << e.offset;
            continue;
        }
        out.replace(e.offset, e.length, e.content);
        limit = e.offset;
    }
    return out;
}

PatchResult JsonPatcher::setValue(const QString& document, const JsonPath& path,
                                  const QJsonValue& value, const FormatOptions& opts)
{
    return setValue(document, path, JsonSyntax::fromValue(value), opts);
}

PatchResult JsonPatcher::setValue(const QString& document, const JsonPath& path,
                                  const SyntaxNode& value, const FormatOptions& opts)
{
    if (path.isEmpty())
        return {true, fmt::canonical(value, opts), {}};

    auto parsed = JsonSyntax::parseDocument(document);
    if (!parsed.ok) {
        QString msg = QStringLiteral("document is not valid JSON: %1 at position %2")
                          .arg(parsed.error).arg(parsed.errorPos);
        qWarning() << "JsonPatcher:" << msg;
        return {false, document, msg};
    }

    QVector<TextEdit> edits;
    QString error;
    if (!computeEdits(document, parsed.root, path, value, opts, &edits, &error)) {
        qWarning() << "JsonPatcher: Cannot patch" << fmt::formatPath(path) << "-" << error;
        return {false, document, error};
    }
    return {true, applyEdits(document, edits), {}};
}

} // namespace jnx
