#include "controller.h"
#include "patcher.h"
#include "resync.h"
#include "snapshot.h"
#include <QDebug>

namespace jnx {

EditSessionController::EditSessionController(DocumentStore* doc, GraphStore* graph,
                                             QObject* parent)
    : QObject(parent)
    , m_doc(doc)
    , m_graph(graph)
{
    connect(m_graph, &GraphStore::selectionChanged,
            this, &EditSessionController::onSelectionChanged);
    connect(m_graph, &GraphStore::rebuilt,
            this, &EditSessionController::onRebuilt);
    loadFromSelection();
}

// ── State ──

void EditSessionController::setMode(EditMode mode) {
    if (m_mode == mode) return;
    m_mode = mode;
    emit modeChanged();
}

void EditSessionController::loadFromSelection() {
    if (const Node* sel = m_graph->selectedNode())
        m_node = *sel;
    else
        m_node.reset();
    m_snapshot = m_node ? buildSnapshot(m_node->text) : EditedValue{};
    resetWorkingState();
}

void EditSessionController::resetWorkingState() {
    m_fieldTexts.clear();
    if (m_snapshot.single) {
        m_fieldTexts.append({QString(), jnx::fieldText(m_snapshot.value)});
    } else {
        for (const auto& f : m_snapshot.fields)
            m_fieldTexts.append({f.first, jnx::fieldText(f.second)});
    }
    m_dirtyFields.clear();
    m_wholeText = liveValueText();
    m_input = InputMode::Fields;
}

// Whole-value text starts from the document so composite members are kept
QString EditSessionController::liveValueText() const {
    if (m_node) {
        auto doc = JsonSyntax::parseDocument(m_doc->text());
        if (doc.ok) {
            if (const SyntaxNode* live = JsonSyntax::findAtPath(doc.root, m_node->path))
                return fmt::canonical(*live, m_opts);
        }
    }
    return snapshotText(m_snapshot, m_opts);
}

void EditSessionController::onSelectionChanged() {
    if (m_mode == EditMode::Editing)
        qDebug() << "EditSession: Selection changed, discarding edits at" << pathText();
    loadFromSelection();
    setMode(EditMode::Viewing);
}

// ── Accessors ──

QString EditSessionController::pathText() const {
    return m_node ? fmt::formatPath(m_node->path) : QString();
}

QString EditSessionController::viewText() const {
    return snapshotText(m_snapshot, m_opts);
}

int EditSessionController::fieldIndex(const QString& key) const {
    for (int i = 0; i < m_fieldTexts.size(); i++)
        if (m_fieldTexts[i].first == key) return i;
    return -1;
}

QStringList EditSessionController::fieldKeys() const {
    QStringList keys;
    for (const auto& f : m_fieldTexts) keys << f.first;
    return keys;
}

QString EditSessionController::fieldText(const QString& key) const {
    int i = fieldIndex(key);
    return i >= 0 ? m_fieldTexts[i].second : QString();
}

EditedValue EditSessionController::workingValue() const {
    EditedValue out = m_snapshot;
    if (out.single) {
        if (m_dirtyFields.contains(QString()))
            out.value = parseFieldText(fieldText(QString()));
        return out;
    }
    for (auto& f : out.fields) {
        if (m_dirtyFields.contains(f.first))
            f.second = parseFieldText(fieldText(f.first));
    }
    return out;
}

// ── Editing ──

bool EditSessionController::enterEdit() {
    if (!m_node) {
        qWarning() << "EditSession: No node selected";
        return false;
    }
    if (m_mode != EditMode::Viewing) return false;
    resetWorkingState();
    setMode(EditMode::Editing);
    return true;
}

bool EditSessionController::updateField(const QString& key, const QString& rawText) {
    if (m_mode != EditMode::Editing) return false;
    int i = fieldIndex(key);
    if (i < 0) {
        qWarning() << "EditSession: No editable field" << key << "at" << pathText();
        return false;
    }
    m_fieldTexts[i].second = rawText;
    m_dirtyFields.insert(key);
    m_input = InputMode::Fields;
    return true;
}

bool EditSessionController::updateWholeValue(const QString& rawText) {
    if (m_mode != EditMode::Editing) return false;
    m_wholeText = rawText;
    m_input = InputMode::WholeValue;
    return true;
}

void EditSessionController::cancel() {
    if (m_mode != EditMode::Editing) return;
    resetWorkingState();
    setMode(EditMode::Viewing);
}

// ── Commit ──

bool EditSessionController::buildNewValue(SyntaxNode* out, QString* error) const {
    SyntaxNode blob;
    if (m_input == InputMode::WholeValue) {
        auto r = JsonSyntax::parse(m_wholeText);
        if (!r.ok) {
            *error = QStringLiteral("Invalid JSON: %1 at position %2").arg(r.error).arg(r.errorPos);
            return false;
        }
        blob = std::move(r.root);
    }

    const bool merge = m_input == InputMode::Fields && !m_snapshot.single;

    // Below the root the captured path must still resolve; a vanished node
    // is never recreated.
    JsonParseResult doc;
    const SyntaxNode* live = nullptr;
    if (merge || !m_node->isRoot()) {
        doc = JsonSyntax::parseDocument(m_doc->text());
        if (!doc.ok) {
            *error = QStringLiteral("Document is not valid JSON: %1 at position %2")
                         .arg(doc.error).arg(doc.errorPos);
            return false;
        }
        live = JsonSyntax::findAtPath(doc.root, m_node->path);
        if (!live) {
            *error = QStringLiteral("%1 no longer exists in the document").arg(pathText());
            return false;
        }
    }

    if (m_input == InputMode::WholeValue) {
        *out = std::move(blob);
        return true;
    }
    if (m_snapshot.single) {
        *out = JsonSyntax::fromValue(parseFieldText(fieldText(QString())));
        return true;
    }

    if (live->kind != SyntaxKind::Object) {
        *error = QStringLiteral("%1 is no longer an object").arg(pathText());
        return false;
    }
    // Edited leaves go over a copy of the live value, keeping member order
    // and the nested composites the snapshot omits.
    SyntaxNode merged = *live;
    for (const auto& f : m_fieldTexts) {
        if (m_dirtyFields.contains(f.first))
            JsonSyntax::setProperty(merged, f.first, JsonSyntax::fromValue(parseFieldText(f.second)));
    }
    *out = std::move(merged);
    return true;
}

void EditSessionController::failSave(const QString& message) {
    qWarning() << "EditSession: Save failed -" << message;
    setMode(EditMode::Editing);
    emit saveFailed(message);
}

bool EditSessionController::commit() {
    if (m_mode != EditMode::Editing) {
        qWarning() << "EditSession: commit() outside an edit session";
        return false;
    }
    setMode(EditMode::Saving);

    SyntaxNode newValue;
    QString error;
    if (!buildNewValue(&newValue, &error)) {
        failSave(error);
        return false;
    }

    const QString current = m_doc->text();
    PatchResult r = JsonPatcher::setValue(current, m_node->path, newValue, m_opts);
    if (!r.ok) {
        failSave(QStringLiteral("Cannot update %1: %2").arg(pathText(), r.error));
        return false;
    }

    if (r.text == current) {
        resetWorkingState();
        setMode(EditMode::Viewing);
        emit saved(QStringLiteral("No changes"));
        return true;
    }

    m_pendingResync = m_node->path;
    m_doc->setText(r.text, true);
    setMode(EditMode::Viewing);
    emit saved(QStringLiteral("Value updated successfully"));
    return true;
}

// ── Resync after rebuild ──

void EditSessionController::onRebuilt() {
    if (!m_pendingResync) return;
    JsonPath path = *m_pendingResync;
    m_pendingResync.reset();

    int idx = findNodeByPath(m_graph->nodes(), path);
    if (idx >= 0) {
        m_graph->setSelectedNode(m_graph->nodes()[idx]);
    } else {
        qDebug() << "EditSession: No node at" << fmt::formatPath(path) << "after rebuild";
        m_graph->clearSelection();
        // clearSelection() is silent when nothing was selected
        if (m_node) loadFromSelection();
    }
    emit resynced(idx >= 0);
}

} // namespace jnx
