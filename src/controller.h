#pragma once
#include "core.h"
#include "document.h"
#include "jsonsyntax.h"
#include <QObject>
#include <QSet>
#include <QStringList>
#include <optional>

namespace jnx {

enum class EditMode : uint8_t { Viewing, Editing, Saving };

// Which working copy commit() reads
enum class InputMode : uint8_t { Fields, WholeValue };

// ── Edit session controller ──

class EditSessionController : public QObject {
    Q_OBJECT
public:
    EditSessionController(DocumentStore* doc, GraphStore* graph, QObject* parent = nullptr);

    void setFormatOptions(const FormatOptions& opts) { m_opts = opts; }
    const FormatOptions& formatOptions() const { return m_opts; }

    bool enterEdit();
    bool updateField(const QString& key, const QString& rawText);
    bool updateWholeValue(const QString& rawText);
    bool commit();
    void cancel();

    EditMode  mode() const      { return m_mode; }
    InputMode inputMode() const { return m_input; }

    bool hasNode() const { return m_node.has_value(); }
    const Node* currentNode() const { return m_node ? &*m_node : nullptr; }
    bool isSingleValue() const { return m_snapshot.single; }

    QString pathText() const;
    QString viewText() const;
    const EditedValue& snapshot() const { return m_snapshot; }
    EditedValue workingValue() const;
    QStringList fieldKeys() const;
    QString fieldText(const QString& key) const;
    QString wholeValueText() const { return m_wholeText; }

signals:
    void modeChanged();
    void saved(const QString& message);
    void saveFailed(const QString& message);
    void resynced(bool found);

private:
    DocumentStore*      m_doc;
    GraphStore*         m_graph;
    FormatOptions       m_opts;

    std::optional<Node> m_node;
    EditedValue         m_snapshot;
    EditMode            m_mode  = EditMode::Viewing;
    InputMode           m_input = InputMode::Fields;

    // ── Working state (one session) ──
    QVector<QPair<QString, QString>> m_fieldTexts;   // row order
    QSet<QString>       m_dirtyFields;
    QString             m_wholeText;

    std::optional<JsonPath> m_pendingResync;

    void setMode(EditMode mode);
    void loadFromSelection();
    void resetWorkingState();
    int  fieldIndex(const QString& key) const;
    QString liveValueText() const;
    bool buildNewValue(SyntaxNode* out, QString* error) const;
    void failSave(const QString& message);
    void onSelectionChanged();
    void onRebuilt();
};

} // namespace jnx
