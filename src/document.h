#pragma once
#include "core.h"
#include <QObject>
#include <functional>
#include <optional>

namespace jnx {

// ── Document ──

class DocumentStore : public QObject {
    Q_OBJECT
public:
    explicit DocumentStore(QObject* parent = nullptr);

    const QString& text() const { return m_text; }
    void setText(const QString& text, bool dirty);
    bool isDirty() const { return m_dirty; }

    QString filePath;

    bool load(const QString& path);
    bool save(const QString& path);

signals:
    void textChanged();

private:
    QString m_text;
    bool    m_dirty = false;
};

// ── Graph ──

// Supplied by the parser that turns document text into nodes.
using NodeBuilder = std::function<QVector<Node>(const QString& text)>;

class GraphStore : public QObject {
    Q_OBJECT
public:
    GraphStore(DocumentStore* doc, NodeBuilder builder, QObject* parent = nullptr);

    const QVector<Node>& nodes() const { return m_nodes; }

    bool hasSelection() const { return m_selected.has_value(); }
    const Node* selectedNode() const { return m_selected ? &*m_selected : nullptr; }
    void setSelectedNode(const Node& node);
    void clearSelection();

    // Rebuild now; normally queued after every document change.
    void rebuild();
    bool rebuildPending() const { return m_rebuildPending; }

signals:
    void rebuilt();
    void selectionChanged();

private:
    DocumentStore*      m_doc;
    NodeBuilder         m_builder;
    QVector<Node>       m_nodes;
    std::optional<Node> m_selected;
    bool                m_rebuildPending = false;

    void scheduleRebuild();
};

} // namespace jnx
