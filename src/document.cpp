#include "document.h"
#include <QDebug>
#include <QFile>
#include <QTimer>

namespace jnx {

// ── DocumentStore ──

DocumentStore::DocumentStore(QObject* parent)
    : QObject(parent)
{
}

void DocumentStore::setText(const QString& text, bool dirty) {
    m_text  = text;
    m_dirty = dirty;
    emit textChanged();
}

bool DocumentStore::load(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "DocumentStore: Cannot open" << path << "-" << file.errorString();
        return false;
    }
    filePath = path;
    setText(QString::fromUtf8(file.readAll()), false);
    return true;
}

bool DocumentStore::save(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        qWarning() << "DocumentStore: Cannot write" << path << "-" << file.errorString();
        return false;
    }
    QByteArray data = m_text.toUtf8();
    if (file.write(data) != data.size()) {
        qWarning() << "DocumentStore: Short write to" << path;
        return false;
    }
    filePath = path;
    m_dirty = false;
    return true;
}

// ── GraphStore ──

GraphStore::GraphStore(DocumentStore* doc, NodeBuilder builder, QObject* parent)
    : QObject(parent)
    , m_doc(doc)
    , m_builder(std::move(builder))
{
    connect(m_doc, &DocumentStore::textChanged, this, &GraphStore::scheduleRebuild);
}

void GraphStore::setSelectedNode(const Node& node) {
    m_selected = node;
    emit selectionChanged();
}

void GraphStore::clearSelection() {
    if (!m_selected) return;
    m_selected.reset();
    emit selectionChanged();
}

// Coalesces bursts of text changes into one rebuild on the next event loop pass
void GraphStore::scheduleRebuild() {
    if (m_rebuildPending) return;
    m_rebuildPending = true;
    QTimer::singleShot(0, this, [this]() {
        if (m_rebuildPending) rebuild();
    });
}

void GraphStore::rebuild() {
    m_rebuildPending = false;
    m_nodes = m_builder ? m_builder(m_doc->text()) : QVector<Node>{};
    qDebug() << "GraphStore: Rebuilt" << m_nodes.size() << "node(s)";
    emit rebuilt();
}

} // namespace jnx
