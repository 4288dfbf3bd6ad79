#pragma once
#include "core.h"

namespace jnx {

// Editable projection of a node's field rows. Composite rows are never
// surfaced; they are edited through their own node.
EditedValue buildSnapshot(const QVector<Field>& rows);

// Inverse view of a snapshot as field rows.
QVector<Field> snapshotFields(const EditedValue& snapshot);

// Canonical view-mode text; mapping keys keep row order.
QString snapshotText(const EditedValue& snapshot, const FormatOptions& opts = {});

// Text shown in a field input: strings unquoted, other scalars as JSON.
QString fieldText(const QJsonValue& v);

// Lenient field parse: a JSON scalar if the whole text is one, otherwise
// the raw text as a string.
QJsonValue parseFieldText(const QString& raw);

} // namespace jnx
