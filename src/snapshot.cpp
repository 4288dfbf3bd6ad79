#include "snapshot.h"
#include "jsonsyntax.h"

namespace jnx {

EditedValue buildSnapshot(const QVector<Field>& rows) {
    EditedValue out;
    if (rows.isEmpty()) return out;

    if (rows.size() == 1 && !rows[0].hasKey()) {
        if (isComposite(rows[0].type)) return out;
        out.single = true;
        out.value  = rows[0].value;
        return out;
    }

    for (const auto& row : rows) {
        if (!row.hasKey() || isComposite(row.type)) continue;
        int existing = out.indexOf(*row.key);
        if (existing >= 0) out.fields[existing].second = row.value;
        else               out.fields.append({*row.key, row.value});
    }
    return out;
}

QVector<Field> snapshotFields(const EditedValue& snapshot) {
    QVector<Field> rows;
    if (snapshot.single) {
        rows.append(Field::scalar(snapshot.value));
        return rows;
    }
    for (const auto& f : snapshot.fields)
        rows.append(Field::keyed(f.first, f.second));
    return rows;
}

QString snapshotText(const EditedValue& snapshot, const FormatOptions& opts) {
    if (snapshot.single)
        return fmt::canonical(snapshot.value, opts);
    return fmt::serializeMembers(snapshot.fields, JsonStyle::canonical(opts));
}

QString fieldText(const QJsonValue& v) {
    if (v.isString()) return v.toString();
    if (v.isUndefined()) return {};
    return fmt::fmtScalar(v);
}

QJsonValue parseFieldText(const QString& raw) {
    auto r = JsonSyntax::parse(raw);
    if (r.ok && !r.root.isContainer())
        return JsonSyntax::toValue(r.root);
    return raw;
}

} // namespace jnx
