#include "settings.h"
#include <QDebug>
#include <QSettings>

namespace jnx {

static constexpr int kMaxIndentWidth = 8;

EditorSettings EditorSettings::load() {
    QSettings s("Jnx", "Jnx");
    EditorSettings out;
    int width = s.value("indentWidth", 2).toInt();
    if (width < 1 || width > kMaxIndentWidth) {
        qWarning() << "EditorSettings: Ignoring indentWidth" << width;
        width = 2;
    }
    out.indentWidth  = width;
    out.insertSpaces = s.value("insertSpaces", true).toBool();
    return out;
}

void EditorSettings::save() const {
    QSettings s("Jnx", "Jnx");
    s.setValue("indentWidth", indentWidth);
    s.setValue("insertSpaces", insertSpaces);
}

} // namespace jnx
