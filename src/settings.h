#pragma once
#include "core.h"

namespace jnx {

struct EditorSettings {
    int  indentWidth  = 2;
    bool insertSpaces = true;

    FormatOptions formatOptions() const {
        FormatOptions o;
        o.indentWidth  = indentWidth;
        o.insertSpaces = insertSpaces;
        return o;
    }

    static EditorSettings load();
    void save() const;
};

} // namespace jnx
