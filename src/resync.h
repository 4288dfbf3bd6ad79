#pragma once
#include "core.h"

namespace jnx {

// Index of the first node whose path equals `path` element-wise, or -1.
int findNodeByPath(const QVector<Node>& nodes, const JsonPath& path);

} // namespace jnx
