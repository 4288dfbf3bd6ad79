#include "resync.h"

namespace jnx {

int findNodeByPath(const QVector<Node>& nodes, const JsonPath& path) {
    for (int i = 0; i < nodes.size(); i++) {
        if (pathsEqual(nodes[i].path, path)) return i;
    }
    return -1;
}

} // namespace jnx
