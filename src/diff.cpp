#include "core.h"

namespace cbx {
namespace diff {

std::optional<Change> computeChange(const QString& oldVal, const QString& newVal) {
    if (oldVal == newVal)
        return std::nullopt;

    int start  = 0;
    int oldEnd = oldVal.size();
    int newEnd = newVal.size();

    while (start < oldEnd && start < newEnd && oldVal[start] == newVal[start])
        ++start;

    // Trim the common suffix, never crossing the common prefix
    while (oldEnd > start && newEnd > start && oldVal[oldEnd - 1] == newVal[newEnd - 1]) {
        --oldEnd;
        --newEnd;
    }

    return Change{start, oldEnd, newVal.mid(start, newEnd - start)};
}

QString applyChange(const QString& text, const Change& change) {
    QString out = text;
    out.replace(change.from, change.to - change.from, change.text);
    return out;
}

} // namespace diff
} // namespace cbx
