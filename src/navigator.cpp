#include "navigator.h"

namespace cbx {
namespace navigator {

bool shouldEscape(const InnerEditor& editor, Unit unit, int dir) {
    TextRange sel = editor.selection();
    if (!sel.empty())
        return false;

    TextPoint pos = sel.head;
    int lastRow = editor.lineCount() - 1;
    if (pos.row != (dir < 0 ? 0 : lastRow))
        return false;
    if (unit == Unit::Char && pos.column != (dir < 0 ? 0 : editor.lineLength(pos.row)))
        return false;
    return true;
}

std::optional<Selection> escapeTarget(const DocState& doc, int nodePos, int dir) {
    const Block* node = doc.nodeAt(nodePos);
    if (!node)
        return std::nullopt;

    // Neighbours that take node selections get selected whole
    if (dir < 0) {
        ResolvedPos rp = doc.resolve(nodePos);
        if (rp.indexBefore >= 0) {
            const Block& prev = doc.block(rp.indexBefore);
            if (isSelectable(prev.type))
                return Selection::node(nodePos - prev.nodeSize(), prev.nodeSize());
        }
    }
    int nextPos = nodePos + node->nodeSize();
    if (dir >= 0) {
        const Block* next = doc.nodeAt(nextPos);
        if (next && isSelectable(next->type))
            return Selection::node(nextPos, next->nodeSize());
    }

    int target = dir < 0 ? nodePos : nextPos;
    if (!doc.nodeAt(target))
        return std::nullopt;
    return doc.selectionNear(target, dir);
}

bool atTextblockEdge(const QString& text, int offset, Direction dir) {
    switch (dir) {
    case Direction::Left:  return offset == 0;
    case Direction::Right: return offset == text.size();
    case Direction::Up:    return text.left(offset).indexOf(QLatin1Char('\n')) < 0;
    case Direction::Down:  return text.indexOf(QLatin1Char('\n'), offset) < 0;
    }
    return false;
}

} // namespace navigator
} // namespace cbx
