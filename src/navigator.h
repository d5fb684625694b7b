#pragma once
#include "document.h"
#include "innereditor.h"
#include <optional>

namespace cbx {
namespace navigator {

enum class Unit { Char, Line };
enum class Direction { Left, Right, Up, Down };

inline int sign(Direction d) { return (d == Direction::Left || d == Direction::Up) ? -1 : 1; }
inline Unit unitOf(Direction d) { return (d == Direction::Left || d == Direction::Right) ? Unit::Char : Unit::Line; }

// True when a movement by unit in direction dir would leave the inner
// editor: empty selection, cursor on the boundary row, and for Unit::Char
// also on the boundary column.
bool shouldEscape(const InnerEditor& editor, Unit unit, int dir);

// Host selection to take when escaping the block starting at nodePos:
// a node selection of a selectable neighbour, else the nearest text
// position beyond the block. nullopt when there is nowhere to go.
std::optional<Selection> escapeTarget(const DocState& doc, int nodePos, int dir);

// Whether a host text cursor at offset in text sits at the edge of its
// block for the given direction.
bool atTextblockEdge(const QString& text, int offset, Direction dir);

} // namespace navigator
} // namespace cbx
