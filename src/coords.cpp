#include "core.h"

namespace cbx {
namespace coords {

int rowCount(const QString& text) {
    return text.count(QLatin1Char('\n')) + 1;
}

int lineLength(const QString& text, int row) {
    if (row < 0) return 0;
    int start = 0;
    for (int r = 0; r < row; r++) {
        int nl = text.indexOf(QLatin1Char('\n'), start);
        if (nl < 0) return 0;
        start = nl + 1;
    }
    int end = text.indexOf(QLatin1Char('\n'), start);
    return (end < 0 ? text.size() : end) - start;
}

TextPoint offsetToPoint(const QString& text, int offset) {
    if (offset < 0) offset = 0;
    if (offset > text.size()) offset = text.size();

    TextPoint pt;
    int lineStart = 0;
    for (int i = 0; i < offset; i++) {
        if (text[i] == QLatin1Char('\n')) {
            pt.row++;
            lineStart = i + 1;
        }
    }
    pt.column = offset - lineStart;
    return pt;
}

int pointToOffset(const QString& text, const TextPoint& pt) {
    if (pt.row < 0) return 0;

    int lineStart = 0;
    for (int r = 0; r < pt.row; r++) {
        int nl = text.indexOf(QLatin1Char('\n'), lineStart);
        if (nl < 0) return text.size();   // past the last row
        lineStart = nl + 1;
    }
    int lineEnd = text.indexOf(QLatin1Char('\n'), lineStart);
    if (lineEnd < 0) lineEnd = text.size();

    int col = pt.column < 0 ? 0 : pt.column;
    return qMin(lineStart + col, lineEnd);
}

} // namespace coords
} // namespace cbx
