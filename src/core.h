#pragma once
#include <QString>
#include <QVector>
#include <QJsonObject>
#include <QJsonArray>
#include <cstdint>
#include <optional>

namespace cbx {

// ── Node type enum ──

enum class NodeType : uint8_t {
    Paragraph, Heading, CodeBlock, RawBlock, Image, HorizontalRule
};

// ── Unified node type table (single source of truth) ──

struct NodeTypeMeta {
    NodeType    type;
    const char* name;        // JSON name
    bool        textblock;   // holds inline text between open/close markers
    bool        selectable;  // can take a node-level selection
    bool        code;        // content is edited by an embedded code editor
};

inline constexpr NodeTypeMeta kNodeTypeMeta[] = {
    // type                      name               text   sel    code
    {NodeType::Paragraph,      "paragraph",       true,  false, false},
    {NodeType::Heading,        "heading",         true,  false, false},
    {NodeType::CodeBlock,      "code_block",      true,  false, true },
    {NodeType::RawBlock,       "raw_block",       true,  false, true },
    {NodeType::Image,          "image",           false, true,  false},
    {NodeType::HorizontalRule, "horizontal_rule", false, true,  false},
};

inline constexpr const NodeTypeMeta* nodeTypeMeta(NodeType t) {
    for (const auto& m : kNodeTypeMeta)
        if (m.type == t) return &m;
    return nullptr;
}

inline constexpr bool isTextblock(NodeType t)  { auto* m = nodeTypeMeta(t); return m && m->textblock; }
inline constexpr bool isSelectable(NodeType t) { auto* m = nodeTypeMeta(t); return m && m->selectable; }
inline constexpr bool isCodeType(NodeType t)   { auto* m = nodeTypeMeta(t); return m && m->code; }

inline const char* nodeTypeToString(NodeType t) {
    auto* m = nodeTypeMeta(t);
    return m ? m->name : "unknown";
}

inline NodeType nodeTypeFromString(const QString& s, bool* ok = nullptr) {
    for (const auto& m : kNodeTypeMeta) {
        if (s == QLatin1String(m.name)) {
            if (ok) *ok = true;
            return m.type;
        }
    }
    if (ok) *ok = false;
    return NodeType::Paragraph;
}

// ── Block ──

struct Block {
    uint64_t id   = 0;
    NodeType type = NodeType::Paragraph;
    QString  text;
    QString  lang;      // info string of code blocks ("r", "python", ...)

    // Text blocks carry an open and a close marker around their content;
    // atoms occupy a single position.
    int nodeSize() const { return isTextblock(type) ? text.size() + 2 : 1; }

    bool operator==(const Block& o) const {
        return id == o.id && type == o.type && text == o.text && lang == o.lang;
    }
    bool operator!=(const Block& o) const { return !(*this == o); }

    QJsonObject toJson() const {
        QJsonObject o;
        o["id"]   = QString::number(id);
        o["type"] = nodeTypeToString(type);
        if (isTextblock(type)) o["text"] = text;
        if (!lang.isEmpty())   o["lang"] = lang;
        return o;
    }
    static Block fromJson(const QJsonObject& o, bool* ok = nullptr) {
        Block b;
        b.id   = o["id"].toString("0").toULongLong();
        b.type = nodeTypeFromString(o["type"].toString(), ok);
        b.text = o["text"].toString();
        b.lang = o["lang"].toString();
        return b;
    }
};

// ── Selection (host space) ──

struct Selection {
    enum Kind : uint8_t { Text, Node, All };

    Kind kind   = Text;
    int  anchor = 0;
    int  head   = 0;

    int  from()  const { return anchor < head ? anchor : head; }
    int  to()    const { return anchor < head ? head : anchor; }
    bool empty() const { return anchor == head; }

    static Selection text(int anchor, int head) { return {Text, anchor, head}; }
    static Selection cursor(int pos)            { return {Text, pos, pos}; }
    static Selection node(int pos, int size)    { return {Node, pos, pos + size}; }
    static Selection all(int docSize)           { return {All, 0, docSize}; }

    bool operator==(const Selection& o) const {
        return kind == o.kind && anchor == o.anchor && head == o.head;
    }
    bool operator!=(const Selection& o) const { return !(*this == o); }
};

// ── Inner editor coordinates ──

struct TextPoint {
    int row    = 0;
    int column = 0;

    bool operator==(const TextPoint& o) const { return row == o.row && column == o.column; }
    bool operator!=(const TextPoint& o) const { return !(*this == o); }
};

struct TextRange {
    TextPoint anchor;
    TextPoint head;

    bool empty() const { return anchor == head; }
    bool operator==(const TextRange& o) const { return anchor == o.anchor && head == o.head; }
    bool operator!=(const TextRange& o) const { return !(*this == o); }
};

// ── Change ──

// Replace [from, to) of the old string with text.
struct Change {
    int     from = 0;
    int     to   = 0;
    QString text;

    bool operator==(const Change& o) const { return from == o.from && to == o.to && text == o.text; }
};

// ── Diff (prefix/suffix trimming, not edit distance) ──

namespace diff {
    std::optional<Change> computeChange(const QString& oldVal, const QString& newVal);
    QString applyChange(const QString& text, const Change& change);
} // namespace diff

// ── Coordinate mapping ──

namespace coords {
    int       rowCount(const QString& text);
    int       lineLength(const QString& text, int row);
    TextPoint offsetToPoint(const QString& text, int offset);
    int       pointToOffset(const QString& text, const TextPoint& pt);

    // The block's content starts one position after the block itself.
    inline constexpr int hostFromLocal(int nodeStart, int local) { return nodeStart + 1 + local; }
    inline constexpr int localFromHost(int nodeStart, int host)  { return host - nodeStart - 1; }
} // namespace coords

} // namespace cbx
