#include "document.h"
#include <QDebug>
#include <QFile>
#include <QJsonDocument>

namespace cbx {

// ── DocState ──

DocState::DocState(const QVector<Block>& blocks) : m_blocks(blocks) {
    for (const auto& b : m_blocks)
        if (b.id >= m_nextId) m_nextId = b.id + 1;
    for (auto& b : m_blocks)
        if (b.id == 0) b.id = allocateId();
}

int DocState::size() const {
    int total = 0;
    for (const auto& b : m_blocks) total += b.nodeSize();
    return total;
}

int DocState::positionOf(int idx) const {
    int pos = 0;
    for (int i = 0; i < idx && i < m_blocks.size(); i++)
        pos += m_blocks[i].nodeSize();
    return pos;
}

int DocState::indexOfId(uint64_t id) const {
    for (int i = 0; i < m_blocks.size(); i++)
        if (m_blocks[i].id == id) return i;
    return -1;
}

int DocState::indexAt(int pos) const {
    int p = 0;
    for (int i = 0; i < m_blocks.size(); i++) {
        if (p == pos) return i;
        if (p > pos) break;
        p += m_blocks[i].nodeSize();
    }
    return -1;
}

const Block* DocState::nodeAt(int pos) const {
    int idx = indexAt(pos);
    return idx >= 0 ? &m_blocks[idx] : nullptr;
}

ResolvedPos DocState::resolve(int pos) const {
    ResolvedPos rp;
    rp.pos = qBound(0, pos, size());

    int p = 0;
    for (int i = 0; i < m_blocks.size(); i++) {
        const Block& b = m_blocks[i];
        int end = p + b.nodeSize();
        if (rp.pos == p) {
            rp.indexBefore = i - 1;
            rp.indexAfter  = i;
            return rp;
        }
        if (rp.pos < end) {
            rp.blockIndex   = i;
            rp.parentOffset = rp.pos - p - 1;
            return rp;
        }
        p = end;
    }
    rp.indexBefore = m_blocks.size() - 1;
    return rp;
}

std::optional<Selection> DocState::selectionNear(int pos, int bias) const {
    ResolvedPos rp = resolve(pos);
    if (!rp.atBoundary())
        return Selection::cursor(rp.pos);

    if (bias < 0) {
        int end = rp.pos;
        for (int i = rp.indexBefore; i >= 0; --i) {
            const Block& b = m_blocks[i];
            int start = end - b.nodeSize();
            if (isTextblock(b.type))  return Selection::cursor(start + 1 + b.text.size());
            if (isSelectable(b.type)) return Selection::node(start, b.nodeSize());
            end = start;
        }
    } else {
        int start = rp.pos;
        for (int i = rp.indexAfter; i >= 0 && i < m_blocks.size(); ++i) {
            const Block& b = m_blocks[i];
            if (isTextblock(b.type))  return Selection::cursor(start + 1);
            if (isSelectable(b.type)) return Selection::node(start, b.nodeSize());
            start += b.nodeSize();
        }
    }
    return std::nullopt;
}

bool DocState::isValidSelection(const Selection& sel) const {
    switch (sel.kind) {
    case Selection::Text:
        return !resolve(sel.anchor).atBoundary() && !resolve(sel.head).atBoundary()
            && sel.anchor >= 0 && sel.head <= size() && sel.head >= 0 && sel.anchor <= size();
    case Selection::Node: {
        const Block* b = nodeAt(sel.anchor);
        return b && sel.head == sel.anchor + b->nodeSize();
    }
    case Selection::All:
        return sel.anchor == 0 && sel.head == size();
    }
    return false;
}

Selection DocState::clampSelection(const Selection& sel) const {
    if (isValidSelection(sel))
        return sel;
    if (sel.kind == Selection::All)
        return Selection::all(size());
    if (sel.kind == Selection::Node) {
        if (const Block* b = nodeAt(sel.anchor))
            return Selection::node(sel.anchor, b->nodeSize());
    }

    auto textPos = [this](int p) -> int {
        p = qBound(0, p, size());
        if (!resolve(p).atBoundary()) return p;
        for (int bias : {1, -1}) {
            auto near = selectionNear(p, bias);
            if (near && near->kind == Selection::Text) return near->head;
        }
        return -1;
    };
    int anchor = textPos(sel.anchor);
    int head   = textPos(sel.kind == Selection::Node ? sel.anchor : sel.head);
    if (anchor >= 0 && head >= 0)
        return Selection::text(anchor, head);

    // No text block anywhere: fall back to the first selectable atom
    for (int bias : {1, -1}) {
        if (auto near = selectionNear(qBound(0, sel.anchor, size()), bias))
            return *near;
    }
    return Selection::all(size());
}

QJsonObject DocState::toJson() const {
    QJsonObject o;
    o["nextId"] = QString::number(m_nextId);
    QJsonArray arr;
    for (const auto& b : m_blocks) arr.append(b.toJson());
    o["blocks"] = arr;
    return o;
}

DocState DocState::fromJson(const QJsonObject& o, bool* ok) {
    QVector<Block> blocks;
    bool allOk = true;
    const QJsonArray arr = o["blocks"].toArray();
    for (const auto& v : arr) {
        bool typeOk = false;
        blocks.append(Block::fromJson(v.toObject(), &typeOk));
        if (!typeOk) allOk = false;
    }
    DocState s(blocks);
    uint64_t next = o["nextId"].toString("1").toULongLong();
    if (next > s.m_nextId) s.m_nextId = next;
    if (ok) *ok = allOk;
    return s;
}

// ── Transaction ──

Transaction::Transaction(const DocState& doc, const Selection& startSelection)
    : m_doc(doc), m_startSelection(startSelection) {}

bool Transaction::replaceWith(int from, int to, const QString& text) {
    if (from > to) return false;
    ResolvedPos rp = m_doc.resolve(from);
    if (rp.atBoundary() || rp.pos != from) return false;

    Block& b = m_doc.m_blocks[rp.blockIndex];
    int contentStart = from - rp.parentOffset;
    if (to > contentStart + b.text.size()) return false;
    if (from == to && text.isEmpty()) return true;

    b.text.replace(from - contentStart, to - from, text);
    m_maps.append({from, to - from, static_cast<int>(text.size())});
    return true;
}

bool Transaction::deleteRange(int from, int to) {
    if (from >= to) return false;
    int first = m_doc.indexAt(from);
    if (first < 0) return false;
    int last = (to == m_doc.size()) ? m_doc.blockCount() : m_doc.indexAt(to);
    if (last < 0) return false;

    m_doc.m_blocks.remove(first, last - first);
    m_maps.append({from, to - from, 0});
    return true;
}

bool Transaction::insertBlock(int pos, const Block& block) {
    int idx = (pos == m_doc.size()) ? m_doc.blockCount() : m_doc.indexAt(pos);
    if (idx < 0) return false;

    Block b = block;
    if (b.id == 0 || m_doc.indexOfId(b.id) >= 0)
        b.id = m_doc.allocateId();
    else if (b.id >= m_doc.m_nextId)
        m_doc.m_nextId = b.id + 1;
    if (!isTextblock(b.type)) b.text.clear();

    m_doc.m_blocks.insert(idx, b);
    m_maps.append({pos, 0, b.nodeSize()});
    return true;
}

bool Transaction::setBlockType(int pos, NodeType type, const QString& lang) {
    int idx = m_doc.indexAt(pos);
    if (idx < 0) return false;

    Block& b = m_doc.m_blocks[idx];
    int oldSize = b.nodeSize();
    b.type = type;
    b.lang = lang;
    if (!isTextblock(type)) b.text.clear();
    m_maps.append({pos, oldSize, b.nodeSize()});
    return true;
}

Transaction& Transaction::setSelection(const Selection& sel) {
    m_selection = sel;
    return *this;
}

int Transaction::mapPos(int pos, int assoc) const {
    for (const auto& m : m_maps) {
        int end = m.from + m.oldLen;
        if (pos < m.from) continue;
        if (pos == m.from && m.oldLen == 0) {
            if (assoc > 0) pos += m.newLen;
            continue;
        }
        if (pos == m.from) continue;
        if (pos >= end) {
            pos += m.newLen - m.oldLen;
            continue;
        }
        if (m.oldLen == m.newLen) continue;
        pos = assoc < 0 ? m.from : m.from + m.newLen;
    }
    return pos;
}

Selection Transaction::mapSelection(const Selection& sel) const {
    switch (sel.kind) {
    case Selection::All:
        return Selection::all(m_doc.size());
    case Selection::Node: {
        int pos = mapPos(sel.anchor, 1);
        if (const Block* b = m_doc.nodeAt(pos))
            return Selection::node(pos, b->nodeSize());
        return Selection::cursor(pos);
    }
    case Selection::Text:
        break;
    }
    return Selection::text(mapPos(sel.anchor), mapPos(sel.head));
}

// ── DocumentCommand ──

DocumentCommand::DocumentCommand(Document* doc,
                                 const DocState& before, const Selection& beforeSel,
                                 const DocState& after, const Selection& afterSel,
                                 const QString& text)
    : QUndoCommand(text)
    , m_doc(doc), m_before(before), m_after(after)
    , m_beforeSel(beforeSel), m_afterSel(afterSel) {}

void DocumentCommand::undo() {
    m_doc->applyHistoryState(m_before, m_beforeSel);
}

void DocumentCommand::redo() {
    if (m_applied) {   // first redo comes from QUndoStack::push
        m_applied = false;
        return;
    }
    m_doc->applyHistoryState(m_after, m_afterSel);
}

// ── Document ──

Document::Document(QObject* parent) : QObject(parent) {
    Block p;
    p.type = NodeType::Paragraph;
    m_state = DocState({p});
    m_selection = Selection::cursor(1);
}

void Document::dispatch(const Transaction& tr) {
    Selection sel = tr.selection() ? *tr.selection() : tr.mapSelection(m_selection);
    sel = tr.doc().clampSelection(sel);

    if (!m_keepInputRule && (tr.docChanged() || sel != m_selection))
        m_inputRule.reset();

    if (tr.docChanged())
        undoStack.push(new DocumentCommand(this, m_state, m_selection, tr.doc(), sel,
                                           tr.label.isEmpty() ? QStringLiteral("Edit") : tr.label));
    m_state = tr.doc();
    m_selection = sel;
    emit stateChanged();

    if (tr.scrolled())
        emit scrollRequested(m_selection.head);
}

void Document::reset(const DocState& state, const Selection& sel) {
    undoStack.clear();
    m_inputRule.reset();
    m_state = state;
    m_selection = state.clampSelection(sel);
    emit stateChanged();
}

void Document::applyHistoryState(const DocState& state, const Selection& sel) {
    m_inputRule.reset();
    m_state = state;
    m_selection = state.clampSelection(sel);
    emit stateChanged();
}

bool Document::undo() {
    if (!undoStack.canUndo()) return false;
    undoStack.undo();
    return true;
}

bool Document::redo() {
    if (!undoStack.canRedo()) return false;
    undoStack.redo();
    return true;
}

bool Document::selectAll() {
    Transaction tr = transaction();
    tr.setSelection(Selection::all(m_state.size()));
    dispatch(tr);
    return true;
}

bool Document::exitCode() {
    ResolvedPos head = m_state.resolve(m_selection.head);
    ResolvedPos anchor = m_state.resolve(m_selection.anchor);
    if (m_selection.kind != Selection::Text || head.atBoundary()
        || anchor.blockIndex != head.blockIndex)
        return false;
    const Block& b = m_state.block(head.blockIndex);
    if (!isCodeType(b.type))
        return false;

    int after = m_state.positionOf(head.blockIndex) + b.nodeSize();
    Block para;
    para.type = NodeType::Paragraph;
    Transaction tr = transaction();
    if (!tr.insertBlock(after, para))
        return false;
    tr.setSelection(Selection::cursor(after + 1)).scrollIntoView();
    tr.label = QStringLiteral("Exit Code Block");
    dispatch(tr);
    return true;
}

bool Document::insertParagraph() {
    ResolvedPos rp = m_state.resolve(m_selection.head);
    int idx = rp.blockIndex;
    if (rp.atBoundary())
        idx = rp.indexAfter >= 0 ? rp.indexAfter : rp.indexBefore;

    int at = idx >= 0 ? m_state.positionOf(idx) + m_state.block(idx).nodeSize() : 0;
    Block para;
    para.type = NodeType::Paragraph;
    Transaction tr = transaction();
    if (!tr.insertBlock(at, para))
        return false;
    tr.setSelection(Selection::cursor(at + 1)).scrollIntoView();
    tr.label = QStringLiteral("Insert Paragraph");
    dispatch(tr);
    return true;
}

bool Document::insertText(const QString& text) {
    if (m_selection.kind != Selection::Text) return false;
    int from = m_selection.from();
    int to   = m_selection.to();
    ResolvedPos rp = m_state.resolve(from);
    if (rp.atBoundary() || rp.blockIndex != m_state.resolve(to).blockIndex)
        return false;

    Transaction tr = transaction();
    if (!tr.replaceWith(from, to, text))
        return false;
    tr.setSelection(Selection::cursor(from + text.size()));
    tr.label = QStringLiteral("Typing");

    // Input rule: a paragraph reading exactly ``` becomes an empty code block
    const Block& b = tr.doc().block(rp.blockIndex);
    if (b.type == NodeType::Paragraph && b.text == QLatin1String("```")) {
        PendingInputRule rule{b.id, b.text};
        int pos = tr.doc().positionOf(rp.blockIndex);
        tr.replaceWith(pos + 1, pos + 1 + b.text.size(), QString());
        tr.setBlockType(pos, NodeType::CodeBlock);
        tr.setSelection(Selection::cursor(pos + 1));

        m_inputRule = rule;
        m_keepInputRule = true;
        dispatch(tr);
        m_keepInputRule = false;
        return true;
    }

    dispatch(tr);
    return true;
}

bool Document::undoInputRule() {
    if (!m_inputRule) return false;
    PendingInputRule rule = *m_inputRule;
    m_inputRule.reset();

    int idx = m_state.indexOfId(rule.blockId);
    if (idx < 0) {
        qWarning() << "Document: Input rule target vanished:" << rule.blockId;
        return false;
    }
    int pos = m_state.positionOf(idx);
    const Block& b = m_state.block(idx);

    Transaction tr = transaction();
    tr.setBlockType(pos, NodeType::Paragraph);
    tr.replaceWith(pos + 1, pos + 1 + b.text.size(), rule.typedText);
    tr.setSelection(Selection::cursor(pos + 1 + rule.typedText.size()));
    tr.label = QStringLiteral("Undo Input Rule");
    dispatch(tr);
    return true;
}

bool Document::save(const QString& path) {
    QJsonDocument jdoc(m_state.toJson());
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly))
        return false;
    file.write(jdoc.toJson(QJsonDocument::Indented));
    filePath = path;
    undoStack.setClean();
    return true;
}

bool Document::load(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly))
        return false;
    QJsonDocument jdoc = QJsonDocument::fromJson(file.readAll());
    if (!jdoc.isObject()) {
        qWarning() << "Document: Not a document file:" << path;
        return false;
    }
    bool ok = false;
    DocState s = DocState::fromJson(jdoc.object(), &ok);
    if (!ok)
        qWarning() << "Document: Unknown block types in" << path << "(loaded as paragraphs)";
    filePath = path;
    reset(s, Selection::cursor(0));
    return true;
}

} // namespace cbx
