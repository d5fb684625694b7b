#pragma once
#include "core.h"
#include <QObject>
#include <QUndoStack>
#include <QUndoCommand>
#include <optional>

namespace cbx {

// ── Resolved position ──

struct ResolvedPos {
    int pos          = 0;
    int blockIndex   = -1;   // text block whose content holds pos; -1 between blocks
    int parentOffset = 0;    // offset into that block's content
    int indexBefore  = -1;   // top-level block ending at pos (boundary positions only)
    int indexAfter   = -1;   // top-level block starting at pos (boundary positions only)

    bool atBoundary() const { return blockIndex < 0; }
};

// ── DocState: one immutable version of the host document ──

class DocState {
public:
    DocState() = default;
    explicit DocState(const QVector<Block>& blocks);

    const QVector<Block>& blocks() const { return m_blocks; }
    int blockCount() const { return m_blocks.size(); }
    const Block& block(int idx) const { return m_blocks[idx]; }

    int size() const;
    int positionOf(int idx) const;
    int indexOfId(uint64_t id) const;
    int indexAt(int pos) const;
    const Block* nodeAt(int pos) const;
    ResolvedPos resolve(int pos) const;

    // Nearest valid selection from a top-level boundary, searching in the
    // direction of bias only.
    std::optional<Selection> selectionNear(int pos, int bias) const;
    bool isValidSelection(const Selection& sel) const;
    Selection clampSelection(const Selection& sel) const;

    QJsonObject toJson() const;
    static DocState fromJson(const QJsonObject& o, bool* ok = nullptr);

private:
    friend class Transaction;

    QVector<Block> m_blocks;
    uint64_t       m_nextId = 1;

    uint64_t allocateId() { return m_nextId++; }
};

// ── Transaction ──

class Transaction {
public:
    Transaction(const DocState& doc, const Selection& startSelection);

    const DocState& doc() const { return m_doc; }
    bool docChanged() const { return !m_maps.isEmpty(); }

    // Steps validate their range and leave the transaction untouched on failure.
    bool replaceWith(int from, int to, const QString& text);
    bool deleteRange(int from, int to);
    bool insertBlock(int pos, const Block& block);
    bool setBlockType(int pos, NodeType type, const QString& lang = {});

    Transaction& setSelection(const Selection& sel);
    Transaction& scrollIntoView() { m_scroll = true; return *this; }

    const std::optional<Selection>& selection() const { return m_selection; }
    bool scrolled() const { return m_scroll; }

    int mapPos(int pos, int assoc = 1) const;
    Selection mapSelection(const Selection& sel) const;

    QString label;

private:
    struct StepMap { int from; int oldLen; int newLen; };

    DocState                 m_doc;
    Selection                m_startSelection;
    QVector<StepMap>         m_maps;
    std::optional<Selection> m_selection;
    bool                     m_scroll = false;
};

// ── Host view (focus owner for a document) ──

class Document;

class HostView {
public:
    virtual ~HostView() = default;
    virtual Document* document() const = 0;
    virtual void      focus() = 0;
    virtual bool      hasFocus() const = 0;
};

// ── Document ──

class Document : public QObject {
    Q_OBJECT
public:
    explicit Document(QObject* parent = nullptr);

    QUndoStack undoStack;
    QString    filePath;

    const DocState&  state() const { return m_state; }
    const Selection& selection() const { return m_selection; }
    Transaction transaction() const { return Transaction(m_state, m_selection); }

    void dispatch(const Transaction& tr);
    void reset(const DocState& state, const Selection& sel = {});

    // Host commands invoked from inner editor key bindings
    bool undo();
    bool redo();
    bool selectAll();
    bool exitCode();
    bool insertParagraph();

    // Host typing; runs input rules
    bool insertText(const QString& text);
    bool hasPendingInputRule() const { return m_inputRule.has_value(); }
    bool undoInputRule();

    bool save(const QString& path);
    bool load(const QString& path);

signals:
    void stateChanged();
    void scrollRequested(int pos);

private:
    friend class DocumentCommand;

    struct PendingInputRule {
        uint64_t blockId = 0;
        QString  typedText;    // paragraph text right before the rule fired
    };

    DocState                        m_state;
    Selection                       m_selection;
    std::optional<PendingInputRule> m_inputRule;
    bool                            m_keepInputRule = false;

    void applyHistoryState(const DocState& state, const Selection& sel);
};

// ── Undo command ──

class DocumentCommand : public QUndoCommand {
public:
    DocumentCommand(Document* doc,
                    const DocState& before, const Selection& beforeSel,
                    const DocState& after, const Selection& afterSel,
                    const QString& text);
    void undo() override;
    void redo() override;
private:
    Document* m_doc;
    DocState  m_before, m_after;
    Selection m_beforeSel, m_afterSel;
    bool      m_applied = true;   // dispatch already installed the new state
};

} // namespace cbx
