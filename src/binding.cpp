#include "binding.h"
#include <QDebug>

namespace cbx {

CodeBlockBinding::CodeBlockBinding(const Block& block, HostView* host, PosFn getPos,
                                   InnerEditor* editor, const CodeViewOptions& options,
                                   const EditorOptions& editorOptions, QObject* parent)
    : QObject(parent)
    , m_node(block)
    , m_host(host)
    , m_getPos(std::move(getPos))
    , m_editor(editor)
    , m_options(options)
    , m_editorOptions(editorOptions)
{
    {
        SyncGuard::Scope scope(m_guard, SyncState::Syncing);
        m_editor->setText(m_node.text);
        m_editor->clearSelection();
    }

    QStringList classes{QStringLiteral("code-editor")};
    classes << m_options.classes;
    classes << (m_options.borderColorClass.isEmpty()
                    ? QStringLiteral("block-border") : m_options.borderColorClass);
    m_editor->setStyleClasses(classes);
    m_editor->setActive(false);
    m_editor->setRunActionsVisible(false);

    updateMode();

    InnerEditor* ed = m_editor.get();
    m_connections << connect(ed, &InnerEditor::textChanged, this, [this]() {
        if (m_guard.syncing()) return;
        valueChanged();
        forwardSelection();
    });
    m_connections << connect(ed, &InnerEditor::cursorChanged, this, [this]() {
        if (m_guard.syncing()) return;
        forwardSelection();
    });
    m_connections << connect(ed, &InnerEditor::focusIn, this, [this]() {
        m_editor->setActive(true);
        if (m_guard.syncing()) return;
        forwardSelection();
    });
    m_connections << connect(ed, &InnerEditor::focusOut, this, [this]() {
        m_editor->setActive(false);
    });
    m_connections << connect(ed, &InnerEditor::runChunkRequested,
                             this, &CodeBlockBinding::executeChunk);
    m_connections << connect(ed, &InnerEditor::runPreviousChunksRequested,
                             this, &CodeBlockBinding::executePreviousChunks);

    m_keyHandles = registerKeyBindings(ed, currentPlatform(),
                                       [this](KeyAction a) { return handlerFor(a); });

    qDebug() << "CodeBlockBinding: Bound block" << m_node.id
             << nodeTypeToString(m_node.type) << "mode" << m_mode;
}

CodeBlockBinding::~CodeBlockBinding() {
    dispose();
}

void CodeBlockBinding::dispose() {
    if (m_disposed) return;
    m_disposed = true;

    for (const auto& c : m_connections)
        disconnect(c);
    m_connections.clear();
    for (int h : m_keyHandles)
        m_editor->removeKeyCommand(h);
    m_keyHandles.clear();
}

// ── Inner -> host ──

void CodeBlockBinding::valueChanged() {
    const QString inner = m_editor->text();
    if (auto change = diff::computeChange(m_node.text, inner)) {
        Document* doc = m_host->document();
        int start = coords::hostFromLocal(m_getPos(), 0);
        Transaction tr = doc->transaction();
        if (tr.replaceWith(start + change->from, start + change->to, change->text)) {
            tr.label = QStringLiteral("Typing");
            doc->dispatch(tr);
        } else {
            qWarning() << "CodeBlockBinding: Rejected change for block" << m_node.id
                       << "at" << start + change->from;
        }
    }
    updateMode();
}

Selection CodeBlockBinding::hostSelection() const {
    const QString text = m_editor->text();
    TextRange r = m_editor->selection();
    int base = m_getPos();
    return Selection::text(coords::hostFromLocal(base, coords::pointToOffset(text, r.anchor)),
                           coords::hostFromLocal(base, coords::pointToOffset(text, r.head)));
}

void CodeBlockBinding::forwardSelection() {
    if (m_guard.escaping() || !m_editor->hasFocus())
        return;

    Document* doc = m_host->document();
    Selection sel = hostSelection();
    if (sel == doc->selection())
        return;
    Transaction tr = doc->transaction();
    tr.setSelection(sel);
    doc->dispatch(tr);
}

// ── Host -> inner ──

bool CodeBlockBinding::update(const Block& block) {
    if (block.type != m_node.type)
        return false;

    m_node = block;
    updateMode();

    const QString current = m_editor->text();
    if (auto change = diff::computeChange(current, m_node.text)) {
        SyncGuard::Scope scope(m_guard, SyncState::Syncing);
        TextRange range{coords::offsetToPoint(current, change->from),
                        coords::offsetToPoint(current, change->to)};
        m_editor->replaceRange(range, change->text);
    }
    return true;
}

void CodeBlockBinding::setSelection(int anchor, int head) {
    const bool escaping = m_guard.escaping();
    SyncGuard::Scope scope(m_guard, SyncState::Syncing);
    if (!escaping)
        m_editor->focus();
    const QString text = m_editor->text();
    m_editor->setSelection({coords::offsetToPoint(text, anchor),
                            coords::offsetToPoint(text, head)});
}

void CodeBlockBinding::selectNode() {
    m_editor->focus();
}

// ── Mode and run affordance ──

void CodeBlockBinding::updateMode() {
    const QString lang = m_options.lang ? m_options.lang(m_node, m_editor->text()) : QString();
    if (!lang.isNull() && lang != m_mode) {
        m_editor->setMode(lang);
        m_mode = lang;
    }

    bool enabled = m_options.executeChunkFn
                && chunks::isExecutableLanguage(lang, m_editorOptions.chunkExecutionLanguages);
    setChunkExecutionEnabled(enabled);
}

void CodeBlockBinding::setChunkExecutionEnabled(bool enabled) {
    if (enabled == m_runEnabled)
        return;
    m_runEnabled = enabled;
    m_editor->setRunActionsVisible(enabled);
    emit chunkExecutionEnabledChanged(enabled);
}

void CodeBlockBinding::executeChunk() {
    if (!m_runEnabled)
        return;
    if (auto chunk = chunks::chunkFromBlock(m_node, m_mode))
        m_options.executeChunkFn(*chunk);
}

void CodeBlockBinding::executePreviousChunks() {
    if (!m_runEnabled)
        return;
    auto previous = chunks::previousExecutableChunks(m_host->document()->state(),
                                                     m_getPos(), m_mode);
    if (auto merged = chunks::mergeChunks(previous))
        m_options.executeChunkFn(*merged);
}

// ── Boundary navigation ──

void CodeBlockBinding::arrowMaybeEscape(navigator::Unit unit, int dir, EditorCommand fallback) {
    if (!navigator::shouldEscape(*m_editor, unit, dir)) {
        m_editor->execCommand(fallback);
        return;
    }

    // Nowhere to go: keep focus and selection where they are
    Document* doc = m_host->document();
    auto target = navigator::escapeTarget(doc->state(), m_getPos(), dir);
    if (!target)
        return;

    SyncGuard::Scope scope(m_guard, SyncState::Escaping);
    m_host->focus();
    Transaction tr = doc->transaction();
    tr.setSelection(*target).scrollIntoView();
    doc->dispatch(tr);
    m_host->focus();
}

void CodeBlockBinding::backspaceMaybeDeleteNode() {
    if (!m_node.text.isEmpty()) {
        m_editor->execCommand(EditorCommand::DeleteBack);
        return;
    }

    // The dispatch below can remove this binding; only locals after it
    HostView* host = m_host;
    Document* doc = host->document();
    if (doc->undoInputRule()) {
        host->focus();
        return;
    }

    int pos = m_getPos();
    Transaction tr = doc->transaction();
    if (!tr.deleteRange(pos, pos + m_node.nodeSize())) {
        qWarning() << "CodeBlockBinding: Cannot delete block" << m_node.id << "at" << pos;
        return;
    }
    auto near = tr.doc().selectionNear(pos, -1);
    if (!near) near = tr.doc().selectionNear(pos, 1);
    if (near) tr.setSelection(*near);
    tr.label = QStringLiteral("Delete Block");
    doc->dispatch(tr);
    host->focus();
}

// ── Key bindings ──

InnerEditor::KeyHandler CodeBlockBinding::handlerFor(KeyAction action) {
    using navigator::Unit;
    switch (action) {
    case KeyAction::MoveLeft:
        return [this]() { arrowMaybeEscape(Unit::Char, -1, EditorCommand::CharLeft); };
    case KeyAction::MoveRight:
        return [this]() { arrowMaybeEscape(Unit::Char, 1, EditorCommand::CharRight); };
    case KeyAction::MoveUp:
        return [this]() { arrowMaybeEscape(Unit::Line, -1, EditorCommand::LineUp); };
    case KeyAction::MoveDown:
        return [this]() { arrowMaybeEscape(Unit::Line, 1, EditorCommand::LineDown); };
    case KeyAction::Backspace:
        return [this]() { backspaceMaybeDeleteNode(); };
    case KeyAction::Undo:
        return [this]() { m_host->document()->undo(); };
    case KeyAction::Redo:
        return [this]() { m_host->document()->redo(); };
    case KeyAction::SelectAll:
        return [this]() {
            HostView* host = m_host;
            host->document()->selectAll();
            host->focus();
        };
    case KeyAction::ExitBlock:
        return [this]() {
            HostView* host = m_host;
            if (host->document()->exitCode())
                host->focus();
        };
    case KeyAction::InsertParagraph:
        return [this]() {
            HostView* host = m_host;
            if (host->document()->insertParagraph())
                host->focus();
        };
    case KeyAction::EditAttributes:
        if (!m_options.attrEditFn) return {};
        return [this]() { m_options.attrEditFn(m_host->document(), m_host); };
    case KeyAction::RunChunk:
        if (!m_options.executeChunkFn) return {};
        return [this]() { executeChunk(); };
    case KeyAction::RunPreviousChunks:
        if (!m_options.executeChunkFn) return {};
        return [this]() { executePreviousChunks(); };
    }
    return {};
}

} // namespace cbx
