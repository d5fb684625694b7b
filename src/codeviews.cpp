#include "codeviews.h"
#include <QDebug>
#include <QSet>
#include <QWidget>

namespace cbx {

CodeViewHost::CodeViewHost(HostView* host, const EditorOptions& editorOptions,
                           InnerEditorFactory factory, QObject* parent)
    : QObject(parent)
    , m_host(host)
    , m_editorOptions(editorOptions)
    , m_factory(std::move(factory))
{
    m_stateConn = connect(m_host->document(), &Document::stateChanged,
                          this, &CodeViewHost::sync);
}

CodeViewHost::~CodeViewHost() {
    disconnect(m_stateConn);
    const auto ids = m_bindings.keys();
    for (quint64 id : ids) {
        CodeBlockBinding* b = m_bindings.take(id);
        b->dispose();
        delete b;
    }
}

void CodeViewHost::registerNodeType(NodeType type, const CodeViewOptions& options) {
    if (!isCodeType(type))
        qWarning() << "CodeViewHost: Binding non-code node type" << nodeTypeToString(type);
    m_options.insert(type, options);
    sync();
}

QList<CodeBlockBinding*> CodeViewHost::bindings() const {
    // document order
    QList<CodeBlockBinding*> out;
    for (const Block& b : m_host->document()->state().blocks())
        if (CodeBlockBinding* binding = m_bindings.value(b.id))
            out.append(binding);
    return out;
}

void CodeViewHost::sync() {
    // Bindings dispatch from inside update(); fold nested syncs into a rerun
    if (m_syncing) {
        m_syncPending = true;
        return;
    }
    m_syncing = true;
    do {
        m_syncPending = false;
        syncOnce();
    } while (m_syncPending);
    m_syncing = false;
}

void CodeViewHost::syncOnce() {
    const DocState state = m_host->document()->state();
    bool created = false;

    QSet<quint64> live;
    for (const Block& b : state.blocks()) {
        if (!m_options.contains(b.type))
            continue;
        live.insert(b.id);

        CodeBlockBinding* binding = m_bindings.value(b.id);
        if (!binding) {
            createBinding(b);
            created = true;
        } else if (binding->block() != b && !binding->update(b)) {
            qDebug() << "CodeViewHost: Recreating binding for block" << b.id
                     << nodeTypeToString(binding->block().type) << "->" << nodeTypeToString(b.type);
            destroyBinding(b.id);
            createBinding(b);
            created = true;
        }
    }

    const auto ids = m_bindings.keys();
    for (quint64 id : ids)
        if (!live.contains(id)) destroyBinding(id);

    routeSelection(created);
}

CodeBlockBinding* CodeViewHost::createBinding(const Block& block) {
    const quint64 id = block.id;
    auto getPos = [this, id]() {
        const DocState& s = m_host->document()->state();
        int idx = s.indexOfId(id);
        return idx >= 0 ? s.positionOf(idx) : -1;
    };
    auto* binding = new CodeBlockBinding(block, m_host, getPos, m_factory(),
                                         m_options.value(block.type), m_editorOptions, this);
    m_bindings.insert(id, binding);
    emit bindingCreated(binding);
    return binding;
}

void CodeViewHost::destroyBinding(quint64 blockId) {
    CodeBlockBinding* binding = m_bindings.take(blockId);
    if (!binding) return;

    binding->dispose();
    // Hiding a focused widget hands focus to the next editor in the chain
    if (binding->editor()->hasFocus())
        m_host->focus();
    if (QWidget* w = binding->editor()->widget())
        w->hide();
    // May be running inside one of the binding's own key handlers
    binding->deleteLater();
    emit bindingRemoved(blockId);
}

void CodeViewHost::routeSelection(bool force) {
    const Selection sel = m_host->document()->selection();
    if (!force && sel == m_routed)
        return;
    m_routed = sel;

    const DocState& state = m_host->document()->state();
    if (sel.kind == Selection::Node) {
        if (const Block* b = state.nodeAt(sel.anchor))
            if (CodeBlockBinding* binding = m_bindings.value(b->id))
                binding->selectNode();
        return;
    }
    if (sel.kind != Selection::Text)
        return;

    ResolvedPos anchor = state.resolve(sel.anchor);
    ResolvedPos head   = state.resolve(sel.head);
    if (head.atBoundary() || anchor.blockIndex != head.blockIndex)
        return;
    if (CodeBlockBinding* binding = m_bindings.value(state.block(head.blockIndex).id))
        binding->setSelection(anchor.parentOffset, head.parentOffset);
}

void CodeViewHost::focusSelection() {
    if (m_syncing)
        return;
    routeSelection(true);
}

bool CodeViewHost::handleArrow(navigator::Direction dir) {
    Document* doc = m_host->document();
    const DocState& state = doc->state();
    const Selection& sel = doc->selection();
    if (sel.kind != Selection::Text || !sel.empty())
        return false;

    ResolvedPos rp = state.resolve(sel.head);
    if (rp.atBoundary())
        return false;
    const Block& b = state.block(rp.blockIndex);
    if (!navigator::atTextblockEdge(b.text, rp.parentOffset, dir))
        return false;

    int side = navigator::sign(dir);
    int start = state.positionOf(rp.blockIndex);
    auto next = state.selectionNear(side > 0 ? start + b.nodeSize() : start, side);
    if (!next || next->kind != Selection::Text)
        return false;
    ResolvedPos np = state.resolve(next->head);
    if (np.atBoundary() || !m_bindings.contains(state.block(np.blockIndex).id))
        return false;

    Transaction tr = doc->transaction();
    tr.setSelection(*next).scrollIntoView();
    doc->dispatch(tr);
    return true;
}

} // namespace cbx
