#pragma once
#include "document.h"
#include "innereditor.h"
#include "keymap.h"
#include "navigator.h"
#include "options.h"
#include "syncguard.h"
#include <QList>
#include <QVector>
#include <functional>
#include <memory>

namespace cbx {

// ── Code block binding ──
//
// Keeps one host code block and one inner editor in sync. Host -> inner
// goes through update()/setSelection(); inner -> host through the editor's
// signals, which dispatch transactions on the host document.

class CodeBlockBinding : public QObject {
    Q_OBJECT
public:
    using PosFn = std::function<int()>;

    // Takes ownership of editor. getPos returns the block's current start
    // position in the host document.
    CodeBlockBinding(const Block& block, HostView* host, PosFn getPos,
                     InnerEditor* editor, const CodeViewOptions& options,
                     const EditorOptions& editorOptions, QObject* parent = nullptr);
    ~CodeBlockBinding() override;

    const Block& block() const { return m_node; }
    InnerEditor* editor() const { return m_editor.get(); }
    QString      mode() const { return m_mode; }
    SyncState    syncState() const { return m_guard.state(); }
    bool         isChunkExecutionEnabled() const { return m_runEnabled; }
    bool         isDisposed() const { return m_disposed; }

    // Host -> inner. Returns false when block has a different node type.
    bool update(const Block& block);
    void setSelection(int anchor, int head);
    void selectNode();

    void executeChunk();
    void executePreviousChunks();

    void arrowMaybeEscape(navigator::Unit unit, int dir, EditorCommand fallback);
    void backspaceMaybeDeleteNode();

    void dispose();

signals:
    void chunkExecutionEnabledChanged(bool enabled);

private:
    Block                        m_node;
    HostView*                    m_host;
    PosFn                        m_getPos;
    std::unique_ptr<InnerEditor> m_editor;
    CodeViewOptions              m_options;
    EditorOptions                m_editorOptions;
    SyncGuard                    m_guard;
    QString                      m_mode;
    bool                         m_runEnabled = false;
    bool                         m_disposed   = false;

    QList<QMetaObject::Connection> m_connections;
    QVector<int>                   m_keyHandles;

    void valueChanged();
    void forwardSelection();
    Selection hostSelection() const;
    void updateMode();
    void setChunkExecutionEnabled(bool enabled);
    InnerEditor::KeyHandler handlerFor(KeyAction action);
};

} // namespace cbx
