#pragma once
#include "binding.h"
#include <QHash>
#include <QMap>

namespace cbx {

// ── Code view host ──
//
// Owns one CodeBlockBinding per bound block of a document and keeps the set
// in step with Document::stateChanged.

class CodeViewHost : public QObject {
    Q_OBJECT
public:
    CodeViewHost(HostView* host, const EditorOptions& editorOptions,
                 InnerEditorFactory factory, QObject* parent = nullptr);
    ~CodeViewHost() override;

    void registerNodeType(NodeType type, const CodeViewOptions& options);
    bool handlesType(NodeType type) const { return m_options.contains(type); }

    CodeBlockBinding* bindingFor(uint64_t blockId) const { return m_bindings.value(blockId); }
    QList<CodeBlockBinding*> bindings() const;
    int bindingCount() const { return m_bindings.size(); }

    void sync();

    // Host-side arrow key: moves a host cursor sitting at the edge of its
    // text block into an adjacent bound block. True when handled.
    bool handleArrow(navigator::Direction dir);

    // The host view took focus; a selection inside a bound block goes back
    // to that block's editor.
    void focusSelection();

signals:
    void bindingCreated(cbx::CodeBlockBinding* binding);
    void bindingRemoved(quint64 blockId);

private:
    HostView*                             m_host;
    EditorOptions                         m_editorOptions;
    InnerEditorFactory                    m_factory;
    QMap<NodeType, CodeViewOptions>       m_options;
    QHash<quint64, CodeBlockBinding*>     m_bindings;
    QMetaObject::Connection               m_stateConn;
    Selection                             m_routed;
    bool                                  m_syncing     = false;
    bool                                  m_syncPending = false;

    void syncOnce();
    CodeBlockBinding* createBinding(const Block& block);
    void destroyBinding(quint64 blockId);
    void routeSelection(bool force);
};

} // namespace cbx
