#pragma once
#include "core.h"
#include <QObject>
#include <QKeySequence>
#include <QList>
#include <QStringList>
#include <functional>

class QWidget;

namespace cbx {

// Built-in commands of the inner editor, run when a key binding does not
// take over the key.
enum class EditorCommand {
    CharLeft, CharRight, LineUp, LineDown, DeleteBack
};

// ── Inner editor interface ──
//
// The plain-text editing surface embedded in a host block. All positions
// are row/column; the binding does the translation to host offsets.

class InnerEditor : public QObject {
    Q_OBJECT
public:
    using KeyHandler = std::function<void()>;

    explicit InnerEditor(QObject* parent = nullptr) : QObject(parent) {}
    ~InnerEditor() override = default;

    virtual QString   text() const = 0;
    virtual void      setText(const QString& text) = 0;
    virtual void      replaceRange(const TextRange& range, const QString& text) = 0;

    virtual TextRange selection() const = 0;
    virtual void      setSelection(const TextRange& range) = 0;
    virtual void      clearSelection() = 0;
    TextPoint         cursor() const { return selection().head; }

    virtual int       lineCount() const = 0;
    virtual int       lineLength(int row) const = 0;

    virtual bool      hasFocus() const = 0;
    virtual void      focus() = 0;

    virtual void      setMode(const QString& mode) = 0;
    virtual QString   mode() const = 0;
    virtual void      execCommand(EditorCommand cmd) = 0;

    // Returns a handle for removeKeyCommand(); keys are tried in order.
    virtual int       addKeyCommand(const QString& name, const QList<QKeySequence>& keys,
                                    KeyHandler handler) = 0;
    virtual void      removeKeyCommand(int handle) = 0;

    // Visual state
    virtual void      setActive(bool active) = 0;
    virtual void      setStyleClasses(const QStringList& classes) = 0;
    virtual void      setRunActionsVisible(bool visible) = 0;
    virtual bool      runActionsVisible() const = 0;

    virtual QWidget*  widget() const = 0;

signals:
    void textChanged();
    void cursorChanged();
    void focusIn();
    void focusOut();
    void runChunkRequested();
    void runPreviousChunksRequested();
};

using InnerEditorFactory = std::function<InnerEditor*()>;

} // namespace cbx
