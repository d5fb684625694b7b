#pragma once
#include "innereditor.h"
#include "themes/theme.h"
#include <QVector>
#include <QPointer>
#include <QFrame>

class QsciScintilla;
class QsciLexer;
class QToolButton;

namespace cbx {

// ── QScintilla-backed inner editor ──

class CodeEditor : public InnerEditor {
    Q_OBJECT
public:
    explicit CodeEditor(const Theme& theme = Theme::dark(), QWidget* parent = nullptr);
    ~CodeEditor() override;

    QsciScintilla* scintilla() const { return m_sci; }

    static void setGlobalFontName(const QString& fontName);
    void setTabWidth(int width);
    void applyTheme(const Theme& theme);

    QString   text() const override;
    void      setText(const QString& text) override;
    void      replaceRange(const TextRange& range, const QString& text) override;

    TextRange selection() const override;
    void      setSelection(const TextRange& range) override;
    void      clearSelection() override;

    int       lineCount() const override;
    int       lineLength(int row) const override;

    bool      hasFocus() const override;
    void      focus() override;

    void      setMode(const QString& mode) override;
    QString   mode() const override { return m_mode; }
    void      execCommand(EditorCommand cmd) override;

    int       addKeyCommand(const QString& name, const QList<QKeySequence>& keys,
                            KeyHandler handler) override;
    void      removeKeyCommand(int handle) override;

    void      setActive(bool active) override;
    void      setStyleClasses(const QStringList& classes) override;
    void      setRunActionsVisible(bool visible) override;
    bool      runActionsVisible() const override { return m_runVisible; }

    QWidget*  widget() const override;

protected:
    bool eventFilter(QObject* obj, QEvent* event) override;

private:
    struct KeyCommand {
        int                 handle = 0;
        QString             name;
        QList<QKeySequence> keys;
        KeyHandler          handler;
    };

    QPointer<QFrame> m_frame;
    QWidget*       m_runBar   = nullptr;
    QToolButton*   m_runChunk = nullptr;
    QToolButton*   m_runPrev  = nullptr;
    QsciScintilla* m_sci      = nullptr;
    QsciLexer*     m_lexer    = nullptr;
    Theme          m_theme;
    QString        m_mode;
    QStringList    m_classes;
    bool           m_active     = false;
    bool           m_runVisible = false;

    QVector<KeyCommand> m_commands;
    int                 m_nextHandle = 1;

    void setupScintilla();
    void setupRunBar();
    void applyLexerColors();
    void updateFrameStyle();

    long      positionOf(const TextPoint& pt) const;
    TextPoint pointOf(long pos) const;
};

} // namespace cbx
