#include "codeeditor.h"
#include <QDebug>
#include <Qsci/qsciscintilla.h>
#include <Qsci/qsciscintillabase.h>
#include <Qsci/qscilexercpp.h>
#include <Qsci/qscilexerpython.h>
#include <Qsci/qscilexersql.h>
#include <Qsci/qscilexerbash.h>
#include <Qsci/qscilexerjavascript.h>
#include <Qsci/qscilexercss.h>
#include <Qsci/qscilexerhtml.h>
#include <Qsci/qscilexeryaml.h>
#include <QFrame>
#include <QToolButton>
#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QKeyEvent>
#include <QFont>
#include <utility>

namespace cbx {

static QString g_fontName = "JetBrains Mono";

static QFont editorFont() {
    QFont f(g_fontName, 11);
    f.setFixedPitch(true);
    return f;
}

// ── Mode → lexer table ──

struct LexerEntry {
    const char* mode;
    QsciLexer* (*create)(QObject* parent);
};

template<class L>
static QsciLexer* makeLexer(QObject* parent) { return new L(parent); }

static const LexerEntry kLexers[] = {
    {"c",          &makeLexer<QsciLexerCPP>},
    {"cpp",        &makeLexer<QsciLexerCPP>},
    {"rcpp",       &makeLexer<QsciLexerCPP>},
    {"python",     &makeLexer<QsciLexerPython>},
    {"sql",        &makeLexer<QsciLexerSQL>},
    {"bash",       &makeLexer<QsciLexerBash>},
    {"sh",         &makeLexer<QsciLexerBash>},
    {"javascript", &makeLexer<QsciLexerJavaScript>},
    {"js",         &makeLexer<QsciLexerJavaScript>},
    {"css",        &makeLexer<QsciLexerCSS>},
    {"html",       &makeLexer<QsciLexerHTML>},
    {"yaml",       &makeLexer<QsciLexerYAML>},
};

// ── CodeEditor ──

CodeEditor::CodeEditor(const Theme& theme, QWidget* parent)
    : InnerEditor(nullptr), m_theme(theme)
{
    m_frame = new QFrame(parent);
    m_frame->setObjectName(QStringLiteral("cbxCodeFrame"));
    auto* layout = new QVBoxLayout(m_frame);
    layout->setContentsMargins(1, 1, 1, 1);
    layout->setSpacing(0);

    setupRunBar();
    layout->addWidget(m_runBar);

    m_sci = new QsciScintilla(m_frame);
    layout->addWidget(m_sci);

    setupScintilla();
    applyLexerColors();
    updateFrameStyle();

    m_sci->installEventFilter(this);

    connect(m_sci, &QsciScintilla::textChanged, this, &InnerEditor::textChanged);
    connect(m_sci, &QsciScintilla::cursorPositionChanged,
            this, [this](int, int) { emit cursorChanged(); });
    connect(m_sci, &QsciScintilla::selectionChanged, this, &InnerEditor::cursorChanged);
}

CodeEditor::~CodeEditor() {
    // The frame may already be gone with the host widget tree
    delete m_frame.data();
}

void CodeEditor::setGlobalFontName(const QString& fontName) {
    g_fontName = fontName;
}

void CodeEditor::setupScintilla() {
    m_sci->setFont(editorFont());
    m_sci->setUtf8(true);
    m_sci->setEolMode(QsciScintilla::EolUnix);
    m_sci->setWrapMode(QsciScintilla::WrapNone);
    m_sci->setCaretLineVisible(false);
    m_sci->setTabWidth(2);
    m_sci->setIndentationsUseTabs(false);
    m_sci->setAutoIndent(true);
    m_sci->setBraceMatching(QsciScintilla::SloppyBraceMatch);

    // Embedded block: no margins, no scrollbars fighting the host
    m_sci->setMarginWidth(0, 0);
    m_sci->setMarginWidth(1, 0);
    m_sci->setMarginWidth(2, 0);
    m_sci->setHorizontalScrollBarPolicy(Qt::ScrollBarAsNeeded);
    m_sci->setVerticalScrollBarPolicy(Qt::ScrollBarAlwaysOff);

    // Host owns undo; the inner buffer keeps no history of its own
    m_sci->SendScintilla(QsciScintillaBase::SCI_SETUNDOCOLLECTION, (unsigned long)0);
}

void CodeEditor::setupRunBar() {
    m_runBar = new QWidget(m_frame);
    auto* row = new QHBoxLayout(m_runBar);
    row->setContentsMargins(0, 0, 2, 0);
    row->setSpacing(2);
    row->addStretch();

#ifdef Q_OS_MACOS
    const QString prevShortcut = QStringLiteral("⌥⌘P");
    const QString runShortcut  = QStringLiteral("⇧⌘↩");
#else
    const QString prevShortcut = QStringLiteral("Ctrl+Alt+P");
    const QString runShortcut  = QStringLiteral("Ctrl+Shift+Enter");
#endif

    m_runPrev = new QToolButton(m_runBar);
    m_runPrev->setText(QStringLiteral("⏫"));
    m_runPrev->setToolTip(tr("Run All Chunks Above (%1)").arg(prevShortcut));
    m_runPrev->setFocusPolicy(Qt::NoFocus);
    m_runPrev->setAutoRaise(true);
    row->addWidget(m_runPrev);

    m_runChunk = new QToolButton(m_runBar);
    m_runChunk->setText(QStringLiteral("▶"));
    m_runChunk->setToolTip(tr("Run Chunk (%1)").arg(runShortcut));
    m_runChunk->setFocusPolicy(Qt::NoFocus);
    m_runChunk->setAutoRaise(true);
    row->addWidget(m_runChunk);

    connect(m_runPrev, &QToolButton::clicked, this, &InnerEditor::runPreviousChunksRequested);
    connect(m_runChunk, &QToolButton::clicked, this, &InnerEditor::runChunkRequested);

    m_runBar->setVisible(false);
}

void CodeEditor::setTabWidth(int width) {
    m_sci->setTabWidth(width);
}

void CodeEditor::applyTheme(const Theme& theme) {
    m_theme = theme;
    applyLexerColors();
    updateFrameStyle();
}

void CodeEditor::applyLexerColors() {
    QFont font = editorFont();
    m_sci->setPaper(m_theme.background);
    m_sci->setColor(m_theme.text);
    m_sci->setCaretForegroundColor(m_theme.text);
    m_sci->setSelectionBackgroundColor(m_theme.selection);

    if (!m_lexer)
        return;

    if (auto* cpp = qobject_cast<QsciLexerCPP*>(m_lexer)) {
        cpp->setColor(m_theme.syntaxKeyword, QsciLexerCPP::Keyword);
        cpp->setColor(m_theme.syntaxNumber,  QsciLexerCPP::Number);
        cpp->setColor(m_theme.syntaxString,  QsciLexerCPP::DoubleQuotedString);
        cpp->setColor(m_theme.syntaxString,  QsciLexerCPP::SingleQuotedString);
        cpp->setColor(m_theme.syntaxComment, QsciLexerCPP::Comment);
        cpp->setColor(m_theme.syntaxComment, QsciLexerCPP::CommentLine);
        cpp->setColor(m_theme.syntaxPreproc, QsciLexerCPP::PreProcessor);
        cpp->setColor(m_theme.syntaxOperator, QsciLexerCPP::Operator);
        cpp->setColor(m_theme.text,          QsciLexerCPP::Default);
        cpp->setColor(m_theme.text,          QsciLexerCPP::Identifier);
    } else if (auto* py = qobject_cast<QsciLexerPython*>(m_lexer)) {
        py->setColor(m_theme.syntaxKeyword, QsciLexerPython::Keyword);
        py->setColor(m_theme.syntaxNumber,  QsciLexerPython::Number);
        py->setColor(m_theme.syntaxString,  QsciLexerPython::DoubleQuotedString);
        py->setColor(m_theme.syntaxString,  QsciLexerPython::SingleQuotedString);
        py->setColor(m_theme.syntaxComment, QsciLexerPython::Comment);
        py->setColor(m_theme.syntaxPreproc, QsciLexerPython::Decorator);
        py->setColor(m_theme.syntaxOperator, QsciLexerPython::Operator);
        py->setColor(m_theme.text,          QsciLexerPython::Default);
        py->setColor(m_theme.text,          QsciLexerPython::Identifier);
    } else if (auto* sql = qobject_cast<QsciLexerSQL*>(m_lexer)) {
        sql->setColor(m_theme.syntaxKeyword, QsciLexerSQL::Keyword);
        sql->setColor(m_theme.syntaxNumber,  QsciLexerSQL::Number);
        sql->setColor(m_theme.syntaxString,  QsciLexerSQL::SingleQuotedString);
        sql->setColor(m_theme.syntaxComment, QsciLexerSQL::Comment);
        sql->setColor(m_theme.syntaxComment, QsciLexerSQL::CommentLine);
        sql->setColor(m_theme.text,          QsciLexerSQL::Default);
    } else if (auto* sh = qobject_cast<QsciLexerBash*>(m_lexer)) {
        sh->setColor(m_theme.syntaxKeyword, QsciLexerBash::Keyword);
        sh->setColor(m_theme.syntaxNumber,  QsciLexerBash::Number);
        sh->setColor(m_theme.syntaxString,  QsciLexerBash::DoubleQuotedString);
        sh->setColor(m_theme.syntaxString,  QsciLexerBash::SingleQuotedString);
        sh->setColor(m_theme.syntaxComment, QsciLexerBash::Comment);
        sh->setColor(m_theme.text,          QsciLexerBash::Default);
    }

    // Same paper and font for every style the lexer may use
    for (int i = 0; i <= 127; i++) {
        m_lexer->setPaper(m_theme.background, i);
        m_lexer->setFont(font, i);
    }
}

void CodeEditor::updateFrameStyle() {
    QColor border = m_theme.borderColor(m_classes, m_active);
    m_frame->setProperty("active", m_active);
    m_frame->setProperty("classes", m_classes.join(QLatin1Char(' ')));
    m_frame->setStyleSheet(QStringLiteral(
        "QFrame#cbxCodeFrame { border: 1px solid %1; background: %2; }"
        "QToolButton { color: %3; border: none; }")
        .arg(border.name(), m_theme.background.name(), m_theme.textDim.name()));
}

// ── Content ──

QString CodeEditor::text() const {
    return m_sci->text();
}

void CodeEditor::setText(const QString& text) {
    m_sci->setText(text);
}

// Columns count UTF-16 units like QString; Scintilla positions are UTF-8 bytes
long CodeEditor::positionOf(const TextPoint& pt) const {
    int row = qBound(0, pt.row, m_sci->lines() - 1);
    const QString line = m_sci->text(row);
    int col = qBound(0, pt.column, lineLength(row));
    if (col > 0 && line.at(col - 1).isHighSurrogate())
        --col;
    long start = m_sci->SendScintilla(QsciScintillaBase::SCI_POSITIONFROMLINE,
                                      (unsigned long)row);
    return start + line.left(col).toUtf8().size();
}

TextPoint CodeEditor::pointOf(long pos) const {
    int row = (int)m_sci->SendScintilla(QsciScintillaBase::SCI_LINEFROMPOSITION,
                                        (unsigned long)pos);
    long start = m_sci->SendScintilla(QsciScintillaBase::SCI_POSITIONFROMLINE,
                                      (unsigned long)row);
    const QByteArray line = m_sci->text(row).toUtf8();
    return {row, int(QString::fromUtf8(line.left(int(pos - start))).size())};
}

void CodeEditor::replaceRange(const TextRange& range, const QString& text) {
    long a = positionOf(range.anchor);
    long b = positionOf(range.head);
    if (a > b) std::swap(a, b);

    QByteArray utf8 = text.toUtf8();
    m_sci->SendScintilla(QsciScintillaBase::SCI_SETTARGETSTART, (unsigned long)a);
    m_sci->SendScintilla(QsciScintillaBase::SCI_SETTARGETEND, (unsigned long)b);
    m_sci->SendScintilla(QsciScintillaBase::SCI_REPLACETARGET,
                         (uintptr_t)utf8.size(), utf8.constData());
}

// ── Selection ──

TextRange CodeEditor::selection() const {
    long anchor = m_sci->SendScintilla(QsciScintillaBase::SCI_GETANCHOR);
    long caret  = m_sci->SendScintilla(QsciScintillaBase::SCI_GETCURRENTPOS);
    return {pointOf(anchor), pointOf(caret)};
}

void CodeEditor::setSelection(const TextRange& range) {
    m_sci->SendScintilla(QsciScintillaBase::SCI_SETSEL,
                         (unsigned long)positionOf(range.anchor), positionOf(range.head));
}

void CodeEditor::clearSelection() {
    long caret = m_sci->SendScintilla(QsciScintillaBase::SCI_GETCURRENTPOS);
    m_sci->SendScintilla(QsciScintillaBase::SCI_SETEMPTYSELECTION, (unsigned long)caret);
}

int CodeEditor::lineCount() const {
    return m_sci->lines();
}

int CodeEditor::lineLength(int row) const {
    if (row < 0 || row >= m_sci->lines()) return 0;
    QString line = m_sci->text(row);
    while (line.endsWith(QLatin1Char('\n')) || line.endsWith(QLatin1Char('\r')))
        line.chop(1);
    return line.size();
}

// ── Focus ──

bool CodeEditor::hasFocus() const {
    return m_sci->hasFocus();
}

void CodeEditor::focus() {
    m_sci->setFocus(Qt::OtherFocusReason);
}

// ── Mode / commands ──

void CodeEditor::setMode(const QString& mode) {
    m_mode = mode;
    const QString key = mode.toLower();

    QsciLexer* lexer = nullptr;
    for (const auto& e : kLexers) {
        if (key == QLatin1String(e.mode)) {
            lexer = e.create(m_sci);
            break;
        }
    }

    m_sci->setLexer(lexer);
    delete m_lexer;
    m_lexer = lexer;
    applyLexerColors();
}

void CodeEditor::execCommand(EditorCommand cmd) {
    switch (cmd) {
    case EditorCommand::CharLeft:   m_sci->SendScintilla(QsciScintillaBase::SCI_CHARLEFT);   break;
    case EditorCommand::CharRight:  m_sci->SendScintilla(QsciScintillaBase::SCI_CHARRIGHT);  break;
    case EditorCommand::LineUp:     m_sci->SendScintilla(QsciScintillaBase::SCI_LINEUP);     break;
    case EditorCommand::LineDown:   m_sci->SendScintilla(QsciScintillaBase::SCI_LINEDOWN);   break;
    case EditorCommand::DeleteBack: m_sci->SendScintilla(QsciScintillaBase::SCI_DELETEBACK); break;
    }
}

int CodeEditor::addKeyCommand(const QString& name, const QList<QKeySequence>& keys,
                              KeyHandler handler) {
    KeyCommand cmd;
    cmd.handle  = m_nextHandle++;
    cmd.name    = name;
    cmd.keys    = keys;
    cmd.handler = std::move(handler);
    m_commands.append(cmd);
    return cmd.handle;
}

void CodeEditor::removeKeyCommand(int handle) {
    for (int i = 0; i < m_commands.size(); ++i) {
        if (m_commands[i].handle == handle) {
            m_commands.removeAt(i);
            return;
        }
    }
}

// ── Visual state ──

void CodeEditor::setActive(bool active) {
    m_active = active;
    updateFrameStyle();
}

void CodeEditor::setStyleClasses(const QStringList& classes) {
    m_classes = classes;
    updateFrameStyle();
}

void CodeEditor::setRunActionsVisible(bool visible) {
    m_runVisible = visible;
    m_runBar->setVisible(visible);
}

QWidget* CodeEditor::widget() const {
    return m_frame;
}

// ── Event filter ──

bool CodeEditor::eventFilter(QObject* obj, QEvent* event) {
    if (obj != m_sci)
        return InnerEditor::eventFilter(obj, event);

    switch (event->type()) {
    case QEvent::FocusIn:
        emit focusIn();
        break;
    case QEvent::FocusOut:
        emit focusOut();
        break;
    case QEvent::KeyPress: {
        auto* ke = static_cast<QKeyEvent*>(event);
        int mods = int(ke->modifiers() & ~Qt::KeypadModifier);
        QKeySequence pressed(ke->key() | mods);
        for (const auto& cmd : m_commands) {
            for (const auto& k : cmd.keys) {
                if (k.matches(pressed) == QKeySequence::ExactMatch) {
                    KeyHandler handler = cmd.handler;   // may dispose us
                    handler();
                    return true;
                }
            }
        }
        break;
    }
    default:
        break;
    }
    return InnerEditor::eventFilter(obj, event);
}

} // namespace cbx
