#include "documentview.h"
#include "codeeditor.h"
#include <QDebug>
#include <QFrame>
#include <QKeyEvent>
#include <QLabel>
#include <QMouseEvent>
#include <QVBoxLayout>

namespace cbx {

DocumentView::DocumentView(Document* doc, const EditorOptions& options, const Theme& theme,
                           QWidget* parent)
    : QWidget(parent), m_doc(doc), m_theme(theme)
{
    setFocusPolicy(Qt::StrongFocus);
    m_layout = new QVBoxLayout(this);
    m_layout->setContentsMargins(12, 12, 12, 12);
    m_layout->setSpacing(6);

    const int tabWidth = options.tabWidth;
    m_codeViews = new CodeViewHost(this, options, [this, tabWidth]() -> InnerEditor* {
        auto* editor = new CodeEditor(m_theme);
        editor->setTabWidth(tabWidth);
        return editor;
    }, this);

    // Registered after the code view host, so bindings are current here
    connect(m_doc, &Document::stateChanged, this, &DocumentView::refresh);
    rebuild();
}

void DocumentView::registerCodeView(NodeType type, const CodeViewOptions& options) {
    m_codeViews->registerNodeType(type, options);
    rebuild();
}

void DocumentView::focus() {
    setFocus(Qt::OtherFocusReason);
    m_codeViews->focusSelection();
}

void DocumentView::applyTheme(const Theme& theme) {
    m_theme = theme;
    for (CodeBlockBinding* b : m_codeViews->bindings())
        if (auto* editor = qobject_cast<CodeEditor*>(b->editor()))
            editor->applyTheme(theme);
    rebuild();
}

QWidget* DocumentView::widgetForPos(int pos) const {
    const DocState& state = m_doc->state();
    int p = 0;
    for (int i = 0; i < state.blockCount() && i < m_blockWidgets.size(); ++i) {
        int end = p + state.block(i).nodeSize();
        if (pos >= p && pos < end) return m_blockWidgets[i];
        p = end;
    }
    return m_blockWidgets.isEmpty() ? nullptr : m_blockWidgets.last();
}

// ── Rendering ──

// Text and selection changes update the existing widgets; only a change in
// the block sequence or in the bound editors rebuilds the layout.
void DocumentView::refresh() {
    if (!layoutMatches()) {
        rebuild();
        return;
    }
    const DocState& state = m_doc->state();
    int pos = 0;
    for (int i = 0; i < state.blockCount(); ++i) {
        const Block& b = state.block(i);
        if (!m_codeViews->bindingFor(b.id))
            updateBlockWidget(m_blockWidgets[i], b, pos);
        pos += b.nodeSize();
    }
}

bool DocumentView::layoutMatches() const {
    const DocState& state = m_doc->state();
    if (state.blockCount() != m_blockIds.size())
        return false;
    for (int i = 0; i < state.blockCount(); ++i) {
        const Block& b = state.block(i);
        if (b.id != m_blockIds[i] || b.type != m_blockTypes[i])
            return false;
        CodeBlockBinding* binding = m_codeViews->bindingFor(b.id);
        QWidget* w = m_blockWidgets[i];
        if (binding ? w != binding->editor()->widget() : !m_owned.contains(w))
            return false;
    }
    return true;
}

void DocumentView::rebuild() {
    while (QLayoutItem* item = m_layout->takeAt(0))
        delete item;
    qDeleteAll(m_owned);
    m_owned.clear();
    m_blockWidgets.clear();
    m_blockIds.clear();
    m_blockTypes.clear();

    const DocState& state = m_doc->state();
    int pos = 0;
    for (const Block& b : state.blocks()) {
        QWidget* w = nullptr;
        if (CodeBlockBinding* binding = m_codeViews->bindingFor(b.id)) {
            w = binding->editor()->widget();
        } else {
            w = makeBlockWidget(b);
            updateBlockWidget(w, b, pos);
            m_owned.append(w);
        }
        m_layout->addWidget(w);
        w->show();
        m_blockWidgets.append(w);
        m_blockIds.append(b.id);
        m_blockTypes.append(b.type);
        pos += b.nodeSize();
    }
    m_layout->addStretch();

    setStyleSheet(QStringLiteral("background: %1; color: %2;")
                  .arg(m_theme.backgroundAlt.name(), m_theme.text.name()));
}

QWidget* DocumentView::makeBlockWidget(const Block& block) {
    if (block.type == NodeType::HorizontalRule) {
        auto* rule = new QFrame(this);
        rule->setAttribute(Qt::WA_TransparentForMouseEvents);
        rule->setFrameShape(QFrame::HLine);
        return rule;
    }

    auto* label = new QLabel(this);
    label->setAttribute(Qt::WA_TransparentForMouseEvents);
    label->setTextFormat(Qt::PlainText);
    label->setWordWrap(true);

    if (block.type == NodeType::Heading) {
        QFont f = label->font();
        f.setBold(true);
        f.setPointSizeF(f.pointSizeF() * 1.4);
        label->setFont(f);
    }
    return label;
}

void DocumentView::updateBlockWidget(QWidget* w, const Block& block, int pos) {
    const Selection& sel = m_doc->selection();
    const bool nodeSelected = (sel.kind == Selection::Node && sel.anchor == pos)
                           || sel.kind == Selection::All;

    auto* label = qobject_cast<QLabel*>(w);
    if (!label) {
        if (auto* rule = qobject_cast<QFrame*>(w))
            rule->setLineWidth(nodeSelected ? 3 : 1);
        return;
    }

    QString text = block.type == NodeType::Image ? tr("[image]") : block.text;
    if (isTextblock(block.type) && sel.kind == Selection::Text && hasFocus()) {
        int offset = sel.head - pos - 1;
        if (offset >= 0 && offset <= block.text.size())
            text.insert(offset, QChar(0x2502));
    }
    label->setText(text.isEmpty() ? QStringLiteral(" ") : text);
    label->setStyleSheet(nodeSelected
        ? QStringLiteral("background: %1;").arg(m_theme.selection.name())
        : QString());
}

// ── Host editing ──

bool DocumentView::moveCursor(navigator::Direction dir) {
    if (m_codeViews->handleArrow(dir))
        return true;

    const DocState& state = m_doc->state();
    const Selection& sel = m_doc->selection();
    int side = navigator::sign(dir);
    std::optional<Selection> next;

    if (sel.kind == Selection::Node) {
        next = state.selectionNear(side < 0 ? sel.from() : sel.to(), side);
    } else if (navigator::unitOf(dir) == navigator::Unit::Char) {
        int target = sel.head + side;
        if (state.resolve(target).atBoundary())
            next = state.selectionNear(target, side);
        else
            next = Selection::cursor(target);
    } else {
        ResolvedPos rp = state.resolve(sel.head);
        int idx = rp.atBoundary() ? (side < 0 ? rp.indexBefore : rp.indexAfter) : rp.blockIndex;
        if (idx < 0) return false;
        int start = state.positionOf(idx);
        next = state.selectionNear(side < 0 ? start : start + state.block(idx).nodeSize(), side);
    }
    if (!next)
        return false;

    Transaction tr = m_doc->transaction();
    tr.setSelection(*next).scrollIntoView();
    m_doc->dispatch(tr);
    return true;
}

bool DocumentView::deleteBackward() {
    const DocState& state = m_doc->state();
    const Selection& sel = m_doc->selection();
    Transaction tr = m_doc->transaction();

    if (sel.kind == Selection::Node) {
        if (!tr.deleteRange(sel.from(), sel.to())) return false;
    } else if (sel.kind == Selection::Text && !sel.empty()) {
        if (!tr.replaceWith(sel.from(), sel.to(), QString())) return false;
    } else if (sel.kind == Selection::Text) {
        ResolvedPos rp = state.resolve(sel.head);
        if (rp.atBoundary() || rp.parentOffset == 0) return false;
        if (!tr.replaceWith(sel.head - 1, sel.head, QString())) return false;
    } else {
        return false;
    }
    tr.label = QStringLiteral("Delete");
    m_doc->dispatch(tr);
    return true;
}

void DocumentView::keyPressEvent(QKeyEvent* event) {
    using navigator::Direction;
    bool handled = true;

    if (event->matches(QKeySequence::Undo))
        m_doc->undo();
    else if (event->matches(QKeySequence::Redo))
        m_doc->redo();
    else if (event->matches(QKeySequence::SelectAll))
        m_doc->selectAll();
    else {
        switch (event->key()) {
        case Qt::Key_Left:      moveCursor(Direction::Left);  break;
        case Qt::Key_Right:     moveCursor(Direction::Right); break;
        case Qt::Key_Up:        moveCursor(Direction::Up);    break;
        case Qt::Key_Down:      moveCursor(Direction::Down);  break;
        case Qt::Key_Backspace: deleteBackward();             break;
        case Qt::Key_Return:
        case Qt::Key_Enter:     m_doc->insertParagraph();     break;
        default: {
            const QString text = event->text();
            if (!text.isEmpty() && text.at(0).isPrint())
                m_doc->insertText(text);
            else
                handled = false;
        }
        }
    }

    if (handled)
        event->accept();
    else
        QWidget::keyPressEvent(event);
}

void DocumentView::mousePressEvent(QMouseEvent* event) {
    // Clicking a text block puts the caret at its end
    for (int i = 0; i < m_blockWidgets.size() && i < m_doc->state().blockCount(); ++i) {
        if (!m_blockWidgets[i]->geometry().contains(event->pos()))
            continue;
        const DocState& state = m_doc->state();
        const Block& b = state.block(i);
        int pos = state.positionOf(i);
        Transaction tr = m_doc->transaction();
        tr.setSelection(isTextblock(b.type) ? Selection::cursor(pos + 1 + b.text.size())
                                            : Selection::node(pos, b.nodeSize()));
        m_doc->dispatch(tr);
        break;
    }
    focus();
    QWidget::mousePressEvent(event);
}

void DocumentView::focusInEvent(QFocusEvent* event) {
    QWidget::focusInEvent(event);
    refresh();
}

void DocumentView::focusOutEvent(QFocusEvent* event) {
    QWidget::focusOutEvent(event);
    refresh();
}

} // namespace cbx
