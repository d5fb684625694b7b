#pragma once
#include "codeviews.h"
#include "themes/theme.h"
#include <QWidget>
#include <QVector>

class QVBoxLayout;

namespace cbx {

// ── Host document view ──
//
// Minimal block view for a Document: text blocks render as labels with a
// caret, bound code blocks show their inner editor widget.

class DocumentView : public QWidget, public HostView {
    Q_OBJECT
public:
    DocumentView(Document* doc, const EditorOptions& options, const Theme& theme,
                 QWidget* parent = nullptr);

    Document*     document() const override { return m_doc; }
    void          focus() override;
    bool          hasFocus() const override { return QWidget::hasFocus(); }

    void          registerCodeView(NodeType type, const CodeViewOptions& options);
    CodeViewHost* codeViews() const { return m_codeViews; }
    QWidget*      widgetForPos(int pos) const;
    void          applyTheme(const Theme& theme);

protected:
    void keyPressEvent(QKeyEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;
    void focusInEvent(QFocusEvent* event) override;
    void focusOutEvent(QFocusEvent* event) override;

private:
    Document*        m_doc;
    Theme            m_theme;
    CodeViewHost*    m_codeViews;
    QVBoxLayout*     m_layout;
    QVector<QWidget*> m_blockWidgets;   // one per block, document order
    QVector<quint64>  m_blockIds;       // block id and type behind each widget
    QVector<NodeType> m_blockTypes;
    QVector<QWidget*> m_owned;          // widgets this view created

    void refresh();
    void rebuild();
    bool layoutMatches() const;
    QWidget* makeBlockWidget(const Block& block);
    void updateBlockWidget(QWidget* w, const Block& block, int pos);
    bool moveCursor(navigator::Direction dir);
    bool deleteBackward();
};

} // namespace cbx
