#include "mainwindow.h"
#include "codeeditor.h"
#include <QApplication>
#include <QDebug>
#include <QAction>
#include <QActionGroup>
#include <QDockWidget>
#include <QFileDialog>
#include <QFileInfo>
#include <QInputDialog>
#include <QLineEdit>
#include <QLabel>
#include <QMenuBar>
#include <QMessageBox>
#include <QPlainTextEdit>
#include <QScrollArea>
#include <QStatusBar>

namespace cbx {

MainWindow::MainWindow(QWidget* parent) : QMainWindow(parent) {
    m_options = EditorOptions::loadDefault();
    bool themeOk = false;
    m_theme = Theme::byName(m_options.themeName, &themeOk);
    if (!themeOk)
        qWarning() << "MainWindow: Unknown theme" << m_options.themeName << "(using dark)";

    m_doc = new Document(this);
    m_doc->reset(demoDocument(), Selection::cursor(1));

    m_view = new DocumentView(m_doc, m_options, m_theme);

    CodeViewOptions code;
    code.lang           = defaultLangClassifier();
    code.attrEditFn     = [this](Document* doc, HostView* view) { editAttributes(doc, view); };
    code.executeChunkFn = [this](const Chunk& chunk) { runChunk(chunk); };
    code.classes        = {QStringLiteral("code-block")};
    code.borderColorClass = QStringLiteral("chunk-border");
    m_view->registerCodeView(NodeType::CodeBlock, code);

    CodeViewOptions raw;
    raw.lang = [](const Block& block, const QString&) { return block.lang; };
    raw.attrEditFn = code.attrEditFn;
    raw.classes = {QStringLiteral("raw-block")};
    raw.borderColorClass = QStringLiteral("raw-block-border");
    m_view->registerCodeView(NodeType::RawBlock, raw);

    m_scroll = new QScrollArea(this);
    m_scroll->setWidgetResizable(true);
    m_scroll->setWidget(m_view);
    setCentralWidget(m_scroll);

    createMenus();
    createStatusBar();
    createOutputDock();

    connect(m_doc, &Document::stateChanged, this, &MainWindow::updateStatus);
    connect(m_doc, &Document::scrollRequested, this, [this](int pos) {
        if (QWidget* w = m_view->widgetForPos(pos))
            m_scroll->ensureWidgetVisible(w);
    });
    connect(&m_doc->undoStack, &QUndoStack::cleanChanged, this, &MainWindow::updateWindowTitle);

    updateWindowTitle();
    updateStatus();
    resize(900, 700);
    m_view->focus();
}

DocState MainWindow::demoDocument() {
    auto block = [](NodeType type, const QString& text, const QString& lang = {}) {
        Block b;
        b.type = type;
        b.text = text;
        b.lang = lang;
        return b;
    };
    return DocState({
        block(NodeType::Heading,   QStringLiteral("Chunkbridge")),
        block(NodeType::Paragraph, QStringLiteral("Arrow into the code below, or type ``` in an empty paragraph.")),
        block(NodeType::CodeBlock, QStringLiteral("{r setup}\nx <- rnorm(100)\nsummary(x)")),
        block(NodeType::HorizontalRule, QString()),
        block(NodeType::CodeBlock, QStringLiteral("import math\nprint(math.pi)"), QStringLiteral("python")),
        block(NodeType::RawBlock,  QStringLiteral("<div class=\"note\"></div>"), QStringLiteral("html")),
        block(NodeType::Paragraph, QString()),
    });
}

// ── Menus ──

void MainWindow::createMenus() {
    auto* file = menuBar()->addMenu(tr("&File"));
    file->addAction(tr("&New"), this, &MainWindow::newFile, QKeySequence::New);
    file->addAction(tr("&Open..."), this, &MainWindow::openFile, QKeySequence::Open);
    file->addAction(tr("&Save"), this, &MainWindow::saveFile, QKeySequence::Save);
    file->addAction(tr("Save &As..."), this, &MainWindow::saveFileAs, QKeySequence::SaveAs);
    file->addSeparator();
    file->addAction(tr("E&xit"), this, &QWidget::close, QKeySequence::Quit);

    // Undo/redo keys belong to the focused surface; the menu items are unbound
    auto* edit = menuBar()->addMenu(tr("&Edit"));
    edit->addAction(tr("&Undo"), this, &MainWindow::undo);
    edit->addAction(tr("&Redo"), this, &MainWindow::redo);

    auto* view = menuBar()->addMenu(tr("&View"));
    auto* themes = view->addMenu(tr("&Theme"));
    auto* group = new QActionGroup(this);
    for (const QString& name : {QStringLiteral("dark"), QStringLiteral("light")}) {
        QAction* act = themes->addAction(name);
        act->setCheckable(true);
        act->setChecked(name.compare(m_theme.name, Qt::CaseInsensitive) == 0);
        group->addAction(act);
        connect(act, &QAction::triggered, this, [this, name]() { setTheme(name); });
    }

    auto* help = menuBar()->addMenu(tr("&Help"));
    help->addAction(tr("&About"), this, &MainWindow::about);
}

void MainWindow::createStatusBar() {
    m_statusLabel = new QLabel(this);
    statusBar()->addWidget(m_statusLabel, 1);
}

void MainWindow::createOutputDock() {
    m_outputDock = new QDockWidget(tr("Chunk Output"), this);
    m_outputDock->setObjectName(QStringLiteral("chunkOutputDock"));
    m_output = new QPlainTextEdit(m_outputDock);
    m_output->setReadOnly(true);
    m_outputDock->setWidget(m_output);
    addDockWidget(Qt::BottomDockWidgetArea, m_outputDock);
    m_outputDock->hide();
}

void MainWindow::updateWindowTitle() {
    QString name = m_doc->filePath.isEmpty() ? tr("Untitled")
                                             : QFileInfo(m_doc->filePath).fileName();
    if (!m_doc->undoStack.isClean())
        name += QStringLiteral(" *");
    setWindowTitle(name + QStringLiteral(" - Chunkbridge"));
}

void MainWindow::updateStatus() {
    const Selection& sel = m_doc->selection();
    static const char* kKinds[] = {"text", "node", "all"};
    m_statusLabel->setText(tr("%1 selection %2-%3   blocks %4   code views %5")
        .arg(QLatin1String(kKinds[sel.kind]))
        .arg(sel.anchor).arg(sel.head)
        .arg(m_doc->state().blockCount())
        .arg(m_view->codeViews()->bindingCount()));
    updateWindowTitle();
}

// ── Actions ──

void MainWindow::newFile() {
    Block p;
    p.type = NodeType::Paragraph;
    m_doc->filePath.clear();
    m_doc->reset(DocState({p}), Selection::cursor(1));
    m_view->focus();
}

void MainWindow::openFile() {
    QString path = QFileDialog::getOpenFileName(this, tr("Open Document"), QString(),
                                                tr("Chunkbridge Documents (*.cbx);;All Files (*)"));
    if (path.isEmpty()) return;
    if (!m_doc->load(path))
        QMessageBox::warning(this, tr("Open"), tr("Could not open %1").arg(path));
    m_view->focus();
}

void MainWindow::saveFile() {
    if (m_doc->filePath.isEmpty()) {
        saveFileAs();
        return;
    }
    if (!m_doc->save(m_doc->filePath))
        QMessageBox::warning(this, tr("Save"), tr("Could not write %1").arg(m_doc->filePath));
}

void MainWindow::saveFileAs() {
    QString path = QFileDialog::getSaveFileName(this, tr("Save Document"), QString(),
                                                tr("Chunkbridge Documents (*.cbx)"));
    if (path.isEmpty()) return;
    if (!m_doc->save(path))
        QMessageBox::warning(this, tr("Save"), tr("Could not write %1").arg(path));
    updateWindowTitle();
}

void MainWindow::undo() { m_doc->undo(); }
void MainWindow::redo() { m_doc->redo(); }

void MainWindow::setTheme(const QString& name) {
    bool ok = false;
    m_theme = Theme::byName(name, &ok);
    m_view->applyTheme(m_theme);
    m_options.themeName = m_theme.name;
    m_options.saveDefault();
}

void MainWindow::about() {
    QMessageBox::about(this, tr("About Chunkbridge"),
        tr("Chunkbridge\n\nEmbedded code editors kept in sync with a block document."));
}

void MainWindow::runChunk(const Chunk& chunk) {
    m_output->appendPlainText(tr("> run %1 chunk (%2 lines)%3")
        .arg(chunk.lang).arg(chunk.lines)
        .arg(chunk.meta.isEmpty() ? QString() : QStringLiteral(" {") + chunk.meta + QLatin1Char('}')));
    m_output->appendPlainText(chunk.code);
    m_outputDock->show();
}

void MainWindow::editAttributes(Document* doc, HostView* view) {
    ResolvedPos rp = doc->state().resolve(doc->selection().head);
    if (rp.atBoundary()) return;
    const Block b = doc->state().block(rp.blockIndex);
    int pos = doc->state().positionOf(rp.blockIndex);

    bool ok = false;
    QString lang = QInputDialog::getText(this, tr("Block Attributes"), tr("Language:"),
                                         QLineEdit::Normal, b.lang, &ok);
    if (!ok) {
        view->focus();
        return;
    }

    Transaction tr = doc->transaction();
    if (tr.setBlockType(pos, b.type, lang.trimmed())) {
        tr.label = QStringLiteral("Edit Attributes");
        doc->dispatch(tr);
    }
}

} // namespace cbx

int main(int argc, char* argv[]) {
    QApplication app(argc, argv);
    app.setApplicationName("Chunkbridge");
    app.setOrganizationName("Chunkbridge");
    app.setStyle("Fusion");

    // Apply saved font preference before creating any editors
    cbx::CodeEditor::setGlobalFontName(cbx::EditorOptions::loadDefault().fontName);

    cbx::MainWindow window;
    window.show();
    return app.exec();
}
