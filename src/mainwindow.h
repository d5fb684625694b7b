#pragma once
#include "documentview.h"
#include <QMainWindow>

class QLabel;
class QPlainTextEdit;
class QDockWidget;
class QScrollArea;
class QActionGroup;

namespace cbx {

class MainWindow : public QMainWindow {
    Q_OBJECT
public:
    explicit MainWindow(QWidget* parent = nullptr);

private slots:
    void newFile();
    void openFile();
    void saveFile();
    void saveFileAs();
    void undo();
    void redo();
    void setTheme(const QString& name);
    void about();

private:
    EditorOptions   m_options;
    Theme           m_theme;
    Document*       m_doc         = nullptr;
    DocumentView*   m_view        = nullptr;
    QScrollArea*    m_scroll      = nullptr;
    QDockWidget*    m_outputDock  = nullptr;
    QPlainTextEdit* m_output      = nullptr;
    QLabel*         m_statusLabel = nullptr;

    void createMenus();
    void createStatusBar();
    void createOutputDock();
    void updateWindowTitle();
    void updateStatus();

    void runChunk(const Chunk& chunk);
    void editAttributes(Document* doc, HostView* view);
    static DocState demoDocument();
};

} // namespace cbx
