#pragma once
#include "chunks.h"
#include <QStringList>
#include <functional>

class QSettings;

namespace cbx {

// ── Editor-wide settings ──

struct EditorOptions {
    QStringList chunkExecutionLanguages;   // empty: chunk execution disabled
    QString     fontName  = QStringLiteral("JetBrains Mono");
    int         tabWidth  = 2;
    QString     themeName = QStringLiteral("dark");

    static EditorOptions load(QSettings& settings);
    void save(QSettings& settings) const;

    // QSettings("Chunkbridge", "Chunkbridge")
    static EditorOptions loadDefault();
    void saveDefault() const;
};

// ── Per node type configuration ──

// Returns the language for a block given its current inner content; a null
// QString leaves the editor mode alone.
using LangFn         = std::function<QString(const Block& block, const QString& content)>;
using AttrEditFn     = std::function<void(Document* doc, HostView* view)>;
using ExecuteChunkFn = std::function<void(const Chunk& chunk)>;

struct CodeViewOptions {
    LangFn         lang;
    AttrEditFn     attrEditFn;        // optional; enables the attribute key
    ExecuteChunkFn executeChunkFn;    // optional; enables the run keys and bar
    QStringList    classes;
    QString        borderColorClass;  // theme border tag, "block-border" if empty
};

// Classifier using the chunk header language, then the block info string.
LangFn defaultLangClassifier();

} // namespace cbx
