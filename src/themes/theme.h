#pragma once
#include <QColor>
#include <QString>
#include <QStringList>
#include <QJsonObject>

namespace cbx {

struct Theme {
    QString name;

    // ── Chrome ──
    QColor background;      // editor paper
    QColor backgroundAlt;   // run bar, margins
    QColor text;            // default text, caret
    QColor textDim;         // run bar buttons
    QColor selection;       // selection background

    // ── Borders (one per border style tag) ──
    QColor border;          // "block-border"
    QColor borderRaw;       // "raw-block-border"
    QColor borderChunk;     // "chunk-border"
    QColor borderFocused;   // any block while the editor is active

    // ── Syntax ──
    QColor syntaxKeyword;
    QColor syntaxNumber;
    QColor syntaxString;
    QColor syntaxComment;
    QColor syntaxPreproc;
    QColor syntaxOperator;

    // Border colour for a set of style classes; the first class naming a
    // border style wins.
    QColor borderColor(const QStringList& classes, bool active) const;

    QJsonObject toJson() const;
    static Theme fromJson(const QJsonObject& obj);

    static Theme dark();
    static Theme light();
    static Theme byName(const QString& name, bool* ok = nullptr);
};

struct ThemeFieldMeta {
    const char* key;
    QColor Theme::* ptr;
};

extern const ThemeFieldMeta kThemeFields[];
extern const int kThemeFieldCount;

} // namespace cbx
