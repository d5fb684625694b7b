#pragma once
#include "document.h"
#include <QStringList>
#include <optional>

namespace cbx {

// An executable unit of code handed to the chunk runner.
struct Chunk {
    QString lang;
    QString meta;    // chunk options after the language in a {lang ...} header
    QString code;
    int     lines = 0;
};

namespace chunks {

// Splits a leading "{lang options}" header off text. Without a header the
// whole text is code in defaultLang; nullopt when there is neither.
std::optional<Chunk> chunkFromText(const QString& text, const QString& defaultLang = {});
std::optional<Chunk> chunkFromBlock(const Block& block, const QString& defaultLang = {});

// Language of a block: the header language, else its info string.
QString blockLanguage(const Block& block);

// Case- and accent-insensitive language name comparison
bool sameLanguage(const QString& a, const QString& b);
bool isExecutableLanguage(const QString& lang, const QStringList& executable);

// Code blocks in lang from the start of the document through the one at pos.
QVector<Chunk> previousExecutableChunks(const DocState& doc, int pos, const QString& lang);
std::optional<Chunk> mergeChunks(const QVector<Chunk>& chunks);

} // namespace chunks
} // namespace cbx
