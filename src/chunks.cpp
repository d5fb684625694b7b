#include "chunks.h"
#include <QRegularExpression>

namespace cbx {
namespace chunks {

static int countLines(const QString& code) {
    return code.isEmpty() ? 0 : code.count(QLatin1Char('\n')) + 1;
}

std::optional<Chunk> chunkFromText(const QString& text, const QString& defaultLang) {
    static const QRegularExpression kHeader(
        QStringLiteral("^\\s*\\{([A-Za-z][\\w.+-]*)([\\s,].*)?\\}\\s*$"));

    int eol = text.indexOf(QLatin1Char('\n'));
    QString first = eol < 0 ? text : text.left(eol);
    QRegularExpressionMatch m = kHeader.match(first);
    if (m.hasMatch()) {
        Chunk c;
        c.lang = m.captured(1);
        c.meta = m.captured(2).trimmed();
        if (c.meta.startsWith(QLatin1Char(',')))
            c.meta = c.meta.mid(1).trimmed();
        c.code = eol < 0 ? QString() : text.mid(eol + 1);
        c.lines = countLines(c.code);
        return c;
    }
    if (defaultLang.isEmpty())
        return std::nullopt;

    Chunk c;
    c.lang = defaultLang;
    c.code = text;
    c.lines = countLines(c.code);
    return c;
}

std::optional<Chunk> chunkFromBlock(const Block& block, const QString& defaultLang) {
    if (!isCodeType(block.type))
        return std::nullopt;
    return chunkFromText(block.text, block.lang.isEmpty() ? defaultLang : block.lang);
}

QString blockLanguage(const Block& block) {
    if (auto c = chunkFromText(block.text, block.lang))
        return c->lang;
    return QString();
}

static QString foldAccents(const QString& s) {
    const QString decomposed = s.normalized(QString::NormalizationForm_D);
    QString out;
    out.reserve(decomposed.size());
    for (QChar ch : decomposed)
        if (ch.category() != QChar::Mark_NonSpacing)
            out.append(ch);
    return out;
}

bool sameLanguage(const QString& a, const QString& b) {
    return QString::compare(foldAccents(a), foldAccents(b), Qt::CaseInsensitive) == 0;
}

bool isExecutableLanguage(const QString& lang, const QStringList& executable) {
    if (lang.isEmpty())
        return false;
    for (const QString& l : executable)
        if (sameLanguage(lang, l)) return true;
    return false;
}

QVector<Chunk> previousExecutableChunks(const DocState& doc, int pos, const QString& lang) {
    QVector<Chunk> out;
    int p = 0;
    for (const Block& b : doc.blocks()) {
        if (p > pos) break;
        if (auto c = chunkFromBlock(b))
            if (sameLanguage(c->lang, lang)) out.append(*c);
        p += b.nodeSize();
    }
    return out;
}

std::optional<Chunk> mergeChunks(const QVector<Chunk>& chunks) {
    if (chunks.isEmpty())
        return std::nullopt;
    Chunk merged = chunks.first();
    QStringList parts;
    for (const Chunk& c : chunks) parts << c.code;
    merged.code = parts.join(QLatin1Char('\n'));
    merged.lines = countLines(merged.code);
    return merged;
}

} // namespace chunks
} // namespace cbx
