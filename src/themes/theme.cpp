#include "theme.h"
#include <type_traits>

namespace cbx {

// ── Shared field metadata (serialization) ──

const ThemeFieldMeta kThemeFields[] = {
    {"background",     &Theme::background},
    {"backgroundAlt",  &Theme::backgroundAlt},
    {"text",           &Theme::text},
    {"textDim",        &Theme::textDim},
    {"selection",      &Theme::selection},
    {"border",         &Theme::border},
    {"borderRaw",      &Theme::borderRaw},
    {"borderChunk",    &Theme::borderChunk},
    {"borderFocused",  &Theme::borderFocused},
    {"syntaxKeyword",  &Theme::syntaxKeyword},
    {"syntaxNumber",   &Theme::syntaxNumber},
    {"syntaxString",   &Theme::syntaxString},
    {"syntaxComment",  &Theme::syntaxComment},
    {"syntaxPreproc",  &Theme::syntaxPreproc},
    {"syntaxOperator", &Theme::syntaxOperator},
};
const int kThemeFieldCount = static_cast<int>(std::extent_v<decltype(kThemeFields)>);

// ── Border style tags ──

struct BorderTag {
    const char* cls;
    QColor Theme::* ptr;
};

static const BorderTag kBorderTags[] = {
    {"block-border",       &Theme::border},
    {"raw-block-border",   &Theme::borderRaw},
    {"chunk-border",       &Theme::borderChunk},
};

QColor Theme::borderColor(const QStringList& classes, bool active) const {
    if (active)
        return borderFocused;
    for (const QString& c : classes) {
        for (const auto& tag : kBorderTags) {
            if (c == QLatin1String(tag.cls))
                return this->*tag.ptr;
        }
    }
    return border;
}

QJsonObject Theme::toJson() const {
    QJsonObject o;
    o["name"] = name;
    for (int i = 0; i < kThemeFieldCount; i++)
        o[kThemeFields[i].key] = (this->*kThemeFields[i].ptr).name();
    return o;
}

Theme Theme::fromJson(const QJsonObject& o) {
    // Missing keys keep the dark palette
    Theme t = dark();
    t.name = o["name"].toString("Untitled");
    for (int i = 0; i < kThemeFieldCount; i++) {
        if (o.contains(kThemeFields[i].key)) {
            QColor c(o[kThemeFields[i].key].toString());
            if (c.isValid())
                t.*kThemeFields[i].ptr = c;
        }
    }
    return t;
}

Theme Theme::dark() {
    Theme t;
    t.name           = QStringLiteral("Dark");
    t.background     = QColor("#1e1e1e");
    t.backgroundAlt  = QColor("#252526");
    t.text           = QColor("#d4d4d4");
    t.textDim        = QColor("#858585");
    t.selection      = QColor("#264f78");
    t.border         = QColor("#3c3c3c");
    t.borderRaw      = QColor("#6a4c93");
    t.borderChunk    = QColor("#2d6a4f");
    t.borderFocused  = QColor("#007acc");
    t.syntaxKeyword  = QColor("#569cd6");
    t.syntaxNumber   = QColor("#b5cea8");
    t.syntaxString   = QColor("#ce9178");
    t.syntaxComment  = QColor("#6a9955");
    t.syntaxPreproc  = QColor("#c586c0");
    t.syntaxOperator = QColor("#d4d4d4");
    return t;
}

Theme Theme::light() {
    Theme t;
    t.name           = QStringLiteral("Light");
    t.background     = QColor("#ffffff");
    t.backgroundAlt  = QColor("#f3f3f3");
    t.text           = QColor("#1f1f1f");
    t.textDim        = QColor("#6e6e6e");
    t.selection      = QColor("#add6ff");
    t.border         = QColor("#d0d0d0");
    t.borderRaw      = QColor("#9b7fc4");
    t.borderChunk    = QColor("#74b49b");
    t.borderFocused  = QColor("#0066b8");
    t.syntaxKeyword  = QColor("#0000ff");
    t.syntaxNumber   = QColor("#098658");
    t.syntaxString   = QColor("#a31515");
    t.syntaxComment  = QColor("#008000");
    t.syntaxPreproc  = QColor("#af00db");
    t.syntaxOperator = QColor("#1f1f1f");
    return t;
}

Theme Theme::byName(const QString& name, bool* ok) {
    if (ok) *ok = true;
    if (name.compare(QLatin1String("light"), Qt::CaseInsensitive) == 0)
        return light();
    if (name.compare(QLatin1String("dark"), Qt::CaseInsensitive) != 0 && ok)
        *ok = false;
    return dark();
}

} // namespace cbx
