#include "options.h"
#include <QDebug>
#include <QSettings>

namespace cbx {

static const char* kOrg = "Chunkbridge";
static const char* kApp = "Chunkbridge";

EditorOptions EditorOptions::load(QSettings& settings) {
    EditorOptions o;
    o.chunkExecutionLanguages = settings.value("chunkExecutionLanguages").toStringList();
    o.fontName  = settings.value("font", o.fontName).toString();
    o.themeName = settings.value("theme", o.themeName).toString();

    bool ok = false;
    int tab = settings.value("tabWidth", o.tabWidth).toInt(&ok);
    if (ok && tab >= 1 && tab <= 16)
        o.tabWidth = tab;
    else
        qWarning() << "EditorOptions: Ignoring invalid tabWidth"
                   << settings.value("tabWidth").toString();
    return o;
}

void EditorOptions::save(QSettings& settings) const {
    settings.setValue("chunkExecutionLanguages", chunkExecutionLanguages);
    settings.setValue("font", fontName);
    settings.setValue("tabWidth", tabWidth);
    settings.setValue("theme", themeName);
}

EditorOptions EditorOptions::loadDefault() {
    QSettings settings(kOrg, kApp);
    return load(settings);
}

void EditorOptions::saveDefault() const {
    QSettings settings(kOrg, kApp);
    save(settings);
}

LangFn defaultLangClassifier() {
    return [](const Block& block, const QString& content) -> QString {
        Block current = block;
        current.text = content;
        return chunks::blockLanguage(current);
    };
}

} // namespace cbx
