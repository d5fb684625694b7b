#include "keymap.h"
#include <type_traits>

namespace cbx {

const KeyBinding kKeyBindings[] = {
    // action                         name                   default                                        mac
    {KeyAction::MoveLeft,          "leftEscape",          "Left",                                        nullptr},
    {KeyAction::MoveRight,         "rightEscape",         "Right",                                       nullptr},
    {KeyAction::MoveUp,            "upEscape",            "Up",                                          nullptr},
    {KeyAction::MoveDown,          "downEscape",          "Down",                                        nullptr},
    {KeyAction::Backspace,         "backspaceDeleteNode", "Backspace",                                   nullptr},
    {KeyAction::Undo,              "undoHost",            "Ctrl+Z",                                      nullptr},
    {KeyAction::Redo,              "redoHost",            "Ctrl+Shift+Z|Ctrl+Y",                         nullptr},
    {KeyAction::SelectAll,         "selectAllHost",       "Ctrl+A",                                      nullptr},
    {KeyAction::ExitBlock,         "exitCodeBlock",       "Ctrl+Return|Shift+Return|Ctrl+Enter|Shift+Enter",
                                                          "Meta+Return|Shift+Return|Ctrl+Return|Meta+Enter|Shift+Enter|Ctrl+Enter"},
    {KeyAction::InsertParagraph,   "insertParagraph",     "Ctrl+\\",                                     nullptr},
    {KeyAction::EditAttributes,    "editAttributes",      "F4",                                          nullptr},
    {KeyAction::RunChunk,          "runChunk",            "Ctrl+Shift+Return|Ctrl+Shift+Enter",          nullptr},
    {KeyAction::RunPreviousChunks, "runPreviousChunks",   "Ctrl+Alt+P",                                  nullptr},
};
const int kKeyBindingCount = static_cast<int>(std::extent_v<decltype(kKeyBindings)>);

Platform currentPlatform() {
#ifdef Q_OS_MACOS
    return Platform::Mac;
#else
    return Platform::Default;
#endif
}

const KeyBinding* keyBindingFor(KeyAction action) {
    for (const auto& b : kKeyBindings)
        if (b.action == action) return &b;
    return nullptr;
}

QList<QKeySequence> parseKeys(const char* keys) {
    QList<QKeySequence> out;
    if (!keys) return out;
    const QStringList parts = QString::fromLatin1(keys).split(QLatin1Char('|'), Qt::SkipEmptyParts);
    for (const QString& p : parts) {
        QKeySequence seq = QKeySequence::fromString(p.trimmed(), QKeySequence::PortableText);
        if (!seq.isEmpty())
            out.append(seq);
    }
    return out;
}

QList<QKeySequence> keysFor(const KeyBinding& binding, Platform platform) {
    if (platform == Platform::Mac && binding.macKeys)
        return parseKeys(binding.macKeys);
    return parseKeys(binding.defaultKeys);
}

QVector<int> registerKeyBindings(InnerEditor* editor, Platform platform,
                                 const KeyActionHandler& handlerFor) {
    QVector<int> handles;
    for (const auto& b : kKeyBindings) {
        InnerEditor::KeyHandler handler = handlerFor(b.action);
        if (!handler)
            continue;   // optional action not configured
        handles.append(editor->addKeyCommand(QString::fromLatin1(b.name),
                                             keysFor(b, platform), std::move(handler)));
    }
    return handles;
}

} // namespace cbx
