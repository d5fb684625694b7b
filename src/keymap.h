#pragma once
#include "innereditor.h"
#include <QVector>

namespace cbx {

enum class KeyAction {
    MoveLeft, MoveRight, MoveUp, MoveDown, Backspace,
    Undo, Redo, SelectAll, ExitBlock, InsertParagraph,
    EditAttributes, RunChunk, RunPreviousChunks
};

enum class Platform { Default, Mac };

// Keys use QKeySequence::PortableText, '|' separated. Qt already maps
// "Ctrl" to Command on macOS, so "Meta" there means the Control key.
struct KeyBinding {
    KeyAction   action;
    const char* name;
    const char* defaultKeys;
    const char* macKeys;      // nullptr: same as defaultKeys
};

extern const KeyBinding kKeyBindings[];
extern const int kKeyBindingCount;

Platform currentPlatform();
const KeyBinding* keyBindingFor(KeyAction action);
QList<QKeySequence> parseKeys(const char* keys);
QList<QKeySequence> keysFor(const KeyBinding& binding, Platform platform);

// Registers every table entry whose handler is non-empty; returns the
// handles for InnerEditor::removeKeyCommand().
using KeyActionHandler = std::function<InnerEditor::KeyHandler(KeyAction)>;
QVector<int> registerKeyBindings(InnerEditor* editor, Platform platform,
                                 const KeyActionHandler& handlerFor);

} // namespace cbx
