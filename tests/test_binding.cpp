#include <QtTest/QTest>
#include <QtTest/QSignalSpy>
#include <QCoreApplication>
#include <memory>
#include "fakeeditor.h"

using namespace cbx;

static QKeySequence key(const char* s) {
    return QKeySequence::fromString(QString::fromLatin1(s), QKeySequence::PortableText);
}

static CodeViewOptions codeOptions() {
    CodeViewOptions o;
    o.lang = defaultLangClassifier();
    o.classes = {QStringLiteral("code-block")};
    return o;
}

// Host document with code blocks bound to fake editors
struct Fixture {
    FakeHost                      host;
    std::unique_ptr<CodeViewHost> views;

    Fixture(const QVector<Block>& blocks, const Selection& sel,
            const CodeViewOptions& options = codeOptions(),
            const EditorOptions& editorOptions = {}) {
        host.doc.reset(DocState(blocks), sel);
        views.reset(new CodeViewHost(&host, editorOptions, host.factory()));
        views->registerNodeType(NodeType::CodeBlock, options);
        host.onFocused = [this]() { views->focusSelection(); };
    }

    Document& doc() { return host.doc; }
    const Block& block(int idx) { return host.doc.state().block(idx); }
    int pos(int idx) { return host.doc.state().positionOf(idx); }
    CodeBlockBinding* binding(int idx) { return views->bindingFor(block(idx).id); }
    FakeEditor* editor(int idx) { return static_cast<FakeEditor*>(binding(idx)->editor()); }
};

class TestBinding : public QObject {
    Q_OBJECT
private slots:
    // ── Creation ──

    void createsOneBindingPerCodeBlock() {
        Fixture f({makeBlock(NodeType::Paragraph, "intro"),
                   makeBlock(NodeType::CodeBlock, "x <- 1", "r"),
                   makeBlock(NodeType::CodeBlock, "{python}\nprint(1)")},
                  Selection::cursor(1));
        QCOMPARE(f.views->bindingCount(), 2);
        QVERIFY(!f.views->bindingFor(f.block(0).id));

        FakeEditor* ed = f.editor(1);
        QCOMPARE(ed->buffer, QString("x <- 1"));
        QCOMPARE(ed->currentMode, QString("r"));
        QCOMPARE(f.editor(2)->currentMode, QString("python"));
        QVERIFY(ed->classes.contains("code-editor"));
        QVERIFY(ed->classes.contains("code-block"));
        QVERIFY(ed->classes.contains("block-border"));
        QVERIFY(!ed->focused);
        QCOMPARE(f.binding(1)->syncState(), SyncState::Idle);
    }

    // ── Host -> inner ──

    void hostEditsReachInnerBuffer() {
        // [P "intro"] 0..7  [Code] 7..22
        Fixture f({makeBlock(NodeType::Paragraph, "intro"),
                   makeBlock(NodeType::CodeBlock, "x <- 1\ny <- 2", "r")},
                  Selection::cursor(1));
        FakeEditor* ed = f.editor(1);

        Transaction tr = f.doc().transaction();
        QVERIFY(tr.replaceWith(8 + 5, 8 + 6, "10"));
        f.doc().dispatch(tr);
        QCOMPARE(ed->buffer, QString("x <- 10\ny <- 2"));
        QCOMPARE(ed->buffer, f.block(1).text);

        tr = f.doc().transaction();
        QVERIFY(tr.replaceWith(8, 8 + 8, QString()));
        f.doc().dispatch(tr);
        QCOMPARE(ed->buffer, QString("y <- 2"));

        // Patches applied under the guard never come back as host edits
        QCOMPARE(f.doc().undoStack.count(), 2);

        QVERIFY(f.doc().undo());
        QVERIFY(f.doc().undo());
        QCOMPARE(ed->buffer, QString("x <- 1\ny <- 2"));
        QCOMPARE(f.doc().undoStack.count(), 2);
        QVERIFY(!diff::computeChange(ed->buffer, f.block(1).text).has_value());
    }

    void updateRejectsOtherNodeType() {
        Fixture f({makeBlock(NodeType::CodeBlock, "abc")}, Selection::cursor(1));
        CodeBlockBinding* b = f.binding(0);
        Block raw = f.block(0);
        raw.type = NodeType::RawBlock;
        raw.text = "zzz";
        QVERIFY(!b->update(raw));
        QCOMPARE(b->block().type, NodeType::CodeBlock);
        QCOMPARE(f.editor(0)->buffer, QString("abc"));
    }

    void recreatedOnTypeChange() {
        Fixture f({makeBlock(NodeType::Paragraph),
                   makeBlock(NodeType::CodeBlock, "<b>hi</b>", "html")},
                  Selection::cursor(1));
        f.views->registerNodeType(NodeType::RawBlock, codeOptions());
        CodeBlockBinding* before = f.binding(1);
        QSignalSpy created(f.views.get(), &CodeViewHost::bindingCreated);
        QSignalSpy removed(f.views.get(), &CodeViewHost::bindingRemoved);

        Transaction tr = f.doc().transaction();
        QVERIFY(tr.setBlockType(f.pos(1), NodeType::RawBlock, "html"));
        f.doc().dispatch(tr);

        QCOMPARE(removed.count(), 1);
        QCOMPARE(created.count(), 1);
        CodeBlockBinding* after = f.binding(1);
        QVERIFY(after && after != before);
        QCOMPARE(after->block().type, NodeType::RawBlock);
        QCOMPARE(f.editor(1)->buffer, QString("<b>hi</b>"));
    }

    // ── Inner -> host ──

    void innerTypingDispatchesMinimalChange() {
        Fixture f({makeBlock(NodeType::Paragraph, "intro"),
                   makeBlock(NodeType::CodeBlock, "x <- 1\ny <- 2", "r")},
                  Selection::cursor(1));
        FakeEditor* ed = f.editor(1);

        ed->focus();
        QCOMPARE(f.doc().selection(), Selection::cursor(8));
        ed->placeCursor(0, 6);
        QCOMPARE(f.doc().selection(), Selection::cursor(14));

        ed->type("0");
        QCOMPARE(f.block(1).text, QString("x <- 10\ny <- 2"));
        QCOMPARE(f.doc().selection(), Selection::cursor(15));
        QCOMPARE(f.doc().undoStack.count(), 1);
        QCOMPARE(ed->buffer, f.block(1).text);
        QCOMPARE(ed->sel.head, (TextPoint{0, 7}));
    }

    void innerDeletionAndUndo() {
        Fixture f({makeBlock(NodeType::CodeBlock, "abc\ndef")}, Selection::cursor(1));
        FakeEditor* ed = f.editor(0);
        QVERIFY(ed->focused);

        ed->setSelection({{0, 1}, {1, 2}});
        ed->type(QString());
        QCOMPARE(f.block(0).text, QString("af"));

        QVERIFY(ed->press(key("Ctrl+Z")));
        QCOMPARE(f.block(0).text, QString("abc\ndef"));
        QCOMPARE(ed->buffer, QString("abc\ndef"));

        QVERIFY(ed->press(key("Ctrl+Y")));
        QCOMPARE(ed->buffer, QString("af"));
        QVERIFY(ed->press(key("Ctrl+Shift+Z")));   // nothing left to redo
        QCOMPARE(ed->buffer, QString("af"));
    }

    void forwardedSelectionKeepsDirection() {
        // [P "intro"] 0..7  [Code "x <- 1\ny <- 2"] content from 8
        Fixture f({makeBlock(NodeType::Paragraph, "intro"),
                   makeBlock(NodeType::CodeBlock, "x <- 1\ny <- 2", "r")},
                  Selection::cursor(1));
        FakeEditor* ed = f.editor(1);
        ed->focus();

        ed->setSelection({{1, 3}, {0, 1}});
        QCOMPARE(f.doc().selection(), Selection::text(18, 9));
    }

    void unfocusedEditorDoesNotForward() {
        Fixture f({makeBlock(NodeType::Paragraph, "intro"),
                   makeBlock(NodeType::CodeBlock, "abc")},
                  Selection::cursor(1));
        QSignalSpy changed(&f.doc(), &Document::stateChanged);
        f.editor(1)->placeCursor(0, 2);
        QCOMPARE(changed.count(), 0);
        QCOMPARE(f.doc().selection(), Selection::cursor(1));
    }

    void hostSelectionRoutesIntoEditor() {
        Fixture f({makeBlock(NodeType::Paragraph, "intro"),
                   makeBlock(NodeType::CodeBlock, "abc\ndef")},
                  Selection::cursor(1));
        FakeEditor* ed = f.editor(1);

        Transaction tr = f.doc().transaction();
        tr.setSelection(Selection::text(8 + 1, 8 + 6));
        f.doc().dispatch(tr);

        QVERIFY(ed->focused);
        QVERIFY(ed->active);
        QCOMPARE(ed->sel.anchor, (TextPoint{0, 1}));
        QCOMPARE(ed->sel.head, (TextPoint{1, 2}));
        QCOMPARE(f.doc().selection(), Selection::text(9, 14));
        QVERIFY(!f.host.focused);
    }

    void nodeSelectionFocusesEditor() {
        Fixture f({makeBlock(NodeType::Paragraph, "intro"),
                   makeBlock(NodeType::CodeBlock, "abc")},
                  Selection::cursor(1));
        FakeEditor* ed = f.editor(1);

        Transaction tr = f.doc().transaction();
        tr.setSelection(Selection::node(7, 5));
        f.doc().dispatch(tr);

        QVERIFY(ed->focused);
        // Focus forwards the inner cursor, replacing the node selection
        QCOMPARE(f.doc().selection(), Selection::cursor(8));
    }

    // ── Boundary navigation ──

    void escapeWithoutTargetIsNoop() {
        Fixture f({makeBlock(NodeType::CodeBlock, "abc")}, Selection::cursor(1));
        FakeEditor* ed = f.editor(0);
        ed->placeCursor(0, 0);
        QVERIFY(ed->focused);

        QSignalSpy changed(&f.doc(), &Document::stateChanged);
        int focusCalls = f.host.focusCalls;
        QVERIFY(ed->press(key("Left")));

        QCOMPARE(changed.count(), 0);
        QCOMPARE(f.doc().selection(), Selection::cursor(1));
        QCOMPARE(f.host.focusCalls, focusCalls);
        QVERIFY(ed->focused);
        QVERIFY(ed->executed.isEmpty());
    }

    void escapeSelectsPrecedingAtom() {
        Fixture f({makeBlock(NodeType::Image),
                   makeBlock(NodeType::CodeBlock, "abc")},
                  Selection::cursor(2));
        FakeEditor* ed = f.editor(1);
        ed->placeCursor(0, 0);

        QVERIFY(ed->press(key("Left")));
        QCOMPARE(f.doc().selection(), Selection::node(0, 1));
        QVERIFY(f.host.focused);
        QVERIFY(!ed->focused);
        QVERIFY(!ed->active);
        QCOMPARE(f.binding(1)->syncState(), SyncState::Idle);
    }

    void escapeForwardIntoText() {
        // [Code "ab"] 0..4  [P "cd"] 4..8
        Fixture f({makeBlock(NodeType::CodeBlock, "ab"),
                   makeBlock(NodeType::Paragraph, "cd")},
                  Selection::cursor(1));
        FakeEditor* ed = f.editor(0);
        ed->placeCursor(0, 2);
        QCOMPARE(f.doc().selection(), Selection::cursor(3));

        QVERIFY(ed->press(key("Right")));
        QCOMPARE(f.doc().selection(), Selection::cursor(5));
        QVERIFY(f.host.focused);
        QVERIFY(!ed->focused);
    }

    void escapeIntoAdjacentCodeBlock() {
        // [Code "ab"] 0..4  [Code "cd"] 4..8
        Fixture f({makeBlock(NodeType::CodeBlock, "ab"),
                   makeBlock(NodeType::CodeBlock, "cd")},
                  Selection::cursor(1));
        FakeEditor* first = f.editor(0);
        first->focus();
        first->placeCursor(0, 2);
        QCOMPARE(f.doc().selection(), Selection::cursor(3));

        QVERIFY(first->press(key("Right")));
        FakeEditor* second = f.editor(1);
        QCOMPARE(f.doc().selection(), Selection::cursor(5));
        QVERIFY(second->focused);
        QVERIFY(second->active);
        QCOMPARE(second->sel.head, (TextPoint{0, 0}));
        QVERIFY(!first->focused);
        QVERIFY(!first->active);
        QVERIFY(!f.host.focused);
        QCOMPARE(f.binding(0)->syncState(), SyncState::Idle);

        QVERIFY(second->press(key("Left")));
        QCOMPARE(f.doc().selection(), Selection::cursor(3));
        QVERIFY(first->focused);
        QCOMPARE(first->sel.head, (TextPoint{0, 2}));
    }

    void escapeDownSelectsFollowingAtom() {
        // [Code "ab\ncd"] 0..7  [HR] 7..8
        Fixture f({makeBlock(NodeType::CodeBlock, "ab\ncd"),
                   makeBlock(NodeType::HorizontalRule)},
                  Selection::cursor(1));
        FakeEditor* ed = f.editor(0);
        ed->placeCursor(1, 1);

        QVERIFY(ed->press(key("Down")));
        QCOMPARE(f.doc().selection(), Selection::node(7, 1));
    }

    void columnInsideLineStaysInEditor() {
        Fixture f({makeBlock(NodeType::Image),
                   makeBlock(NodeType::CodeBlock, "0123456789")},
                  Selection::cursor(2));
        FakeEditor* ed = f.editor(1);
        ed->placeCursor(0, 3);

        QVERIFY(ed->press(key("Left")));
        QCOMPARE(ed->executed, QVector<EditorCommand>{EditorCommand::CharLeft});
        QCOMPARE(ed->sel.head, (TextPoint{0, 2}));
        QCOMPARE(f.doc().selection(), Selection::cursor(4));
        QVERIFY(ed->focused);
    }

    void nonEmptySelectionNeverEscapes() {
        Fixture f({makeBlock(NodeType::Image),
                   makeBlock(NodeType::CodeBlock, "abc")},
                  Selection::cursor(2));
        FakeEditor* ed = f.editor(1);
        ed->setSelection({{0, 2}, {0, 0}});

        QVERIFY(ed->press(key("Left")));
        QCOMPARE(ed->executed, QVector<EditorCommand>{EditorCommand::CharLeft});
        QVERIFY(f.doc().selection().kind == Selection::Text);
    }

    void upFromSecondRowStaysInEditor() {
        Fixture f({makeBlock(NodeType::Image),
                   makeBlock(NodeType::CodeBlock, "ab\ncd")},
                  Selection::cursor(2));
        FakeEditor* ed = f.editor(1);
        ed->placeCursor(1, 0);

        QVERIFY(ed->press(key("Up")));
        QCOMPARE(ed->executed, QVector<EditorCommand>{EditorCommand::LineUp});
        QCOMPARE(ed->sel.head, (TextPoint{0, 0}));
    }

    void hostArrowEntersCodeBlock() {
        // [P "ab"] 0..4  [Code "xy"] 4..8
        Fixture f({makeBlock(NodeType::Paragraph, "ab"),
                   makeBlock(NodeType::CodeBlock, "xy")},
                  Selection::cursor(2));
        QVERIFY(!f.views->handleArrow(navigator::Direction::Right));

        Transaction tr = f.doc().transaction();
        tr.setSelection(Selection::cursor(3));
        f.doc().dispatch(tr);
        QVERIFY(f.views->handleArrow(navigator::Direction::Right));

        FakeEditor* ed = f.editor(1);
        QCOMPARE(f.doc().selection(), Selection::cursor(5));
        QVERIFY(ed->focused);
        QCOMPARE(ed->sel.head, (TextPoint{0, 0}));
    }

    void hostArrowUpLandsOnLastLine() {
        // [Code "a\nbc"] 0..6  [P "cd"] 6..10
        Fixture f({makeBlock(NodeType::CodeBlock, "a\nbc"),
                   makeBlock(NodeType::Paragraph, "cd")},
                  Selection::cursor(8));
        QVERIFY(f.views->handleArrow(navigator::Direction::Up));
        QCOMPARE(f.doc().selection(), Selection::cursor(5));
        QCOMPARE(f.editor(0)->sel.head, (TextPoint{1, 2}));
    }

    // ── Backspace ──

    void backspaceDeletesEmptyBlock() {
        // [P "ab"] 0..4  [Code ""] 4..6  [P "cd"] 6..10
        Fixture f({makeBlock(NodeType::Paragraph, "ab"),
                   makeBlock(NodeType::CodeBlock),
                   makeBlock(NodeType::Paragraph, "cd")},
                  Selection::cursor(2));
        FakeEditor* ed = f.editor(1);

        QVERIFY(ed->press(key("Backspace")));
        QCOMPARE(f.doc().state().blockCount(), 2);
        QCOMPARE(f.doc().selection(), Selection::cursor(3));
        QCOMPARE(f.views->bindingCount(), 0);
        QVERIFY(f.host.focused);
        QTRY_VERIFY(!f.host.isLive(ed));
    }

    void removingFocusedBlockFocusesHost() {
        // [P "ab"] 0..4  [Code "x"] 4..7  [Code "cd"] 7..11
        Fixture f({makeBlock(NodeType::Paragraph, "ab"),
                   makeBlock(NodeType::CodeBlock, "x"),
                   makeBlock(NodeType::CodeBlock, "cd")},
                  Selection::cursor(2));
        FakeEditor* removed = f.editor(1);
        FakeEditor* next = f.editor(2);
        removed->focus();
        QVERIFY(removed->focused);

        Transaction tr = f.doc().transaction();
        QVERIFY(tr.deleteRange(4, 7));
        tr.setSelection(Selection::cursor(3));
        f.doc().dispatch(tr);

        QCOMPARE(f.views->bindingCount(), 1);
        QCOMPARE(f.doc().selection(), Selection::cursor(3));
        QVERIFY(f.host.focused);
        QVERIFY(!next->focused);
        QTRY_VERIFY(!f.host.isLive(removed));
    }

    void backspaceWithContentDeletesCharacter() {
        Fixture f({makeBlock(NodeType::CodeBlock, "ab")}, Selection::cursor(1));
        FakeEditor* ed = f.editor(0);
        ed->placeCursor(0, 2);

        QVERIFY(ed->press(key("Backspace")));
        QCOMPARE(ed->executed, QVector<EditorCommand>{EditorCommand::DeleteBack});
        QCOMPARE(f.block(0).text, QString("a"));
        QCOMPARE(f.views->bindingCount(), 1);
    }

    void backspaceRevertsInputRule() {
        Fixture f({makeBlock(NodeType::Paragraph)}, Selection::cursor(1));
        QVERIFY(f.doc().insertText("```"));
        QCOMPARE(f.block(0).type, NodeType::CodeBlock);
        QCOMPARE(f.views->bindingCount(), 1);

        FakeEditor* ed = f.editor(0);
        QVERIFY(ed->focused);
        QVERIFY(ed->press(key("Backspace")));

        QCOMPARE(f.doc().state().blockCount(), 1);
        QCOMPARE(f.block(0).type, NodeType::Paragraph);
        QCOMPARE(f.block(0).text, QString("```"));
        QCOMPARE(f.doc().selection(), Selection::cursor(4));
        QCOMPARE(f.views->bindingCount(), 0);
    }

    // ── Host commands ──

    void exitBlockInsertsParagraph() {
        Fixture f({makeBlock(NodeType::CodeBlock, "x")}, Selection::cursor(2));
        FakeEditor* ed = f.editor(0);
        QVERIFY(ed->press(key("Ctrl+Return")));

        QCOMPARE(f.doc().state().blockCount(), 2);
        QCOMPARE(f.block(1).type, NodeType::Paragraph);
        QCOMPARE(f.doc().selection(), Selection::cursor(4));
        QVERIFY(f.host.focused);
        QVERIFY(!ed->focused);
    }

    void insertParagraphAndSelectAll() {
        Fixture f({makeBlock(NodeType::CodeBlock, "x")}, Selection::cursor(2));
        FakeEditor* ed = f.editor(0);

        QVERIFY(ed->press(key("Ctrl+\\")));
        QCOMPARE(f.doc().state().blockCount(), 2);
        QCOMPARE(f.block(1).type, NodeType::Paragraph);

        Transaction tr = f.doc().transaction();
        tr.setSelection(Selection::cursor(2));
        f.doc().dispatch(tr);
        QVERIFY(ed->focused);
        QVERIFY(ed->press(key("Ctrl+A")));
        QCOMPARE(f.doc().selection(), Selection::all(f.doc().state().size()));
        QVERIFY(f.host.focused);
    }

    void optionalKeysNeedCallbacks() {
        Fixture bare({makeBlock(NodeType::CodeBlock, "x")}, Selection::cursor(1));
        QVERIFY(bare.editor(0)->hasCommand("leftEscape"));
        QVERIFY(bare.editor(0)->hasCommand("undoHost"));
        QVERIFY(!bare.editor(0)->hasCommand("editAttributes"));
        QVERIFY(!bare.editor(0)->hasCommand("runChunk"));
        QVERIFY(!bare.editor(0)->hasCommand("runPreviousChunks"));

        int attrCalls = 0;
        Document* seen = nullptr;
        CodeViewOptions o = codeOptions();
        o.attrEditFn = [&](Document* doc, HostView*) { ++attrCalls; seen = doc; };
        o.executeChunkFn = [](const Chunk&) {};
        Fixture full({makeBlock(NodeType::CodeBlock, "x")}, Selection::cursor(1), o);
        QVERIFY(full.editor(0)->hasCommand("editAttributes"));
        QVERIFY(full.editor(0)->hasCommand("runChunk"));

        QVERIFY(full.editor(0)->press(key("F4")));
        QCOMPARE(attrCalls, 1);
        QCOMPARE(seen, &full.doc());
    }

    // ── Mode and run affordance ──

    void modeSetOncePerChange() {
        Fixture f({makeBlock(NodeType::Paragraph),
                   makeBlock(NodeType::CodeBlock, "print(1)", "r")},
                  Selection::cursor(1));
        FakeEditor* ed = f.editor(1);
        QCOMPARE(ed->modeHistory, QStringList{"r"});

        Transaction tr = f.doc().transaction();
        QVERIFY(tr.setBlockType(f.pos(1), NodeType::CodeBlock, "python"));
        f.doc().dispatch(tr);
        QCOMPARE(ed->currentMode, QString("python"));

        tr = f.doc().transaction();
        QVERIFY(tr.replaceWith(f.pos(1) + 1, f.pos(1) + 1, "#"));
        f.doc().dispatch(tr);
        tr = f.doc().transaction();
        QVERIFY(tr.replaceWith(1, 1, "text"));
        f.doc().dispatch(tr);

        QCOMPARE(ed->modeHistory, (QStringList{"r", "python"}));
        QCOMPARE(f.binding(1)->mode(), QString("python"));
    }

    void runAffordance_data() {
        QTest::addColumn<QStringList>("languages");
        QTest::addColumn<bool>("callback");
        QTest::addColumn<bool>("visible");

        QTest::newRow("listed")        << QStringList{"R", "Python"} << true  << true;
        QTest::newRow("accent folded") << QStringList{"PYTHÖN"}      << true  << true;
        QTest::newRow("not listed")    << QStringList{"r"}           << true  << false;
        QTest::newRow("no callback")   << QStringList{"python"}      << false << false;
        QTest::newRow("empty list")    << QStringList{}              << true  << false;
    }

    void runAffordance() {
        QFETCH(QStringList, languages);
        QFETCH(bool, callback);
        QFETCH(bool, visible);

        CodeViewOptions o = codeOptions();
        if (callback)
            o.executeChunkFn = [](const Chunk&) {};
        EditorOptions eo;
        eo.chunkExecutionLanguages = languages;

        Fixture f({makeBlock(NodeType::Paragraph),
                   makeBlock(NodeType::CodeBlock, "print(1)", "r")},
                  Selection::cursor(1), o, eo);

        Transaction tr = f.doc().transaction();
        QVERIFY(tr.setBlockType(f.pos(1), NodeType::CodeBlock, "python"));
        f.doc().dispatch(tr);

        QCOMPARE(f.editor(1)->runVisible, visible);
        QCOMPARE(f.binding(1)->isChunkExecutionEnabled(), visible);
        QCOMPARE(f.editor(1)->modeHistory.count("python"), 1);
    }

    void runChunkAndPreviousChunks() {
        QVector<Chunk> ran;
        CodeViewOptions o = codeOptions();
        o.executeChunkFn = [&](const Chunk& c) { ran.append(c); };
        EditorOptions eo;
        eo.chunkExecutionLanguages = {"r", "python"};

        Fixture f({makeBlock(NodeType::CodeBlock, "{r}\nx <- 1"),
                   makeBlock(NodeType::Paragraph, "t"),
                   makeBlock(NodeType::CodeBlock, "{python}\nprint(1)"),
                   makeBlock(NodeType::CodeBlock, "{r label}\ny <- 2")},
                  Selection::cursor(1), o, eo);

        QVERIFY(f.editor(0)->press(key("Ctrl+Shift+Return")));
        QCOMPARE(ran.size(), 1);
        QCOMPARE(ran[0].lang, QString("r"));
        QCOMPARE(ran[0].code, QString("x <- 1"));

        QVERIFY(f.editor(3)->press(key("Ctrl+Alt+P")));
        QCOMPARE(ran.size(), 2);
        QCOMPARE(ran[1].lang, QString("r"));
        QCOMPARE(ran[1].code, QString("x <- 1\ny <- 2"));

        emit f.editor(2)->runChunkRequested();
        QCOMPARE(ran.size(), 3);
        QCOMPARE(ran[2].lang, QString("python"));
        QCOMPARE(ran[2].code, QString("print(1)"));
    }

    void runIgnoredWhileHidden() {
        int runs = 0;
        CodeViewOptions o = codeOptions();
        o.executeChunkFn = [&](const Chunk&) { ++runs; };
        Fixture f({makeBlock(NodeType::CodeBlock, "{sql}\nselect 1")}, Selection::cursor(1), o);

        QVERIFY(!f.binding(0)->isChunkExecutionEnabled());
        f.binding(0)->executeChunk();
        f.binding(0)->executePreviousChunks();
        QCOMPARE(runs, 0);
    }

    // ── Teardown ──

    void disposeStopsSync() {
        Fixture f({makeBlock(NodeType::CodeBlock, "abc")}, Selection::cursor(1));
        CodeBlockBinding* b = f.binding(0);
        FakeEditor* ed = f.editor(0);

        b->dispose();
        QVERIFY(b->isDisposed());
        QVERIFY(ed->commands.isEmpty());

        ed->type("zzz");
        QCOMPARE(f.block(0).text, QString("abc"));
        b->dispose();
    }
};

QTEST_MAIN(TestBinding)
#include "test_binding.moc"
