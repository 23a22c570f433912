#include "test_support.h"
#include "input_engine.h"
#include "log_writer.h"
#include "display_surface.h"
#include "chat_record.h"
#include "logger.h"

struct EngineFixture {
    explicit EngineFixture(const std::string& name)
        : path(temp_log_path(name)), log(path), writer(log), display(term), engine(writer, "Tester", display) {}
    ~EngineFixture() { remove_file(path); }

    void feed(const std::vector<RawInput>& inputs) {
        for (const auto& in : inputs) engine.handle(in);
    }

    std::vector<ChatRecord> records() const {
        std::vector<ChatRecord> out;
        for (const auto& line : read_file_lines(path)) {
            ChatRecord r;
            if (parse_record(line, r)) out.push_back(r);
        }
        return out;
    }

    std::string path;
    SharedLog log;
    LogWriter writer;
    RecordingTerminal term;
    DisplaySurface display;
    InputEngine engine;
};

bool test_classification() {
    std::cout << "Testing input classification..." << std::endl;

    // Same meaning whichever form the terminal delivers
    TEST_ASSERT(classify_input(RawInput::key(kKeyBackspace)).type == InputEventType::Backspace, "backspace key code");
    TEST_ASSERT(classify_input(RawInput::key(127)).type == InputEventType::Backspace, "code 127");
    TEST_ASSERT(classify_input(RawInput::text("\x7f")).type == InputEventType::Backspace, "DEL character");
    TEST_ASSERT(classify_input(RawInput::text("\b")).type == InputEventType::Backspace, "BS character");

    TEST_ASSERT(classify_input(RawInput::key(kKeyEnter)).type == InputEventType::Submit, "enter key code");
    TEST_ASSERT(classify_input(RawInput::key(10)).type == InputEventType::Submit, "code 10");
    TEST_ASSERT(classify_input(RawInput::key(13)).type == InputEventType::Submit, "code 13");
    TEST_ASSERT(classify_input(RawInput::text("\n")).type == InputEventType::Submit, "LF character");
    TEST_ASSERT(classify_input(RawInput::text("\r")).type == InputEventType::Submit, "CR character");

    TEST_ASSERT(classify_input(RawInput::text("\x03")).type == InputEventType::Interrupt, "Ctrl-C character");
    TEST_ASSERT(classify_input(RawInput::key(3)).type == InputEventType::Interrupt, "Ctrl-C key code");

    TEST_ASSERT(classify_input(RawInput::key(kKeyResize)).type == InputEventType::Resize, "resize key code");

    InputEvent ch = classify_input(RawInput::text("\xE4\xBD\xA0"));
    TEST_ASSERT(ch.type == InputEventType::Character && ch.character == "\xE4\xBD\xA0", "wide character");
    TEST_ASSERT(classify_input(RawInput::text("a")).type == InputEventType::Character, "plain character");

    TEST_ASSERT(classify_input(RawInput::key(0410)).type == InputEventType::Ignore, "unused key code ignored");
    TEST_ASSERT(classify_input(RawInput::text("\x1b")).type == InputEventType::Ignore, "ESC ignored");
    TEST_ASSERT(classify_input(RawInput::text("\xE4\xBD")).type == InputEventType::Ignore, "partial sequence ignored");
    TEST_ASSERT(classify_input(RawInput::text("ab")).type == InputEventType::Ignore, "more than one character ignored");

    std::cout << "Input classification Passed!" << std::endl;
    return true;
}

bool test_backspace() {
    std::cout << "Testing backspace..." << std::endl;
    EngineFixture f("backspace");

    f.feed(typed("hi"));
    f.engine.handle(RawInput::key(kKeyBackspace));
    TEST_ASSERT(f.engine.buffer() == "h", "\"hi\" + backspace leaves \"h\"");
    TEST_ASSERT(f.term.input_text() == "h", "input viewport repainted");

    f.engine.handle(RawInput::text("\x7f"));
    TEST_ASSERT(f.engine.buffer().empty(), "second backspace empties the buffer");
    const int refreshes = f.term.input_refreshes();
    f.engine.handle(RawInput::key(127));
    TEST_ASSERT(f.engine.buffer().empty(), "backspace on empty buffer is harmless");
    TEST_ASSERT(f.term.input_refreshes() == refreshes, "no repaint for backspace on empty buffer");

    f.engine.handle(RawInput::text("\xE4\xBD\xA0"));
    f.engine.handle(RawInput::text("\xE5\xA5\xBD"));
    f.engine.handle(RawInput::text("\b"));
    TEST_ASSERT(f.engine.buffer() == "\xE4\xBD\xA0", "backspace removes a whole wide character");

    TEST_ASSERT(f.records().empty(), "nothing sent");
    std::cout << "Backspace Passed!" << std::endl;
    return true;
}

bool test_submit() {
    std::cout << "Testing submit..." << std::endl;
    EngineFixture f("submit");

    f.feed(typed("hi"));
    f.engine.handle(RawInput::key(kKeyEnter));
    TEST_ASSERT(f.engine.buffer().empty(), "buffer reset after enter");
    TEST_ASSERT(f.term.input_text().empty(), "input viewport cleared");
    auto recs = f.records();
    TEST_ASSERT(recs.size() == 1, "one record sent");
    TEST_ASSERT(recs[0].author == "Tester" && recs[0].body == "hi", "record carries identity and body");

    f.feed(typed("again"));
    f.engine.handle(RawInput::text("\r"));
    recs = f.records();
    TEST_ASSERT(recs.size() == 2 && recs[1].body == "again", "character form of enter also sends");

    f.feed(typed("  spaced  "));
    f.engine.handle(RawInput::key(10));
    recs = f.records();
    TEST_ASSERT(recs.size() == 3 && recs[2].body == "  spaced  ", "body sent as typed, not trimmed");

    std::cout << "Submit Passed!" << std::endl;
    return true;
}

bool test_whitespace_submit() {
    std::cout << "Testing whitespace submit..." << std::endl;
    EngineFixture f("whitespace");

    f.feed(typed("   "));
    TEST_ASSERT(f.engine.buffer() == "   ", "spaces buffered");
    const int refreshes = f.term.input_refreshes();
    f.engine.handle(RawInput::text("\n"));
    TEST_ASSERT(f.engine.buffer().empty(), "buffer cleared");
    TEST_ASSERT(f.term.input_refreshes() == refreshes + 1, "input repainted");
    TEST_ASSERT(f.records().empty(), "whitespace-only line not sent");

    f.engine.handle(RawInput::key(kKeyEnter));
    TEST_ASSERT(f.records().empty(), "empty enter sends nothing");

    // Ideographic and no-break spaces are whitespace too
    f.engine.handle(RawInput::text("\xE3\x80\x80"));
    f.engine.handle(RawInput::text("\xC2\xA0"));
    f.engine.handle(RawInput::text("\xE3\x80\x80"));
    TEST_ASSERT(f.engine.buffer().size() == 8, "unicode spaces buffered");
    f.engine.handle(RawInput::key(kKeyEnter));
    TEST_ASSERT(f.engine.buffer().empty(), "buffer cleared");
    TEST_ASSERT(f.records().empty(), "unicode-whitespace line not sent");

    std::cout << "Whitespace submit Passed!" << std::endl;
    return true;
}

bool test_interrupt_and_resize() {
    std::cout << "Testing interrupt and resize..." << std::endl;
    EngineFixture f("interrupt");

    TEST_ASSERT(f.engine.handle(RawInput::key(kKeyResize)), "resize keeps running");
    TEST_ASSERT(f.term.size_updates == 1 && f.term.base_clears == 1, "resize clears the base surface");

    f.feed(typed("unsent"));
    TEST_ASSERT(!f.engine.handle(RawInput::text("\x03")), "Ctrl-C stops the engine");
    TEST_ASSERT(f.records().empty(), "interrupt does not send the pending line");

    ScriptedInput script([] {
        std::vector<RawInput> s = typed("one");
        s.push_back(RawInput::key(kKeyEnter));
        s.push_back(RawInput::key(3));
        auto rest = typed("never");
        s.insert(s.end(), rest.begin(), rest.end());
        return s;
    }());
    EngineFixture g("run");
    g.engine.run(script);
    TEST_ASSERT(script.remaining() == 5, "run stops at the interrupt");
    auto recs = g.records();
    TEST_ASSERT(recs.size() == 1 && recs[0].body == "one", "line before interrupt was sent");

    ScriptedInput closing(typed("abc"));
    EngineFixture h("closed");
    h.engine.run(closing);
    TEST_ASSERT(h.engine.buffer() == "abc", "run returns when input closes");

    std::cout << "Interrupt and resize Passed!" << std::endl;
    return true;
}

bool test_control_characters_ignored() {
    std::cout << "Testing control characters..." << std::endl;
    EngineFixture f("controls");

    f.engine.handle(RawInput::text("a"));
    f.engine.handle(RawInput::text("\t"));
    f.engine.handle(RawInput::text("\x1b"));
    f.engine.handle(RawInput::key(0403));
    f.engine.handle(RawInput::text("b"));
    TEST_ASSERT(f.engine.buffer() == "ab", "controls and unused keys do not enter the buffer");

    std::cout << "Control characters Passed!" << std::endl;
    return true;
}

int main() {
    set_log_level(LogLevel::NONE);
    std::cout << "Running InputEngine Tests..." << std::endl;

    test_classification();
    test_backspace();
    test_submit();
    test_whitespace_submit();
    test_interrupt_and_resize();
    test_control_characters_ignored();

    if (tests_failed == 0) {
        std::cout << "ALL INPUTENGINE TESTS PASSED" << std::endl;
        return 0;
    } else {
        std::cerr << tests_failed << " TESTS FAILED" << std::endl;
        return 1;
    }
}
