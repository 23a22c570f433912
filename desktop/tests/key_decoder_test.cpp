#include "test_support.h"
#include "key_decoder.h"
#include "logger.h"

// Terminal bytes already typed; reads past the end time out
class ScriptedBytes : public ByteSource {
public:
    explicit ScriptedBytes(const std::string& bytes) : bytes_(bytes) {}

    bool read_byte(unsigned char& c, int) override {
        if (pos_ >= bytes_.size()) return false;
        c = static_cast<unsigned char>(bytes_[pos_++]);
        return true;
    }

    bool next_first(KeyDecoder& decoder, unsigned char& c) {
        if (decoder.take_pending(c)) return true;
        return read_byte(c, 0);
    }

private:
    std::string bytes_;
    size_t pos_ = 0;
};

// Everything the decoder produces from the byte stream
static std::vector<RawInput> decode_all(const std::string& bytes) {
    ScriptedBytes source(bytes);
    KeyDecoder decoder;
    std::vector<RawInput> events;
    unsigned char c = 0;
    while (source.next_first(decoder, c)) {
        RawInput ev;
        if (decoder.decode(c, source, ev)) events.push_back(ev);
    }
    return events;
}

bool test_plain_and_multibyte() {
    std::cout << "Testing plain and multi-byte characters..." << std::endl;
    auto events = decode_all("a\xE4\xBD\xA0\x7F");
    TEST_ASSERT(events.size() == 3, "three keystrokes");
    TEST_ASSERT(events[0].character == "a", "ascii");
    TEST_ASSERT(events[1].character == "\xE4\xBD\xA0", "three-byte character kept together");
    TEST_ASSERT(classify_input(events[2]).type == InputEventType::Backspace, "DEL is backspace");
    std::cout << "Plain and multi-byte Passed!" << std::endl;
    return true;
}

bool test_escape_sequences() {
    std::cout << "Testing escape sequences..." << std::endl;
    auto events = decode_all("\x1B[A" "x" "\x1BOM");
    TEST_ASSERT(events.size() == 2, "cursor key dropped");
    TEST_ASSERT(events[0].character == "x", "text after a cursor key");
    TEST_ASSERT(events[1].is_key_code && events[1].key_code == kKeyEnter, "keypad enter");

    events = decode_all("\x1B");
    TEST_ASSERT(events.empty(), "lone ESC produces nothing");
    std::cout << "Escape sequences Passed!" << std::endl;
    return true;
}

bool test_alt_key_keeps_the_key() {
    std::cout << "Testing Alt+key..." << std::endl;
    auto events = decode_all("\x1B" "b" "c");
    TEST_ASSERT(events.size() == 2, "ESC dropped, both keys kept");
    TEST_ASSERT(events[0].character == "b" && events[1].character == "c", "keys in order");

    events = decode_all("\x1B\x03");
    TEST_ASSERT(events.size() == 1, "Alt+Ctrl-C still delivered");
    TEST_ASSERT(classify_input(events[0]).type == InputEventType::Interrupt, "interrupt survives");
    std::cout << "Alt+key Passed!" << std::endl;
    return true;
}

bool test_broken_sequence_keeps_next_key() {
    std::cout << "Testing a broken UTF-8 sequence..." << std::endl;
    auto events = decode_all("\xE4\xBD" "q");
    TEST_ASSERT(events.size() == 2, "truncated character and the next key");
    TEST_ASSERT(classify_input(events[0]).type == InputEventType::Ignore, "truncated character ignored");
    TEST_ASSERT(events[1].character == "q", "following key not swallowed");

    events = decode_all("\xC3\r");
    TEST_ASSERT(events.size() == 2, "lead byte then enter");
    TEST_ASSERT(classify_input(events[1]).type == InputEventType::Submit, "enter still submits");
    std::cout << "Broken UTF-8 sequence Passed!" << std::endl;
    return true;
}

int main() {
    set_log_level(LogLevel::NONE);
    std::cout << "Running KeyDecoder Tests..." << std::endl;

    test_plain_and_multibyte();
    test_escape_sequences();
    test_alt_key_keeps_the_key();
    test_broken_sequence_keeps_next_key();

    if (tests_failed == 0) {
        std::cout << "ALL KEYDECODER TESTS PASSED" << std::endl;
        return 0;
    } else {
        std::cerr << tests_failed << " TESTS FAILED" << std::endl;
        return 1;
    }
}
