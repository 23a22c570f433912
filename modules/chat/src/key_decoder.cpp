#include "key_decoder.h"
#include <string>

bool KeyDecoder::take_pending(unsigned char& c) {
    if (pending_ < 0) {
        return false;
    }
    c = static_cast<unsigned char>(pending_);
    pending_ = -1;
    return true;
}

bool KeyDecoder::decode(unsigned char first, ByteSource& more, RawInput& out) {
    if (first == 0x1B) {
        return decode_escape(more, out);
    }

    std::string ch(1, static_cast<char>(first));
    size_t expected = 1;
    if ((first & 0xE0) == 0xC0) expected = 2;
    else if ((first & 0xF0) == 0xE0) expected = 3;
    else if ((first & 0xF8) == 0xF0) expected = 4;

    unsigned char c = 0;
    while (ch.size() < expected && more.read_byte(c, kSequenceTimeoutMs)) {
        if ((c & 0xC0) != 0x80) {
            // Start of the next keystroke
            pending_ = c;
            break;
        }
        ch.push_back(static_cast<char>(c));
    }
    // Truncated sequences are passed on; classify_input ignores them
    out = RawInput::text(ch);
    return true;
}

bool KeyDecoder::decode_escape(ByteSource& more, RawInput& out) {
    unsigned char c = 0;
    if (!more.read_byte(c, kSequenceTimeoutMs)) {
        // Lone ESC
        return false;
    }
    if (c != '[' && c != 'O') {
        // Alt+key: drop the ESC, keep the key
        pending_ = c;
        return false;
    }
    const unsigned char intro = c;
    size_t params = 0;
    while (more.read_byte(c, kSequenceTimeoutMs)) {
        if (c >= 0x40 && c <= 0x7E) {
            if (intro == 'O' && c == 'M') {
                // Keypad enter
                out = RawInput::key(kKeyEnter);
                return true;
            }
            // Cursor and function keys are not used
            return false;
        }
        if (++params > 16) {
            return false;
        }
    }
    return false;
}
