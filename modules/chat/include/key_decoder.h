#ifndef FILECHAT_KEY_DECODER_H
#define FILECHAT_KEY_DECODER_H

#include "input_engine.h"

// Byte-at-a-time access to the terminal with a per-byte timeout
class ByteSource {
public:
    virtual ~ByteSource() = default;
    // False on timeout or when the source is closed
    virtual bool read_byte(unsigned char& c, int timeout_ms) = 0;
};

/**
 * @brief Turns raw terminal bytes into RawInput.
 *
 * Multi-byte UTF-8 characters are collected into one RawInput. Escape
 * sequences are swallowed except keypad enter ("ESC O M"). A byte read while
 * completing a sequence that turns out to start the next keystroke is held
 * back and returned by take_pending().
 */
class KeyDecoder {
public:
    // Same delay curses uses for a lone ESC when ESCDELAY=25
    static constexpr int kSequenceTimeoutMs = 25;

    // Decodes the event starting with `first`. False if it produced nothing.
    bool decode(unsigned char first, ByteSource& more, RawInput& out);

    bool take_pending(unsigned char& c);

private:
    bool decode_escape(ByteSource& more, RawInput& out);

    int pending_ = -1;
};

#endif // FILECHAT_KEY_DECODER_H
