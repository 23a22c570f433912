#include "input_engine.h"
#include "text_utils.h"
#include "logger.h"
#include <cstdint>
#include <utility>

RawInput RawInput::key(int code) {
    RawInput r;
    r.is_key_code = true;
    r.key_code = code;
    return r;
}

RawInput RawInput::text(std::string ch) {
    RawInput r;
    r.character = std::move(ch);
    return r;
}

// Codes with the same meaning in both representations
static bool control_event(uint32_t code, InputEventType& type) {
    switch (code) {
        case 8:
        case 127:
            type = InputEventType::Backspace;
            return true;
        case 10:
        case 13:
            type = InputEventType::Submit;
            return true;
        case 3:
            type = InputEventType::Interrupt;
            return true;
        default:
            return false;
    }
}

InputEvent classify_input(const RawInput& raw) {
    InputEvent ev;

    if (raw.is_key_code) {
        switch (raw.key_code) {
            case kKeyBackspace: ev.type = InputEventType::Backspace; break;
            case kKeyEnter:     ev.type = InputEventType::Submit; break;
            case kKeyResize:    ev.type = InputEventType::Resize; break;
            default:
                if (raw.key_code < 0 || !control_event(static_cast<uint32_t>(raw.key_code), ev.type)) {
                    ev.type = InputEventType::Ignore;
                }
                break;
        }
        return ev;
    }

    uint32_t cp = 0;
    const size_t n = utf8_decode(raw.character, 0, cp);
    if (n == 0 || n != raw.character.size()) {
        // Not exactly one well-formed code point
        return ev;
    }
    if (control_event(cp, ev.type)) {
        return ev;
    }
    if (cp < 0x20) {
        return ev;
    }
    ev.type = InputEventType::Character;
    ev.character = raw.character;
    return ev;
}

InputEngine::InputEngine(const LogWriter& writer, std::string identity, DisplaySurface& display)
    : writer_(writer)
    , identity_(std::move(identity))
    , display_(display)
{
}

bool InputEngine::handle(const RawInput& raw) {
    const InputEvent ev = classify_input(raw);

    switch (ev.type) {
        case InputEventType::Resize:
            display_.handle_resize();
            break;
        case InputEventType::Backspace:
            if (!buffer_.empty()) {
                utf8_pop_back(buffer_);
                display_.repaint_input(buffer_);
            }
            break;
        case InputEventType::Submit:
            submit();
            break;
        case InputEventType::Interrupt:
            LOG_INFO("InputEngine: interrupt received");
            return false;
        case InputEventType::Character:
            buffer_ += ev.character;
            display_.repaint_input(buffer_);
            break;
        case InputEventType::Ignore:
            break;
    }
    return true;
}

void InputEngine::submit() {
    if (!trim_copy(buffer_).empty()) {
        writer_.append(identity_, buffer_);
    }
    // Whitespace-only lines are discarded without sending
    buffer_.clear();
    display_.repaint_input(buffer_);
}

void InputEngine::run(InputSource& source) {
    RawInput raw;
    while (source.next(raw)) {
        if (!handle(raw)) {
            return;
        }
    }
    LOG_WARN("InputEngine: input closed, leaving");
}
