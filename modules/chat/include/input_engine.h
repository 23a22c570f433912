#ifndef FILECHAT_INPUT_ENGINE_H
#define FILECHAT_INPUT_ENGINE_H

#include "display_surface.h"
#include "log_writer.h"
#include <string>

// Key codes the terminal layer reports for special keys (curses numbering)
constexpr int kKeyBackspace = 0407;
constexpr int kKeyEnter = 0527;
constexpr int kKeyResize = 0632;

/**
 * @brief One unit read from the terminal: either a key code or a decoded
 * character. Terminals differ in which form they use for the same key.
 */
struct RawInput {
    bool is_key_code = false;
    int key_code = 0;
    std::string character;  // one UTF-8 encoded code point

    static RawInput key(int code);
    static RawInput text(std::string ch);
};

enum class InputEventType {
    Backspace,
    Submit,
    Interrupt,
    Resize,
    Character,
    Ignore
};

struct InputEvent {
    InputEventType type = InputEventType::Ignore;
    std::string character;  // set for Character
};

// Maps both representations onto one event
InputEvent classify_input(const RawInput& raw);

// Blocking source of raw input. next() returns false once input is closed.
class InputSource {
public:
    virtual ~InputSource() = default;
    virtual bool next(RawInput& out) = 0;
};

/**
 * @brief Foreground line editor. Owns the unsent line; completed lines go to
 * LogWriter under the session identity.
 */
class InputEngine {
public:
    InputEngine(const LogWriter& writer, std::string identity, DisplaySurface& display);

    // Applies one input unit. Returns false on Interrupt.
    bool handle(const RawInput& raw);

    // Dispatches until Interrupt or until the source closes
    void run(InputSource& source);

    const std::string& buffer() const { return buffer_; }

private:
    void submit();

    const LogWriter& writer_;
    const std::string identity_;
    DisplaySurface& display_;
    std::string buffer_;
};

#endif // FILECHAT_INPUT_ENGINE_H
