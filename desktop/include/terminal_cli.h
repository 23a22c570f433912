/**
 * terminal_cli.h - Two-viewport chat TUI on a raw /dev/tty
 *
 * Layout (fixed when the session starts):
 * ┌───────────────────────────────────────────────────────────────────────┐
 * │ HISTORY: last lines of the shared chat log, scrolling                 │
 * │ ...                                                                   │
 * ╔═══════════════════════════════════════════════════════════════════════╗
 * ║ Say: [input]                                                          ║
 * ╚═══════════════════════════════════════════════════════════════════════╝
 */

#ifndef FILECHAT_TERMINAL_CLI_H
#define FILECHAT_TERMINAL_CLI_H

#include "terminal_surface.h"
#include "input_engine.h"
#include "key_decoder.h"
#include "display_surface.h"
#include <deque>
#include <optional>
#include <string>
#include <termios.h>
#include <vector>

class TerminalCLI : public TerminalSurface, public InputSource, public ByteSource {
public:
    TerminalCLI();
    ~TerminalCLI() override;

    TerminalCLI(const TerminalCLI&) = delete;
    TerminalCLI& operator=(const TerminalCLI&) = delete;

    // Raw mode, alternate screen, viewport layout. Throws std::runtime_error
    // if there is no controlling terminal.
    void setup_terminal();
    void restore_terminal();

    /**
     * @brief Centered nickname prompt. Input is capped at max_bytes.
     * @return std::nullopt if the user interrupts, kAnonymousNickname if the
     * terminal closes, otherwise the trimmed input (possibly empty).
     */
    std::optional<std::string> prompt_nickname(DisplaySurface& display, size_t max_bytes);

    // TerminalSurface
    int rows() const override { return term_height; }
    int columns() const override { return term_width; }
    void update_size() override;
    int width(Viewport viewport) const override;
    void clear(Viewport viewport) override;
    void draw_border(Viewport viewport) override;
    void add_line(Viewport viewport, const std::string& text) override;
    void write_at(Viewport viewport, int row, int col, const std::string& text) override;
    void refresh(Viewport viewport) override;

    // InputSource: blocks until a key, a character or a resize arrives
    bool next(RawInput& out) override;

    // ByteSource
    bool read_byte(unsigned char& c, int timeout_ms) override;

    static constexpr const char* kAnonymousNickname = "Anonymous";

    // Screen rows occupied by the input box
    static constexpr int kInputHeight = 3;

private:
    struct Placed {
        int row;
        int col;
        std::string text;
    };

    struct Region {
        int top = 0;      // 0-based screen row
        int height = 0;
        int width = 0;
        bool border = false;
        bool cleared = false;
        std::vector<Placed> placed;
    };

    void calculate_layout();
    void write_tty(const std::string& s);
    Region& region(Viewport viewport);
    void flush_region(const Region& r, bool whole_screen);


    int term_width;
    int term_height;

    Region base_;
    Region history_;
    Region input_;
    std::deque<std::string> history_rows_;

    int tty_fd_;
    KeyDecoder decoder_;
    bool raw_mode_;
    struct termios orig_termios_;
    int saved_stdout_;
    int saved_stderr_;
    int null_fd_;
};

#endif // FILECHAT_TERMINAL_CLI_H
