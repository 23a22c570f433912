/**
 * terminal_cli.cpp - Two-viewport chat TUI on a raw /dev/tty
 *
 * All drawing goes through write_tty(), which writes to /dev/tty directly.
 * stdout/stderr are pointed at /dev/null while the UI owns the terminal.
 */

#include "terminal_cli.h"
#include "text_utils.h"
#include "logger.h"
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <fcntl.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <unistd.h>

// ═══════════════════════════════════════════════════════════════════════════
// ANSI ESCAPE CODES
// ═══════════════════════════════════════════════════════════════════════════

#define ESC_ALT_SCREEN_ON   "\033[?1049h"
#define ESC_ALT_SCREEN_OFF  "\033[?1049l"
#define ESC_CLEAR           "\033[2J"
#define ESC_HOME            "\033[H"
#define ESC_HIDE_CURSOR     "\033[?25l"
#define ESC_SHOW_CURSOR     "\033[?25h"
#define ESC_CLEAR_LINE      "\033[2K"

#define C_RESET      "\033[0m"
#define C_CYAN       "\033[36m"

#define BOX_TL  "╔"
#define BOX_TR  "╗"
#define BOX_BL  "╚"
#define BOX_BR  "╝"
#define BOX_H   "═"
#define BOX_V   "║"

// ═══════════════════════════════════════════════════════════════════════════
// GLOBAL STATE
// ═══════════════════════════════════════════════════════════════════════════

// SIGWINCH may land on any thread, so the handler only pokes a pipe
static int g_resize_pipe[2] = {-1, -1};
static struct sigaction g_old_winch;

static void on_sigwinch(int) {
    int saved = errno;
    if (g_resize_pipe[1] >= 0) {
        char b = 1;
        ssize_t n = ::write(g_resize_pipe[1], &b, 1);
        (void)n;
    }
    errno = saved;
}

// ═══════════════════════════════════════════════════════════════════════════
// HELPERS
// ═══════════════════════════════════════════════════════════════════════════

static std::string repeat_str(const std::string& s, int n) {
    std::string r;
    for (int i = 0; i < n; i++) r += s;
    return r;
}

static std::string cursor_to(int row0, int col0) {
    return "\033[" + std::to_string(row0 + 1) + ";" + std::to_string(col0 + 1) + "H";
}

// Rejects text that would be interpreted by the terminal (ESC, C0 and C1
// controls). Tabs become spaces.
static std::string renderable_or_throw(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size()) {
        uint32_t cp = 0;
        size_t n = utf8_decode(text, pos, cp);
        if (n == 0) {
            throw RenderError("malformed UTF-8");
        }
        if (cp == '\t') {
            out += ' ';
        } else if (cp < 0x20 || cp == 0x7F || (cp >= 0x80 && cp <= 0x9F)) {
            throw RenderError("control character U+" + std::to_string(cp));
        } else {
            out.append(text, pos, n);
        }
        pos += n;
    }
    return out;
}

// Splits text into rows no wider than width by the width heuristic
static std::vector<std::string> wrap_rows(const std::string& text, int width) {
    std::vector<std::string> rows;
    std::string current;
    int current_w = 0;
    size_t pos = 0;
    while (pos < text.size()) {
        uint32_t cp = 0;
        size_t n = utf8_decode(text, pos, cp);
        if (n == 0) n = 1;
        int w = (cp > 127) ? 2 : 1;
        if (current_w + w > width && !current.empty()) {
            rows.push_back(current);
            current.clear();
            current_w = 0;
        }
        current.append(text, pos, n);
        current_w += w;
        pos += n;
    }
    rows.push_back(current);
    return rows;
}

// ═══════════════════════════════════════════════════════════════════════════
// TERMINAL CLI
// ═══════════════════════════════════════════════════════════════════════════

TerminalCLI::TerminalCLI()
    : term_width(80)
    , term_height(24)
    , tty_fd_(-1)
    , raw_mode_(false)
    , orig_termios_()
    , saved_stdout_(-1)
    , saved_stderr_(-1)
    , null_fd_(-1)
{
}

TerminalCLI::~TerminalCLI() {
    restore_terminal();
}

void TerminalCLI::setup_terminal() {
    tty_fd_ = ::open("/dev/tty", O_RDWR | O_CLOEXEC);
    if (tty_fd_ < 0) {
        throw std::runtime_error(std::string("cannot open /dev/tty: ") + std::strerror(errno));
    }

    if (::pipe(g_resize_pipe) == 0) {
        ::fcntl(g_resize_pipe[0], F_SETFL, O_NONBLOCK);
        ::fcntl(g_resize_pipe[1], F_SETFL, O_NONBLOCK);
        struct sigaction sa;
        std::memset(&sa, 0, sizeof(sa));
        sa.sa_handler = on_sigwinch;
        sigemptyset(&sa.sa_mask);
        sa.sa_flags = SA_RESTART;
        ::sigaction(SIGWINCH, &sa, &g_old_winch);
    } else {
        LOG_WARN(std::string("TerminalCLI: resize notifications disabled: ") + std::strerror(errno));
    }

    // Save stdout/stderr, then silence them while the UI is up
    saved_stdout_ = ::dup(STDOUT_FILENO);
    saved_stderr_ = ::dup(STDERR_FILENO);
    null_fd_ = ::open("/dev/null", O_WRONLY | O_CLOEXEC);
    if (null_fd_ >= 0) {
        ::dup2(null_fd_, STDOUT_FILENO);
        ::dup2(null_fd_, STDERR_FILENO);
    }

    if (::tcgetattr(tty_fd_, &orig_termios_) == 0) {
        struct termios raw = orig_termios_;
        // ISIG off so Ctrl-C arrives as byte 3
        raw.c_lflag &= ~(ICANON | ECHO | ISIG | IEXTEN);
        raw.c_iflag &= ~(IXON);
        raw.c_cc[VMIN] = 1;
        raw.c_cc[VTIME] = 0;
        if (::tcsetattr(tty_fd_, TCSAFLUSH, &raw) == 0) {
            raw_mode_ = true;
        }
    }
    if (!raw_mode_) {
        LOG_WARN(std::string("TerminalCLI: raw mode unavailable: ") + std::strerror(errno));
    }

    update_size();
    calculate_layout();

    write_tty(ESC_ALT_SCREEN_ON);
    write_tty(ESC_HIDE_CURSOR);
    write_tty(ESC_CLEAR);
    write_tty(ESC_HOME);
    LOG_INFO("TerminalCLI: " + std::to_string(term_width) + "x" + std::to_string(term_height));
}

void TerminalCLI::restore_terminal() {
    if (tty_fd_ < 0) {
        return;
    }
    write_tty(ESC_SHOW_CURSOR);
    write_tty(ESC_ALT_SCREEN_OFF);

    if (raw_mode_) {
        ::tcsetattr(tty_fd_, TCSAFLUSH, &orig_termios_);
        raw_mode_ = false;
    }

    if (g_resize_pipe[0] >= 0) {
        ::sigaction(SIGWINCH, &g_old_winch, nullptr);
        ::close(g_resize_pipe[0]);
        ::close(g_resize_pipe[1]);
        g_resize_pipe[0] = g_resize_pipe[1] = -1;
    }

    if (saved_stdout_ >= 0) {
        ::dup2(saved_stdout_, STDOUT_FILENO);
        ::close(saved_stdout_);
        saved_stdout_ = -1;
    }
    if (saved_stderr_ >= 0) {
        ::dup2(saved_stderr_, STDERR_FILENO);
        ::close(saved_stderr_);
        saved_stderr_ = -1;
    }
    if (null_fd_ >= 0) {
        ::close(null_fd_);
        null_fd_ = -1;
    }
    ::close(tty_fd_);
    tty_fd_ = -1;
}

void TerminalCLI::write_tty(const std::string& s) {
    size_t off = 0;
    while (tty_fd_ >= 0 && off < s.size()) {
        ssize_t n = ::write(tty_fd_, s.data() + off, s.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            return;
        }
        off += static_cast<size_t>(n);
    }
}

void TerminalCLI::update_size() {
    struct winsize ws;
    int fd = (tty_fd_ >= 0) ? tty_fd_ : STDIN_FILENO;
    if (::ioctl(fd, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0 && ws.ws_row > 0) {
        term_width = ws.ws_col;
        term_height = ws.ws_row;
    }
    base_.height = std::max(term_height, kInputHeight + 1);
    base_.width = term_width;
}

int TerminalCLI::width(Viewport viewport) const {
    switch (viewport) {
        case Viewport::History: return history_.width;
        case Viewport::Input:   return input_.width;
        case Viewport::Base:    break;
    }
    return base_.width;
}

void TerminalCLI::calculate_layout() {
    const int h = std::max(term_height, kInputHeight + 1);

    base_.top = 0;
    base_.height = h;
    base_.width = term_width;

    history_.top = 0;
    history_.height = h - kInputHeight;
    history_.width = term_width;

    input_.top = h - kInputHeight;
    input_.height = kInputHeight;
    input_.width = term_width;
}

TerminalCLI::Region& TerminalCLI::region(Viewport viewport) {
    switch (viewport) {
        case Viewport::History: return history_;
        case Viewport::Input:   return input_;
        case Viewport::Base:    break;
    }
    return base_;
}

void TerminalCLI::clear(Viewport viewport) {
    Region& r = region(viewport);
    r.cleared = true;
    r.border = false;
    r.placed.clear();
    if (viewport == Viewport::History) {
        history_rows_.clear();
    }
}

void TerminalCLI::draw_border(Viewport viewport) {
    region(viewport).border = true;
}

void TerminalCLI::add_line(Viewport viewport, const std::string& text) {
    const std::string clean = renderable_or_throw(text);
    if (viewport != Viewport::History) {
        throw RenderError("viewport does not scroll");
    }
    Region& r = region(viewport);
    for (auto& row : wrap_rows(clean, std::max(1, r.width))) {
        history_rows_.push_back(std::move(row));
    }
    // Scrolling: keep only what fits
    while (static_cast<int>(history_rows_.size()) > r.height) {
        history_rows_.pop_front();
    }
}

void TerminalCLI::write_at(Viewport viewport, int row, int col, const std::string& text) {
    const std::string clean = renderable_or_throw(text);
    Region& r = region(viewport);
    if (row < 0 || row >= r.height || col < 0) {
        throw RenderError("position outside viewport");
    }
    if (col + static_cast<int>(display_width(clean)) > r.width) {
        throw RenderError("text wider than viewport");
    }
    r.placed.push_back(Placed{row, col, clean});
}

void TerminalCLI::refresh(Viewport viewport) {
    Region& r = region(viewport);
    flush_region(r, viewport == Viewport::Base);
    if (viewport == Viewport::History) {
        std::ostringstream oss;
        int row = r.top;
        for (const auto& line : history_rows_) {
            oss << cursor_to(row++, 0) << line;
        }
        write_tty(oss.str());
    }
    r.cleared = false;
}

void TerminalCLI::flush_region(const Region& r, bool whole_screen) {
    std::ostringstream oss;

    if (r.cleared) {
        if (whole_screen) {
            oss << ESC_CLEAR << ESC_HOME;
        } else {
            for (int i = 0; i < r.height; i++) {
                oss << cursor_to(r.top + i, 0) << ESC_CLEAR_LINE;
            }
        }
    }

    if (r.border && r.height >= 2 && r.width >= 2) {
        oss << C_CYAN;
        oss << cursor_to(r.top, 0) << BOX_TL << repeat_str(BOX_H, r.width - 2) << BOX_TR;
        for (int i = 1; i < r.height - 1; i++) {
            oss << cursor_to(r.top + i, 0) << BOX_V;
            oss << cursor_to(r.top + i, r.width - 1) << BOX_V;
        }
        oss << cursor_to(r.top + r.height - 1, 0) << BOX_BL << repeat_str(BOX_H, r.width - 2) << BOX_BR;
        oss << C_RESET;
    }

    for (const auto& p : r.placed) {
        oss << cursor_to(r.top + p.row, p.col) << p.text;
    }
    write_tty(oss.str());
}

// ═══════════════════════════════════════════════════════════════════════════
// INPUT
// ═══════════════════════════════════════════════════════════════════════════

bool TerminalCLI::read_byte(unsigned char& c, int timeout_ms) {
    struct pollfd pfd;
    pfd.fd = tty_fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;
    int rc = ::poll(&pfd, 1, timeout_ms);
    if (rc <= 0) {
        return false;
    }
    return ::read(tty_fd_, &c, 1) == 1;
}

bool TerminalCLI::next(RawInput& out) {
    if (tty_fd_ < 0) {
        return false;
    }

    while (true) {
        unsigned char held = 0;
        if (decoder_.take_pending(held)) {
            if (decoder_.decode(held, *this, out)) {
                return true;
            }
            continue;
        }

        struct pollfd fds[2];
        fds[0].fd = tty_fd_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = g_resize_pipe[0];
        fds[1].events = POLLIN;
        fds[1].revents = 0;
        const nfds_t count = (g_resize_pipe[0] >= 0) ? 2 : 1;

        // No timeout: the session waits for the user
        int rc = ::poll(fds, count, -1);
        if (rc < 0) {
            if (errno == EINTR) continue;
            LOG_ERROR(std::string("TerminalCLI: poll failed: ") + std::strerror(errno));
            return false;
        }

        if (count == 2 && (fds[1].revents & POLLIN)) {
            char drain[64];
            while (::read(g_resize_pipe[0], drain, sizeof(drain)) > 0) {
            }
            out = RawInput::key(kKeyResize);
            return true;
        }

        if (fds[0].revents & (POLLHUP | POLLERR | POLLNVAL)) {
            if (!(fds[0].revents & POLLIN)) {
                LOG_WARN("TerminalCLI: terminal hung up");
                return false;
            }
        }
        if (!(fds[0].revents & POLLIN)) {
            continue;
        }

        unsigned char c = 0;
        ssize_t n = ::read(tty_fd_, &c, 1);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            LOG_ERROR(std::string("TerminalCLI: read failed: ") + std::strerror(errno));
            return false;
        }
        if (n == 0) {
            return false;
        }
        if (decoder_.decode(c, *this, out)) {
            return true;
        }
    }
}

std::optional<std::string> TerminalCLI::prompt_nickname(DisplaySurface& display, size_t max_bytes) {
    static const std::string prompt = "Enter your nickname: ";
    std::string nick;
    display.show_prompt(prompt, nick);

    RawInput raw;
    while (next(raw)) {
        const InputEvent ev = classify_input(raw);
        switch (ev.type) {
            case InputEventType::Interrupt:
                return std::nullopt;
            case InputEventType::Submit:
                return trim_copy(nick);
            case InputEventType::Backspace:
                utf8_pop_back(nick);
                break;
            case InputEventType::Resize:
                display.handle_resize();
                break;
            case InputEventType::Character:
                if (nick.size() + ev.character.size() <= max_bytes) {
                    nick += ev.character;
                }
                break;
            case InputEventType::Ignore:
                continue;
        }
        display.show_prompt(prompt, nick);
    }
    // Input closed before a name was entered
    return std::string(kAnonymousNickname);
}
