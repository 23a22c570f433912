#ifndef FILECHAT_DISPLAY_SURFACE_H
#define FILECHAT_DISPLAY_SURFACE_H

#include "terminal_surface.h"
#include <mutex>
#include <string>
#include <vector>

/**
 * @brief The history and input viewports behind one mutex.
 *
 * LogWatcher (background thread) and InputEngine (foreground thread) both
 * draw through this class. Every operation on the TerminalSurface happens with
 * surface_mutex_ held, and the lock covers exactly one redraw.
 */
class DisplaySurface {
public:
    explicit DisplaySurface(TerminalSurface& terminal);

    DisplaySurface(const DisplaySurface&) = delete;
    DisplaySurface& operator=(const DisplaySurface&) = delete;

    // Clears the history viewport and draws lines in order. Lines the
    // terminal rejects are skipped.
    void repaint_history(std::vector<std::string> lines);

    // Boxed "Say: " line showing the tail of buffer_text if it is too wide
    void repaint_input(const std::string& buffer_text);

    /**
     * @brief Resize handling: re-query the dimensions, clear and refresh the
     * whole screen. History and input viewports keep their initial geometry
     * until the next session.
     */
    void handle_resize();

    // Clears the screen and draws prompt + input centered (nickname entry)
    void show_prompt(const std::string& prompt, const std::string& input);

    /**
     * @brief Part of text rendered in a box max_width columns wide. When text
     * is wider, only its last max_width / 2 characters are shown.
     */
    static std::string visible_slice(const std::string& text, int max_width);

    static constexpr const char* kInputLabel = "Say: ";
    static constexpr int kInputRow = 1;
    static constexpr int kInputLabelColumn = 1;
    static constexpr int kInputTextColumn = 6;
    static constexpr int kInputReservedColumns = 8;

private:
    std::mutex surface_mutex_;
    TerminalSurface& terminal_;
};

#endif // FILECHAT_DISPLAY_SURFACE_H
