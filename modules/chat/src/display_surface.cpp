#include "display_surface.h"
#include "text_utils.h"
#include "logger.h"
#include <algorithm>

DisplaySurface::DisplaySurface(TerminalSurface& terminal) : terminal_(terminal) {}

void DisplaySurface::repaint_history(std::vector<std::string> lines) {
    std::lock_guard<std::mutex> lock(surface_mutex_);

    terminal_.clear(Viewport::History);
    size_t skipped = 0;
    for (const auto& line : lines) {
        try {
            terminal_.add_line(Viewport::History, line);
        } catch (const RenderError& e) {
            ++skipped;
            LOG_DEBUG(std::string("DisplaySurface: skipped history line: ") + e.what());
        }
    }
    terminal_.refresh(Viewport::History);

    if (skipped > 0) {
        LOG_DEBUG("DisplaySurface: " + std::to_string(skipped) + " of " +
                  std::to_string(lines.size()) + " lines not rendered");
    }
}

void DisplaySurface::repaint_input(const std::string& buffer_text) {
    std::lock_guard<std::mutex> lock(surface_mutex_);

    terminal_.clear(Viewport::Input);
    terminal_.draw_border(Viewport::Input);
    try {
        terminal_.write_at(Viewport::Input, kInputRow, kInputLabelColumn, kInputLabel);
    } catch (const RenderError& e) {
        LOG_DEBUG(std::string("DisplaySurface: input label not rendered: ") + e.what());
    }

    // Budget from the box itself: it keeps its size across a resize
    const int max_width = terminal_.width(Viewport::Input) - kInputReservedColumns;
    try {
        terminal_.write_at(Viewport::Input, kInputRow, kInputTextColumn, visible_slice(buffer_text, max_width));
    } catch (const RenderError& e) {
        LOG_DEBUG(std::string("DisplaySurface: input text not rendered: ") + e.what());
    }
    terminal_.refresh(Viewport::Input);
}

void DisplaySurface::handle_resize() {
    std::lock_guard<std::mutex> lock(surface_mutex_);

    terminal_.update_size();
    terminal_.clear(Viewport::Base);
    terminal_.refresh(Viewport::Base);
    LOG_DEBUG("DisplaySurface: resized to " + std::to_string(terminal_.columns()) + "x" +
              std::to_string(terminal_.rows()));
}

void DisplaySurface::show_prompt(const std::string& prompt, const std::string& input) {
    std::lock_guard<std::mutex> lock(surface_mutex_);

    const int prompt_width = static_cast<int>(display_width(prompt));
    const int start_col = std::max(0, (terminal_.width(Viewport::Base) - prompt_width) / 2);
    const int start_row = terminal_.rows() / 2;

    terminal_.clear(Viewport::Base);
    try {
        terminal_.write_at(Viewport::Base, start_row, start_col, prompt + input);
    } catch (const RenderError& e) {
        // Typed text the terminal refuses: show the prompt alone
        LOG_DEBUG(std::string("DisplaySurface: prompt input not rendered: ") + e.what());
        try {
            terminal_.write_at(Viewport::Base, start_row, start_col, prompt);
        } catch (const RenderError& inner) {
            LOG_DEBUG(std::string("DisplaySurface: prompt not rendered: ") + inner.what());
        }
    }
    terminal_.refresh(Viewport::Base);
}

std::string DisplaySurface::visible_slice(const std::string& text, int max_width) {
    if (max_width <= 0) {
        return std::string();
    }
    if (display_width(text) <= static_cast<size_t>(max_width)) {
        return text;
    }
    // Half the width in characters keeps even all-wide text inside the box
    return utf8_tail(text, static_cast<size_t>(max_width / 2));
}
