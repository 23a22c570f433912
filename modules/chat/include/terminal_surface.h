#ifndef FILECHAT_TERMINAL_SURFACE_H
#define FILECHAT_TERMINAL_SURFACE_H

#include <stdexcept>
#include <string>

// Screen regions. Base is the whole screen; History and Input are laid out
// once when the surface is set up.
enum class Viewport {
    Base,
    History,
    Input
};

// Thrown by a TerminalSurface that refuses to draw a piece of text
class RenderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Drawing primitives of the terminal. Implementations are not
 * thread-safe; callers serialize access (see DisplaySurface).
 */
class TerminalSurface {
public:
    virtual ~TerminalSurface() = default;

    virtual int rows() const = 0;
    virtual int columns() const = 0;

    // Re-query the terminal dimensions. Base follows the new size; History
    // and Input keep the geometry they were laid out with.
    virtual void update_size() = 0;

    // Columns available to a viewport, borders included
    virtual int width(Viewport viewport) const = 0;

    virtual void clear(Viewport viewport) = 0;
    virtual void draw_border(Viewport viewport) = 0;

    // Appends a line to a scrolling viewport; older lines scroll off the top
    virtual void add_line(Viewport viewport, const std::string& text) = 0;

    // Writes text at a position relative to the viewport origin
    virtual void write_at(Viewport viewport, int row, int col, const std::string& text) = 0;

    virtual void refresh(Viewport viewport) = 0;
};

#endif // FILECHAT_TERMINAL_SURFACE_H
