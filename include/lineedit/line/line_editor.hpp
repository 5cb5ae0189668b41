/*
 * Line editor - LineEdit
 * Supports: insertion, deletion, cursor motion, transpose, kill, word delete,
 * history browsing, tab completion, help listing, hints, multi-row lines.
 *
 * One read_line() call is one editing session. It blocks on the stream,
 * decodes keys, applies them and redraws after every key until enter,
 * ctrl-C, ctrl-D on an empty line, end of stream or an I/O error. Only one
 * session may run at a time; write_out() from another thread needs the
 * caller to serialize access to the stream.
 */
#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <lineedit/complete/providers.hpp>
#include <lineedit/core/status.hpp>
#include <lineedit/edit/edit_state.hpp>
#include <lineedit/edit/history.hpp>
#include <lineedit/io/stream.hpp>
#include <lineedit/key/key_decoder.hpp>
#include <lineedit/render/renderer.hpp>

namespace lineedit {

struct LineResult {
    std::string line;   // the buffer as it was when the session ended
    Status status;      // Ok after enter
};

struct WriteResult {
    std::size_t written = 0;
    Status status;
};

struct EditorOptions {
    Geometry geometry;  // zero fields fall back to 80x24
    WidthFn width;      // empty: default_width
    Providers providers;
};

// Parses "ESC [ rows ; cols R" (anything before the last ESC [ is ignored).
std::optional<Geometry> parse_cursor_report(const std::string& report);

class LineEditor {
public:
    LineEditor(Stream& stream, std::string prompt, EditorOptions opts = {});

    LineResult read_line();

    // Asks the terminal for its size by parking the cursor at 999;999 and
    // reading the position report back.
    Status probe_geometry();

    // Prints bytes above the line being edited, then redraws the line.
    // Outside read_line() the last drawn line is erased and not redrawn.
    WriteResult write_out(const std::string& bytes);

    // Same as ctrl-L; outside read_line() only the screen is cleared.
    Status clear_screen();

    History& history() { return m_history; }
    const EditState& state() const { return m_state; }
    const Geometry& geometry() const { return m_geometry; }
    void set_geometry(Geometry g) { m_geometry = normalized(g); }
    const std::string& prompt() const { return m_prompt; }
    void set_prompt(std::string prompt) { m_prompt = std::move(prompt); }
    Providers& providers() { return m_providers; }

private:
    std::optional<LineResult> dispatch(const KeyEvent& ev);
    LineResult finish(const Status& st);

    Status line_reset();
    Status clear_line();
    Status refresh();
    Status beep();
    Status edit(bool applied);
    Status complete_line();
    Status show_help();
    Status history_prev();
    Status history_next();
    Hint current_hint() const;

    InputReader m_in;
    OutputBuffer m_out;
    KeyDecoder m_decoder;
    std::string m_prompt;
    Geometry m_geometry;
    WidthFn m_width;
    Providers m_providers;
    EditState m_state;
    History m_history;
    bool m_active = false; // inside read_line()
};

} // namespace lineedit
