/*
 * LineEdit Renderer Implementation
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: See header for overview.
 */
#include <lineedit/render/renderer.hpp>
#include <lineedit/key/key_decoder.hpp>
#include <lineedit/util/utf8.hpp>
#include <algorithm>

namespace lineedit {

namespace vt {
std::string up(int n) { return "\x1b[" + std::to_string(n) + "A"; }
std::string down(int n) { return "\x1b[" + std::to_string(n) + "B"; }
std::string right(int n) { return "\x1b[" + std::to_string(n) + "C"; }
} // namespace vt

int default_width(char32_t ch) { return ch == keys::Tab ? 4 : 1; }

WidthFn make_width_fn(int tab_width) {
    if (tab_width <= 0) tab_width = 4;
    return [tab_width](char32_t ch) { return ch == keys::Tab ? tab_width : 1; };
}

int visual_width(const std::u32string& text, const WidthFn& width) {
    int w = 0; bool in_escape = false;
    for (char32_t ch : text) {
        if (in_escape) {
            if ((ch >= U'a' && ch <= U'z') || (ch >= U'A' && ch <= U'Z')) in_escape = false;
        } else if (ch == keys::Esc) {
            in_escape = true;
        } else {
            w += width(ch);
        }
    }
    return w;
}

int visual_width(const std::string& utf8_text, const WidthFn& width) {
    return visual_width(utf8::decode(utf8_text), width);
}

Geometry normalized(Geometry g) {
    if (g.columns <= 0) g.columns = 80;
    if (g.rows <= 0) g.rows = 24;
    return g;
}

std::string move_to_bottom(const EditState& state) {
    int down = state.max_rows - state.previous_row;
    return down > 0 ? vt::down(down) : std::string();
}

std::string erase_block(const EditState& state) {
    std::string out = move_to_bottom(state);
    for (int i = 0; i < state.max_rows; ++i) {
        out += vt::ClearLine;
        out += vt::up(1);
    }
    out += "\r";
    return out;
}

Frame render_line(const std::string& prompt, const EditState& state, const Hint& hint,
                  const Geometry& geometry, const WidthFn& width) {
    const int cols = normalized(geometry).columns;
    const WidthFn& wf = width ? width : WidthFn(default_width);

    int pw = visual_width(prompt, wf);
    int bw = 0, cw = 0;
    for (std::size_t i = 0; i < state.buffer.size(); ++i) {
        int w = wf(state.buffer[i]);
        if (i < state.cursor) cw += w;
        bw += w;
    }
    int hw = visual_width(hint.text, wf);

    // After writing `total` columns the terminal sits on the row of the last
    // character: a line ending exactly at the margin does not wrap by itself.
    int total = pw + bw + hw;
    int end_row = total > 0 ? (total - 1) / cols : 0;
    int cursor_col = (pw + cw) % cols;
    int cursor_row = (pw + cw) / cols;

    Frame f;
    f.bytes = erase_block(state);
    f.bytes += prompt;
    f.bytes += utf8::encode(state.buffer);
    f.bytes += colorize(hint.text, hint.style, hint.bold);
    f.bytes += vt::ClearToEol;

    if (state.cursor == state.buffer.size() && hw == 0 && pw + cw > 0 && cursor_col == 0) {
        // cursor belongs at the start of the next row; make the terminal go there
        f.bytes += "\n\r";
        end_row = cursor_row;
    }

    if (end_row - cursor_row > 0) f.bytes += vt::up(end_row - cursor_row);
    f.bytes += "\r";
    if (cursor_col > 0) f.bytes += vt::right(cursor_col);

    f.cursor_row = cursor_row;
    f.max_rows = std::max(state.max_rows, end_row);
    return f;
}

} // namespace lineedit
