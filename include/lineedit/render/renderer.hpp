/*
 * LineEdit Renderer
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Computes the bytes that bring the terminal in line with the edit state:
 *   prompt, buffer and hint are redrawn from the first row of the line, the
 *   rows a longer previous frame left behind are cleared bottom-up, and the
 *   cursor is put back where the edit cursor is. Rows are counted from the
 *   first row of the line (row 0). Nothing here touches a stream, so every
 *   frame can be checked byte for byte.
 *
 * License (MIT):
 *   Permission is hereby granted, free of charge, to any person obtaining a copy of this
 *   software and associated documentation files (the "Software"), to deal in the Software
 *   without restriction, including without limitation the rights to use, copy, modify, merge,
 *   publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons
 *   to whom the Software is furnished to do so, subject to the following conditions:
 *
 *   The above copyright notice and this permission notice shall be included in all copies or
 *   substantial portions of the Software.
 *
 *   THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED,
 *   INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR
 *   PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE
 *   FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR
 *   OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER
 *   DEALINGS IN THE SOFTWARE.
 */
#pragma once
#include <functional>
#include <string>
#include <lineedit/edit/edit_state.hpp>
#include <lineedit/render/style.hpp>

namespace lineedit {

namespace vt {
constexpr const char* ClearToEol = "\x1b[0K";
constexpr const char* ClearLine = "\x1b[2K";
constexpr const char* ClearScreen = "\x1b[H\x1b[2J";
constexpr const char* Bell = "\a";
constexpr const char* SaveCursor = "\x1b" "7";
constexpr const char* RestoreCursor = "\x1b" "8";
constexpr const char* ProbeSize = "\x1b[999;999H\x1b[6n";

std::string up(int n);
std::string down(int n);
std::string right(int n);
} // namespace vt

using WidthFn = std::function<int(char32_t)>;

// Tab is 4 columns, everything else 1.
int default_width(char32_t ch);
WidthFn make_width_fn(int tab_width);

// Columns taken by text, not counting escape sequences: after ESC every
// character up to and including the first ASCII letter is skipped.
int visual_width(const std::u32string& text, const WidthFn& width);
int visual_width(const std::string& utf8_text, const WidthFn& width);

struct Geometry {
    int columns = 80;
    int rows = 24;
};

// Zero or negative fields fall back to 80x24.
Geometry normalized(Geometry g);

struct Hint {
    std::string text;
    Style style = Style::Default;
    bool bold = false;
};

struct Frame {
    std::string bytes;
    int cursor_row = 0; // row the cursor is left on
    int max_rows = 0;   // new value for EditState::max_rows
};

Frame render_line(const std::string& prompt, const EditState& state, const Hint& hint,
                  const Geometry& geometry, const WidthFn& width);

// Moves from the cursor row to the lowest row drawn so far.
std::string move_to_bottom(const EditState& state);
// Clears every drawn row and leaves the cursor at the start of row 0.
std::string erase_block(const EditState& state);

} // namespace lineedit
