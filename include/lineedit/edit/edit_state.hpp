/*
 * Edit state - LineEdit
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <cstddef>
#include <string>

namespace lineedit {

// Line buffer, cursor and what the renderer needs to remember about the
// last frame it drew. Every primitive keeps 0 <= cursor <= buffer.size();
// the ones returning bool report false for a no-op at a buffer edge and
// leave the state untouched.
struct EditState {
    std::u32string buffer;
    std::size_t cursor = 0;

    // Set only after a frame reached the terminal.
    std::size_t previous_cursor = 0;
    int previous_row = 0; // row the cursor was left on, relative to the first row of the line
    int max_rows = 0;     // lowest row index drawn since the block started

    void reset();
    // The drawn rows are no longer under the cursor (something was printed
    // below them, or the screen was cleared): the next frame starts fresh.
    void detach();
    void commit_frame(int cursor_row, int rows);

    // Replaces the whole buffer and puts the cursor at its end.
    void assign(std::u32string text);
    std::string text() const;

    void insert(char32_t ch);
    bool backspace();
    bool erase_forward();
    bool transpose();
    bool move_left();
    bool move_right();
    bool move_home();
    bool move_end();
    void kill_to_end();
    void delete_previous_word();
};

} // namespace lineedit
