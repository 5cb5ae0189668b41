#include <lineedit/edit/edit_state.hpp>
#include <lineedit/util/utf8.hpp>
#include <utility>

namespace lineedit {

void EditState::reset() {
    buffer.clear();
    cursor = 0;
    previous_cursor = 0;
    previous_row = 0;
    max_rows = 0;
}

void EditState::detach() {
    previous_row = 0;
    max_rows = 0;
}

void EditState::commit_frame(int cursor_row, int rows) {
    previous_cursor = cursor;
    previous_row = cursor_row;
    max_rows = rows;
}

void EditState::assign(std::u32string text) {
    buffer = std::move(text);
    cursor = buffer.size();
}

std::string EditState::text() const { return utf8::encode(buffer); }

void EditState::insert(char32_t ch) {
    buffer.insert(buffer.begin() + static_cast<std::ptrdiff_t>(cursor), ch);
    ++cursor;
}

bool EditState::backspace() {
    if (cursor == 0) return false;
    --cursor;
    buffer.erase(cursor, 1);
    return true;
}

bool EditState::erase_forward() {
    if (cursor == buffer.size()) return false;
    buffer.erase(cursor, 1);
    return true;
}

bool EditState::transpose() {
    // at the end of the line the last two characters swap
    std::size_t p = cursor == buffer.size() ? buffer.size() - 1 : cursor;
    if (buffer.empty() || p == 0) return false;
    std::swap(buffer[p - 1], buffer[p]);
    if (cursor < buffer.size()) ++cursor;
    return true;
}

bool EditState::move_left() {
    if (cursor == 0) return false;
    --cursor;
    return true;
}

bool EditState::move_right() {
    if (cursor == buffer.size()) return false;
    ++cursor;
    return true;
}

bool EditState::move_home() {
    if (cursor == 0) return false;
    cursor = 0;
    return true;
}

bool EditState::move_end() {
    if (cursor == buffer.size()) return false;
    cursor = buffer.size();
    return true;
}

void EditState::kill_to_end() { buffer.resize(cursor); }

void EditState::delete_previous_word() {
    // skip the spaces left of the cursor, then the word; everything from
    // there on is dropped
    std::size_t p = cursor;
    while (p > 0 && buffer[p - 1] == U' ') --p;
    while (p > 0 && buffer[p - 1] != U' ') --p;
    buffer.resize(p);
    cursor = p;
}

} // namespace lineedit
