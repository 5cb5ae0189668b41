#include <lineedit/edit/history.hpp>

namespace lineedit {

void History::add(const std::string& line) {
    m_lines.back() = line;
    m_lines.emplace_back();
    m_pos = m_lines.size() - 1;
}

void History::save(const std::string& line) {
    if (!at_scratch()) return;
    m_lines.back() = line;
}

bool History::prev() {
    if (m_pos == 0) return false;
    --m_pos;
    return true;
}

bool History::next() {
    if (at_scratch()) return false;
    ++m_pos;
    return true;
}

} // namespace lineedit
