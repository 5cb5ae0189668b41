/*
 * History - LineEdit
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace lineedit {

// In-memory history. The last entry is the scratch slot holding the line
// being typed; the position always stays within [0, size()-1].
class History {
public:
    History() : m_lines{std::string()} {}

    // Freezes the scratch slot to line and opens a new empty one.
    void add(const std::string& line);
    // Stores line in the scratch slot, only while the scratch slot is selected.
    void save(const std::string& line);

    bool prev(); // false: beginning of history
    bool next(); // false: end of history

    const std::string& get() const { return m_lines[m_pos]; }
    std::size_t position() const { return m_pos; }
    std::size_t size() const { return m_lines.size(); }
    bool at_scratch() const { return m_pos + 1 == m_lines.size(); }
    const std::vector<std::string>& entries() const { return m_lines; }

private:
    std::vector<std::string> m_lines;
    std::size_t m_pos = 0;
};

} // namespace lineedit
