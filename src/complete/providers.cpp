#include <lineedit/complete/providers.hpp>
#include <lineedit/util/utf8.hpp>
#include <algorithm>

namespace lineedit {

static std::size_t cell_width(const std::string& cell) { return utf8::decode(cell).size(); }

std::string format_table(const std::vector<std::vector<std::string>>& rows,
                         const std::string& indent, int padding) {
    // the carriage return and indent count as part of the first cell
    const std::string lead = "\r" + indent;
    std::vector<std::size_t> widths;
    for (auto& row : rows) {
        for (std::size_t c = 0; c < row.size(); ++c) {
            std::size_t w = cell_width(row[c]) + (c == 0 ? cell_width(lead) : 0);
            if (widths.size() <= c) widths.push_back(w);
            else widths[c] = std::max(widths[c], w);
        }
    }
    std::string out;
    for (auto& row : rows) {
        out += "\n";
        for (std::size_t c = 0; c < row.size(); ++c) {
            std::string cell = (c == 0 ? lead : std::string()) + row[c];
            out += cell;
            out.append(widths[c] - cell_width(cell) + static_cast<std::size_t>(padding), ' ');
        }
    }
    out += "\n";
    return out;
}

std::string format_candidates(const std::vector<std::string>& candidates) {
    std::vector<std::vector<std::string>> rows;
    for (std::size_t i = 0; i < candidates.size(); i += 3) {
        auto end = candidates.begin() + static_cast<std::ptrdiff_t>(std::min(i + 3, candidates.size()));
        rows.emplace_back(candidates.begin() + static_cast<std::ptrdiff_t>(i), end);
    }
    return format_table(rows, "    ", 4);
}

std::string format_help(const std::vector<HelpEntry>& entries) {
    std::vector<std::vector<std::string>> rows;
    for (auto& e : entries) rows.push_back({e.key, e.description});
    return format_table(rows, "  ", 3);
}

} // namespace lineedit
