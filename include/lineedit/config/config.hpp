/*
 * Configuration - LineEdit
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <iosfwd>
#include <string>
#include <lineedit/render/style.hpp>

namespace lineedit {

// Read from ~/.lineeditrc by the demo; key=value per line, '#' comments.
struct EditorConfig {
    std::string prompt = "> ";
    int columns = 0;              // 0: probe the terminal, or 80
    int rows = 0;                 // 0: probe the terminal, or 24
    int tab_width = 4;
    bool probe_geometry = true;
    bool debug = false;
    std::string log_file;         // empty: ~/.lineedit.log when stderr is the terminal
    bool color = true;
    Style prompt_style = Style::Default;
    Style hint_style = Style::Default;
    bool hint_bold = false;
};

// Applies every recognised key; unknown keys and unparsable values are skipped.
void parse_config(std::istream& in, EditorConfig& cfg);
// false when the file cannot be opened (cfg untouched).
bool load_config(const std::string& path, EditorConfig& cfg);

} // namespace lineedit
