/*
 * Styles - LineEdit
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <optional>
#include <string>

namespace lineedit {

enum class Style { Default, Black, Red, Green, Yellow, Blue, Magenta, Cyan, White };

constexpr const char* kStyleReset = "\x1b[0m";

const char* to_string(Style style);
std::optional<Style> parse_style(const std::string& name); // "red", "cyan", ...

// SGR sequence selecting style (and bold); empty for Default without bold.
std::string style_sequence(Style style, bool bold = false);
// text wrapped in the style and a reset, or text unchanged when nothing applies.
std::string colorize(const std::string& text, Style style, bool bold = false);

} // namespace lineedit
