#include <lineedit/render/style.hpp>

namespace lineedit {

static const char* const kNames[] = {"default", "black", "red", "green", "yellow", "blue", "magenta", "cyan", "white"};

const char* to_string(Style style) { return kNames[static_cast<int>(style)]; }

std::optional<Style> parse_style(const std::string& name) {
    for (int i = 0; i <= static_cast<int>(Style::White); ++i)
        if (name == kNames[i]) return static_cast<Style>(i);
    return std::nullopt;
}

std::string style_sequence(Style style, bool bold) {
    if (style == Style::Default) return bold ? "\x1b[1m" : "";
    // Black..White are SGR 30..37
    std::string color = std::to_string(30 + static_cast<int>(style) - static_cast<int>(Style::Black));
    return std::string("\x1b[") + (bold ? "1;" : "") + color + "m";
}

std::string colorize(const std::string& text, Style style, bool bold) {
    std::string seq = style_sequence(style, bold);
    if (seq.empty()) return text;
    return seq + text + kStyleReset;
}

} // namespace lineedit
