/*
 * Completion, hint and help providers - LineEdit
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Providers are optional capabilities handed to the line editor. An absent
 * provider (std::nullopt in Providers) is a real configuration: tab and '?'
 * then insert themselves literally and no hint is drawn.
 */
#pragma once
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <lineedit/render/renderer.hpp>

namespace lineedit {

// Grid policy: no candidate rings the bell, one replaces the line, more are
// listed below the line (the line itself is kept). Every tab lists again.
struct CompletionProvider {
    std::function<std::vector<std::string>(const std::string& line)> candidates;
};

// Recomputed on every frame; an empty text draws nothing.
struct HintProvider {
    std::function<Hint(const std::string& line)> hint;
};

struct HelpEntry {
    std::string key;
    std::string description;
};

struct HelpProvider {
    std::function<std::vector<HelpEntry>(const std::string& line)> entries;
};

struct Providers {
    std::optional<CompletionProvider> completion;
    std::optional<HintProvider> hint;
    std::optional<HelpProvider> help;
};

// Aligned table: every row starts on a new line with "\n\r" + indent, each
// cell is padded to the widest cell of its column plus `padding` spaces,
// and a final "\n" closes the table.
std::string format_table(const std::vector<std::vector<std::string>>& rows,
                         const std::string& indent, int padding);

std::string format_candidates(const std::vector<std::string>& candidates); // three per row
std::string format_help(const std::vector<HelpEntry>& entries);

} // namespace lineedit
