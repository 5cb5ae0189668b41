/*
 * Configuration - LineEdit
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <lineedit/config/config.hpp>
#include <lineedit/util/log.hpp>
#include <cctype>
#include <fstream>
#include <optional>
#include <stdexcept>

namespace lineedit {

static std::string trim(const std::string& s) {
    std::size_t first = 0, last = s.size();
    while (first < last && std::isspace(static_cast<unsigned char>(s[first]))) ++first;
    while (last > first && std::isspace(static_cast<unsigned char>(s[last - 1]))) --last;
    return s.substr(first, last - first);
}

static std::optional<bool> parse_bool(const std::string& v) {
    if (v=="1"||v=="true"||v=="on") return true;
    if (v=="0"||v=="false"||v=="off") return false;
    return std::nullopt;
}

static std::optional<int> parse_int(const std::string& v) {
    try {
        std::size_t used = 0; int n = std::stoi(v, &used);
        if (used != v.size()) return std::nullopt;
        return n;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

void parse_config(std::istream& in, EditorConfig& cfg) {
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back()=='\r') line.pop_back();
        auto t = trim(line);
        if (t.empty() || t[0]=='#') continue;
        auto eq = line.find('='); if (eq==std::string::npos) continue;
        auto key = trim(line.substr(0, eq)); auto val = line.substr(eq+1);
        if (key != "prompt") val = trim(val); // a prompt keeps its trailing blanks
        bool ok = true;
        if (key=="prompt") cfg.prompt = val;
        else if (key=="columns") { auto n = parse_int(val); ok = n && *n >= 0; if (ok) cfg.columns = *n; }
        else if (key=="rows") { auto n = parse_int(val); ok = n && *n >= 0; if (ok) cfg.rows = *n; }
        else if (key=="tab_width") { auto n = parse_int(val); ok = n && *n > 0; if (ok) cfg.tab_width = *n; }
        else if (key=="probe_geometry") { auto b = parse_bool(val); ok = b.has_value(); if (ok) cfg.probe_geometry = *b; }
        else if (key=="log_file") cfg.log_file = val;
        else if (key=="debug") { auto b = parse_bool(val); ok = b.has_value(); if (ok) cfg.debug = *b; }
        else if (key=="color") { auto b = parse_bool(val); ok = b.has_value(); if (ok) cfg.color = *b; }
        else if (key=="hint_bold") { auto b = parse_bool(val); ok = b.has_value(); if (ok) cfg.hint_bold = *b; }
        else if (key=="prompt_style") { auto s = parse_style(val); ok = s.has_value(); if (ok) cfg.prompt_style = *s; }
        else if (key=="hint_style") { auto s = parse_style(val); ok = s.has_value(); if (ok) cfg.hint_style = *s; }
        else log::debug("config: unknown key '" + key + "'");
        if (!ok) log::debug("config: bad value for '" + key + "': " + val);
    }
}

bool load_config(const std::string& path, EditorConfig& cfg) {
    std::ifstream in(path);
    if (!in) return false;
    parse_config(in, cfg);
    return true;
}

} // namespace lineedit
