#include <lineedit/util/utf8.hpp>

namespace lineedit::utf8 {

std::size_t sequence_length(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 0;
}

std::optional<char32_t> decode_one(const unsigned char* bytes, std::size_t len) {
    if (len == 0 || len != sequence_length(bytes[0])) return std::nullopt;
    if (len == 1) return bytes[0];
    static const unsigned char lead_mask[] = {0, 0, 0x1F, 0x0F, 0x07};
    static const char32_t min_value[] = {0, 0, 0x80, 0x800, 0x10000};
    char32_t cp = bytes[0] & lead_mask[len];
    for (std::size_t i = 1; i < len; ++i) {
        if ((bytes[i] & 0xC0) != 0x80) return std::nullopt;
        cp = (cp << 6) | (bytes[i] & 0x3F);
    }
    if (cp < min_value[len] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return std::nullopt;
    return cp;
}

void append(std::string& out, char32_t cp) {
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) cp = kReplacement;
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

std::string encode(const std::u32string& text) {
    std::string out; out.reserve(text.size());
    for (char32_t cp : text) append(out, cp);
    return out;
}

std::u32string decode(const std::string& text) {
    std::u32string out; out.reserve(text.size());
    auto bytes = reinterpret_cast<const unsigned char*>(text.data());
    std::size_t i = 0;
    while (i < text.size()) {
        std::size_t len = sequence_length(bytes[i]);
        if (len == 0 || i + len > text.size()) { out.push_back(kReplacement); ++i; continue; }
        auto cp = decode_one(bytes + i, len);
        if (!cp) { out.push_back(kReplacement); ++i; continue; }
        out.push_back(*cp);
        i += len;
    }
    return out;
}

} // namespace lineedit::utf8
