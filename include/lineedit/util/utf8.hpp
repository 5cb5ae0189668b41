/*
 * UTF-8 helpers - LineEdit
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <cstddef>
#include <optional>
#include <string>

namespace lineedit::utf8 {

constexpr char32_t kReplacement = 0xFFFD;

// Number of bytes announced by a lead byte, 0 for a stray continuation/invalid byte.
std::size_t sequence_length(unsigned char lead);

// Decodes one sequence of len bytes. Invalid, overlong or surrogate
// sequences yield nullopt.
std::optional<char32_t> decode_one(const unsigned char* bytes, std::size_t len);

void append(std::string& out, char32_t cp);
std::string encode(const std::u32string& text);
std::u32string decode(const std::string& text);

} // namespace lineedit::utf8
