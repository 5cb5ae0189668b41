/*
 * Byte stream plumbing - LineEdit
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <lineedit/io/stream.hpp>
#include <lineedit/util/utf8.hpp>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace lineedit {

ssize_t FdStream::read(char* buf, std::size_t len) { return ::read(m_read_fd, buf, len); }
ssize_t FdStream::write(const char* buf, std::size_t len) { return ::write(m_write_fd, buf, len); }

bool InputReader::fill() {
    ssize_t n = m_stream.read(m_buf, sizeof(m_buf));
    if (n < 0) {
        m_status = Status::io_error(std::string("read failed: ") + std::strerror(errno));
        return false;
    }
    if (n == 0) {
        m_status = Status::end_of_input();
        return false;
    }
    m_pos = 0; m_len = static_cast<std::size_t>(n);
    return true;
}

std::optional<unsigned char> InputReader::peek_byte() {
    if (m_pos >= m_len && !fill()) return std::nullopt;
    return static_cast<unsigned char>(m_buf[m_pos]);
}

std::optional<unsigned char> InputReader::read_byte() {
    auto b = peek_byte();
    if (b) ++m_pos;
    return b;
}

std::optional<char32_t> InputReader::read_rune() {
    auto lead = read_byte();
    if (!lead) return std::nullopt;
    std::size_t len = utf8::sequence_length(*lead);
    if (len == 1) return static_cast<char32_t>(*lead);
    if (len == 0) return utf8::kReplacement;
    unsigned char seq[4] = {*lead, 0, 0, 0};
    for (std::size_t i = 1; i < len; ++i) {
        auto next = peek_byte();
        if (!next) {
            // a truncated sequence at end of stream is still a character
            if (m_status.code == StatusCode::EndOfInput) return utf8::kReplacement;
            return std::nullopt;
        }
        if ((*next & 0xC0) != 0x80) return utf8::kReplacement; // leave it for the next call
        seq[i] = *next; ++m_pos;
    }
    auto cp = utf8::decode_one(seq, len);
    return cp ? *cp : utf8::kReplacement;
}

Status OutputBuffer::flush() {
    std::size_t done = 0;
    while (done < m_pending.size()) {
        ssize_t n = m_stream.write(m_pending.data() + done, m_pending.size() - done);
        if (n <= 0) {
            std::string why = n < 0 ? std::strerror(errno) : "stream accepted no bytes";
            m_pending.clear();
            return Status::io_error("write failed: " + why);
        }
        done += static_cast<std::size_t>(n);
    }
    m_pending.clear();
    return Status::success();
}

} // namespace lineedit
