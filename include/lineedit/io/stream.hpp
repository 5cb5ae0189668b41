/*
 * Byte stream plumbing - LineEdit
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * The editor talks to an arbitrary duplex byte stream (a tty, a socket, a
 * pipe pair, an in-memory script in tests). Stream is the only seam; the
 * buffered reader and writer on top of it carry the error state so callers
 * can check once after a batch of operations.
 */
#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <sys/types.h>
#include <lineedit/core/status.hpp>

namespace lineedit {

class Stream {
public:
    virtual ~Stream() = default;
    // Both return the number of bytes transferred, 0 at end of stream and -1 on failure.
    virtual ssize_t read(char* buf, std::size_t len) = 0;
    virtual ssize_t write(const char* buf, std::size_t len) = 0;
};

// Stream over a pair of file descriptors (not owned).
class FdStream : public Stream {
public:
    FdStream(int read_fd, int write_fd) : m_read_fd(read_fd), m_write_fd(write_fd) {}
    ssize_t read(char* buf, std::size_t len) override;
    ssize_t write(const char* buf, std::size_t len) override;
private:
    int m_read_fd;
    int m_write_fd;
};

class InputReader {
public:
    explicit InputReader(Stream& stream) : m_stream(stream) {}

    std::optional<unsigned char> read_byte();
    // Decodes UTF-8; malformed input yields U+FFFD and consumes a single byte.
    std::optional<char32_t> read_rune();

    // Why the last read returned nullopt (EndOfInput or IoError).
    const Status& status() const { return m_status; }

private:
    bool fill();
    std::optional<unsigned char> peek_byte();

    Stream& m_stream;
    char m_buf[256];
    std::size_t m_pos = 0;
    std::size_t m_len = 0;
    Status m_status;
};

class OutputBuffer {
public:
    explicit OutputBuffer(Stream& stream) : m_stream(stream) {}

    void append(const std::string& bytes) { m_pending += bytes; }
    void append(char c) { m_pending.push_back(c); }
    const std::string& pending() const { return m_pending; }

    // Writes everything pending in as few calls as the stream allows.
    // On failure the pending bytes are dropped.
    Status flush();

private:
    Stream& m_stream;
    std::string m_pending;
};

} // namespace lineedit
