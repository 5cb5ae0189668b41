/*
 * Status - LineEdit
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <utility>

namespace lineedit {

enum class StatusCode {
    Ok,
    Interrupted,           // ctrl-C
    EndOfInput,            // ctrl-D on empty line or end of stream
    IoError,               // read/write failure on the stream
    MalformedCursorReport  // geometry probe answer not understood
};

const char* to_string(StatusCode code);

struct Status {
    StatusCode code = StatusCode::Ok;
    std::string message;

    bool ok() const { return code == StatusCode::Ok; }

    static Status success() { return {}; }
    static Status interrupted() { return {StatusCode::Interrupted, "interrupted"}; }
    static Status end_of_input() { return {StatusCode::EndOfInput, "end of input"}; }
    static Status io_error(std::string msg) { return {StatusCode::IoError, std::move(msg)}; }
    static Status malformed_report(std::string msg) { return {StatusCode::MalformedCursorReport, std::move(msg)}; }
};

} // namespace lineedit
