#include <lineedit/core/status.hpp>

namespace lineedit {

const char* to_string(StatusCode code) {
    switch (code) {
        case StatusCode::Ok: return "ok";
        case StatusCode::Interrupted: return "interrupted";
        case StatusCode::EndOfInput: return "end of input";
        case StatusCode::IoError: return "i/o error";
        case StatusCode::MalformedCursorReport: return "malformed cursor report";
    }
    return "unknown";
}

} // namespace lineedit
