/*
 * LineEdit Key Decoder Implementation
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: See header for overview.
 */
#include <lineedit/key/key_decoder.hpp>

namespace lineedit {

const char* to_string(Command cmd) {
    switch (cmd) {
        case Command::Insert: return "insert";
        case Command::Submit: return "submit";
        case Command::Complete: return "complete";
        case Command::Help: return "help";
        case Command::Backspace: return "backspace";
        case Command::DeleteForward: return "delete-forward";
        case Command::DeleteOrEnd: return "delete-or-end";
        case Command::Interrupt: return "interrupt";
        case Command::ClearScreen: return "clear-screen";
        case Command::DeleteWord: return "delete-word";
        case Command::MoveLeft: return "move-left";
        case Command::MoveRight: return "move-right";
        case Command::MoveHome: return "move-home";
        case Command::MoveEnd: return "move-end";
        case Command::HistoryPrev: return "history-prev";
        case Command::HistoryNext: return "history-next";
        case Command::Reset: return "reset";
        case Command::KillToEnd: return "kill-to-end";
        case Command::Transpose: return "transpose";
    }
    return "unknown";
}

std::optional<KeyEvent> KeyDecoder::feed_normal(char32_t ch) {
    switch (ch) {
        case keys::Enter: return KeyEvent::of(Command::Submit);
        case keys::Tab: return KeyEvent::of(Command::Complete);
        case U'?': return KeyEvent::of(Command::Help);
        case keys::Backspace:
        case keys::CtrlH: return KeyEvent::of(Command::Backspace);
        case keys::CtrlC: return KeyEvent::of(Command::Interrupt);
        case keys::CtrlD: return KeyEvent::of(Command::DeleteOrEnd);
        case keys::Esc: m_state = State::Escape; return std::nullopt;
        case keys::CtrlL: return KeyEvent::of(Command::ClearScreen);
        case keys::CtrlW: return KeyEvent::of(Command::DeleteWord);
        case keys::CtrlB: return KeyEvent::of(Command::MoveLeft);
        case keys::CtrlF: return KeyEvent::of(Command::MoveRight);
        case keys::CtrlP: return KeyEvent::of(Command::HistoryPrev);
        case keys::CtrlN: return KeyEvent::of(Command::HistoryNext);
        case keys::CtrlU: return KeyEvent::of(Command::Reset);
        case keys::CtrlK: return KeyEvent::of(Command::KillToEnd);
        case keys::CtrlA: return KeyEvent::of(Command::MoveHome);
        case keys::CtrlE: return KeyEvent::of(Command::MoveEnd);
        case keys::CtrlT: return KeyEvent::of(Command::Transpose);
        default: return KeyEvent::insert(ch);
    }
}

std::optional<KeyEvent> KeyDecoder::feed_csi(char32_t ch) {
    m_state = State::Normal;
    switch (ch) {
        case U'0': case U'1': case U'2': case U'4': case U'5':
        case U'6': case U'7': case U'8': case U'9':
            m_state = State::CsiSkip; return std::nullopt;
        case U'3': m_state = State::CsiDelete; return std::nullopt;
        case U'A': return KeyEvent::of(Command::HistoryPrev);
        case U'B': return KeyEvent::of(Command::HistoryNext);
        case U'C': return KeyEvent::of(Command::MoveRight);
        case U'D': return KeyEvent::of(Command::MoveLeft);
        case U'H': return KeyEvent::of(Command::MoveHome);
        case U'F': return KeyEvent::of(Command::MoveEnd);
        default: return std::nullopt;
    }
}

std::optional<KeyEvent> KeyDecoder::feed(char32_t ch) {
    switch (m_state) {
        case State::Normal:
            return feed_normal(ch);
        case State::Escape:
            if (ch == U'[') m_state = State::Csi;
            else if (ch == U'O') m_state = State::Ss3;
            else m_state = State::Normal;
            return std::nullopt;
        case State::Csi:
            return feed_csi(ch);
        case State::CsiSkip:
            m_state = State::Normal;
            return std::nullopt;
        case State::CsiDelete:
            m_state = State::Normal;
            if (ch == U'~') return KeyEvent::of(Command::DeleteForward);
            return std::nullopt;
        case State::Ss3:
            m_state = State::Normal;
            if (ch == U'H') return KeyEvent::of(Command::MoveHome);
            if (ch == U'F') return KeyEvent::of(Command::MoveEnd);
            return std::nullopt;
    }
    m_state = State::Normal;
    return std::nullopt;
}

std::optional<KeyEvent> KeyDecoder::next(InputReader& reader) {
    while (true) {
        auto ch = reader.read_rune();
        if (!ch) { reset(); return std::nullopt; }
        if (auto ev = feed(*ch)) return ev;
    }
}

} // namespace lineedit
