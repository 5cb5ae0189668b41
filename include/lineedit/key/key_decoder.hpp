/*
 * LineEdit Key Decoder
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Turns the characters typed on a VT100-class terminal into editing
 *   commands. Single control bytes map directly; escape sequences go through
 *   a small state machine (ESC, ESC [ and ESC O prefixes). Unknown or
 *   malformed sequences are swallowed so the decoder stays in sync with the
 *   input, they never surface as errors.
 *
 *   Known limitation: after ESC [ <digit> (other than 3) exactly one more
 *   byte is discarded. Reports carrying several digits or parameters
 *   (ESC [ 1 5 ~, ESC [ 1 ; 5 C) therefore leak their tail as input.
 *
 * License (MIT):
 *   Permission is hereby granted, free of charge, to any person obtaining a copy of this
 *   software and associated documentation files (the "Software"), to deal in the Software
 *   without restriction, including without limitation the rights to use, copy, modify, merge,
 *   publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons
 *   to whom the Software is furnished to do so, subject to the following conditions:
 *
 *   The above copyright notice and this permission notice shall be included in all copies or
 *   substantial portions of the Software.
 *
 *   THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED,
 *   INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR
 *   PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE
 *   FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR
 *   OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER
 *   DEALINGS IN THE SOFTWARE.
 */
#pragma once
#include <optional>
#include <lineedit/io/stream.hpp>

namespace lineedit {

namespace keys {
constexpr char32_t CtrlA = 1;
constexpr char32_t CtrlB = 2;
constexpr char32_t CtrlC = 3;
constexpr char32_t CtrlD = 4;
constexpr char32_t CtrlE = 5;
constexpr char32_t CtrlF = 6;
constexpr char32_t CtrlH = 8;
constexpr char32_t Tab = 9;
constexpr char32_t CtrlK = 11;
constexpr char32_t CtrlL = 12;
constexpr char32_t Enter = 13;
constexpr char32_t CtrlN = 14;
constexpr char32_t CtrlP = 16;
constexpr char32_t CtrlT = 20;
constexpr char32_t CtrlU = 21;
constexpr char32_t CtrlW = 23;
constexpr char32_t Esc = 27;
constexpr char32_t Backspace = 127;
} // namespace keys

enum class Command {
    Insert,          // KeyEvent::ch carries the character
    Submit,
    Complete,
    Help,
    Backspace,
    DeleteForward,   // ESC [ 3 ~
    DeleteOrEnd,     // ctrl-D: delete under cursor, end of input on empty line
    Interrupt,
    ClearScreen,
    DeleteWord,
    MoveLeft,
    MoveRight,
    MoveHome,
    MoveEnd,
    HistoryPrev,
    HistoryNext,
    Reset,
    KillToEnd,
    Transpose
};

const char* to_string(Command cmd);

struct KeyEvent {
    Command command = Command::Insert;
    char32_t ch = 0;

    static KeyEvent of(Command c) { return {c, 0}; }
    static KeyEvent insert(char32_t c) { return {Command::Insert, c}; }
};

inline bool operator==(const KeyEvent& a, const KeyEvent& b) { return a.command == b.command && a.ch == b.ch; }
inline bool operator!=(const KeyEvent& a, const KeyEvent& b) { return !(a == b); }

class KeyDecoder {
public:
    enum class State {
        Normal,
        Escape,     // after ESC
        Csi,        // after ESC [
        CsiSkip,    // after ESC [ <digit>, one byte left to drop
        CsiDelete,  // after ESC [ 3, waiting for '~'
        Ss3         // after ESC O
    };

    // Feeds one character; returns a command once a key is complete.
    std::optional<KeyEvent> feed(char32_t ch);

    // Reads until a complete key is available. On read failure the partial
    // sequence is dropped and nullopt is returned; reader.status() says why.
    std::optional<KeyEvent> next(InputReader& reader);

    State state() const { return m_state; }
    bool pending() const { return m_state != State::Normal; }
    void reset() { m_state = State::Normal; }

private:
    std::optional<KeyEvent> feed_normal(char32_t ch);
    std::optional<KeyEvent> feed_csi(char32_t ch);

    State m_state = State::Normal;
};

} // namespace lineedit
