/*
 * Line editor implementation
 */
#include <lineedit/line/line_editor.hpp>
#include <lineedit/util/log.hpp>
#include <lineedit/util/utf8.hpp>
#include <cctype>
#include <cstdio>

namespace lineedit {

static constexpr std::size_t kMaxCursorReport = 64;

static std::string printable(const std::string& s) {
    std::string out;
    for (unsigned char c : s) {
        if (c == 0x1b) out += "\\e";
        else if (std::isprint(c)) out.push_back(static_cast<char>(c));
        else { char buf[8]; std::snprintf(buf, sizeof(buf), "\\x%02x", c); out += buf; }
    }
    return out;
}

static std::optional<int> parse_field(const std::string& s, std::size_t& pos, char terminator) {
    std::size_t start = pos; int value = 0;
    while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
        if (pos - start >= 5) return std::nullopt;
        value = value * 10 + (s[pos] - '0');
        ++pos;
    }
    if (pos == start || pos >= s.size() || s[pos] != terminator) return std::nullopt;
    ++pos;
    return value;
}

std::optional<Geometry> parse_cursor_report(const std::string& report) {
    auto csi = report.rfind("\x1b[");
    if (csi == std::string::npos) return std::nullopt;
    std::size_t pos = csi + 2;
    auto rows = parse_field(report, pos, ';');
    if (!rows) return std::nullopt;
    auto cols = parse_field(report, pos, 'R');
    if (!cols || pos != report.size()) return std::nullopt;
    if (*rows <= 0 || *cols <= 0) return std::nullopt;
    Geometry g; g.rows = *rows; g.columns = *cols;
    return g;
}

LineEditor::LineEditor(Stream& stream, std::string prompt, EditorOptions opts)
    : m_in(stream), m_out(stream), m_prompt(std::move(prompt)),
      m_geometry(normalized(opts.geometry)),
      m_width(opts.width ? std::move(opts.width) : WidthFn(default_width)),
      m_providers(std::move(opts.providers)) {}

LineResult LineEditor::read_line() {
    m_active = true;
    Status st = line_reset();
    if (!st.ok()) return finish(st);
    while (true) {
        auto ev = m_decoder.next(m_in);
        if (!ev) return finish(m_in.status());
        if (auto done = dispatch(*ev)) return *done;
    }
}

LineResult LineEditor::finish(const Status& st) {
    m_active = false;
    if (st.code == StatusCode::IoError) log::error(st.message);
    else if (!st.ok()) log::debug(std::string("session ended: ") + to_string(st.code));
    return {m_state.text(), st};
}

std::optional<LineResult> LineEditor::dispatch(const KeyEvent& ev) {
    log::debug(std::string("key ") + to_string(ev.command));
    Status st;
    switch (ev.command) {
        case Command::Submit: return finish(Status::success());
        case Command::Interrupt: return finish(Status::interrupted());
        case Command::DeleteOrEnd:
            if (m_state.buffer.empty()) return finish(Status::end_of_input());
            st = edit(m_state.erase_forward());
            break;
        case Command::Insert: m_state.insert(ev.ch); st = refresh(); break;
        case Command::Complete: st = complete_line(); break;
        case Command::Help: st = show_help(); break;
        case Command::Backspace: st = edit(m_state.backspace()); break;
        case Command::DeleteForward: st = edit(m_state.erase_forward()); break;
        case Command::ClearScreen: st = clear_screen(); break;
        case Command::DeleteWord: m_state.delete_previous_word(); st = refresh(); break;
        case Command::MoveLeft: st = edit(m_state.move_left()); break;
        case Command::MoveRight: st = edit(m_state.move_right()); break;
        case Command::MoveHome: st = edit(m_state.move_home()); break;
        case Command::MoveEnd: st = edit(m_state.move_end()); break;
        case Command::HistoryPrev: st = history_prev(); break;
        case Command::HistoryNext: st = history_next(); break;
        case Command::Reset: st = clear_line(); break;
        case Command::KillToEnd: m_state.kill_to_end(); st = refresh(); break;
        case Command::Transpose: st = edit(m_state.transpose()); break;
    }
    if (!st.ok()) return finish(st);
    return std::nullopt;
}

Status LineEditor::line_reset() {
    m_state.reset();
    return refresh();
}

Status LineEditor::clear_screen() {
    m_out.append(vt::ClearScreen);
    m_state.detach();
    if (m_active) return refresh();
    Status st = m_out.flush();
    if (!st.ok()) log::error(st.message);
    return st;
}

// ctrl-U: the wrapped rows of the old line go before the state is reset.
Status LineEditor::clear_line() {
    if (m_state.max_rows > 0) m_out.append(erase_block(m_state));
    return line_reset();
}

Hint LineEditor::current_hint() const {
    if (!m_providers.hint || !m_providers.hint->hint) return {};
    return m_providers.hint->hint(m_state.text());
}

Status LineEditor::refresh() {
    Frame f = render_line(m_prompt, m_state, current_hint(), m_geometry, m_width);
    m_out.append(f.bytes);
    Status st = m_out.flush();
    if (!st.ok()) return st;
    m_state.commit_frame(f.cursor_row, f.max_rows);
    return st;
}

Status LineEditor::beep() {
    m_out.append(vt::Bell);
    return m_out.flush();
}

Status LineEditor::edit(bool applied) { return applied ? refresh() : beep(); }

Status LineEditor::complete_line() {
    if (!m_providers.completion || !m_providers.completion->candidates) {
        m_state.insert(keys::Tab);
        return refresh();
    }
    auto candidates = m_providers.completion->candidates(m_state.text());
    if (candidates.empty()) return beep();
    if (candidates.size() == 1) {
        m_state.assign(utf8::decode(candidates.front()));
        return refresh();
    }
    m_out.append(move_to_bottom(m_state));
    m_out.append(format_candidates(candidates));
    m_state.detach();
    return refresh();
}

Status LineEditor::show_help() {
    if (!m_providers.help || !m_providers.help->entries) {
        m_state.insert(U'?');
        return refresh();
    }
    m_out.append(move_to_bottom(m_state));
    m_out.append(format_help(m_providers.help->entries(m_state.text())));
    m_state.detach();
    return refresh();
}

Status LineEditor::history_prev() {
    m_history.save(m_state.text());
    if (!m_history.prev()) return beep();
    m_state.assign(utf8::decode(m_history.get()));
    return refresh();
}

Status LineEditor::history_next() {
    if (!m_history.next()) return beep();
    m_state.assign(utf8::decode(m_history.get()));
    return refresh();
}

Status LineEditor::probe_geometry() {
    m_out.append(vt::SaveCursor);
    m_out.append(vt::ProbeSize);
    Status st = m_out.flush();
    if (!st.ok()) { log::error(st.message); return st; }

    std::string report;
    while (report.empty() || report.back() != 'R') {
        if (report.size() >= kMaxCursorReport) break;
        auto b = m_in.read_byte();
        if (!b) {
            if (m_in.status().code == StatusCode::IoError) log::error(m_in.status().message);
            return m_in.status();
        }
        report.push_back(static_cast<char>(*b));
    }

    m_out.append(vt::RestoreCursor);
    st = m_out.flush();
    if (!st.ok()) { log::error(st.message); return st; }

    auto g = parse_cursor_report(report);
    if (!g) {
        log::error("malformed cursor report: " + printable(report));
        return Status::malformed_report("malformed cursor report: " + printable(report));
    }
    m_geometry = *g;
    log::debug("geometry " + std::to_string(g->columns) + "x" + std::to_string(g->rows));
    return Status::success();
}

WriteResult LineEditor::write_out(const std::string& bytes) {
    std::string out = erase_block(m_state) + vt::ClearToEol;
    for (char c : bytes) {
        if (c == '\n') out += "\r\n";
        else out.push_back(c);
    }
    if (!bytes.empty() && bytes.back() != '\n') out += "\r\n";
    m_out.append(out);
    Status st = m_out.flush();
    if (!st.ok()) { log::error(st.message); return {0, st}; }
    m_state.detach();
    // between sessions the finished line is gone for good; the next
    // read_line() draws its prompt where the output ended
    if (!m_active) return {bytes.size(), st};
    st = refresh();
    if (!st.ok()) log::error(st.message);
    return {bytes.size(), st};
}

} // namespace lineedit
