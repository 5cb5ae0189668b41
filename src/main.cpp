// LineEdit demo: an interactive prompt on the controlling terminal
#include <lineedit/config/config.hpp>
#include <lineedit/line/line_editor.hpp>
#include <lineedit/render/style.hpp>
#include <lineedit/util/log.hpp>

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>
#include <termios.h>
#include <unistd.h>

static lineedit::EditorConfig g_cfg;

static std::string getenv_or(const char* k, const std::string& def="") { const char* v = std::getenv(k); return v?std::string(v):def; }

// Puts the tty in raw mode for the lifetime of the object.
class RawMode {
public:
    explicit RawMode(int fd) : m_fd(fd) {
        if (!isatty(fd) || tcgetattr(fd, &m_orig) != 0) return;
        struct termios t = m_orig;
        t.c_iflag &= ~(BRKINT | ICRNL | INPCK | ISTRIP | IXON);
        t.c_oflag &= ~OPOST;
        t.c_cflag |= CS8;
        t.c_lflag &= ~(ECHO | ICANON | IEXTEN | ISIG);
        t.c_cc[VMIN] = 1; t.c_cc[VTIME] = 0;
        m_raw = tcsetattr(fd, TCSAFLUSH, &t) == 0;
    }
    ~RawMode() { if (m_raw) tcsetattr(m_fd, TCSAFLUSH, &m_orig); }
    RawMode(const RawMode&) = delete;
    RawMode& operator=(const RawMode&) = delete;
    bool active() const { return m_raw; }
private:
    int m_fd;
    struct termios m_orig{};
    bool m_raw = false;
};

static const std::vector<std::string> kWords = {
    "help", "history", "hello", "exit", "echo", "clear", "columns", "rows"
};

static lineedit::Providers make_providers() {
    lineedit::Providers p;
    p.completion = lineedit::CompletionProvider{ [](const std::string& line) {
        std::vector<std::string> matches;
        for (auto& w : kWords) if (w.rfind(line, 0) == 0) matches.push_back(w);
        std::sort(matches.begin(), matches.end());
        return matches;
    } };
    p.hint = lineedit::HintProvider{ [](const std::string& line) {
        lineedit::Hint h; h.style = g_cfg.hint_style; h.bold = g_cfg.hint_bold;
        if (!g_cfg.color) { h.style = lineedit::Style::Default; h.bold = false; }
        if (line == "echo") h.text = " <text>";
        else if (line == "hello") h.text = " world";
        return h;
    } };
    p.help = lineedit::HelpProvider{ [](const std::string&) {
        return std::vector<lineedit::HelpEntry>{
            {"echo <text>", "print text above the prompt"},
            {"history", "list the lines entered so far"},
            {"clear", "clear the screen"},
            {"exit", "leave the demo"},
        };
    } };
    return p;
}

int main(int argc, char* argv[]) {
    std::string home = getenv_or("HOME");
    if (!home.empty()) lineedit::load_config(home + "/.lineeditrc", g_cfg);
    for (int i=1;i<argc;++i) {
        std::string a=argv[i];
        if (a=="--debug"||a=="-d") g_cfg.debug=true;
        else if (a=="--no-probe") g_cfg.probe_geometry=false;
        else if (a=="--prompt" && i+1<argc) g_cfg.prompt=argv[++i];
        else { std::cerr << "usage: " << argv[0] << " [-d|--debug] [--no-probe] [--prompt <text>]\n"; return 2; }
    }
    lineedit::log::set_debug(g_cfg.debug);
    if (isatty(STDERR_FILENO)) {
        // stderr is the terminal being edited: log lines would land inside the prompt
        std::string path = !g_cfg.log_file.empty() ? g_cfg.log_file : (home.empty() ? std::string() : home + "/.lineedit.log");
        if (path.empty() || !lineedit::log::open_file(path)) {
            if (g_cfg.debug) std::cerr << "[lineedit] cannot open log file, logging disabled\n";
            lineedit::log::set_sink(nullptr);
        }
    }

    RawMode raw(STDIN_FILENO);
    if (!raw.active()) lineedit::log::debug("stdin is not a tty, raw mode not enabled");

    lineedit::FdStream stream(STDIN_FILENO, STDOUT_FILENO);
    lineedit::EditorOptions opts;
    opts.geometry.columns = g_cfg.columns; opts.geometry.rows = g_cfg.rows;
    opts.width = lineedit::make_width_fn(g_cfg.tab_width);
    opts.providers = make_providers();
    std::string prompt = g_cfg.color ? lineedit::colorize(g_cfg.prompt, g_cfg.prompt_style) : g_cfg.prompt;
    lineedit::LineEditor editor(stream, prompt, std::move(opts));

    if (g_cfg.probe_geometry && g_cfg.columns == 0 && raw.active()) {
        auto st = editor.probe_geometry();
        if (st.code == lineedit::StatusCode::IoError) return 1;
    }

    int status = 0;
    while (true) {
        auto r = editor.read_line();
        // keep the finished line on screen above the next prompt
        std::string echoed = prompt + r.line;
        if (r.status.code == lineedit::StatusCode::Interrupted) {
            if (editor.write_out(echoed + "^C\n").status.code == lineedit::StatusCode::IoError) { status = 1; break; }
            continue;
        }
        if (r.status.code == lineedit::StatusCode::EndOfInput) break;
        if (r.status.code == lineedit::StatusCode::IoError) { status = 1; break; }

        const std::string& line = r.line;
        echoed += "\n";
        if (line.empty()) {
            if (editor.write_out(echoed).status.code == lineedit::StatusCode::IoError) { status = 1; break; }
            continue;
        }
        editor.history().add(line);
        lineedit::WriteResult w;
        if (line == "exit") break;
        else if (line == "clear") w.status = editor.clear_screen();
        else if (line == "history") {
            std::string out = echoed; auto& e = editor.history().entries();
            for (std::size_t i = 0; i + 1 < e.size(); ++i) out += std::to_string(i + 1) + "  " + e[i] + "\n";
            w = editor.write_out(out);
        }
        else if (line.rfind("echo ", 0) == 0) w = editor.write_out(echoed + line.substr(5) + "\n");
        else if (line == "columns") w = editor.write_out(echoed + std::to_string(editor.geometry().columns) + "\n");
        else if (line == "rows") w = editor.write_out(echoed + std::to_string(editor.geometry().rows) + "\n");
        else w = editor.write_out(echoed + "you entered: " + line + "\n");
        if (w.status.code == lineedit::StatusCode::IoError) { status = 1; break; }
    }
    std::cout << "\r\n" << std::flush;
    return status;
}
