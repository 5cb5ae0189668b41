#include <lineedit/util/log.hpp>
#include <fstream>
#include <iostream>

namespace lineedit::log {

static std::ostream* g_sink = &std::cerr;
static bool g_debug = false;
static std::ofstream g_file;

void set_sink(std::ostream* s) { g_sink = s; }
std::ostream* sink() { return g_sink; }

bool open_file(const std::string& path) {
    if (g_file.is_open()) g_file.close();
    g_file.clear();
    g_file.open(path, std::ios::app);
    if (!g_file) return false;
    g_sink = &g_file;
    return true;
}

void set_debug(bool on) { g_debug = on; }
bool debug_enabled() { return g_debug; }

void debug(const std::string& msg) {
    if (!g_debug || !g_sink) return;
    *g_sink << "[DEBUG] " << msg << std::endl;
}

void error(const std::string& msg) {
    if (!g_sink) return;
    *g_sink << "[lineedit] error: " << msg << std::endl;
}

} // namespace lineedit::log
