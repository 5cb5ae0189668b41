/*
 * Logging - LineEdit
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Tagged one-line messages on an iostream sink. Errors are always written,
 * debug lines only while debug mode is on. The sink must not be the stream
 * being edited, otherwise the messages land inside the rendered line.
 */
#pragma once
#include <iosfwd>
#include <string>

namespace lineedit::log {

void set_sink(std::ostream* sink); // nullptr silences everything
std::ostream* sink();
// Appends to the file at path and makes it the sink; false if it cannot be opened.
bool open_file(const std::string& path);

void set_debug(bool on);
bool debug_enabled();

void debug(const std::string& msg);
void error(const std::string& msg);

} // namespace lineedit::log
