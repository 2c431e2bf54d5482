#pragma once
#include <string>

namespace taskgate {
namespace log {

void set_verbose(bool value);
bool verbose_enabled();

// Tagged console lines: "[tag] msg". info -> stdout, warn/error -> stderr.
void info(const std::string& tag, const std::string& msg);
void warn(const std::string& tag, const std::string& msg);
void error(const std::string& tag, const std::string& msg);
void debug(const std::string& tag, const std::string& msg);

} // namespace log
} // namespace taskgate
