// Leveled diagnostics on stderr: "LEVEL: message".
#pragma once

#include <iosfwd>
#include <string>

namespace av {
namespace log {

enum class Level { Debug, Info, Warning, Error, Critical };

// DEBUG, INFO, WARNING, ERROR, CRITICAL (case-insensitive; WARN is accepted).
// Throws std::invalid_argument for anything else.
Level level_from_name(const std::string& name);
std::string level_name(Level level);

void set_level(Level level);
Level level();
bool enabled(Level level);

// Apply AV_LOG_LEVEL when it is set. An unrecognised value is reported and ignored.
void init_from_env();

// Redirect output, e.g. to a std::ostringstream in tests. nullptr restores stderr.
void set_stream(std::ostream* out);

void write(Level level, const std::string& message);

inline void debug(const std::string& message) { write(Level::Debug, message); }
inline void info(const std::string& message) { write(Level::Info, message); }
inline void warning(const std::string& message) { write(Level::Warning, message); }
inline void error(const std::string& message) { write(Level::Error, message); }
inline void critical(const std::string& message) { write(Level::Critical, message); }

}  // namespace log
}  // namespace av
