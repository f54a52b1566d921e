#include <av/log.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace av {
namespace log {

namespace {
    std::atomic<int> g_level{static_cast<int>(Level::Info)};
    std::mutex g_mutex;
    std::ostream* g_stream = nullptr;
}  // namespace

Level level_from_name(const std::string& name) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (n == "DEBUG") return Level::Debug;
    if (n == "INFO") return Level::Info;
    if (n == "WARNING" || n == "WARN") return Level::Warning;
    if (n == "ERROR") return Level::Error;
    if (n == "CRITICAL") return Level::Critical;
    throw std::invalid_argument("invalid log level '" + name + "' (expected DEBUG, INFO, WARNING, ERROR or CRITICAL)");
}

std::string level_name(Level level) {
    switch (level) {
        case Level::Debug:
            return "DEBUG";
        case Level::Info:
            return "INFO";
        case Level::Warning:
            return "WARNING";
        case Level::Error:
            return "ERROR";
        case Level::Critical:
            return "CRITICAL";
    }
    return "INFO";
}

void set_level(Level level) { g_level.store(static_cast<int>(level)); }

Level level() { return static_cast<Level>(g_level.load()); }

bool enabled(Level level) { return static_cast<int>(level) >= g_level.load(); }

void init_from_env() {
    const char* env = std::getenv("AV_LOG_LEVEL");
    if (env == nullptr || *env == '\0') return;
    try {
        set_level(level_from_name(env));
    } catch (const std::invalid_argument& e) {
        write(Level::Warning, std::string("ignoring AV_LOG_LEVEL: ") + e.what());
    }
}

void set_stream(std::ostream* out) {
    std::lock_guard<std::mutex> lock(g_mutex);
    g_stream = out;
}

void write(Level level, const std::string& message) {
    if (!enabled(level)) return;
    std::lock_guard<std::mutex> lock(g_mutex);
    std::ostream& out = g_stream ? *g_stream : std::cerr;
    out << level_name(level) << ": " << message << "\n";
}

}  // namespace log
}  // namespace av
