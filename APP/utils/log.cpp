#include "log.hpp"

#include "string_utils.hpp"

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

namespace {

todo::log::Level& global_level() {
    static todo::log::Level lvl = todo::log::Level::Warn;
    return lvl;
}

bool& env_init_flag() {
    static bool f = false;
    return f;
}

bool& level_pinned_flag() {
    static bool pinned = false;
    return pinned;
}

std::unique_ptr<std::ofstream>& file_sink() {
    static std::unique_ptr<std::ofstream> f{};
    return f;
}

std::chrono::steady_clock::time_point& time_origin() {
    static auto t0 = std::chrono::steady_clock::now();
    return t0;
}

bool env_truthy(const char* v) {
    return v && (*v == '1' || *v == 'y' || *v == 'Y' || *v == 't' || *v == 'T');
}

void init_from_env_once() {
    if (env_init_flag()) {
        return;
    }
    env_init_flag() = true;

    // An explicit set_level() (e.g. --verbose) wins over the environment.
    if (!level_pinned_flag()) {
        if (const char* v = std::getenv("TODO_LOG_LEVEL")) {
            if (auto parsed = todo::log::parse_level(v)) {
                global_level() = *parsed;
            }
        }
    }

    const char* file = std::getenv("TODO_LOG_FILE");
    if (file && *file) {
        std::ios_base::openmode mode = std::ios::out;
        if (env_truthy(std::getenv("TODO_LOG_APPEND"))) mode |= std::ios::app; else mode |= std::ios::trunc;
        auto ofs = std::make_unique<std::ofstream>(file, mode);
        if (ofs->good()) {
            file_sink() = std::move(ofs);
        }
    }
}

const char* level_tag(todo::log::Level level) {
    switch (level) {
        case todo::log::Level::Error: return "ERROR";
        case todo::log::Level::Warn:  return "WARN";
        case todo::log::Level::Info:  return "INFO";
        case todo::log::Level::Debug: return "DEBUG";
        default:                      return "INFO";
    }
}

void log_line_impl(todo::log::Level level, const std::string& message) {
    init_from_env_once();
    if (static_cast<int>(level) > static_cast<int>(global_level())) {
        return;
    }
    using namespace std::chrono;
    const double secs = duration_cast<duration<double>>(steady_clock::now() - time_origin()).count();
    std::ostringstream ss;
    ss.setf(std::ios::fixed);
    ss << '[' << level_tag(level) << "] +" << std::setprecision(3) << secs << "s: " << message << '\n';
    const std::string line = ss.str();

    // stdout belongs to command output.
    std::cerr << line;
    std::cerr.flush();
    if (file_sink()) {
        (*file_sink()) << line;
        file_sink()->flush();
    }
}

}

namespace todo::log {

void set_level(Level level) {
    level_pinned_flag() = true;
    global_level() = level;
}

Level level() {
    init_from_env_once();
    return global_level();
}

std::optional<Level> parse_level(std::string_view name) {
    const std::string lower = todo::strings::to_lower_copy(todo::strings::trim_copy(name));
    if (lower == "error") return Level::Error;
    if (lower == "warn" || lower == "warning") return Level::Warn;
    if (lower == "info") return Level::Info;
    if (lower == "debug") return Level::Debug;
    return std::nullopt;
}

void error(const std::string& message) { log_line_impl(Level::Error, message); }
void warn (const std::string& message) { log_line_impl(Level::Warn,  message); }
void info (const std::string& message) { log_line_impl(Level::Info,  message); }
void debug(const std::string& message) { log_line_impl(Level::Debug, message); }

}
