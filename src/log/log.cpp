#include <ednpath/log/Log.hpp>

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <sstream>

#if defined(_WIN32)
#include <io.h>
#else
#include <unistd.h>
#endif

namespace ednpath::log {

namespace {

std::atomic<Level> g_level{Level::kInfo};
std::atomic<ColorMode> g_color{ColorMode::kAuto};

// One write per line so lines from different threads do not interleave.
void emit(std::string_view tagged, std::string_view message) {
    std::ostringstream oss;
    oss << tagged << " " << message << "\n";
    std::cerr << oss.str();
}

} // namespace

void set_level(Level lvl) { g_level.store(lvl, std::memory_order_relaxed); }
Level level() { return g_level.load(std::memory_order_relaxed); }
void set_color(ColorMode mode) { g_color.store(mode, std::memory_order_relaxed); }
ColorMode color() { return g_color.load(std::memory_order_relaxed); }

std::optional<Level> parse_level(std::string_view s) {
    if (s == "quiet") return Level::kQuiet;
    if (s == "info") return Level::kInfo;
    if (s == "debug") return Level::kDebug;
    return std::nullopt;
}

std::optional<ColorMode> parse_color(std::string_view s) {
    if (s == "auto") return ColorMode::kAuto;
    if (s == "always") return ColorMode::kAlways;
    if (s == "never") return ColorMode::kNever;
    return std::nullopt;
}

std::string_view level_name(Level lvl) {
    switch (lvl) {
        case Level::kQuiet: return "quiet";
        case Level::kInfo: return "info";
        case Level::kDebug: return "debug";
    }
    return "info";
}

std::string_view color_name(ColorMode mode) {
    switch (mode) {
        case ColorMode::kAuto: return "auto";
        case ColorMode::kAlways: return "always";
        case ColorMode::kNever: return "never";
    }
    return "auto";
}

bool use_stderr_color() {
    const auto mode = color();
    if (mode == ColorMode::kNever) return false;
    if (mode == ColorMode::kAlways) return true;
    if (std::getenv("NO_COLOR") != nullptr) return false;
#if defined(_WIN32)
    return _isatty(_fileno(stderr)) != 0;
#else
    return isatty(fileno(stderr)) != 0;
#endif
}

std::string paint(std::string_view text, const char* ansi) {
    if (!use_stderr_color()) return std::string(text);
    return std::string(ansi) + std::string(text) + kAnsiReset;
}

std::string tag(std::string_view text, const char* ansi) {
    if (!use_stderr_color()) {
        return "[" + std::string(text) + "]";
    }
    return "[" + std::string(ansi) + std::string(text) + kAnsiReset + "]";
}

void info(std::string_view message) {
    if (level() < Level::kInfo) return;
    emit(tag("INFO", kAnsiCyan), message);
}

void warn(std::string_view message) {
    emit(tag("WARN", kAnsiOrange), message);
}

void fail(std::string_view message) {
    emit(tag("FAIL", kAnsiRed), message);
}

void debug(std::string_view message) {
    if (level() < Level::kDebug) return;
    emit(tag("DEBUG", kAnsiGray), message);
}

void done(std::string_view message) {
    if (level() < Level::kInfo) return;
    emit(tag("DONE", kAnsiGreen), message);
}

} // namespace ednpath::log
