#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ednpath::log {

enum class Level : uint8_t {
    kQuiet,
    kInfo,
    kDebug,
};

enum class ColorMode : uint8_t {
    kAuto,
    kAlways,
    kNever,
};

inline constexpr const char* kAnsiReset = "\033[0m";
inline constexpr const char* kAnsiGreen = "\033[32m";
inline constexpr const char* kAnsiRed = "\033[31m";
inline constexpr const char* kAnsiCyan = "\033[36m";
inline constexpr const char* kAnsiOrange = "\033[38;5;208m";
inline constexpr const char* kAnsiGray = "\033[90m";

// Process-wide; safe to change from any thread.
void set_level(Level lvl);
Level level();
void set_color(ColorMode mode);
ColorMode color();

std::optional<Level> parse_level(std::string_view s);
std::optional<ColorMode> parse_color(std::string_view s);
std::string_view level_name(Level lvl);
std::string_view color_name(ColorMode mode);

// True when stderr output should carry ANSI colour.
bool use_stderr_color();

std::string paint(std::string_view text, const char* ansi);
std::string tag(std::string_view text, const char* ansi);

// Tagged stderr lines. [WARN] and [FAIL] always print; [INFO] needs
// kInfo and [DEBUG] needs kDebug.
void info(std::string_view message);
void warn(std::string_view message);
void fail(std::string_view message);
void debug(std::string_view message);
void done(std::string_view message);

} // namespace ednpath::log
