#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace ednpath_tool::cli {

enum class Mode : uint8_t {
    kUsage,
    kVersion,
    kCommand,
};

enum class Command : uint8_t {
    kNone,
    kLocate,
    kCheck,
    kTree,
};

enum class OutputFormat : uint8_t {
    kText,
    kJson,
};

enum class Table : uint8_t {
    kCompiler,
    kBuild,
};

struct LocateOptions {
    std::string file{};
    std::string path{};
    OutputFormat format = OutputFormat::kText;
};

struct CheckOptions {
    std::string file{};
    std::optional<std::string> at{};
    std::optional<uint32_t> context{};
    Table table = Table::kCompiler;
};

struct TreeOptions {
    std::string file{};
};

struct Options {
    Mode mode = Mode::kUsage;
    Command command = Command::kNone;

    // Override ednpath.toml when set.
    std::optional<std::string> head{};
    std::optional<std::string> color{};
    std::optional<std::string> log_level{};

    LocateOptions locate{};
    CheckOptions check{};
    TreeOptions tree{};

    bool ok = true;
    std::string error{};
};

void print_usage(std::ostream& os);
Options parse_options(int argc, char** argv);

} // namespace ednpath_tool::cli
