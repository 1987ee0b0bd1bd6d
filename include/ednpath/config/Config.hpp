#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace ednpath::config {

using Value = std::variant<std::string, int64_t, bool>;
using FlatMap = std::map<std::string, Value>;

inline constexpr const char* kConfigFileName = "ednpath.toml";

struct LoadedConfig {
    std::optional<std::filesystem::path> path{};
    FlatMap values{};
    std::vector<std::string> warnings{};
};

struct EffectiveSettings {
    std::string resolve_call_form_head = "defproject";
    int64_t diag_context = 2;
    std::string diag_color = "auto";
    std::string log_level = "info";
};

// Nearest ednpath.toml in `start` (or its directory, when `start` is a
// file) and its ancestors.
std::optional<std::filesystem::path> find_config(std::filesystem::path start);

// Reads the settings file found from `anchor`. A missing file is not an
// error. Unknown keys and unreadable files become warnings.
LoadedConfig load(const std::optional<std::filesystem::path>& anchor);

// Typed settings with defaults for anything unset or invalid; problems
// are appended to `warnings`.
EffectiveSettings materialize(const LoadedConfig& cfg, std::vector<std::string>* warnings = nullptr);

bool is_known_key(std::string_view key);

std::string render_value_text(const Value& v);

} // namespace ednpath::config
