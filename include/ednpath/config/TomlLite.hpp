#pragma once

#include <ednpath/config/Config.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace ednpath::config::toml_lite {

// Flat `key = value` files with `[section]` headers and `#` comments.
// Values are strings, integers and booleans; keys come out as
// "section.key".
bool parse_file(const std::filesystem::path& path,
                FlatMap& out,
                std::vector<std::string>& warnings,
                std::string& err);

bool parse_text(std::string_view text,
                std::string_view source_name,
                FlatMap& out,
                std::vector<std::string>& warnings,
                std::string& err);

} // namespace ednpath::config::toml_lite
