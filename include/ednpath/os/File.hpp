#pragma once

#include <string>
#include <string_view>

namespace ednpath::os {

struct ReadTextResult {
    bool ok = false;
    bool missing = false;   // the path does not name a regular file
    std::string text{};
    std::string err{};
};

// Reads the whole file as bytes. Line endings are left alone so that the
// parsed tree reproduces the file exactly.
ReadTextResult read_text_file(std::string_view path);

bool is_regular_file(std::string_view path);
std::string normalize_path(std::string_view path);

} // namespace ednpath::os
