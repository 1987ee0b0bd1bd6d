#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ednpath::text {

struct SnippetBlock {
    uint32_t first_line_no = 1;             // 1-based
    std::vector<std::string_view> lines;    // [first_line_no ...]
    uint32_t caret_line_offset = 0;         // index into lines
    uint32_t caret_cols_before = 0;
    uint32_t caret_cols_len = 1;
};

class SourceManager {
public:
    // Registers a buffer under `name` and returns its id.
    uint32_t add(std::string name, std::string content);

    std::optional<uint32_t> find(std::string_view name) const;

    std::string_view name(uint32_t file_id) const;
    std::string_view content(uint32_t file_id) const;

    uint32_t line_count(uint32_t file_id) const;

    // Text of 1-based `line_no`, without its line terminator. Empty when out
    // of range.
    std::string_view line_text(uint32_t file_id, uint32_t line_no) const;

    /// Lines around (line_no, col) with `context_lines` extra lines above
    /// and below, clamped to the file. `col` counts code points.
    SnippetBlock snippet_block(uint32_t file_id, uint32_t line_no, uint32_t col,
                               uint32_t context_lines) const;

private:
    struct File {
        std::string name;
        std::string content;
        std::vector<uint32_t> line_starts; // byte offsets, includes 0
    };

    static std::vector<uint32_t> build_line_starts(std::string_view s);

    std::vector<File> files_;
};

} // namespace ednpath::text
