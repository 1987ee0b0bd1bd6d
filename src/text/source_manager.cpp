#include <ednpath/text/SourceManager.hpp>

#include <algorithm>

namespace ednpath::text {

uint32_t SourceManager::add(std::string name, std::string content) {
    File f{};
    f.name = std::move(name);
    f.content = std::move(content);
    f.line_starts = build_line_starts(f.content);
    files_.push_back(std::move(f));
    return static_cast<uint32_t>(files_.size() - 1);
}

std::optional<uint32_t> SourceManager::find(std::string_view name) const {
    for (size_t i = 0; i < files_.size(); ++i) {
        if (files_[i].name == name) return static_cast<uint32_t>(i);
    }
    return std::nullopt;
}

std::string_view SourceManager::name(uint32_t file_id) const {
    if (file_id >= files_.size()) return {};
    return files_[file_id].name;
}

std::string_view SourceManager::content(uint32_t file_id) const {
    if (file_id >= files_.size()) return {};
    return files_[file_id].content;
}

uint32_t SourceManager::line_count(uint32_t file_id) const {
    if (file_id >= files_.size()) return 0;
    return static_cast<uint32_t>(files_[file_id].line_starts.size());
}

std::vector<uint32_t> SourceManager::build_line_starts(std::string_view s) {
    std::vector<uint32_t> starts;
    starts.push_back(0);
    for (uint32_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\n') starts.push_back(i + 1);
    }
    return starts;
}

std::string_view SourceManager::line_text(uint32_t file_id, uint32_t line_no) const {
    if (file_id >= files_.size() || line_no == 0) return {};
    const auto& f = files_[file_id];
    if (line_no > f.line_starts.size()) return {};

    const std::string_view all(f.content);
    const uint32_t lo = f.line_starts[line_no - 1];
    uint32_t hi = (line_no < f.line_starts.size())
        ? f.line_starts[line_no] - 1
        : static_cast<uint32_t>(all.size());
    if (hi > lo && all[hi - 1] == '\r') --hi;
    return all.substr(lo, hi - lo);
}

SnippetBlock SourceManager::snippet_block(uint32_t file_id, uint32_t line_no, uint32_t col,
                                          uint32_t context_lines) const {
    SnippetBlock blk{};
    const uint32_t total = line_count(file_id);
    if (total == 0) return blk;

    line_no = std::clamp<uint32_t>(line_no, 1, total);
    const uint32_t first = (line_no > context_lines) ? line_no - context_lines : 1;
    const uint32_t last = std::min(total, line_no + context_lines);

    blk.first_line_no = first;
    for (uint32_t ln = first; ln <= last; ++ln) blk.lines.push_back(line_text(file_id, ln));
    blk.caret_line_offset = line_no - first;
    blk.caret_cols_before = (col > 0) ? col - 1 : 0;
    blk.caret_cols_len = 1;
    return blk;
}

} // namespace ednpath::text
