#include <ednpath/diag/Render.hpp>

#include <sstream>

namespace ednpath::diag {

namespace {

constexpr uint32_t digits10(uint32_t v) {
    uint32_t d = 1;
    while (v >= 10) { v /= 10; ++d; }
    return d;
}

void render_header(std::ostringstream& out, const Diagnostic& d) {
    out << "error[" << code_name(d.code) << "]: " << d.message << "\n";
    if (d.has_location()) {
        out << " --> " << d.file << ":" << d.line << ":" << d.column << "\n";
    } else if (!d.path.empty()) {
        out << " --> " << d.file << " (path " << d.path << ")\n";
    } else {
        out << " --> " << d.file << "\n";
    }
}

} // namespace

std::string render_one_context(const Diagnostic& d, const text::SourceManager& sm,
                               uint32_t context_lines) {
    std::ostringstream out;
    render_header(out, d);

    const auto file_id = sm.find(d.file);
    if (d.has_location() && file_id && d.line <= sm.line_count(*file_id)) {
        const auto blk = sm.snippet_block(*file_id, d.line, d.column, context_lines);
        const uint32_t last_line_no = blk.first_line_no + static_cast<uint32_t>(blk.lines.size()) - 1;
        const uint32_t w = digits10(last_line_no);

        out << std::string(w + 2, ' ') << " |\n";
        for (uint32_t i = 0; i < blk.lines.size(); ++i) {
            const std::string num = std::to_string(blk.first_line_no + i);
            out << "  " << std::string(w - static_cast<uint32_t>(num.size()), ' ') << num
                << " | " << blk.lines[i] << "\n";

            if (i == blk.caret_line_offset) {
                out << "  " << std::string(w, ' ') << " | "
                    << std::string(blk.caret_cols_before, ' ')
                    << std::string(blk.caret_cols_len, '^') << "\n";
            }
        }
    }

    if (!d.note.empty()) out << "  = " << d.note << "\n";
    return out.str();
}

std::string render_with_source(const Bag& bag, const text::SourceManager& sm,
                               uint32_t context_lines) {
    std::string out;
    for (const auto& d : bag.all()) out += render_one_context(d, sm, context_lines);
    return out;
}

} // namespace ednpath::diag
