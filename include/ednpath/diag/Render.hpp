#pragma once

#include <ednpath/diag/DiagCode.hpp>
#include <ednpath/text/SourceManager.hpp>

#include <cstdint>
#include <string>

namespace ednpath::diag {

// One diagnostic with a code frame of `context_lines` lines above and below
// the reported line. Falls back to the plain two-line form when the file is
// not registered in `sm` or the location is unknown.
std::string render_one_context(const Diagnostic& d, const text::SourceManager& sm,
                               uint32_t context_lines);

std::string render_with_source(const Bag& bag, const text::SourceManager& sm,
                               uint32_t context_lines);

} // namespace ednpath::diag
