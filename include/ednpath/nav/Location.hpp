#pragma once

#include <ednpath/cst/Cursor.hpp>
#include <ednpath/diag/DiagCode.hpp>
#include <ednpath/nav/Path.hpp>
#include <ednpath/nav/Resolve.hpp>
#include <ednpath/value/Value.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ednpath::nav {

// Which node a Location's value was decoded from.
enum class ValueSource : uint8_t {
    kPairedValue,   // the value paired with the resolved key
    kSelf,          // the resolved node itself
    kNone,          // nothing decoded
};

std::string_view value_source_name(ValueSource s);

struct Extracted {
    std::optional<value::Value> value{};
    ValueSource source = ValueSource::kNone;
};

/// Result of resolving a path in a document. Only built on success, with
/// every field filled in.
struct Location {
    std::string file;
    uint32_t line = 1;
    uint32_t column = 1;
    std::optional<value::Value> value{};
    ValueSource value_source = ValueSource::kNone;
    Path path{};
    cst::Cursor cursor;
};

// 1 + the number of newline nodes before `at` in document order.
uint32_t line_number(const cst::Cursor& at);

// Decodes the value for a resolved position: the paired value when `at` is
// a key, otherwise the node itself.
Extracted extract_value(const cst::Cursor& at, const ResolveOptions& opt = {});

// Resolves `path` in an already parsed document.
std::optional<Location> locate_in(const Path& path,
                                  const cst::NodePtr& root,
                                  std::string_view file,
                                  const ResolveOptions& opt = {},
                                  diag::Bag* why = nullptr);

// Parses `text` and resolves `path` in it. Reader errors, a missing start
// form and unresolved segments all give nullopt; `why`, when given,
// receives the reason. ContractViolation propagates.
std::optional<Location> locate(const Path& path,
                               std::string_view text,
                               std::string_view file,
                               const ResolveOptions& opt = {},
                               diag::Bag* why = nullptr);

// locate() on the contents of `file`. A missing or unreadable file gives
// nullopt.
std::optional<Location> locate_file(const Path& path,
                                    std::string_view file,
                                    const ResolveOptions& opt = {},
                                    diag::Bag* why = nullptr);

} // namespace ednpath::nav
