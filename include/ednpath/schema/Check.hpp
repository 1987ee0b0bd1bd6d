#pragma once

#include <ednpath/cst/Node.hpp>
#include <ednpath/diag/DiagCode.hpp>
#include <ednpath/nav/Path.hpp>
#include <ednpath/nav/Resolve.hpp>
#include <ednpath/schema/KeyTable.hpp>
#include <ednpath/value/Value.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ednpath::schema {

enum class ViolationKind : uint8_t {
    kNotAMap,
    kUnknownKey,
    kInvalidValue,
    kMissingKey,
};

std::string_view violation_kind_name(ViolationKind k);

struct Violation {
    ViolationKind kind = ViolationKind::kInvalidValue;
    nav::Path path{};       // the offending key; for kNotAMap and kMissingKey the map itself
    std::string message{};
    std::optional<std::string> suggestion{};
    std::string doc{};      // documentation of the key, when known
};

// Checks `v` as a map that may only hold keys from `table`. Nested tables
// are checked recursively. Violations come out in document order, with
// missing required keys last.
std::vector<Violation> check_strict_map(const value::Value& v,
                                        const KeyTable& table,
                                        const nav::Path& base_path = {});

// Turns violations into diagnostics in `bag`, giving each the line and
// column its path resolves to in `document`. When the path does not
// resolve the diagnostic keeps line 0 and carries the path instead.
void report(const std::vector<Violation>& violations,
            const cst::NodePtr& document,
            std::string_view file,
            diag::Bag& bag,
            const nav::ResolveOptions& opt = {});

} // namespace ednpath::schema
