#pragma once

#include <ednpath/schema/KeyTable.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace ednpath::schema {

size_t edit_distance(std::string_view a, std::string_view b);

// Closest key of `table` for a misspelt `name`: the nearest within two
// edits, else the single key equal to `name` once '-', '_' and '.' are
// dropped and case is ignored.
std::optional<std::string> suggest_key(std::string_view name, const KeyTable& table);

} // namespace ednpath::schema
