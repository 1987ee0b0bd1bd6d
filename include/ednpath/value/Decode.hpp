#pragma once

#include <ednpath/cst/Node.hpp>
#include <ednpath/value/Value.hpp>

#include <optional>
#include <string_view>

namespace ednpath::value {

// Decodes one significant form. Whitespace, newline, comment, discard and
// delimiter nodes decode to nothing, as does anything the EDN reader would
// reject (odd map, duplicate keys, bad escape, anonymous fn, syntax-quote,
// reader conditionals).
std::optional<Value> decode(const cst::Node& n);

// Parses `text` and decodes its first significant form. nullopt on reader
// errors or when the text holds no form.
std::optional<Value> read_value(std::string_view text);

// Literal-level helpers, exposed for the schema and path readers.
std::optional<std::string> decode_string_literal(std::string_view raw);
std::optional<Value> decode_number(std::string_view text);
std::string_view keyword_name(std::string_view raw);

} // namespace ednpath::value
