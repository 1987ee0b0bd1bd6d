#pragma once

#include <ednpath/cst/Cursor.hpp>
#include <ednpath/cst/Node.hpp>
#include <ednpath/nav/Path.hpp>

#include <string_view>

namespace ednpath::nav {

inline bool is_kind(const cst::Node& n, syntax::NodeKind k) { return n.kind == k; }

inline bool is_root(const cst::Node& n) { return is_kind(n, syntax::NodeKind::kRoot); }
inline bool is_map(const cst::Node& n) { return is_kind(n, syntax::NodeKind::kMap); }
inline bool is_set(const cst::Node& n) { return is_kind(n, syntax::NodeKind::kSet); }
inline bool is_list(const cst::Node& n) { return is_kind(n, syntax::NodeKind::kList); }
inline bool is_vector(const cst::Node& n) { return is_kind(n, syntax::NodeKind::kVector); }
inline bool is_symbolic_name(const cst::Node& n) { return is_kind(n, syntax::NodeKind::kSymbol); }
inline bool is_keyword_token(const cst::Node& n) { return is_kind(n, syntax::NodeKind::kKeyword); }

inline bool is_collection(const cst::Node& n) {
    return is_map(n) || is_list(n) || is_vector(n);
}

inline bool is_insignificant(const cst::Node& n) {
    switch (n.kind) {
        case syntax::NodeKind::kWhitespace:
        case syntax::NodeKind::kNewline:
        case syntax::NodeKind::kComment:
        case syntax::NodeKind::kDiscard:
            return true;
        default:
            return false;
    }
}

inline bool is_delimiter(const cst::Node& n) { return is_kind(n, syntax::NodeKind::kDelimiter); }

// Cursor overloads, for use as direction predicates.
inline bool is_root_at(const cst::Cursor& c) { return is_root(c.node()); }
inline bool is_insignificant_at(const cst::Cursor& c) { return is_insignificant(c.node()); }

// Keyword text without its leading colon(s): ":foo/bar" -> "foo/bar".
std::string_view keyword_name(const cst::Node& n);

// True iff `n` is a keyword token named like the keyword segment `seg`.
bool is_keyword_match(const KeySegment& seg, const cst::Node& n);

// Key comparison used inside maps and call forms: keywords, symbols and
// strings by decoded text, indexes against integer literal keys.
bool is_key_match(const KeySegment& seg, const cst::Node& n);

// A list whose first significant child is the symbol `head`.
bool is_call_form(const cst::Node& n, std::string_view head);

} // namespace ednpath::nav
