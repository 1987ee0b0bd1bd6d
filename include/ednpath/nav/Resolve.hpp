#pragma once

#include <ednpath/cst/Cursor.hpp>
#include <ednpath/nav/Path.hpp>

#include <optional>
#include <stdexcept>
#include <string>

namespace ednpath::nav {

struct ResolveOptions {
    // Symbol that marks the top-level call form, e.g. (defproject name "1.0" :k v).
    std::string call_form_head = "defproject";
};

/// Thrown when a path is applied to a node it can never address, such as a
/// keyword segment against a vector. Absence of data is never reported
/// this way.
class ContractViolation : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Position of `seg` inside the node under `at`: the key token for maps and
// call forms, the element for vectors and lists. nullopt when nothing
// matches or the node cannot hold keys (sets, scalars).
std::optional<cst::Cursor> find_key_in_node(const KeySegment& seg,
                                            const cst::Cursor& at,
                                            const ResolveOptions& opt = {});

// Like find_key_in_node, but for maps and call forms returns the value
// paired with the key instead of the key itself.
std::optional<cst::Cursor> find_key_value_in_node(const KeySegment& seg,
                                                  const cst::Cursor& at,
                                                  const ResolveOptions& opt = {});

// Walks `path` from `start`. Intermediate segments step into values; the
// last one stops on the key (maps, call forms) or element (sequences).
// An empty path, or any segment that does not match, gives nullopt.
std::optional<cst::Cursor> resolve_path(const Path& path,
                                        const cst::Cursor& start,
                                        const ResolveOptions& opt = {});

// Same walk, but the last segment also steps into its value.
std::optional<cst::Cursor> get_value_at_path(const Path& path,
                                             const cst::Cursor& start,
                                             const ResolveOptions& opt = {});

// True when `at` sits in key position of a map or call form, i.e. has a
// paired value to its right.
bool is_key_position(const cst::Cursor& at, const ResolveOptions& opt = {});

// Where resolution starts in a document: the first call form headed by
// `opt.call_form_head`, else the first collection in document order.
std::optional<cst::Cursor> initial_position(const cst::Cursor& root,
                                            const ResolveOptions& opt = {});

} // namespace ednpath::nav
