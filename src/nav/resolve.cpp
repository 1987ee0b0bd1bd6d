#include <ednpath/nav/Resolve.hpp>

#include <ednpath/nav/Classify.hpp>
#include <ednpath/nav/Direction.hpp>
#include <ednpath/syntax/NodeKind.hpp>

#include <vector>

namespace ednpath::nav {

namespace {

using K = syntax::NodeKind;

struct Hit {
    cst::Cursor key;
    std::optional<cst::Cursor> value;
};

// Significant children between the opening and closing delimiters.
std::vector<cst::Cursor> elements_of(const cst::Cursor& coll) {
    std::vector<cst::Cursor> out;
    const auto first = coll.down();
    if (!first) return out;

    for (const auto& c : siblings_rightward(*first)) {
        if (is_delimiter(c.node())) {
            if (c.index() == 0) continue;
            break;
        }
        out.push_back(c);
    }
    return out;
}

// Pairs elems[from..] as key/value and returns the first pair whose key
// matches. A trailing key without a value still matches.
std::optional<Hit> find_pair(const KeySegment& seg,
                             const std::vector<cst::Cursor>& elems,
                             size_t from) {
    for (size_t i = from; i < elems.size(); i += 2) {
        if (!is_key_match(seg, elems[i].node())) continue;
        if (i + 1 < elems.size()) return Hit{elems[i], elems[i + 1]};
        return Hit{elems[i], std::nullopt};
    }
    return std::nullopt;
}

std::optional<Hit> find_index(const KeySegment& seg, const std::vector<cst::Cursor>& elems) {
    if (seg.index >= elems.size()) return std::nullopt;
    const auto& c = elems[static_cast<size_t>(seg.index)];
    return Hit{c, c};
}

std::optional<Hit> lookup_sequence(const KeySegment& seg, const cst::Cursor& at) {
    if (!seg.is_index()) {
        throw ContractViolation("path segment " + to_string(seg) + " cannot address a " +
                                std::string(syntax::node_kind_name(at.node().kind)) +
                                "; sequences take integer indexes");
    }
    return find_index(seg, elements_of(at));
}

// Offset of the option region: past the head symbol and the positionals
// before the first keyword.
size_t options_begin(const std::vector<cst::Cursor>& elems) {
    size_t from = elems.empty() ? 0 : 1;
    while (from < elems.size() && !is_keyword_token(elems[from].node())) ++from;
    return from;
}

std::optional<Hit> lookup_call_form(const KeySegment& seg, const cst::Cursor& at) {
    const auto elems = elements_of(at);
    if (seg.is_index()) return find_index(seg, elems);
    return find_pair(seg, elems, options_begin(elems));
}

std::optional<Hit> lookup(const KeySegment& seg, const cst::Cursor& at, const ResolveOptions& opt) {
    const auto& n = at.node();
    switch (n.kind) {
        case K::kList:
            if (is_call_form(n, opt.call_form_head)) return lookup_call_form(seg, at);
            return lookup_sequence(seg, at);

        case K::kVector:
            return lookup_sequence(seg, at);

        case K::kMap:
            return find_pair(seg, elements_of(at), 0);

        // sets have no addressable positions
        case K::kSet:
            return std::nullopt;

        case K::kRoot:
        case K::kFn:
        case K::kSymbol:
        case K::kKeyword:
        case K::kString:
        case K::kNumber:
        case K::kCharacter:
        case K::kRegex:
        case K::kReaderMacro:
        case K::kDelimiter:
        case K::kWhitespace:
        case K::kNewline:
        case K::kComment:
        case K::kDiscard:
        case K::kError:
            return std::nullopt;
    }
    return std::nullopt;
}

std::optional<cst::Cursor> walk(const Path& path,
                                const cst::Cursor& start,
                                const ResolveOptions& opt,
                                bool last_to_value) {
    if (path.empty()) return std::nullopt;

    cst::Cursor cur = start;
    for (size_t i = 0; i < path.size(); ++i) {
        auto hit = lookup(path[i], cur, opt);
        if (!hit) return std::nullopt;

        const bool last = (i + 1 == path.size());
        if (last && !last_to_value) return hit->key;
        if (!hit->value) return std::nullopt;
        cur = *hit->value;
    }
    return cur;
}

// Inside a #_ form, and so not part of the document's data.
bool is_discarded(const cst::Cursor& c) {
    for (const auto& a : direction(step::up, c)) {
        if (is_kind(a.node(), K::kDiscard)) return true;
    }
    return false;
}

} // namespace

std::optional<cst::Cursor> find_key_in_node(const KeySegment& seg,
                                            const cst::Cursor& at,
                                            const ResolveOptions& opt) {
    auto hit = lookup(seg, at, opt);
    if (!hit) return std::nullopt;
    return hit->key;
}

std::optional<cst::Cursor> find_key_value_in_node(const KeySegment& seg,
                                                  const cst::Cursor& at,
                                                  const ResolveOptions& opt) {
    auto hit = lookup(seg, at, opt);
    if (!hit) return std::nullopt;
    return hit->value;
}

std::optional<cst::Cursor> resolve_path(const Path& path,
                                        const cst::Cursor& start,
                                        const ResolveOptions& opt) {
    return walk(path, start, opt, /*last_to_value=*/false);
}

std::optional<cst::Cursor> get_value_at_path(const Path& path,
                                             const cst::Cursor& start,
                                             const ResolveOptions& opt) {
    return walk(path, start, opt, /*last_to_value=*/true);
}

bool is_key_position(const cst::Cursor& at, const ResolveOptions& opt) {
    const auto parent = at.up();
    if (!parent) return false;

    const auto& pn = parent->node();
    const bool map = is_map(pn);
    if (!map && !is_call_form(pn, opt.call_form_head)) return false;

    const auto elems = elements_of(*parent);
    const size_t from = map ? 0 : options_begin(elems);
    for (size_t i = from; i < elems.size(); ++i) {
        if (elems[i] == at) return (i - from) % 2 == 0;
    }
    return false;
}

std::optional<cst::Cursor> initial_position(const cst::Cursor& root, const ResolveOptions& opt) {
    const std::string& head = opt.call_form_head;
    const auto call_form = [&](const cst::Cursor& c) {
        return is_call_form(c.node(), head) && !is_discarded(c);
    };
    if (auto c = direction_find(step::next, call_form, root)) return c;

    const auto any_collection = [](const cst::Cursor& c) {
        return (is_collection(c.node()) || is_set(c.node())) && !is_discarded(c);
    };
    return direction_find(step::next, any_collection, root);
}

} // namespace ednpath::nav
