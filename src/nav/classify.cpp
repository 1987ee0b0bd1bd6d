#include <ednpath/nav/Classify.hpp>

#include <ednpath/value/Decode.hpp>

namespace ednpath::nav {

std::string_view keyword_name(const cst::Node& n) {
    if (!is_keyword_token(n)) return {};
    return value::keyword_name(n.text);
}

bool is_keyword_match(const KeySegment& seg, const cst::Node& n) {
    return seg.kind == KeySegment::Kind::kKeyword &&
           is_keyword_token(n) &&
           keyword_name(n) == seg.name;
}

bool is_key_match(const KeySegment& seg, const cst::Node& n) {
    switch (seg.kind) {
        case KeySegment::Kind::kKeyword:
            return is_keyword_match(seg, n);
        case KeySegment::Kind::kSymbol:
            return is_symbolic_name(n) && n.text == seg.name;
        case KeySegment::Kind::kString: {
            if (!is_kind(n, syntax::NodeKind::kString)) return false;
            const auto s = value::decode_string_literal(n.text);
            return s && *s == seg.name;
        }
        case KeySegment::Kind::kIndex: {
            if (!is_kind(n, syntax::NodeKind::kNumber)) return false;
            const auto v = value::decode_number(n.text);
            if (!v) return false;
            const auto* i = v->as_int();
            return i && *i >= 0 && static_cast<uint64_t>(*i) == seg.index;
        }
    }
    return false;
}

bool is_call_form(const cst::Node& n, std::string_view head) {
    if (!is_list(n)) return false;
    for (const auto& c : n.children) {
        if (is_insignificant(*c) || is_delimiter(*c)) continue;
        return is_symbolic_name(*c) && c->text == head;
    }
    return false;
}

} // namespace ednpath::nav
