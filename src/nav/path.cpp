#include <ednpath/nav/Path.hpp>

#include <ednpath/parse/Parser.hpp>
#include <ednpath/value/Decode.hpp>

#include <sstream>

namespace ednpath::nav {

namespace {

const char* kPathFile = "<path>";

bool is_trivia(const cst::Node& n) {
    return n.kind == syntax::NodeKind::kWhitespace ||
           n.kind == syntax::NodeKind::kNewline ||
           n.kind == syntax::NodeKind::kComment ||
           n.kind == syntax::NodeKind::kDiscard;
}

void bad_path(diag::Bag& diags, const cst::Node& n, std::string message) {
    diags.add(diag::Code::R_INVALID_PATH, kPathFile, n.loc.line, n.loc.column, std::move(message));
}

std::optional<KeySegment> segment_from(const cst::Node& n, diag::Bag& diags) {
    auto v = value::decode(n);
    if (!v) {
        bad_path(diags, n, "cannot read path element '" + cst::text_of(n) + "'");
        return std::nullopt;
    }
    if (auto k = v->as_keyword()) return KeySegment::keyword(k->name);
    if (auto s = v->as_symbol()) return KeySegment::symbol(s->name);
    if (auto s = v->as_string()) return KeySegment::string(*s);
    if (auto i = v->as_int()) {
        if (*i < 0) {
            bad_path(diags, n, "path index must be non-negative, got " + std::to_string(*i));
            return std::nullopt;
        }
        return KeySegment::at(static_cast<uint64_t>(*i));
    }
    bad_path(diags, n, "unsupported path element of type " + std::string(value::type_name(*v)));
    return std::nullopt;
}

} // namespace

std::optional<Path> parse_path(std::string_view text, diag::Bag& diags) {
    diag::Bag reader_diags;
    const auto root = parse::parse_source(text, kPathFile, reader_diags);
    if (reader_diags.has_error()) {
        for (const auto& d : reader_diags.all()) {
            diags.add(diag::Code::R_INVALID_PATH, kPathFile, d.line, d.column, d.message);
        }
        return std::nullopt;
    }

    std::vector<const cst::Node*> elements;
    for (const auto& c : root->children) {
        if (!is_trivia(*c)) elements.push_back(c.get());
    }

    // a single vector is the path itself
    if (elements.size() == 1 && elements.front()->kind == syntax::NodeKind::kVector) {
        const auto* vec = elements.front();
        elements.clear();
        for (const auto& c : vec->children) {
            if (!is_trivia(*c) && c->kind != syntax::NodeKind::kDelimiter) elements.push_back(c.get());
        }
    }

    if (elements.empty()) {
        diags.add(diag::Code::R_INVALID_PATH, kPathFile, 1, 1, "path is empty");
        return std::nullopt;
    }

    Path out;
    out.reserve(elements.size());
    for (const auto* e : elements) {
        auto seg = segment_from(*e, diags);
        if (!seg) return std::nullopt;
        out.push_back(std::move(*seg));
    }
    return out;
}

std::string to_string(const KeySegment& seg) {
    switch (seg.kind) {
        case KeySegment::Kind::kKeyword: return ":" + seg.name;
        case KeySegment::Kind::kSymbol: return seg.name;
        case KeySegment::Kind::kString: return value::to_edn(value::make_string(seg.name));
        case KeySegment::Kind::kIndex: return std::to_string(seg.index);
    }
    return "?";
}

std::string to_string(const Path& path) {
    std::ostringstream oss;
    oss << '[';
    for (size_t i = 0; i < path.size(); ++i) {
        if (i != 0) oss << ' ';
        oss << to_string(path[i]);
    }
    oss << ']';
    return oss.str();
}

} // namespace ednpath::nav
