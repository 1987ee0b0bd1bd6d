#include <ednpath/nav/Location.hpp>

#include <ednpath/log/Log.hpp>
#include <ednpath/nav/Classify.hpp>
#include <ednpath/nav/Direction.hpp>
#include <ednpath/os/File.hpp>
#include <ednpath/parse/Parser.hpp>
#include <ednpath/value/Decode.hpp>

#include <utility>

namespace ednpath::nav {

namespace {

void note(diag::Bag* why, diag::Code code, std::string_view file, std::string message) {
    log::debug(std::string(file) + ": " + message);
    if (why) why->add(code, std::string(file), 0, 0, std::move(message));
}

} // namespace

std::string_view value_source_name(ValueSource s) {
    switch (s) {
        case ValueSource::kPairedValue: return "paired-value";
        case ValueSource::kSelf: return "self";
        case ValueSource::kNone: return "none";
    }
    return "none";
}

uint32_t line_number(const cst::Cursor& at) {
    const auto root = to_root(at);
    if (!root) return 1;

    uint32_t newlines = 0;
    for (const auto& c : direction(step::next, *root)) {
        if (c == at) break;
        if (is_kind(c.node(), syntax::NodeKind::kNewline)) ++newlines;
    }
    return newlines + 1;
}

Extracted extract_value(const cst::Cursor& at, const ResolveOptions& opt) {
    if (is_key_position(at, opt)) {
        if (const auto paired = siblings_rightward(at).nth(1)) {
            if (!is_delimiter(paired->node())) {
                if (auto v = value::decode(paired->node())) {
                    return Extracted{std::move(v), ValueSource::kPairedValue};
                }
            }
        }
    }
    if (auto v = value::decode(at.node())) {
        return Extracted{std::move(v), ValueSource::kSelf};
    }
    return Extracted{};
}

std::optional<Location> locate_in(const Path& path,
                                  const cst::NodePtr& root,
                                  std::string_view file,
                                  const ResolveOptions& opt,
                                  diag::Bag* why) {
    const cst::Cursor top(root);
    const auto start = initial_position(top, opt);
    if (!start) {
        note(why, diag::Code::R_NO_INITIAL_FORM, file,
             "no '" + opt.call_form_head + "' form or collection to start from");
        return std::nullopt;
    }

    const auto at = resolve_path(path, *start, opt);
    if (!at) {
        note(why, diag::Code::R_PATH_NOT_FOUND, file, "path " + to_string(path) + " not found");
        return std::nullopt;
    }

    auto ex = extract_value(*at, opt);
    return Location{
        std::string(file),
        line_number(*at),
        at->column(),
        std::move(ex.value),
        ex.source,
        path,
        *at,
    };
}

std::optional<Location> locate(const Path& path,
                               std::string_view text,
                               std::string_view file,
                               const ResolveOptions& opt,
                               diag::Bag* why) {
    diag::Bag reader{};
    const auto root = parse::parse_source(text, file, reader);
    if (reader.has_error()) {
        log::debug(std::string(file) + ": not resolving " + to_string(path) + ", document has " +
                   std::to_string(reader.size()) + " reader error(s)");
        if (why) {
            for (const auto& d : reader.all()) why->add(d);
        }
        return std::nullopt;
    }
    return locate_in(path, root, file, opt, why);
}

std::optional<Location> locate_file(const Path& path,
                                    std::string_view file,
                                    const ResolveOptions& opt,
                                    diag::Bag* why) {
    const auto rd = os::read_text_file(file);
    if (!rd.ok) {
        note(why, rd.missing ? diag::Code::R_FILE_NOT_FOUND : diag::Code::R_FILE_READ_FAILED,
             file, rd.err);
        return std::nullopt;
    }
    return locate(path, rd.text, file, opt, why);
}

} // namespace ednpath::nav
