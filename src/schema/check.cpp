#include <ednpath/schema/Check.hpp>

#include <ednpath/nav/Location.hpp>
#include <ednpath/schema/Suggest.hpp>

#include <unordered_set>
#include <utility>

namespace ednpath::schema {

namespace {

constexpr size_t kMaxShownValue = 48;

std::string shown(const value::Value& v) {
    std::string s = value::to_edn(v);
    if (s.size() > kMaxShownValue) {
        s.resize(kMaxShownValue - 3);
        s += "...";
    }
    return s;
}

nav::Path child_path(const nav::Path& base, nav::KeySegment seg) {
    nav::Path p = base;
    p.push_back(std::move(seg));
    return p;
}

// Path segment naming a map key, when the key has a form paths can express.
std::optional<nav::KeySegment> segment_for(const value::Value& key) {
    if (const auto* k = key.as_keyword()) return nav::KeySegment::keyword(k->name);
    if (const auto* s = key.as_string()) return nav::KeySegment::string(*s);
    if (const auto* s = key.as_symbol()) return nav::KeySegment::symbol(s->name);
    if (const auto* i = key.as_int(); i && *i >= 0) return nav::KeySegment::at(static_cast<uint64_t>(*i));
    return std::nullopt;
}

void check_into(const value::Value& v, const KeyTable& table, const nav::Path& base,
                std::vector<Violation>& out);

void check_value(const KeySpec& spec, const value::Value& val, const nav::Path& at,
                 std::vector<Violation>& out) {
    if (spec.nested) {
        if (spec.nesting == Nesting::kMap && val.is_map()) {
            check_into(val, *spec.nested, at, out);
            return;
        }
        if (spec.nesting == Nesting::kEachMap && val.is_sequential()) {
            const auto& items = *val.items();
            for (size_t i = 0; i < items.size(); ++i) {
                check_into(items[i], *spec.nested, child_path(at, nav::KeySegment::at(i)), out);
            }
            if (!items.empty()) return;
        }
    }

    if (!spec.rule.accepts || spec.rule.accepts(val)) return;

    Violation viol{};
    viol.kind = ViolationKind::kInvalidValue;
    viol.path = at;
    viol.message = "value of :" + spec.name + " must be " + spec.rule.expect + ", got " + shown(val);
    viol.doc = spec.doc;
    out.push_back(std::move(viol));
}

void check_into(const value::Value& v, const KeyTable& table, const nav::Path& base,
                std::vector<Violation>& out) {
    const auto* m = v.as_map();
    if (!m) {
        Violation viol{};
        viol.kind = ViolationKind::kNotAMap;
        viol.path = base;
        viol.message = "expected a map of " + std::string(table.name()) + ", got " +
                       std::string(value::type_name(v));
        out.push_back(std::move(viol));
        return;
    }

    std::unordered_set<std::string> seen;
    for (const auto& e : m->entries) {
        const auto seg = segment_for(e.key);
        const nav::Path at = seg ? child_path(base, *seg) : base;

        const auto* kw = e.key.as_keyword();
        const KeySpec* spec = kw ? table.find(kw->name) : nullptr;
        if (!spec) {
            Violation viol{};
            viol.kind = ViolationKind::kUnknownKey;
            viol.path = at;
            viol.message = "unknown key " + shown(e.key) + " in " + std::string(table.name());
            if (kw) viol.suggestion = suggest_key(kw->name, table);
            out.push_back(std::move(viol));
            continue;
        }

        seen.insert(spec->name);
        check_value(*spec, e.val, at, out);
    }

    for (const auto& spec : table.entries()) {
        if (!spec.required || seen.count(spec.name) != 0) continue;
        Violation viol{};
        viol.kind = ViolationKind::kMissingKey;
        viol.path = base;
        viol.message = "missing required key :" + spec.name + " in " + std::string(table.name());
        viol.doc = spec.doc;
        out.push_back(std::move(viol));
    }
}

diag::Code code_for(ViolationKind k) {
    switch (k) {
        case ViolationKind::kNotAMap: return diag::Code::S_NOT_A_MAP;
        case ViolationKind::kUnknownKey: return diag::Code::S_UNKNOWN_KEY;
        case ViolationKind::kInvalidValue: return diag::Code::S_INVALID_VALUE;
        case ViolationKind::kMissingKey: return diag::Code::S_MISSING_KEY;
    }
    return diag::Code::S_INVALID_VALUE;
}

} // namespace

std::string_view violation_kind_name(ViolationKind k) {
    switch (k) {
        case ViolationKind::kNotAMap: return "not-a-map";
        case ViolationKind::kUnknownKey: return "unknown-key";
        case ViolationKind::kInvalidValue: return "invalid-value";
        case ViolationKind::kMissingKey: return "missing-key";
    }
    return "invalid-value";
}

std::vector<Violation> check_strict_map(const value::Value& v,
                                        const KeyTable& table,
                                        const nav::Path& base_path) {
    std::vector<Violation> out;
    check_into(v, table, base_path, out);
    return out;
}

void report(const std::vector<Violation>& violations,
            const cst::NodePtr& document,
            std::string_view file,
            diag::Bag& bag,
            const nav::ResolveOptions& opt) {
    const cst::Cursor top(document);
    for (const auto& viol : violations) {
        diag::Diagnostic d{};
        d.code = code_for(viol.kind);
        d.file = std::string(file);
        d.line = 0;
        d.column = 0;
        d.message = viol.message;
        d.path = nav::to_string(viol.path);
        if (viol.suggestion) d.note = "did you mean :" + *viol.suggestion + "?";

        if (viol.path.empty()) {
            if (const auto start = nav::initial_position(top, opt)) {
                d.line = nav::line_number(*start);
                d.column = start->column();
            }
        } else if (const auto loc = nav::locate_in(viol.path, document, file, opt)) {
            d.line = loc->line;
            d.column = loc->column;
        }
        bag.add(std::move(d));
    }
}

} // namespace ednpath::schema
