#include <ednpath/value/Decode.hpp>

#include <ednpath/diag/DiagCode.hpp>
#include <ednpath/parse/Parser.hpp>

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace ednpath::value {

namespace {

using NK = syntax::NodeKind;

bool is_significant(const cst::Node& n) {
    switch (n.kind) {
        case NK::kWhitespace:
        case NK::kNewline:
        case NK::kComment:
        case NK::kDiscard:
        case NK::kDelimiter:
            return false;
        default:
            return true;
    }
}

std::vector<const cst::Node*> significant_children(const cst::Node& n) {
    std::vector<const cst::Node*> out;
    for (const auto& c : n.children) {
        if (is_significant(*c)) out.push_back(c.get());
    }
    return out;
}

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

bool parse_radix(std::string_view digits, int base, uint32_t& out) {
    if (digits.empty()) return false;
    const auto* first = digits.data();
    const auto* last = digits.data() + digits.size();
    auto [ptr, ec] = std::from_chars(first, last, out, base);
    return ec == std::errc{} && ptr == last;
}

bool all_digits(std::string_view s) {
    if (s.empty()) return false;
    for (const char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

// Number of bytes in the UTF-8 sequence led by `c`; 0 for a stray byte.
size_t utf8_length(unsigned char c) {
    if (c < 0x80) return 1;
    if ((c & 0xE0) == 0xC0) return 2;
    if ((c & 0xF0) == 0xE0) return 3;
    if ((c & 0xF8) == 0xF0) return 4;
    return 0;
}

std::optional<Value> decode_character(std::string_view raw) {
    if (raw.size() < 2 || raw.front() != '\\') return std::nullopt;
    const std::string_view body = raw.substr(1);

    std::string utf8;
    if (body == "newline") utf8 = "\n";
    else if (body == "space") utf8 = " ";
    else if (body == "tab") utf8 = "\t";
    else if (body == "backspace") utf8 = "\b";
    else if (body == "formfeed") utf8 = "\f";
    else if (body == "return") utf8 = "\r";
    else if (body.size() == 5 && body[0] == 'u') {
        uint32_t cp = 0;
        if (!parse_radix(body.substr(1), 16, cp)) return std::nullopt;
        append_utf8(utf8, cp);
    } else if (body.size() >= 2 && body.size() <= 4 && body[0] == 'o') {
        uint32_t cp = 0;
        if (!parse_radix(body.substr(1), 8, cp) || cp > 0377) return std::nullopt;
        append_utf8(utf8, cp);
    } else if (utf8_length(static_cast<unsigned char>(body[0])) == body.size()) {
        utf8 = std::string(body);
    } else {
        return std::nullopt;
    }

    Value v;
    v.data = Character{std::move(utf8)};
    return v;
}

std::optional<Value> decode_regex(std::string_view raw) {
    if (raw.size() < 3 || raw.substr(0, 2) != "#\"" || raw.back() != '"') return std::nullopt;
    Value v;
    v.data = Regex{std::string(raw.substr(2, raw.size() - 3))};
    return v;
}

std::optional<Value> decode_symbol(std::string_view raw) {
    if (raw == "nil") return make_nil();
    if (raw == "true") return make_bool(true);
    if (raw == "false") return make_bool(false);
    return make_symbol(std::string(raw));
}

bool contains_duplicates(const std::vector<Value>& items) {
    for (size_t i = 0; i < items.size(); ++i) {
        for (size_t j = i + 1; j < items.size(); ++j) {
            if (equal(items[i], items[j])) return true;
        }
    }
    return false;
}

std::optional<std::vector<Value>> decode_items(const cst::Node& n) {
    std::vector<Value> items;
    for (const auto* c : significant_children(n)) {
        auto v = decode(*c);
        if (!v) return std::nullopt;
        items.push_back(std::move(*v));
    }
    return items;
}

std::optional<Value> decode_map(const std::vector<Value>& items) {
    if (items.size() % 2 != 0) return std::nullopt;

    Map m;
    std::vector<Value> keys;
    for (size_t i = 0; i < items.size(); i += 2) {
        keys.push_back(items[i]);
        m.entries.push_back(MapEntry{items[i], items[i + 1]});
    }
    if (contains_duplicates(keys)) return std::nullopt;

    Value v;
    v.data = std::move(m);
    return v;
}

Value wrap_call(std::string head, Value form) {
    List l;
    l.items.push_back(make_symbol(std::move(head)));
    l.items.push_back(std::move(form));
    Value v;
    v.data = std::move(l);
    return v;
}

std::optional<Value> decode_reader_macro(const cst::Node& n) {
    if (n.children.empty()) return std::nullopt;
    const std::string& prefix = n.children.front()->text;
    const auto forms = significant_children(n);

    if (prefix == "^") {
        // metadata does not change the value
        if (forms.size() != 2) return std::nullopt;
        return decode(*forms[1]);
    }

    if (forms.size() != 1) return std::nullopt;
    auto form = decode(*forms[0]);
    if (!form) return std::nullopt;

    if (prefix == "'") return wrap_call("quote", std::move(*form));
    if (prefix == "@") return wrap_call("clojure.core/deref", std::move(*form));
    if (prefix == "#'") return wrap_call("var", std::move(*form));
    if (prefix == "~") return wrap_call("clojure.core/unquote", std::move(*form));
    if (prefix == "~@") return wrap_call("clojure.core/unquote-splicing", std::move(*form));
    if (prefix == "`") return std::nullopt;
    if (prefix == "#?" || prefix == "#?@") return std::nullopt;

    if (prefix.size() > 2 && prefix.compare(0, 2, "#:") == 0) {
        // namespaced map: #:ns{:a 1} reads as {:ns/a 1}
        auto* m = std::get_if<Map>(&form->data);
        if (!m) return std::nullopt;
        const std::string ns = prefix.substr(2);
        for (auto& e : m->entries) {
            auto* k = std::get_if<Keyword>(&e.key.data);
            if (!k) continue;
            if (k->name.compare(0, 2, "_/") == 0) {
                k->name = k->name.substr(2);
            } else if (k->name.find('/') == std::string::npos) {
                k->name = ns + "/" + k->name;
            }
        }
        return form;
    }

    if (prefix.size() > 1 && prefix[0] == '#') {
        Value v;
        v.data = Tagged{prefix.substr(1), std::make_shared<const Value>(std::move(*form))};
        return v;
    }
    return std::nullopt;
}

} // namespace

std::string_view keyword_name(std::string_view raw) {
    while (!raw.empty() && raw.front() == ':') raw.remove_prefix(1);
    return raw;
}

std::optional<std::string> decode_string_literal(std::string_view raw) {
    if (raw.size() < 2 || raw.front() != '"' || raw.back() != '"') return std::nullopt;
    const std::string_view body = raw.substr(1, raw.size() - 2);

    std::string out;
    out.reserve(body.size());
    for (size_t i = 0; i < body.size(); ++i) {
        const char c = body[i];
        if (c != '\\') {
            out.push_back(c);
            continue;
        }
        if (++i >= body.size()) return std::nullopt; // the closing quote was escaped
        const char esc = body[i];
        switch (esc) {
            case 'n': out.push_back('\n'); break;
            case 't': out.push_back('\t'); break;
            case 'r': out.push_back('\r'); break;
            case 'b': out.push_back('\b'); break;
            case 'f': out.push_back('\f'); break;
            case '"': out.push_back('"'); break;
            case '\'': out.push_back('\''); break;
            case '\\': out.push_back('\\'); break;
            case 'u': {
                uint32_t cp = 0;
                if (i + 4 >= body.size()) return std::nullopt;
                if (!parse_radix(body.substr(i + 1, 4), 16, cp)) return std::nullopt;
                append_utf8(out, cp);
                i += 4;
                break;
            }
            default: {
                if (esc < '0' || esc > '7') return std::nullopt;
                size_t n = 1;
                while (n < 3 && i + n < body.size() && body[i + n] >= '0' && body[i + n] <= '7') ++n;
                uint32_t cp = 0;
                if (!parse_radix(body.substr(i, n), 8, cp) || cp > 0377) return std::nullopt;
                append_utf8(out, cp);
                i += n - 1;
                break;
            }
        }
    }
    return out;
}

std::optional<Value> decode_number(std::string_view text) {
    if (text == "##Inf" || text == "##-Inf" || text == "##NaN") {
        Value v;
        if (text == "##NaN") v.data = std::numeric_limits<double>::quiet_NaN();
        else if (text == "##Inf") v.data = std::numeric_limits<double>::infinity();
        else v.data = -std::numeric_limits<double>::infinity();
        return v;
    }
    if (text.empty()) return std::nullopt;

    std::string_view body = text;
    bool negative = false;
    if (body.front() == '+' || body.front() == '-') {
        negative = body.front() == '-';
        body.remove_prefix(1);
    }
    if (body.empty() || !std::isdigit(static_cast<unsigned char>(body.front()))) return std::nullopt;

    auto big = [&]() {
        Value v;
        v.data = BigNumber{std::string(text)};
        return v;
    };

    // ratio
    if (const auto slash = body.find('/'); slash != std::string_view::npos) {
        if (!all_digits(body.substr(0, slash)) || !all_digits(body.substr(slash + 1))) return std::nullopt;
        return big();
    }

    // decimal
    if (body.back() == 'M') {
        const std::string s(body.substr(0, body.size() - 1));
        char* end = nullptr;
        (void)std::strtod(s.c_str(), &end);
        if (s.empty() || end != s.c_str() + s.size()) return std::nullopt;
        return big();
    }

    const bool bigint_suffix = body.back() == 'N';
    if (bigint_suffix) body.remove_suffix(1);

    int base = 10;
    std::string_view digits = body;
    if (digits.size() > 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        base = 16;
        digits.remove_prefix(2);
    } else if (const auto r = digits.find_first_of("rR"); r != std::string_view::npos && !bigint_suffix) {
        uint32_t radix = 0;
        if (!parse_radix(digits.substr(0, r), 10, radix) || radix < 2 || radix > 36) return std::nullopt;
        base = static_cast<int>(radix);
        digits.remove_prefix(r + 1);
    } else if (digits.size() > 1 && digits[0] == '0' && all_digits(digits)) {
        base = 8;
        digits.remove_prefix(1);
    }

    if (base == 10 && digits.find_first_of(".eE") != std::string_view::npos) {
        if (bigint_suffix) return std::nullopt;
        const std::string s(text);
        char* end = nullptr;
        const double d = std::strtod(s.c_str(), &end);
        if (end != s.c_str() + s.size()) return std::nullopt;
        Value v;
        v.data = d;
        return v;
    }

    if (digits.empty()) return std::nullopt;
    uint64_t magnitude = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), magnitude, base);
    if (ptr != digits.data() + digits.size()) {
        if (ec == std::errc::result_out_of_range) return big();
        return std::nullopt;
    }
    if (ec != std::errc{}) return big();

    const uint64_t limit = negative ? static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) + 1
                                    : static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    if (magnitude > limit) return big();

    Value v;
    if (negative) {
        v.data = magnitude == limit ? std::numeric_limits<int64_t>::min() : -static_cast<int64_t>(magnitude);
    } else {
        v.data = static_cast<int64_t>(magnitude);
    }
    return v;
}

std::optional<Value> decode(const cst::Node& n) {
    switch (n.kind) {
        case NK::kSymbol: return decode_symbol(n.text);
        case NK::kKeyword: {
            const auto name = keyword_name(n.text);
            if (name.empty()) return std::nullopt;
            return make_keyword(std::string(name));
        }
        case NK::kString: {
            auto s = decode_string_literal(n.text);
            if (!s) return std::nullopt;
            return make_string(std::move(*s));
        }
        case NK::kNumber: return decode_number(n.text);
        case NK::kCharacter: return decode_character(n.text);
        case NK::kRegex: return decode_regex(n.text);

        case NK::kList:
        case NK::kVector:
        case NK::kSet: {
            auto items = decode_items(n);
            if (!items) return std::nullopt;
            Value v;
            if (n.kind == NK::kList) {
                v.data = List{std::move(*items)};
            } else if (n.kind == NK::kVector) {
                v.data = Vector{std::move(*items)};
            } else {
                if (contains_duplicates(*items)) return std::nullopt;
                v.data = Set{std::move(*items)};
            }
            return v;
        }
        case NK::kMap: {
            auto items = decode_items(n);
            if (!items) return std::nullopt;
            return decode_map(*items);
        }
        case NK::kReaderMacro: return decode_reader_macro(n);

        case NK::kRoot:
        case NK::kFn:
        case NK::kDelimiter:
        case NK::kWhitespace:
        case NK::kNewline:
        case NK::kComment:
        case NK::kDiscard:
        case NK::kError:
            break;
    }
    return std::nullopt;
}

std::optional<Value> read_value(std::string_view text) {
    diag::Bag bag;
    const auto root = parse::parse_source(text, "<value>", bag);
    if (bag.has_error()) return std::nullopt;

    for (const auto& c : root->children) {
        if (is_significant(*c)) return decode(*c);
    }
    return std::nullopt;
}

} // namespace ednpath::value
