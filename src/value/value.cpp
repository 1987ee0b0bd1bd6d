#include <ednpath/value/Value.hpp>

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <sstream>

namespace ednpath::value {

namespace {

bool equal_items(const std::vector<Value>& a, const std::vector<Value>& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (!equal(a[i], b[i])) return false;
    }
    return true;
}

// Sets compare without regard to order.
bool equal_unordered(const std::vector<Value>& a, const std::vector<Value>& b) {
    if (a.size() != b.size()) return false;
    for (const auto& x : a) {
        bool found = false;
        for (const auto& y : b) {
            if (equal(x, y)) {
                found = true;
                break;
            }
        }
        if (!found) return false;
    }
    return true;
}

bool equal_maps(const Map& a, const Map& b) {
    if (a.entries.size() != b.entries.size()) return false;
    for (const auto& e : a.entries) {
        bool found = false;
        for (const auto& f : b.entries) {
            if (equal(e.key, f.key)) {
                if (!equal(e.val, f.val)) return false;
                found = true;
                break;
            }
        }
        if (!found) return false;
    }
    return true;
}

void write_string_literal(std::ostream& os, const std::string& s) {
    os << '"';
    for (const char c : s) {
        switch (c) {
            case '"': os << "\\\""; break;
            case '\\': os << "\\\\"; break;
            case '\n': os << "\\n"; break;
            case '\t': os << "\\t"; break;
            case '\r': os << "\\r"; break;
            default: os << c; break;
        }
    }
    os << '"';
}

void write_character(std::ostream& os, const std::string& utf8) {
    if (utf8 == "\n") os << "\\newline";
    else if (utf8 == " ") os << "\\space";
    else if (utf8 == "\t") os << "\\tab";
    else if (utf8 == "\r") os << "\\return";
    else if (utf8 == "\b") os << "\\backspace";
    else if (utf8 == "\f") os << "\\formfeed";
    else os << '\\' << utf8;
}

void write_double(std::ostream& os, double d) {
    if (std::isnan(d)) {
        os << "##NaN";
        return;
    }
    if (std::isinf(d)) {
        os << (d > 0 ? "##Inf" : "##-Inf");
        return;
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.17g", d);
    std::string s(buf);
    // shortest form that still reads back as the same double
    for (int prec = 1; prec < 17; ++prec) {
        std::snprintf(buf, sizeof(buf), "%.*g", prec, d);
        if (std::strtod(buf, nullptr) == d) {
            s = buf;
            break;
        }
    }
    if (s.find_first_of(".eEn") == std::string::npos) s += ".0";
    os << s;
}

void write_seq(std::ostream& os, const std::vector<Value>& items, const char* open, char close);

void write(std::ostream& os, const Value& v) {
    if (v.is_nil()) {
        os << "nil";
    } else if (auto b = std::get_if<bool>(&v.data)) {
        os << (*b ? "true" : "false");
    } else if (auto i = std::get_if<int64_t>(&v.data)) {
        os << *i;
    } else if (auto d = std::get_if<double>(&v.data)) {
        write_double(os, *d);
    } else if (auto n = std::get_if<BigNumber>(&v.data)) {
        os << n->text;
    } else if (auto s = std::get_if<std::string>(&v.data)) {
        write_string_literal(os, *s);
    } else if (auto c = std::get_if<Character>(&v.data)) {
        write_character(os, c->utf8);
    } else if (auto k = std::get_if<Keyword>(&v.data)) {
        os << ':' << k->name;
    } else if (auto sym = std::get_if<Symbol>(&v.data)) {
        os << sym->name;
    } else if (auto r = std::get_if<Regex>(&v.data)) {
        os << "#\"" << r->pattern << '"';
    } else if (auto l = std::get_if<List>(&v.data)) {
        write_seq(os, l->items, "(", ')');
    } else if (auto vec = std::get_if<Vector>(&v.data)) {
        write_seq(os, vec->items, "[", ']');
    } else if (auto set = std::get_if<Set>(&v.data)) {
        write_seq(os, set->items, "#{", '}');
    } else if (auto m = std::get_if<Map>(&v.data)) {
        os << '{';
        bool first = true;
        for (const auto& e : m->entries) {
            if (!first) os << ", ";
            first = false;
            write(os, e.key);
            os << ' ';
            write(os, e.val);
        }
        os << '}';
    } else if (auto t = std::get_if<Tagged>(&v.data)) {
        os << '#' << t->tag << ' ';
        if (t->form) write(os, *t->form);
        else os << "nil";
    }
}

void write_seq(std::ostream& os, const std::vector<Value>& items, const char* open, char close) {
    os << open;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i != 0) os << ' ';
        write(os, items[i]);
    }
    os << close;
}

} // namespace

const std::vector<Value>* Value::items() const {
    if (auto l = std::get_if<List>(&data)) return &l->items;
    if (auto v = std::get_if<Vector>(&data)) return &v->items;
    if (auto s = std::get_if<Set>(&data)) return &s->items;
    return nullptr;
}

const Value* Value::get(const Value& key) const {
    const auto* m = as_map();
    if (!m) return nullptr;
    for (const auto& e : m->entries) {
        if (equal(e.key, key)) return &e.val;
    }
    return nullptr;
}

Value make_nil() { return Value{}; }

Value make_bool(bool b) {
    Value v;
    v.data = b;
    return v;
}

Value make_int(int64_t i) {
    Value v;
    v.data = i;
    return v;
}

Value make_string(std::string s) {
    Value v;
    v.data = std::move(s);
    return v;
}

Value make_keyword(std::string name) {
    Value v;
    v.data = Keyword{std::move(name)};
    return v;
}

Value make_symbol(std::string name) {
    Value v;
    v.data = Symbol{std::move(name)};
    return v;
}

bool equal(const Value& a, const Value& b) {
    if (a.data.index() != b.data.index()) return false;

    if (a.is_nil()) return true;
    if (auto x = std::get_if<bool>(&a.data)) return *x == std::get<bool>(b.data);
    if (auto x = std::get_if<int64_t>(&a.data)) return *x == std::get<int64_t>(b.data);
    if (auto x = std::get_if<double>(&a.data)) return *x == std::get<double>(b.data);
    if (auto x = std::get_if<BigNumber>(&a.data)) return x->text == std::get<BigNumber>(b.data).text;
    if (auto x = std::get_if<std::string>(&a.data)) return *x == std::get<std::string>(b.data);
    if (auto x = std::get_if<Character>(&a.data)) return x->utf8 == std::get<Character>(b.data).utf8;
    if (auto x = std::get_if<Keyword>(&a.data)) return x->name == std::get<Keyword>(b.data).name;
    if (auto x = std::get_if<Symbol>(&a.data)) return x->name == std::get<Symbol>(b.data).name;
    if (auto x = std::get_if<Regex>(&a.data)) return x->pattern == std::get<Regex>(b.data).pattern;
    if (auto x = std::get_if<List>(&a.data)) return equal_items(x->items, std::get<List>(b.data).items);
    if (auto x = std::get_if<Vector>(&a.data)) return equal_items(x->items, std::get<Vector>(b.data).items);
    if (auto x = std::get_if<Set>(&a.data)) return equal_unordered(x->items, std::get<Set>(b.data).items);
    if (auto x = std::get_if<Map>(&a.data)) return equal_maps(*x, std::get<Map>(b.data));
    if (auto x = std::get_if<Tagged>(&a.data)) {
        const auto& y = std::get<Tagged>(b.data);
        if (x->tag != y.tag) return false;
        if (!x->form || !y.form) return x->form == y.form;
        return equal(*x->form, *y.form);
    }
    return false;
}

std::string to_edn(const Value& v) {
    std::ostringstream oss;
    write(oss, v);
    return oss.str();
}

std::string_view type_name(const Value& v) {
    if (v.is_nil()) return "nil";
    if (v.is_bool()) return "boolean";
    if (v.is_int()) return "integer";
    if (v.is_float()) return "float";
    if (std::holds_alternative<BigNumber>(v.data)) return "number";
    if (v.is_string()) return "string";
    if (std::holds_alternative<Character>(v.data)) return "character";
    if (v.is_keyword()) return "keyword";
    if (v.is_symbol()) return "symbol";
    if (std::holds_alternative<Regex>(v.data)) return "regex";
    if (v.is_list()) return "list";
    if (v.is_vector()) return "vector";
    if (v.is_set()) return "set";
    if (v.is_map()) return "map";
    return "tagged";
}

} // namespace ednpath::value
