#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace ednpath::value {

struct Value;
struct MapEntry;

struct Nil {};

// Integers that do not fit int64, ratios (1/3) and decimals (1.5M), kept
// as their source text.
struct BigNumber {
    std::string text;
};

struct Character {
    std::string utf8;
};

// Name without the leading ':'; namespaced keywords keep "ns/name".
struct Keyword {
    std::string name;
};

struct Symbol {
    std::string name;
};

struct Regex {
    std::string pattern;
};

struct List {
    std::vector<Value> items;
};

struct Vector {
    std::vector<Value> items;
};

struct Set {
    std::vector<Value> items;
};

// Entries keep source order.
struct Map {
    std::vector<MapEntry> entries;
};

struct Tagged {
    std::string tag;
    std::shared_ptr<const Value> form;
};

struct Value {
    std::variant<Nil, bool, int64_t, double, BigNumber, std::string, Character,
                 Keyword, Symbol, Regex, List, Vector, Set, Map, Tagged> data;

    bool is_nil() const { return std::holds_alternative<Nil>(data); }
    bool is_bool() const { return std::holds_alternative<bool>(data); }
    bool is_int() const { return std::holds_alternative<int64_t>(data); }
    bool is_float() const { return std::holds_alternative<double>(data); }
    bool is_number() const { return is_int() || is_float() || std::holds_alternative<BigNumber>(data); }
    bool is_string() const { return std::holds_alternative<std::string>(data); }
    bool is_keyword() const { return std::holds_alternative<Keyword>(data); }
    bool is_symbol() const { return std::holds_alternative<Symbol>(data); }
    bool is_list() const { return std::holds_alternative<List>(data); }
    bool is_vector() const { return std::holds_alternative<Vector>(data); }
    bool is_set() const { return std::holds_alternative<Set>(data); }
    bool is_map() const { return std::holds_alternative<Map>(data); }
    bool is_sequential() const { return is_list() || is_vector(); }

    const std::string* as_string() const { return std::get_if<std::string>(&data); }
    const Keyword* as_keyword() const { return std::get_if<Keyword>(&data); }
    const Symbol* as_symbol() const { return std::get_if<Symbol>(&data); }
    const Map* as_map() const { return std::get_if<Map>(&data); }
    const int64_t* as_int() const { return std::get_if<int64_t>(&data); }
    const bool* as_bool() const { return std::get_if<bool>(&data); }

    // Items of a list, vector or set; nullptr otherwise.
    const std::vector<Value>* items() const;

    // Lookup by key in a map value; nullptr when absent or not a map.
    const Value* get(const Value& key) const;
};

struct MapEntry {
    Value key;
    Value val;
};

Value make_nil();
Value make_bool(bool b);
Value make_int(int64_t v);
Value make_string(std::string s);
Value make_keyword(std::string name);
Value make_symbol(std::string name);

bool equal(const Value& a, const Value& b);
inline bool operator==(const Value& a, const Value& b) { return equal(a, b); }
inline bool operator!=(const Value& a, const Value& b) { return !equal(a, b); }

// Prints the value back as EDN. Map entries and set items keep their order.
std::string to_edn(const Value& v);

std::string_view type_name(const Value& v);

} // namespace ednpath::value
