#pragma once

#include <ednpath/value/Value.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace ednpath::schema {

// A value predicate plus a short description of what it accepts, used in
// "expected ..." messages.
struct Rule {
    std::function<bool(const value::Value&)> accepts{};
    std::string expect{};
};

namespace rules {

Rule any();
Rule string();
Rule boolean();
Rule integer();
Rule number();
Rule symbol();
Rule keyword();
Rule map();
Rule string_or_symbol();
Rule string_or_named();   // string, symbol or keyword
Rule one_of(std::vector<std::string> keyword_names);
Rule either(Rule a, Rule b);
Rule seq_of(Rule item);   // non-empty vector or list
Rule map_of(Rule key, Rule val);

} // namespace rules

class KeyTable;

enum class Nesting : uint8_t {
    kNone,
    kMap,       // the value is itself a strict map of `nested`
    kEachMap,   // the value is a sequence of strict maps of `nested`
};

struct KeySpec {
    std::string name;   // keyword name without ':'
    Rule rule{};
    std::string doc{};
    bool required = false;
    Nesting nesting = Nesting::kNone;
    std::shared_ptr<const KeyTable> nested{};
};

/// Ordered table of the keys a strict map may hold. Built explicitly and
/// passed to check_strict_map; there is no global registry.
class KeyTable {
public:
    explicit KeyTable(std::string name) : name_(std::move(name)) {}

    // Adds or replaces the entry for spec.name. Insertion order is kept.
    KeyTable& add(KeySpec spec);

    const KeySpec* find(std::string_view name) const;

    std::string_view name() const { return name_; }
    const std::vector<KeySpec>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }

private:
    std::string name_;
    std::vector<KeySpec> entries_{};
};

// ClojureScript compiler options, the :compiler map of a cljsbuild build.
std::shared_ptr<const KeyTable> cljs_compiler_options();

// One build entry: {:id ... :source-paths [...] :compiler {...}}.
std::shared_ptr<const KeyTable> cljs_build_options();

} // namespace ednpath::schema
