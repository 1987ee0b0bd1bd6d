#pragma once

#include <ednpath/diag/DiagCode.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ednpath::nav {

struct KeySegment {
    enum class Kind : uint8_t {
        kKeyword,
        kSymbol,
        kString,
        kIndex,
    } kind = Kind::kKeyword;

    std::string name{};   // keyword name (no ':'), symbol name or string contents
    uint64_t index = 0;

    bool is_index() const { return kind == Kind::kIndex; }

    static KeySegment keyword(std::string n) { return KeySegment{Kind::kKeyword, std::move(n), 0}; }
    static KeySegment symbol(std::string n) { return KeySegment{Kind::kSymbol, std::move(n), 0}; }
    static KeySegment string(std::string s) { return KeySegment{Kind::kString, std::move(s), 0}; }
    static KeySegment at(uint64_t i) { return KeySegment{Kind::kIndex, {}, i}; }

    friend bool operator==(const KeySegment& a, const KeySegment& b) {
        return a.kind == b.kind && a.name == b.name && a.index == b.index;
    }
};

// Shallowest segment first.
using Path = std::vector<KeySegment>;

// Reads a path written as EDN: either a vector "[:cljsbuild :builds 0]" or
// bare elements ":cljsbuild :builds 0". Keywords, symbols, strings and
// non-negative integers are accepted. Problems go to `diags` with code
// R_INVALID_PATH and yield nullopt.
std::optional<Path> parse_path(std::string_view text, diag::Bag& diags);

std::string to_string(const KeySegment& seg);

// EDN vector form, e.g. "[:cljsbuild :builds 0]".
std::string to_string(const Path& path);

} // namespace ednpath::nav
