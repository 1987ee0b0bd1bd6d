#pragma once

#include <cstdint>
#include <string_view>

namespace ednpath::syntax {

enum class NodeKind : uint8_t {
    kRoot = 0,

    // collections
    kMap,
    kVector,
    kList,
    kSet,
    kFn,

    // atoms
    kSymbol,
    kKeyword,
    kString,
    kNumber,
    kCharacter,
    kRegex,

    // prefix forms: 'x `x ~x ~@x @x #'x ^meta x #tag x
    kReaderMacro,

    // punctuation inside a collection or prefix form
    kDelimiter,

    // insignificant
    kWhitespace,
    kNewline,
    kComment,
    kDiscard,

    kError,
};

constexpr std::string_view node_kind_name(NodeKind k) {
    switch (k) {
        case NodeKind::kRoot: return "root";
        case NodeKind::kMap: return "map";
        case NodeKind::kVector: return "vector";
        case NodeKind::kList: return "list";
        case NodeKind::kSet: return "set";
        case NodeKind::kFn: return "fn";
        case NodeKind::kSymbol: return "symbol";
        case NodeKind::kKeyword: return "keyword";
        case NodeKind::kString: return "string";
        case NodeKind::kNumber: return "number";
        case NodeKind::kCharacter: return "character";
        case NodeKind::kRegex: return "regex";
        case NodeKind::kReaderMacro: return "reader-macro";
        case NodeKind::kDelimiter: return "delimiter";
        case NodeKind::kWhitespace: return "whitespace";
        case NodeKind::kNewline: return "newline";
        case NodeKind::kComment: return "comment";
        case NodeKind::kDiscard: return "discard";
        case NodeKind::kError: return "error";
    }
    return "unknown";
}

} // namespace ednpath::syntax
