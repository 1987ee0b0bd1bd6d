#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace ednpath::syntax {

enum class TokenKind : uint16_t {
    kEof = 0,
    kError,

    // trivia
    kWhitespace,
    kNewline,
    kComment,

    // atoms
    kSymbol,
    kKeyword,
    kNumber,
    kString,
    kCharacter,
    kRegex,

    // delimiters
    kLParen,
    kRParen,
    kLBracket,
    kRBracket,
    kLBrace,
    kRBrace,
    kHashBrace,  // #{
    kHashParen,  // #(

    // prefixes
    kQuote,          // '
    kSyntaxQuote,    // `
    kUnquote,        // ~
    kUnquoteSplice,  // ~@
    kDeref,          // @
    kMeta,           // ^
    kVarQuote,       // #'
    kDiscard,        // #_
    kTag,            // #inst, #uuid, #my/tag
};

struct SourceLoc {
    uint32_t line = 1;
    uint32_t column = 1;
};

struct Token {
    TokenKind kind = TokenKind::kError;
    std::string lexeme;
    SourceLoc loc{};
};

constexpr std::string_view token_kind_name(TokenKind k) {
    switch (k) {
        case TokenKind::kEof: return "eof";
        case TokenKind::kError: return "error";
        case TokenKind::kWhitespace: return "whitespace";
        case TokenKind::kNewline: return "newline";
        case TokenKind::kComment: return "comment";
        case TokenKind::kSymbol: return "symbol";
        case TokenKind::kKeyword: return "keyword";
        case TokenKind::kNumber: return "number";
        case TokenKind::kString: return "string";
        case TokenKind::kCharacter: return "character";
        case TokenKind::kRegex: return "regex";
        case TokenKind::kLParen: return "(";
        case TokenKind::kRParen: return ")";
        case TokenKind::kLBracket: return "[";
        case TokenKind::kRBracket: return "]";
        case TokenKind::kLBrace: return "{";
        case TokenKind::kRBrace: return "}";
        case TokenKind::kHashBrace: return "#{";
        case TokenKind::kHashParen: return "#(";
        case TokenKind::kQuote: return "'";
        case TokenKind::kSyntaxQuote: return "`";
        case TokenKind::kUnquote: return "~";
        case TokenKind::kUnquoteSplice: return "~@";
        case TokenKind::kDeref: return "@";
        case TokenKind::kMeta: return "^";
        case TokenKind::kVarQuote: return "#'";
        case TokenKind::kDiscard: return "#_";
        case TokenKind::kTag: return "tag";
    }
    return "unknown";
}

constexpr bool is_trivia(TokenKind k) {
    return k == TokenKind::kWhitespace || k == TokenKind::kNewline || k == TokenKind::kComment;
}

constexpr bool is_opener(TokenKind k) {
    return k == TokenKind::kLParen || k == TokenKind::kLBracket || k == TokenKind::kLBrace ||
           k == TokenKind::kHashBrace || k == TokenKind::kHashParen;
}

constexpr bool is_closer(TokenKind k) {
    return k == TokenKind::kRParen || k == TokenKind::kRBracket || k == TokenKind::kRBrace;
}

} // namespace ednpath::syntax
