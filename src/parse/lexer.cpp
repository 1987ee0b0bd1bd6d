#include <ednpath/parse/Parser.hpp>

#include <cctype>

namespace ednpath::parse {

namespace {

bool is_blank(char c) {
    return c == ' ' || c == '\t' || c == ',' || c == '\f' || c == '\v';
}

// Characters that end a symbol, keyword or number. '#' and '\'' are allowed
// inside a token, as in Clojure.
bool is_terminator(char c) {
    switch (c) {
        case ' ': case '\t': case ',': case '\f': case '\v': case '\r': case '\n':
        case '"': case ';': case '(': case ')': case '[': case ']': case '{': case '}':
        case '\\': case '`': case '~': case '^': case '@':
            return true;
        default:
            return false;
    }
}

bool is_control(char c) {
    const auto u = static_cast<unsigned char>(c);
    return u < 0x20 || u == 0x7F;
}

bool is_continuation_byte(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

} // namespace

std::vector<syntax::Token> lex(std::string_view source, std::string_view file_path, diag::Bag& diags) {
    using K = syntax::TokenKind;

    std::vector<syntax::Token> toks;
    toks.reserve(source.size() / 2 + 1);

    size_t i = 0;
    uint32_t line = 1;
    uint32_t col = 1;

    auto at = [&](size_t off) -> char {
        const size_t p = i + off;
        if (p >= source.size()) return '\0';
        return source[p];
    };

    auto has = [&](size_t off) -> bool {
        return i + off < source.size();
    };

    auto advance = [&]() {
        if (i >= source.size()) return;
        const char c = source[i];
        if (c == '\n') {
            ++line;
            col = 1;
        } else if (!is_continuation_byte(c)) {
            ++col;
        }
        ++i;
    };

    size_t start = 0;
    uint32_t tok_line = 1;
    uint32_t tok_col = 1;

    auto push = [&](K kind) {
        toks.push_back(syntax::Token{kind, std::string(source.substr(start, i - start)), {tok_line, tok_col}});
    };

    auto take_token_body = [&]() {
        while (has(0) && !is_terminator(at(0))) advance();
    };

    // Consumes a quoted body up to and including the closing '"'.
    auto take_quoted = [&]() -> bool {
        while (has(0)) {
            const char ch = at(0);
            if (ch == '\\') {
                advance();
                if (has(0)) advance();
                continue;
            }
            advance();
            if (ch == '"') return true;
        }
        return false;
    };

    while (i < source.size()) {
        start = i;
        tok_line = line;
        tok_col = col;
        const char c = at(0);

        if (c == '\n') {
            advance();
            push(K::kNewline);
            continue;
        }
        if (c == '\r' && at(1) == '\n') {
            advance();
            advance();
            push(K::kNewline);
            continue;
        }
        if (is_blank(c) || c == '\r') {
            while (has(0) && (is_blank(at(0)) || (at(0) == '\r' && at(1) != '\n'))) advance();
            push(K::kWhitespace);
            continue;
        }

        // line comment; the newline stays a token of its own
        if (c == ';' || (c == '#' && at(1) == '!')) {
            while (has(0) && at(0) != '\n' && !(at(0) == '\r' && at(1) == '\n')) advance();
            push(K::kComment);
            continue;
        }

        switch (c) {
            case '(': advance(); push(K::kLParen); continue;
            case ')': advance(); push(K::kRParen); continue;
            case '[': advance(); push(K::kLBracket); continue;
            case ']': advance(); push(K::kRBracket); continue;
            case '{': advance(); push(K::kLBrace); continue;
            case '}': advance(); push(K::kRBrace); continue;
            case '\'': advance(); push(K::kQuote); continue;
            case '`': advance(); push(K::kSyntaxQuote); continue;
            case '@': advance(); push(K::kDeref); continue;
            case '^': advance(); push(K::kMeta); continue;
            case '~':
                advance();
                if (at(0) == '@') {
                    advance();
                    push(K::kUnquoteSplice);
                } else {
                    push(K::kUnquote);
                }
                continue;
            default:
                break;
        }

        if (c == '"') {
            advance();
            if (!take_quoted()) {
                diags.add(diag::Code::C_UNTERMINATED_STRING, std::string(file_path), tok_line, tok_col,
                          "unterminated string literal");
            }
            push(K::kString);
            continue;
        }

        if (c == '\\') {
            advance();
            if (!has(0)) {
                diags.add(diag::Code::C_INVALID_TOKEN, std::string(file_path), tok_line, tok_col,
                          "character literal is missing its character");
                push(K::kError);
                continue;
            }
            const char first = at(0);
            advance();
            // named and unicode characters: \newline \space A \o101
            if (std::isalnum(static_cast<unsigned char>(first))) {
                while (has(0) && std::isalnum(static_cast<unsigned char>(at(0)))) advance();
            } else {
                while (has(0) && is_continuation_byte(at(0))) advance();
            }
            push(K::kCharacter);
            continue;
        }

        if (c == '#') {
            const char d = at(1);
            if (d == '{') { advance(); advance(); push(K::kHashBrace); continue; }
            if (d == '(') { advance(); advance(); push(K::kHashParen); continue; }
            if (d == '_') { advance(); advance(); push(K::kDiscard); continue; }
            if (d == '\'') { advance(); advance(); push(K::kVarQuote); continue; }
            if (d == '"') {
                advance();
                advance();
                if (!take_quoted()) {
                    diags.add(diag::Code::C_UNTERMINATED_STRING, std::string(file_path), tok_line, tok_col,
                              "unterminated regex literal");
                }
                push(K::kRegex);
                continue;
            }
            if (d == '#') {
                // symbolic values: ##Inf ##-Inf ##NaN
                advance();
                advance();
                take_token_body();
                push(K::kNumber);
                continue;
            }
            if (d == '?') {
                // reader conditional #? / #?@
                advance();
                advance();
                if (at(0) == '@') advance();
                push(K::kTag);
                continue;
            }
            if (d == ':' || std::isalpha(static_cast<unsigned char>(d))) {
                // tagged literal or namespaced map prefix (#:ns)
                advance();
                take_token_body();
                push(K::kTag);
                continue;
            }

            advance();
            diags.add(diag::Code::C_INVALID_TOKEN, std::string(file_path), tok_line, tok_col,
                      "unsupported dispatch macro '#" + std::string(1, d) + "'");
            push(K::kError);
            continue;
        }

        if (is_control(c)) {
            advance();
            diags.add(diag::Code::C_INVALID_TOKEN, std::string(file_path), tok_line, tok_col,
                      "invalid control character in source");
            push(K::kError);
            continue;
        }

        if (std::isdigit(static_cast<unsigned char>(c)) ||
            ((c == '+' || c == '-') && std::isdigit(static_cast<unsigned char>(at(1))))) {
            take_token_body();
            push(K::kNumber);
            continue;
        }

        if (c == ':') {
            take_token_body();
            if (i - start == 1) {
                diags.add(diag::Code::C_INVALID_TOKEN, std::string(file_path), tok_line, tok_col,
                          "keyword is missing its name");
                push(K::kError);
                continue;
            }
            push(K::kKeyword);
            continue;
        }

        take_token_body();
        push(K::kSymbol);
    }

    start = i;
    tok_line = line;
    tok_col = col;
    push(K::kEof);
    return toks;
}

} // namespace ednpath::parse
