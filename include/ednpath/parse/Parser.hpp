#pragma once

#include <ednpath/cst/Node.hpp>
#include <ednpath/diag/DiagCode.hpp>
#include <ednpath/parse/Cursor.hpp>
#include <ednpath/syntax/TokenKind.hpp>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ednpath::parse {

// Collections and prefixed forms nested deeper than this are not built
// into the tree; the excess text becomes one kError leaf.
inline constexpr size_t kMaxNesting = 1000;

// Tokens keep their raw source text, trivia included, so that concatenating
// all lexemes reproduces `source` exactly.
std::vector<syntax::Token> lex(std::string_view source, std::string_view file_path, diag::Bag& diags);

class Parser {
public:
    Parser(std::vector<syntax::Token> tokens,
           std::string file_path,
           diag::Bag& diags)
        : tokens_(std::move(tokens)),
          file_path_(std::move(file_path)),
          diags_(diags),
          cursor_(tokens_) {}

    cst::NodePtr parse_document();

private:
    using K = syntax::TokenKind;
    using NK = syntax::NodeKind;

    const syntax::Token& peek(size_t k = 0) const;
    bool at(K k) const;
    const syntax::Token& bump();

    // Next token is neither trivia, a closer, nor EOF.
    bool at_form_start() const;

    cst::NodePtr parse_form();
    cst::NodePtr parse_collection(NK kind, K closer);
    cst::NodePtr parse_prefixed(NK kind, size_t form_count);

    // Consumes the over-deep form at the cursor, and everything after it up
    // to the closer of the enclosing collection, without recursing.
    cst::NodePtr swallow_nested();

    // Moves trivia tokens into `out` until the next non-trivia token.
    void take_trivia(std::vector<cst::NodePtr>& out);

    cst::NodePtr leaf_from(const syntax::Token& t, NK kind) const;
    void diag_at(const syntax::Token& t, diag::Code code, std::string message);

    std::vector<syntax::Token> tokens_;
    std::string file_path_;
    diag::Bag& diags_;
    Cursor cursor_;
    size_t depth_ = 0;
};

cst::NodePtr parse_source(std::string_view source,
                          std::string_view file_path,
                          diag::Bag& diags);

} // namespace ednpath::parse
