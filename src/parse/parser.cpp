#include <ednpath/parse/Parser.hpp>

#include <string>

namespace ednpath::parse {

namespace {

syntax::NodeKind trivia_node_kind(syntax::TokenKind k) {
    switch (k) {
        case syntax::TokenKind::kNewline: return syntax::NodeKind::kNewline;
        case syntax::TokenKind::kComment: return syntax::NodeKind::kComment;
        default: return syntax::NodeKind::kWhitespace;
    }
}

} // namespace

const syntax::Token& Parser::peek(size_t k) const { return cursor_.peek(k); }
bool Parser::at(K k) const { return peek().kind == k; }
const syntax::Token& Parser::bump() { return cursor_.bump(); }

bool Parser::at_form_start() const {
    const auto k = peek().kind;
    return k != K::kEof && !syntax::is_trivia(k) && !syntax::is_closer(k);
}

cst::NodePtr Parser::leaf_from(const syntax::Token& t, NK kind) const {
    return cst::make_leaf(kind, t.lexeme, t.loc);
}

void Parser::diag_at(const syntax::Token& t, diag::Code code, std::string message) {
    diags_.add(code, file_path_, t.loc.line, t.loc.column, std::move(message));
}

void Parser::take_trivia(std::vector<cst::NodePtr>& out) {
    while (syntax::is_trivia(peek().kind)) {
        const auto& t = bump();
        out.push_back(leaf_from(t, trivia_node_kind(t.kind)));
    }
}

cst::NodePtr Parser::parse_document() {
    std::vector<cst::NodePtr> children;
    while (!at(K::kEof)) {
        const auto k = peek().kind;
        if (syntax::is_trivia(k)) {
            take_trivia(children);
            continue;
        }
        if (syntax::is_closer(k)) {
            const auto& t = bump();
            diag_at(t, diag::Code::C_UNBALANCED_DELIMITER, "unmatched closing delimiter '" + t.lexeme + "'");
            children.push_back(leaf_from(t, NK::kError));
            continue;
        }
        children.push_back(parse_form());
    }
    return cst::make_branch(NK::kRoot, std::move(children), syntax::SourceLoc{1, 1});
}

cst::NodePtr Parser::parse_form() {
    switch (peek().kind) {
        case K::kSymbol: return leaf_from(bump(), NK::kSymbol);
        case K::kKeyword: return leaf_from(bump(), NK::kKeyword);
        case K::kNumber: return leaf_from(bump(), NK::kNumber);
        case K::kString: return leaf_from(bump(), NK::kString);
        case K::kCharacter: return leaf_from(bump(), NK::kCharacter);
        case K::kRegex: return leaf_from(bump(), NK::kRegex);

        case K::kLParen: return parse_collection(NK::kList, K::kRParen);
        case K::kLBracket: return parse_collection(NK::kVector, K::kRBracket);
        case K::kLBrace: return parse_collection(NK::kMap, K::kRBrace);
        case K::kHashBrace: return parse_collection(NK::kSet, K::kRBrace);
        case K::kHashParen: return parse_collection(NK::kFn, K::kRParen);

        case K::kQuote:
        case K::kSyntaxQuote:
        case K::kUnquote:
        case K::kUnquoteSplice:
        case K::kDeref:
        case K::kVarQuote:
        case K::kTag:
            return parse_prefixed(NK::kReaderMacro, 1);
        case K::kMeta:
            return parse_prefixed(NK::kReaderMacro, 2);
        case K::kDiscard:
            return parse_prefixed(NK::kDiscard, 1);

        case K::kError:
        case K::kEof:
        case K::kWhitespace:
        case K::kNewline:
        case K::kComment:
        case K::kRParen:
        case K::kRBracket:
        case K::kRBrace:
            break;
    }
    return leaf_from(bump(), NK::kError);
}

cst::NodePtr Parser::parse_collection(NK kind, K closer) {
    if (depth_ >= kMaxNesting) return swallow_nested();
    ++depth_;

    const auto& open = bump();
    std::vector<cst::NodePtr> children;
    children.push_back(leaf_from(open, NK::kDelimiter));

    while (true) {
        if (at(K::kEof)) {
            diag_at(open, diag::Code::C_UNEXPECTED_EOF,
                    "unexpected end of input; '" + open.lexeme + "' is never closed");
            break;
        }
        const auto k = peek().kind;
        if (syntax::is_trivia(k)) {
            take_trivia(children);
            continue;
        }
        if (syntax::is_closer(k)) {
            if (k == closer) {
                children.push_back(leaf_from(bump(), NK::kDelimiter));
                break;
            }
            // leave the stray closer to the enclosing form
            diag_at(peek(), diag::Code::C_UNBALANCED_DELIMITER,
                    "mismatched closing delimiter '" + peek().lexeme + "' for '" + open.lexeme + "'");
            break;
        }
        children.push_back(parse_form());
    }

    --depth_;
    return cst::make_branch(kind, std::move(children), open.loc);
}

cst::NodePtr Parser::parse_prefixed(NK kind, size_t form_count) {
    if (depth_ >= kMaxNesting) return swallow_nested();
    ++depth_;

    const auto& prefix = bump();
    std::vector<cst::NodePtr> children;
    children.push_back(leaf_from(prefix, NK::kDelimiter));

    for (size_t n = 0; n < form_count; ++n) {
        take_trivia(children);
        if (!at_form_start()) {
            diag_at(peek(), diag::Code::C_EXPECTED_FORM,
                    "expected a form after '" + prefix.lexeme + "'");
            break;
        }
        children.push_back(parse_form());
    }

    --depth_;
    return cst::make_branch(kind, std::move(children), prefix.loc);
}

cst::NodePtr Parser::swallow_nested() {
    const auto& first = peek();
    diag_at(first, diag::Code::C_NESTING_TOO_DEEP,
            "forms nested deeper than " + std::to_string(kMaxNesting) + " levels");

    std::string text;
    size_t open = 0;
    while (!at(K::kEof)) {
        const auto k = peek().kind;
        if (syntax::is_closer(k)) {
            if (open == 0) break;
            --open;
        } else if (syntax::is_opener(k)) {
            ++open;
        }
        text += bump().lexeme;
    }
    return cst::make_leaf(NK::kError, std::move(text), first.loc);
}

cst::NodePtr parse_source(std::string_view source,
                          std::string_view file_path,
                          diag::Bag& diags) {
    auto tokens = lex(source, file_path, diags);
    Parser p(std::move(tokens), std::string(file_path), diags);
    return p.parse_document();
}

} // namespace ednpath::parse
