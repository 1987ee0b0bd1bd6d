#pragma once

#include <ednpath/syntax/TokenKind.hpp>

#include <cstddef>
#include <vector>

namespace ednpath::parse {

// Token stream position used by the parser. Not to be confused with
// cst::Cursor, which walks the finished tree.
class Cursor {
public:
    explicit Cursor(const std::vector<syntax::Token>& tokens) : tokens_(tokens) {}

    const syntax::Token& peek(std::size_t k = 0) const {
        const std::size_t i = pos_ + k;
        if (i >= tokens_.size()) return tokens_.back();
        return tokens_[i];
    }

    const syntax::Token& bump() {
        if (pos_ >= tokens_.size()) return tokens_.back();
        return tokens_[pos_++];
    }

private:
    const std::vector<syntax::Token>& tokens_;
    std::size_t pos_ = 0;
};

} // namespace ednpath::parse
