#pragma once

#include <ednpath/syntax/NodeKind.hpp>
#include <ednpath/syntax/TokenKind.hpp>

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace ednpath::cst {

struct Node;
using NodePtr = std::shared_ptr<const Node>;

/// Concrete-syntax node. Leaves carry their source text; branches carry
/// children only. Immutable once built by the parser.
struct Node {
    syntax::NodeKind kind = syntax::NodeKind::kError;
    std::string text{};
    std::vector<NodePtr> children{};
    syntax::SourceLoc loc{};

    bool is_leaf() const { return children.empty(); }
};

NodePtr make_leaf(syntax::NodeKind kind, std::string text, syntax::SourceLoc loc);
NodePtr make_branch(syntax::NodeKind kind, std::vector<NodePtr> children, syntax::SourceLoc loc);

// Depth-first concatenation of leaf text. For a root node this reproduces
// the parsed text exactly.
std::string text_of(const Node& n);
void append_text(const Node& n, std::string& out);

// Number of nodes in the subtree, root included.
size_t subtree_size(const Node& n);

} // namespace ednpath::cst
