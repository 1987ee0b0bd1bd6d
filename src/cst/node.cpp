#include <ednpath/cst/Node.hpp>

namespace ednpath::cst {

NodePtr make_leaf(syntax::NodeKind kind, std::string text, syntax::SourceLoc loc) {
    auto n = std::make_shared<Node>();
    n->kind = kind;
    n->text = std::move(text);
    n->loc = loc;
    return n;
}

NodePtr make_branch(syntax::NodeKind kind, std::vector<NodePtr> children, syntax::SourceLoc loc) {
    auto n = std::make_shared<Node>();
    n->kind = kind;
    n->children = std::move(children);
    n->loc = loc;
    return n;
}

void append_text(const Node& n, std::string& out) {
    if (n.is_leaf()) {
        out += n.text;
        return;
    }
    for (const auto& c : n.children) append_text(*c, out);
}

std::string text_of(const Node& n) {
    std::string out;
    append_text(n, out);
    return out;
}

size_t subtree_size(const Node& n) {
    size_t total = 1;
    for (const auto& c : n.children) total += subtree_size(*c);
    return total;
}

} // namespace ednpath::cst
