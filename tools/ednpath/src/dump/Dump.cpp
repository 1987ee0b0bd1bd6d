#include "Dump.hpp"

#include <ednpath/syntax/NodeKind.hpp>

#include <string>
#include <string_view>

namespace ednpath_tool::dump {

namespace {

std::string escaped(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (const char c : s) {
        switch (c) {
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\'': out += "\\'"; break;
            default: out.push_back(c); break;
        }
    }
    return out;
}

void dump_node(const ednpath::cst::Node& n, int indent, std::ostream& os) {
    os << std::string(static_cast<size_t>(indent) * 2, ' ')
       << ednpath::syntax::node_kind_name(n.kind);
    if (n.is_leaf()) os << " '" << escaped(n.text) << "'";
    os << " @" << n.loc.line << ":" << n.loc.column << "\n";

    for (const auto& c : n.children) dump_node(*c, indent + 1, os);
}

} // namespace

void dump_tree(const ednpath::cst::Node& root, std::ostream& os) {
    dump_node(root, 0, os);
}

} // namespace ednpath_tool::dump
