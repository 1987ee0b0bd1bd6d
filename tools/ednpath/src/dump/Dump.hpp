#pragma once

#include <ednpath/cst/Node.hpp>

#include <ostream>

namespace ednpath_tool::dump {

/// @brief Prints the CST one node per line, children indented under their
/// parent: `kind @line:col` for branches, `kind 'text' @line:col` for leaves.
void dump_tree(const ednpath::cst::Node& root, std::ostream& os);

} // namespace ednpath_tool::dump
