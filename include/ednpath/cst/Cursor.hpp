#pragma once

#include <ednpath/cst/Node.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>

namespace ednpath::cst {

/// Immutable position in a CST. Holds the chain of frames from the current
/// node back to the root; moving allocates a new frame and never touches
/// the one it came from, so cursors can be copied and shared freely.
class Cursor {
public:
    explicit Cursor(NodePtr root);

    const Node& node() const { return *frame_->node; }
    const NodePtr& node_ptr() const { return frame_->node; }

    // Position among the parent's children; 0 at the root.
    size_t index() const { return frame_->index; }
    size_t depth() const { return frame_->depth; }
    bool at_top() const { return frame_->parent == nullptr; }

    // Parser-reported position of the node's first character.
    uint32_t column() const { return node().loc.column; }
    syntax::SourceLoc source_loc() const { return node().loc; }

    std::optional<Cursor> up() const;
    std::optional<Cursor> down() const;
    std::optional<Cursor> left() const;
    std::optional<Cursor> right() const;

    // Pre-order successor; nullopt once the document is exhausted.
    std::optional<Cursor> next() const;

    friend bool operator==(const Cursor& a, const Cursor& b) {
        return a.frame_->node == b.frame_->node &&
               a.frame_->index == b.frame_->index &&
               a.frame_->depth == b.frame_->depth;
    }
    friend bool operator!=(const Cursor& a, const Cursor& b) { return !(a == b); }

private:
    struct Frame {
        NodePtr node{};
        std::shared_ptr<const Frame> parent{};
        size_t index = 0;
        size_t depth = 0;
    };

    explicit Cursor(std::shared_ptr<const Frame> frame) : frame_(std::move(frame)) {}

    std::optional<Cursor> sibling_at(size_t idx) const;

    std::shared_ptr<const Frame> frame_;
};

} // namespace ednpath::cst
