#include <ednpath/cst/Cursor.hpp>

namespace ednpath::cst {

Cursor::Cursor(NodePtr root) {
    auto f = std::make_shared<Frame>();
    f->node = std::move(root);
    frame_ = std::move(f);
}

std::optional<Cursor> Cursor::up() const {
    if (!frame_->parent) return std::nullopt;
    return Cursor(frame_->parent);
}

std::optional<Cursor> Cursor::down() const {
    const auto& kids = frame_->node->children;
    if (kids.empty()) return std::nullopt;

    auto f = std::make_shared<Frame>();
    f->node = kids.front();
    f->parent = frame_;
    f->index = 0;
    f->depth = frame_->depth + 1;
    return Cursor(std::move(f));
}

std::optional<Cursor> Cursor::sibling_at(size_t idx) const {
    if (!frame_->parent) return std::nullopt;
    const auto& kids = frame_->parent->node->children;
    if (idx >= kids.size()) return std::nullopt;

    auto f = std::make_shared<Frame>();
    f->node = kids[idx];
    f->parent = frame_->parent;
    f->index = idx;
    f->depth = frame_->depth;
    return Cursor(std::move(f));
}

std::optional<Cursor> Cursor::left() const {
    if (frame_->index == 0) return std::nullopt;
    return sibling_at(frame_->index - 1);
}

std::optional<Cursor> Cursor::right() const {
    return sibling_at(frame_->index + 1);
}

std::optional<Cursor> Cursor::next() const {
    if (auto d = down()) return d;

    Cursor cur = *this;
    while (true) {
        if (auto r = cur.right()) return r;
        auto u = cur.up();
        if (!u) return std::nullopt;
        cur = *u;
    }
}

} // namespace ednpath::cst
