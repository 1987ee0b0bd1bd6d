#pragma once

#include <ednpath/cst/Cursor.hpp>
#include <ednpath/nav/Classify.hpp>

#include <cstddef>
#include <iterator>
#include <optional>
#include <utility>
#include <vector>

namespace ednpath::nav {

namespace step {

inline std::optional<cst::Cursor> up(const cst::Cursor& c) { return c.up(); }
inline std::optional<cst::Cursor> down(const cst::Cursor& c) { return c.down(); }
inline std::optional<cst::Cursor> left(const cst::Cursor& c) { return c.left(); }
inline std::optional<cst::Cursor> right(const cst::Cursor& c) { return c.right(); }
inline std::optional<cst::Cursor> next(const cst::Cursor& c) { return c.next(); }

} // namespace step

using StepFn = std::optional<cst::Cursor> (*)(const cst::Cursor&);

struct KeepAll {
    bool operator()(const cst::Cursor&) const { return true; }
};

struct KeepSignificant {
    bool operator()(const cst::Cursor& c) const { return !is_insignificant(c.node()); }
};

/// The cursors reached from `start` by applying `Step` until it yields
/// nothing, `start` included, restricted to those `Keep` accepts.
///
/// A Direction is a description, not a stream: every begin() walks again
/// from `start`, so it can be iterated any number of times. It is finite
/// because the tree is.
template <typename Step, typename Keep = KeepAll>
class Direction {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = cst::Cursor;
        using difference_type = std::ptrdiff_t;
        using pointer = const cst::Cursor*;
        using reference = const cst::Cursor&;

        iterator() = default;
        iterator(std::optional<cst::Cursor> cur, const Step* step, const Keep* keep)
            : cur_(std::move(cur)), step_(step), keep_(keep) {
            settle();
        }

        reference operator*() const { return *cur_; }
        pointer operator->() const { return &*cur_; }

        iterator& operator++() {
            cur_ = (*step_)(*cur_);
            settle();
            return *this;
        }

        friend bool operator==(const iterator& a, const iterator& b) {
            if (a.cur_.has_value() != b.cur_.has_value()) return false;
            return !a.cur_ || *a.cur_ == *b.cur_;
        }
        friend bool operator!=(const iterator& a, const iterator& b) { return !(a == b); }

    private:
        void settle() {
            while (cur_ && !(*keep_)(*cur_)) cur_ = (*step_)(*cur_);
        }

        std::optional<cst::Cursor> cur_{};
        const Step* step_ = nullptr;
        const Keep* keep_ = nullptr;
    };

    Direction(Step step, cst::Cursor start, Keep keep = Keep{})
        : step_(std::move(step)), start_(std::move(start)), keep_(std::move(keep)) {}

    iterator begin() const { return iterator(start_, &step_, &keep_); }
    iterator end() const { return iterator(); }

    // Element at offset `n`, or nullopt when the walk is shorter.
    std::optional<cst::Cursor> nth(size_t n) const {
        for (const auto& c : *this) {
            if (n == 0) return c;
            --n;
        }
        return std::nullopt;
    }

    std::optional<cst::Cursor> first() const { return nth(0); }

    std::vector<cst::Cursor> to_vector() const {
        std::vector<cst::Cursor> out;
        for (const auto& c : *this) out.push_back(c);
        return out;
    }

private:
    Step step_;
    cst::Cursor start_;
    Keep keep_;
};

template <typename Step>
Direction<Step> direction(Step step, cst::Cursor start) {
    return Direction<Step>(std::move(step), std::move(start));
}

template <typename Step, typename Pred>
std::optional<cst::Cursor> direction_find(Step step, Pred pred, cst::Cursor start) {
    for (const auto& c : direction(std::move(step), std::move(start))) {
        if (pred(c)) return c;
    }
    return std::nullopt;
}

// Pre-order walk from `start` to the first node satisfying `pred`.
template <typename NodePred>
std::optional<cst::Cursor> find_first(NodePred pred, cst::Cursor start) {
    return direction_find(
        step::next, [&](const cst::Cursor& c) { return pred(c.node()); }, std::move(start));
}

inline std::optional<cst::Cursor> to_root(const cst::Cursor& c) {
    return direction_find(step::up, is_root_at, c);
}

inline Direction<StepFn, KeepSignificant> siblings_rightward(const cst::Cursor& c) {
    return Direction<StepFn, KeepSignificant>(step::right, c);
}

} // namespace ednpath::nav
