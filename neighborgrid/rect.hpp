#ifndef NEIGHBORGRID_RECT_HPP
#define NEIGHBORGRID_RECT_HPP

#include <algorithm>

namespace neighborgrid {

//Axis-aligned block of cells in canonical (column, row) space.
//left/top are inclusive, right/bottom are exclusive, so an unsigned
//rect can still be empty at the origin.
template<typename T>
struct Rect {
    T left, top, right, bottom;

    Rect() : Rect(0, 0, 0, 0) {}
    Rect(T left, T top, T right, T bottom)
        : left(left), top(top), right(right), bottom(bottom)
    {}

    static Rect from_extent(T left, T top, T width, T height) {
        return Rect(left, top, left + width, top + height);
    }

    bool contains(T x, T y) const {
        return x >= left && x < right
            && y >= top && y < bottom;
    }

    bool intersects(const Rect &r) const {
        return !is_empty() && !r.is_empty()
            && r.left < right && r.top < bottom
            && left < r.right && top < r.bottom;
    }

    //empty rect if the two don't overlap
    Rect intersection(const Rect &other) const {
        if (!intersects(other))
            return Rect();
        return Rect(
            std::max(left, other.left),
            std::max(top, other.top),
            std::min(right, other.right),
            std::min(bottom, other.bottom)
        );
    }

    bool is_empty() const {
        return right <= left || bottom <= top;
    }

    bool operator==(const Rect &other) const {
        return left == other.left && top == other.top
            && right == other.right && bottom == other.bottom;
    }

    T width() const { return is_empty() ? 0 : right - left; }
    T height() const { return is_empty() ? 0 : bottom - top; }
    T area() const { return width() * height(); }
};

} //neighborgrid

#endif
