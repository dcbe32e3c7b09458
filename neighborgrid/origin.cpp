#include "origin.hpp"
#include <algorithm>

namespace neighborgrid {

namespace {

std::ptrdiff_t signed_extent(std::size_t n) {
    return static_cast<std::ptrdiff_t>(n);
}

//logical coordinates of the upper left and lower right storage cells
void corners(const Layout &layout, Coordinates &first, Coordinates &last) {
    first = from_canonical(layout, { 0, 0 });
    last = from_canonical(layout, 
        { signed_extent(layout.cols) - 1, signed_extent(layout.rows) - 1 });
}

} //namespace

Coordinates to_canonical(const Layout &layout, Coordinates logical) {
    const std::ptrdiff_t cols = signed_extent(layout.cols),
                         rows = signed_extent(layout.rows);
    std::ptrdiff_t x = logical.x,
                   y = layout.options.inverted_y ? -logical.y : logical.y;

    switch (layout.options.origin) {
    case Origin::UpperLeft:
        return { x, -y };
    case Origin::UpperRight:
        return { x + cols - 1, -y };
    case Origin::Center:
        return { x + cols / 2, rows / 2 - y };
    case Origin::LowerLeft:
        return { x, rows - 1 - y };
    case Origin::LowerRight:
        return { x + cols - 1, rows - 1 - y };
    };
    return { x, -y };
}

Coordinates from_canonical(const Layout &layout, Coordinates canonical) {
    const std::ptrdiff_t cols = signed_extent(layout.cols),
                         rows = signed_extent(layout.rows);
    std::ptrdiff_t x = canonical.x, y = -canonical.y;

    switch (layout.options.origin) {
    case Origin::UpperLeft:
        break;
    case Origin::UpperRight:
        x = canonical.x - (cols - 1);
        break;
    case Origin::Center:
        x = canonical.x - cols / 2;
        y = rows / 2 - canonical.y;
        break;
    case Origin::LowerLeft:
        y = rows - 1 - canonical.y;
        break;
    case Origin::LowerRight:
        x = canonical.x - (cols - 1);
        y = rows - 1 - canonical.y;
        break;
    };

    if (layout.options.inverted_y)
        y = -y;
    return { x, y };
}

bool xy_to_offset(const Layout &layout, Coordinates logical, std::size_t &offset) {
    const std::ptrdiff_t cols = signed_extent(layout.cols),
                         rows = signed_extent(layout.rows);
    //no legal coordinate is further than one extent from the origin;
    //rejecting early keeps the translation below from overflowing
    if (logical.x < -cols || logical.x > cols || logical.y < -rows || logical.y > rows)
        return false;

    Coordinates c = to_canonical(layout, logical);
    if (c.x < 0 || c.y < 0 || c.x >= cols || c.y >= rows)
        return false;

    offset = static_cast<std::size_t>(c.y) * layout.cols + static_cast<std::size_t>(c.x);
    return true;
}

Coordinates offset_to_xy(const Layout &layout, std::size_t offset) {
    Coordinates canonical = {
        signed_extent(offset % layout.cols),
        signed_extent(offset / layout.cols)
    };
    return from_canonical(layout, canonical);
}

std::ptrdiff_t min_x(const Layout &layout) {
    Coordinates first, last;
    corners(layout, first, last);
    return std::min(first.x, last.x);
}

std::ptrdiff_t max_x(const Layout &layout) {
    Coordinates first, last;
    corners(layout, first, last);
    return std::max(first.x, last.x);
}

std::ptrdiff_t min_y(const Layout &layout) {
    Coordinates first, last;
    corners(layout, first, last);
    return std::min(first.y, last.y);
}

std::ptrdiff_t max_y(const Layout &layout) {
    Coordinates first, last;
    corners(layout, first, last);
    return std::max(first.y, last.y);
}

const char* origin_name(Origin origin) {
    switch (origin) {
    case Origin::UpperLeft:
        return "upper-left";
    case Origin::UpperRight:
        return "upper-right";
    case Origin::Center:
        return "center";
    case Origin::LowerLeft:
        return "lower-left";
    case Origin::LowerRight:
        return "lower-right";
    };
    return "unknown";
}

bool parse_origin(const std::string &name, Origin &origin) {
    const Origin ALL[] = {
        Origin::UpperLeft, Origin::UpperRight, Origin::Center,
        Origin::LowerLeft, Origin::LowerRight,
    };
    for (Origin o: ALL) {
        if (name == origin_name(o)) {
            origin = o;
            return true;
        }
    }
    return false;
}

} //neighborgrid
