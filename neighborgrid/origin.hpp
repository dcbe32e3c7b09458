#ifndef NEIGHBORGRID_ORIGIN_HPP
#define NEIGHBORGRID_ORIGIN_HPP

#include <cstddef>
#include <cstdint>
#include <string>

namespace neighborgrid {

//which cell of the grid the caller treats as (0, 0)
enum class Origin : uint8_t {
    UpperLeft,
    UpperRight,
    Center,
    LowerLeft,
    LowerRight,
};

struct GridOptions {
    Origin origin = Origin::UpperLeft;
    //negate y before translating it from the origin
    bool inverted_y = true;
    //only matters with inverted_y: "up" follows y + 1 instead of the previous storage row
    bool neighbor_ybased = true;
    bool wrap_x = false;
    bool wrap_y = false;

    bool operator==(const GridOptions &other) const {
        return origin == other.origin && inverted_y == other.inverted_y
            && neighbor_ybased == other.neighbor_ybased
            && wrap_x == other.wrap_x && wrap_y == other.wrap_y;
    }

    bool operator!=(const GridOptions &other) const { return !(*this == other); }
};

struct Coordinates {
    std::ptrdiff_t x, y;

    bool operator==(const Coordinates &other) const {
        return x == other.x && y == other.y;
    }

    bool operator!=(const Coordinates &other) const { return !(*this == other); }
};

//shape and configuration of a grid; all the coordinate math needs
struct Layout {
    std::size_t rows, cols;
    GridOptions options;

    std::size_t size() const { return rows * cols; }

    bool operator==(const Layout &other) const {
        return rows == other.rows && cols == other.cols && options == other.options;
    }

    bool operator!=(const Layout &other) const { return !(*this == other); }
};

//Canonical space has (0, 0) in the upper left cell, x grows to the right
//and y grows downward, i.e. canonical (x, y) is (column, row).
//Neither function checks bounds.
Coordinates to_canonical(const Layout &layout, Coordinates logical);
Coordinates from_canonical(const Layout &layout, Coordinates canonical);

//returns false if the coordinate lies outside the grid
bool xy_to_offset(const Layout &layout, Coordinates logical, std::size_t &offset);
//offset must be less than layout.size()
Coordinates offset_to_xy(const Layout &layout, std::size_t offset);

//inclusive bounds of the legal logical coordinates
std::ptrdiff_t min_x(const Layout &layout);
std::ptrdiff_t max_x(const Layout &layout);
std::ptrdiff_t min_y(const Layout &layout);
std::ptrdiff_t max_y(const Layout &layout);

const char* origin_name(Origin origin);
bool parse_origin(const std::string &name, Origin &origin);

} //neighborgrid

#endif
