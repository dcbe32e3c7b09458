#ifndef NEIGHBORGRID_NEIGHBORS_HPP
#define NEIGHBORGRID_NEIGHBORS_HPP

#include <array>
#include <cstddef>
#include "origin.hpp"

namespace neighborgrid {

//declaration order matches the all-around record
enum class Direction : uint8_t {
    UpLeft,
    Up,
    UpRight,
    Left,
    Right,
    DownLeft,
    Down,
    DownRight,
};

//Raw single steps over canonical offsets. Each returns false when the step
//leaves the grid on an axis without wrap. offset must already be valid.
bool step_row_up(const Layout &layout, std::size_t offset, std::size_t &out);
bool step_row_down(const Layout &layout, std::size_t offset, std::size_t &out);
bool step_left(const Layout &layout, std::size_t offset, std::size_t &out);
bool step_right(const Layout &layout, std::size_t offset, std::size_t &out);

//Logical step: "up" and "down" are swapped relative to storage rows when
//inverted_y && neighbor_ybased, so that "up" always means y + 1.
//Diagonals are a vertical step followed by a horizontal one.
bool step(const Layout &layout, std::size_t offset, Direction dir, std::size_t &out);

//The four cardinal neighbors of a cell, nullptr where there is none.
template<typename T>
struct XyNeighbor {
    T *up = nullptr;
    T *left = nullptr;
    T *right = nullptr;
    T *down = nullptr;

    //up, left, right, down
    std::array<T*, 4> cells() const { return { up, left, right, down }; }

    std::size_t count() const {
        std::size_t n = 0;
        for (T *p: cells())
            n += p != nullptr;
        return n;
    }
};

//All eight neighbors of a cell, nullptr where there is none.
template<typename T>
struct AllAroundNeighbor {
    T *upleft = nullptr;
    T *up = nullptr;
    T *upright = nullptr;
    T *left = nullptr;
    T *right = nullptr;
    T *downleft = nullptr;
    T *down = nullptr;
    T *downright = nullptr;

    //upleft, up, upright, left, right, downleft, down, downright
    std::array<T*, 8> cells() const {
        return { upleft, up, upright, left, right, downleft, down, downright };
    }

    std::size_t count() const {
        std::size_t n = 0;
        for (T *p: cells())
            n += p != nullptr;
        return n;
    }
};

} //neighborgrid

#endif
