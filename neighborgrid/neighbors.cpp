#include "neighbors.hpp"

namespace neighborgrid {

bool step_row_up(const Layout &layout, std::size_t offset, std::size_t &out) {
    if (offset >= layout.cols) {
        out = offset - layout.cols;
        return true;
    }
    if (!layout.options.wrap_y)
        return false;
    out = offset + layout.size() - layout.cols;
    return true;
}

bool step_row_down(const Layout &layout, std::size_t offset, std::size_t &out) {
    std::size_t next = offset + layout.cols;
    if (next < layout.size()) {
        out = next;
        return true;
    }
    if (!layout.options.wrap_y)
        return false;
    out = next - layout.size();
    return true;
}

bool step_left(const Layout &layout, std::size_t offset, std::size_t &out) {
    if (offset % layout.cols != 0) {
        out = offset - 1;
        return true;
    }
    if (!layout.options.wrap_x)
        return false;
    out = offset + layout.cols - 1;
    return true;
}

bool step_right(const Layout &layout, std::size_t offset, std::size_t &out) {
    std::size_t next = offset + 1;
    if (next % layout.cols != 0) {
        out = next;
        return true;
    }
    if (!layout.options.wrap_x)
        return false;
    out = next - layout.cols;
    return true;
}

namespace {

bool step_up(const Layout &layout, std::size_t offset, std::size_t &out) {
    if (layout.options.inverted_y && layout.options.neighbor_ybased)
        return step_row_down(layout, offset, out);
    return step_row_up(layout, offset, out);
}

bool step_down(const Layout &layout, std::size_t offset, std::size_t &out) {
    if (layout.options.inverted_y && layout.options.neighbor_ybased)
        return step_row_up(layout, offset, out);
    return step_row_down(layout, offset, out);
}

} //namespace

bool step(const Layout &layout, std::size_t offset, Direction dir, std::size_t &out) {
    std::size_t mid;
    switch (dir) {
    case Direction::Up:
        return step_up(layout, offset, out);
    case Direction::Down:
        return step_down(layout, offset, out);
    case Direction::Left:
        return step_left(layout, offset, out);
    case Direction::Right:
        return step_right(layout, offset, out);
    case Direction::UpLeft:
        return step_up(layout, offset, mid) && step_left(layout, mid, out);
    case Direction::UpRight:
        return step_up(layout, offset, mid) && step_right(layout, mid, out);
    case Direction::DownLeft:
        return step_down(layout, offset, mid) && step_left(layout, mid, out);
    case Direction::DownRight:
        return step_down(layout, offset, mid) && step_right(layout, mid, out);
    };
    return false;
}

} //neighborgrid
