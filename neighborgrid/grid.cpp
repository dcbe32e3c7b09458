#include "grid.hpp"
#include <spdlog/spdlog.h>

namespace neighborgrid {

namespace detail {

GridError rejected(GridErrorKind kind, std::size_t rows, std::size_t cols) {
    spdlog::debug("neighborgrid: refusing {}x{} grid (rows x cols): {}",
            rows, cols, describe(kind));
    return GridError(kind);
}

std::size_t validate_layout(const Layout &layout) {
    std::size_t rows = layout.rows, cols = layout.cols;
    if (rows == 0 || cols == 0)
        throw rejected(GridErrorKind::InvalidSize, rows, cols);

    //rows * cols < MAX_CELLS, without forming the product
    if (rows >= MAX_CELLS || cols >= MAX_CELLS || cols > (MAX_CELLS - 1) / rows)
        throw rejected(GridErrorKind::ExcessiveSize, rows, cols);

    //the center cell only exists with odd sides
    if (layout.options.origin == Origin::Center && (rows % 2 == 0 || cols % 2 == 0))
        throw rejected(GridErrorKind::InvalidSize, rows, cols);

    return rows * cols;
}

} //detail

} //neighborgrid
