#ifndef NEIGHBORGRID_PARTITIONER_HPP
#define NEIGHBORGRID_PARTITIONER_HPP

#include <algorithm>
#include <cstddef>
#include <vector>
#include "rect.hpp"

namespace neighborgrid {

inline std::size_t ceil_div(std::size_t a, std::size_t b) {
    return (a + b - 1) / b;
}

//Splits a cols x rows grid into divisor x divisor regions numbered row-major.
//Regions are ceil(cols / divisor) wide and ceil(rows / divisor) high, so the
//ones along the right and bottom edges can be smaller, or even empty.
//Works purely on canonical offsets; origin and inversion play no part.
class Partitioner {
public:
    //throws GridError(InvalidDivisionSize) unless 1 <= divisor <= max(rows, cols)
    Partitioner(std::size_t cols, std::size_t rows, std::size_t divisor);

    static bool valid_divisor(std::size_t cols, std::size_t rows, std::size_t divisor) {
        return divisor >= 1 && divisor <= std::max(rows, cols);
    }

    std::size_t divisor() const { return m_divisor; }
    std::size_t num_regions() const { return m_divisor * m_divisor; }
    std::size_t region_width() const { return m_region_width; }
    std::size_t region_height() const { return m_region_height; }

    //offset must be less than cols * rows
    std::size_t region_of(std::size_t offset) const;
    //First offset of the region's full sized window. Throws GridError(IndexOutOfBounds)
    //if region >= num_regions() or the region has no cells in the grid.
    std::size_t region_start(std::size_t region) const;
    //cells of the region that actually lie in the grid
    Rect<std::size_t> region_bounds(std::size_t region) const;

    //block boundaries along each axis: 0, w, 2w, ..., cols
    std::size_t x_bound(std::size_t k) const;
    std::size_t y_bound(std::size_t k) const;
    std::size_t num_xbounds() const;
    std::size_t num_ybounds() const;

private:
    std::size_t m_cols, m_rows;
    std::size_t m_divisor;
    std::size_t m_region_width, m_region_height;
    std::vector<std::size_t> m_xbounds, m_ybounds;
};

} //neighborgrid

#endif
