#include "partitioner.hpp"
#include "error.hpp"

namespace neighborgrid {

Partitioner::Partitioner(std::size_t cols, std::size_t rows, std::size_t divisor)
    : m_cols(cols), m_rows(rows), m_divisor(divisor)
{
    if (!valid_divisor(cols, rows, divisor))
        throw GridError(GridErrorKind::InvalidDivisionSize);

    m_region_width = ceil_div(cols, divisor);
    m_region_height = ceil_div(rows, divisor);

    m_xbounds.reserve(divisor + 1);
    m_ybounds.reserve(divisor + 1);
    for (std::size_t i = 0; i < m_cols; i += m_region_width)
        m_xbounds.push_back(i);
    m_xbounds.push_back(m_cols);

    for (std::size_t j = 0; j < m_rows; j += m_region_height)
        m_ybounds.push_back(j);
    m_ybounds.push_back(m_rows);
}

std::size_t Partitioner::region_of(std::size_t offset) const {
    std::size_t row_block = offset / m_cols / m_region_height,
                col_block = offset % m_cols / m_region_width;
    return row_block * m_divisor + col_block;
}

std::size_t Partitioner::region_start(std::size_t region) const {
    //an empty region has no first cell; its window offset would belong to another region
    if (region >= num_regions() || region_bounds(region).is_empty())
        throw GridError(GridErrorKind::IndexOutOfBounds);
    std::size_t row_block = region / m_divisor,
                col_block = region % m_divisor;
    return row_block * m_region_height * m_cols + col_block * m_region_width;
}

Rect<std::size_t> Partitioner::region_bounds(std::size_t region) const {
    std::size_t row_block = region / m_divisor,
                col_block = region % m_divisor;
    auto window = Rect<std::size_t>::from_extent(col_block * m_region_width,
            row_block * m_region_height, m_region_width, m_region_height);
    return window.intersection(Rect<std::size_t>(0, 0, m_cols, m_rows));
}

std::size_t Partitioner::x_bound(std::size_t k) const { return m_xbounds[k]; }

std::size_t Partitioner::y_bound(std::size_t k) const { return m_ybounds[k]; }

std::size_t Partitioner::num_xbounds() const { return m_xbounds.size(); }

std::size_t Partitioner::num_ybounds() const { return m_ybounds.size(); }

} //neighborgrid
