#ifndef NEIGHBORGRID_GRID_HPP
#define NEIGHBORGRID_GRID_HPP

#include <cstddef>
#include <iterator>
#include <type_traits>
#include <utility>
#include <vector>
#include "error.hpp"
#include "index.hpp"
#include "iterators.hpp"
#include "neighbors.hpp"
#include "origin.hpp"
#include "partitioner.hpp"

namespace neighborgrid {

//grids of this many cells (or with a side this long) are refused
const std::size_t MAX_CELLS = 2147483647;

namespace detail {

//Checks the shape against the size limits and the origin; returns rows * cols.
//Throws GridError(InvalidSize) or GridError(ExcessiveSize).
std::size_t validate_layout(const Layout &layout);

//logs the rejected shape, returns the exception to throw
GridError rejected(GridErrorKind kind, std::size_t rows, std::size_t cols);

} //detail

//Dense rows x cols grid stored row-major in one vector.
//
//Every accessor takes any coordinate form Index<> knows about: a flat offset,
//a signed (x, y) std::pair or a Coordinates record. How (x, y) maps onto storage
//is decided by GridOptions, see origin.hpp.
//
//Lookups that are expected to miss (get, neighbors, iteration) report it with
//nullptr or an empty range; explicit ones (resolve, at, set, swap, nrant) throw GridError.
template<typename T>
class Grid {
    static_assert(!std::is_same<T, bool>::value,
            "std::vector<bool> can't hand out cell pointers, store a small enum instead");
public:
    using value_type = T;
    using iterator = typename std::vector<T>::iterator;
    using const_iterator = typename std::vector<T>::const_iterator;

    Grid(std::size_t columns, std::size_t rows, const T &fill = T(),
            const GridOptions &options = GridOptions())
        : m_layout{ rows, columns, options }
    {
        m_data.assign(detail::validate_layout(m_layout), fill);
    }

    //rows of equal length, top to bottom
    static Grid from_rows(std::vector<std::vector<T>> rows,
            const GridOptions &options = GridOptions())
    {
        std::size_t cols = rows.empty() ? 0 : rows.front().size();
        Grid grid(Layout{ rows.size(), cols, options });
        grid.m_data.reserve(detail::validate_layout(grid.m_layout));
        for (auto &row: rows) {
            if (row.size() != cols)
                throw detail::rejected(GridErrorKind::RowSizeMismatch, rows.size(), row.size());
            std::move(row.begin(), row.end(), std::back_inserter(grid.m_data));
        }
        return grid;
    }

    //items.size() must equal columns * rows
    static Grid from_flat(std::vector<T> items, std::size_t columns, std::size_t rows,
            const GridOptions &options = GridOptions())
    {
        Grid grid(Layout{ rows, columns, options });
        if (items.size() != detail::validate_layout(grid.m_layout))
            throw detail::rejected(GridErrorKind::InvalidSize, rows, columns);
        grid.m_data = std::move(items);
        return grid;
    }

    //row repeated row_count times
    static Grid from_pattern(const std::vector<T> &row, std::size_t row_count,
            const GridOptions &options = GridOptions())
    {
        Grid grid(Layout{ row_count, row.size(), options });
        grid.m_data.reserve(detail::validate_layout(grid.m_layout));
        for (std::size_t j = 0; j < row_count; ++j)
            grid.m_data.insert(grid.m_data.end(), row.begin(), row.end());
        return grid;
    }

    std::size_t size() const { return m_data.size(); }
    std::size_t rows() const { return m_layout.rows; }
    std::size_t columns() const { return m_layout.cols; }
    const GridOptions& options() const { return m_layout.options; }
    const Layout& layout() const { return m_layout; }

    std::ptrdiff_t min_x() const { return neighborgrid::min_x(m_layout); }
    std::ptrdiff_t max_x() const { return neighborgrid::max_x(m_layout); }
    std::ptrdiff_t min_y() const { return neighborgrid::min_y(m_layout); }
    std::ptrdiff_t max_y() const { return neighborgrid::max_y(m_layout); }

    iterator begin() { return m_data.begin(); }
    const_iterator begin() const { return m_data.begin(); }
    iterator end() { return m_data.end(); }
    const_iterator end() const { return m_data.end(); }

    //--------------Index resolution--------------

    template<typename I>
    bool try_resolve(const I &index, std::size_t &offset) const {
        return Index<I>::resolve(m_layout, index, offset);
    }

    template<typename I>
    std::size_t resolve(const I &index) const {
        std::size_t offset;
        if (!try_resolve(index, offset))
            throw GridError(GridErrorKind::IndexOutOfBounds);
        return offset;
    }

    template<typename I>
    bool contains(const I &index) const {
        std::size_t offset;
        return try_resolve(index, offset);
    }

    //the coordinate of form I that resolves to offset
    template<typename I>
    I coord_of(std::size_t offset) const {
        if (offset >= size())
            throw GridError(GridErrorKind::IndexOutOfBounds);
        return Index<I>::materialize(m_layout, offset);
    }

    //--------------Cell access--------------

    template<typename I>
    const T* get(const I &index) const {
        std::size_t offset;
        return try_resolve(index, offset) ? &m_data[offset] : nullptr;
    }

    template<typename I>
    T* get(const I &index) {
        std::size_t offset;
        return try_resolve(index, offset) ? &m_data[offset] : nullptr;
    }

    template<typename I>
    const T& at(const I &index) const { return m_data[resolve(index)]; }

    template<typename I>
    T& at(const I &index) { return m_data[resolve(index)]; }

    template<typename I>
    void set(const I &index, T value) {
        m_data[resolve(index)] = std::move(value);
    }

    template<typename A, typename B>
    void swap(const A &a, const B &b) {
        std::size_t i = resolve(a), j = resolve(b);
        std::swap(m_data[i], m_data[j]);
    }

    //--------------Neighbors--------------

    template<typename I>
    bool try_neighbor_offset(const I &index, Direction dir, std::size_t &offset) const {
        std::size_t from;
        return try_resolve(index, from) && step(m_layout, from, dir, offset);
    }

    template<typename I>
    const T* get_neighbor(const I &index, Direction dir) const {
        std::size_t offset;
        return try_neighbor_offset(index, dir, offset) ? &m_data[offset] : nullptr;
    }

    template<typename I>
    T* get_neighbor(const I &index, Direction dir) {
        std::size_t offset;
        return try_neighbor_offset(index, dir, offset) ? &m_data[offset] : nullptr;
    }

    template<typename I> const T* get_up(const I &i) const { return get_neighbor(i, Direction::Up); }
    template<typename I> const T* get_down(const I &i) const { return get_neighbor(i, Direction::Down); }
    template<typename I> const T* get_left(const I &i) const { return get_neighbor(i, Direction::Left); }
    template<typename I> const T* get_right(const I &i) const { return get_neighbor(i, Direction::Right); }
    template<typename I> const T* get_upleft(const I &i) const { return get_neighbor(i, Direction::UpLeft); }
    template<typename I> const T* get_upright(const I &i) const { return get_neighbor(i, Direction::UpRight); }
    template<typename I> const T* get_downleft(const I &i) const { return get_neighbor(i, Direction::DownLeft); }
    template<typename I> const T* get_downright(const I &i) const { return get_neighbor(i, Direction::DownRight); }

    template<typename I> T* get_up(const I &i) { return get_neighbor(i, Direction::Up); }
    template<typename I> T* get_down(const I &i) { return get_neighbor(i, Direction::Down); }
    template<typename I> T* get_left(const I &i) { return get_neighbor(i, Direction::Left); }
    template<typename I> T* get_right(const I &i) { return get_neighbor(i, Direction::Right); }
    template<typename I> T* get_upleft(const I &i) { return get_neighbor(i, Direction::UpLeft); }
    template<typename I> T* get_upright(const I &i) { return get_neighbor(i, Direction::UpRight); }
    template<typename I> T* get_downleft(const I &i) { return get_neighbor(i, Direction::DownLeft); }
    template<typename I> T* get_downright(const I &i) { return get_neighbor(i, Direction::DownRight); }

    //throws if index itself is outside the grid
    template<typename I>
    XyNeighbor<const T> xy_neighbors(const I &index) const {
        return xy_neighbors_of<const T>(*this, resolve(index));
    }

    template<typename I>
    XyNeighbor<T> xy_neighbors(const I &index) {
        return xy_neighbors_of<T>(*this, resolve(index));
    }

    template<typename I>
    AllAroundNeighbor<const T> all_around_neighbors(const I &index) const {
        return all_around_of<const T>(*this, resolve(index));
    }

    template<typename I>
    AllAroundNeighbor<T> all_around_neighbors(const I &index) {
        return all_around_of<T>(*this, resolve(index));
    }

    //--------------Regions--------------

    //Region id of the cell when the grid is split into divisor x divisor regions.
    //Throws GridError(InvalidDivisionSize) before looking at the index.
    template<typename I>
    std::size_t nrant(const I &index, std::size_t divisor) const {
        Partitioner p(columns(), rows(), divisor);
        return p.region_of(resolve(index));
    }

    template<typename I>
    std::size_t quadrant(const I &index) const { return nrant(index, 2); }

    //--------------Iteration--------------
    //An invalid start gives an empty range instead of an error.

    template<typename I>
    RowRange<const T> row_iter(const I &index) const { return row_of<const T>(*this, index); }

    template<typename I>
    RowRange<T> row_iter(const I &index) { return row_of<T>(*this, index); }

    template<typename I>
    ColRange<const T> col_iter(const I &index) const { return col_of<const T>(*this, index); }

    template<typename I>
    ColRange<T> col_iter(const I &index) { return col_of<T>(*this, index); }

    template<typename I>
    NrantRange<const T> nrant_iter(std::size_t divisor, const I &index) const {
        return nrant_of<const T>(*this, divisor, index);
    }

    template<typename I>
    NrantRange<T> nrant_iter(std::size_t divisor, const I &index) {
        return nrant_of<T>(*this, divisor, index);
    }

    template<typename I>
    NrantRange<const T> quadrant_iter(const I &index) const { return nrant_iter(2, index); }

    template<typename I>
    NrantRange<T> quadrant_iter(const I &index) { return nrant_iter(2, index); }

    bool operator==(const Grid &other) const {
        return m_layout == other.m_layout && m_data == other.m_data;
    }

    bool operator!=(const Grid &other) const { return !(*this == other); }

private:
    Layout m_layout;
    std::vector<T> m_data;

    //storage is filled in by the caller
    explicit Grid(const Layout &layout) : m_layout(layout) {}

    //the helpers below serve both constness flavours; G is Grid or const Grid

    template<typename U, typename G>
    static U* cell_or_null(G &grid, std::size_t from, Direction dir) {
        std::size_t offset;
        if (!step(grid.m_layout, from, dir, offset))
            return nullptr;
        return grid.m_data.data() + offset;
    }

    template<typename U, typename G>
    static XyNeighbor<U> xy_neighbors_of(G &grid, std::size_t from) {
        XyNeighbor<U> n;
        n.up = cell_or_null<U>(grid, from, Direction::Up);
        n.left = cell_or_null<U>(grid, from, Direction::Left);
        n.right = cell_or_null<U>(grid, from, Direction::Right);
        n.down = cell_or_null<U>(grid, from, Direction::Down);
        return n;
    }

    template<typename U, typename G>
    static AllAroundNeighbor<U> all_around_of(G &grid, std::size_t from) {
        AllAroundNeighbor<U> n;
        n.upleft = cell_or_null<U>(grid, from, Direction::UpLeft);
        n.up = cell_or_null<U>(grid, from, Direction::Up);
        n.upright = cell_or_null<U>(grid, from, Direction::UpRight);
        n.left = cell_or_null<U>(grid, from, Direction::Left);
        n.right = cell_or_null<U>(grid, from, Direction::Right);
        n.downleft = cell_or_null<U>(grid, from, Direction::DownLeft);
        n.down = cell_or_null<U>(grid, from, Direction::Down);
        n.downright = cell_or_null<U>(grid, from, Direction::DownRight);
        return n;
    }

    template<typename U, typename G, typename I>
    static RowRange<U> row_of(G &grid, const I &index) {
        std::size_t offset;
        if (!grid.try_resolve(index, offset))
            return RowRange<U>();
        std::size_t cols = grid.columns();
        return RowRange<U>(grid.m_data.data() + offset / cols * cols, cols);
    }

    template<typename U, typename G, typename I>
    static ColRange<U> col_of(G &grid, const I &index) {
        std::size_t offset;
        if (!grid.try_resolve(index, offset))
            return ColRange<U>();
        return ColRange<U>(grid.m_data.data(), offset % grid.columns(),
                grid.columns(), grid.rows());
    }

    template<typename U, typename G, typename I>
    static NrantRange<U> nrant_of(G &grid, std::size_t divisor, const I &index) {
        std::size_t offset;
        if (!Partitioner::valid_divisor(grid.columns(), grid.rows(), divisor)
                || !grid.try_resolve(index, offset))
            return NrantRange<U>();
        Partitioner p(grid.columns(), grid.rows(), divisor);
        return NrantRange<U>(grid.m_data.data(), grid.columns(), p, p.region_of(offset));
    }
};

} //neighborgrid

#endif
