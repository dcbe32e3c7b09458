#ifndef NEIGHBORGRID_ITERATORS_HPP
#define NEIGHBORGRID_ITERATORS_HPP

#include <cstddef>
#include <iterator>
#include <type_traits>
#include "partitioner.hpp"
#include "rect.hpp"

namespace neighborgrid {

//All ranges below are views into a grid's storage. They stay valid as long as
//the grid does and can be walked any number of times. A range over T (rather
//than const T) must be the only live access to the grid while it is in use.

//one storage row
template<typename T>
class RowRange {
public:
    using iterator = T*;

    RowRange() : m_first(nullptr), m_last(nullptr) {}
    RowRange(T *first, std::size_t n) : m_first(first), m_last(first + n) {}

    iterator begin() const { return m_first; }
    iterator end() const { return m_last; }

    std::size_t size() const { return static_cast<std::size_t>(m_last - m_first); }
    bool empty() const { return m_first == m_last; }

private:
    T *m_first, *m_last;
};

template<typename T>
class StrideIterator {
public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = std::remove_const_t<T>;
    using difference_type = std::ptrdiff_t;
    using pointer = T*;
    using reference = T&;

    StrideIterator() = default;
    StrideIterator(T *base, std::size_t pos, std::size_t stride)
        : m_base(base), m_pos(pos), m_stride(stride) {}

    reference operator*() const { return m_base[m_pos]; }
    pointer operator->() const { return m_base + m_pos; }

    StrideIterator& operator++() {
        m_pos += m_stride;
        return *this;
    }

    StrideIterator operator++(int) {
        StrideIterator tmp = *this;
        ++(*this);
        return tmp;
    }

    bool operator==(const StrideIterator &other) const { return m_pos == other.m_pos; }
    bool operator!=(const StrideIterator &other) const { return m_pos != other.m_pos; }

private:
    T *m_base = nullptr;
    //kept as an index so the end position is never turned into a pointer
    std::size_t m_pos = 0;
    std::size_t m_stride = 1;
};

//one storage column, top to bottom
template<typename T>
class ColRange {
public:
    using iterator = StrideIterator<T>;

    ColRange() = default;
    ColRange(T *base, std::size_t col, std::size_t cols, std::size_t rows)
        : m_base(base), m_first(col), m_stride(cols), m_count(rows) {}

    iterator begin() const { return iterator(m_base, m_first, m_stride); }
    iterator end() const { return iterator(m_base, m_first + m_stride * m_count, m_stride); }

    std::size_t size() const { return m_count; }
    bool empty() const { return m_count == 0; }

private:
    T *m_base = nullptr;
    std::size_t m_first = 0;
    std::size_t m_stride = 1;
    std::size_t m_count = 0;
};

namespace detail {

struct RegionWindow {
    //full region_width x region_height window, may hang over the grid edges
    Rect<std::size_t> window;
    //part of the window inside the grid
    Rect<std::size_t> bounds;
    std::size_t cols = 0;
};

} //detail

//Walks a region window row by row and yields a pointer per slot,
//nullptr for slots that fall outside the grid.
template<typename T>
class RegionIterator {
public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = T*;
    using difference_type = std::ptrdiff_t;
    using pointer = T* const*;
    using reference = T*;

    RegionIterator() = default;
    RegionIterator(T *data, const detail::RegionWindow &w, std::size_t slot)
        : m_data(data), m_w(w), m_slot(slot) {}

    reference operator*() const {
        std::size_t width = m_w.window.width();
        std::size_t x = m_w.window.left + m_slot % width,
                    y = m_w.window.top + m_slot / width;
        if (!m_w.bounds.contains(x, y))
            return nullptr;
        return m_data + y * m_w.cols + x;
    }

    RegionIterator& operator++() {
        ++m_slot;
        return *this;
    }

    RegionIterator operator++(int) {
        RegionIterator tmp = *this;
        ++(*this);
        return tmp;
    }

    bool operator==(const RegionIterator &other) const { return m_slot == other.m_slot; }
    bool operator!=(const RegionIterator &other) const { return m_slot != other.m_slot; }

private:
    T *m_data = nullptr;
    detail::RegionWindow m_w;
    std::size_t m_slot = 0;
};

//Every region yields exactly region_width * region_height slots, so positions
//line up between regions even when the edge ones are ragged.
template<typename T>
class NrantRange {
public:
    using iterator = RegionIterator<T>;

    NrantRange() = default;
    NrantRange(T *data, std::size_t cols, const Partitioner &p, std::size_t region)
        : m_data(data)
    {
        std::size_t start = p.region_start(region);
        m_w.window = Rect<std::size_t>::from_extent(start % cols, start / cols,
                p.region_width(), p.region_height());
        m_w.bounds = p.region_bounds(region);
        m_w.cols = cols;
    }

    iterator begin() const { return iterator(m_data, m_w, 0); }
    iterator end() const { return iterator(m_data, m_w, size()); }

    std::size_t size() const { return m_w.window.area(); }
    bool empty() const { return size() == 0; }

private:
    T *m_data = nullptr;
    detail::RegionWindow m_w;
};

} //neighborgrid

#endif
