#ifndef NEIGHBORGRID_INDEX_HPP
#define NEIGHBORGRID_INDEX_HPP

#include <cstddef>
#include <type_traits>
#include <utility>
#include "origin.hpp"

namespace neighborgrid {

//Index<I> turns a coordinate representation I into a canonical offset and back.
//
//  static bool resolve(const Layout &, const I &index, std::size_t &offset);
//  static I materialize(const Layout &, std::size_t offset);
//
//resolve() only succeeds with an offset that is safe for direct storage access.
//materialize() expects offset < layout.size().
//Unsupported representations have no specialization and fail to compile.
template<typename I, typename Enable = void>
struct Index;

//flat offset
template<typename I>
struct Index<I, std::enable_if_t<std::is_integral<I>::value && !std::is_same<I, bool>::value>> {
    static bool resolve(const Layout &layout, I index, std::size_t &offset) {
        if constexpr (std::is_signed<I>::value) {
            if (index < 0)
                return false;
        }
        if (static_cast<std::make_unsigned_t<I>>(index) >= layout.size())
            return false;
        offset = static_cast<std::size_t>(index);
        return true;
    }

    static I materialize(const Layout &, std::size_t offset) {
        return static_cast<I>(offset);
    }
};

//(x, y) pair
template<typename X, typename Y>
struct Index<std::pair<X, Y>> {
    static_assert(std::is_integral<X>::value && std::is_integral<Y>::value,
            "coordinate pairs must be integral");
    static_assert(std::is_signed<X>::value && std::is_signed<Y>::value,
            "coordinate pairs must be signed");

    static bool resolve(const Layout &layout, const std::pair<X, Y> &xy, std::size_t &offset) {
        Coordinates c = { static_cast<std::ptrdiff_t>(xy.first),
                          static_cast<std::ptrdiff_t>(xy.second) };
        return xy_to_offset(layout, c, offset);
    }

    static std::pair<X, Y> materialize(const Layout &layout, std::size_t offset) {
        Coordinates c = offset_to_xy(layout, offset);
        return { static_cast<X>(c.x), static_cast<Y>(c.y) };
    }
};

//named {x, y} record
template<>
struct Index<Coordinates> {
    static bool resolve(const Layout &layout, const Coordinates &c, std::size_t &offset) {
        return xy_to_offset(layout, c, offset);
    }

    static Coordinates materialize(const Layout &layout, std::size_t offset) {
        return offset_to_xy(layout, offset);
    }
};

} //neighborgrid

#endif
