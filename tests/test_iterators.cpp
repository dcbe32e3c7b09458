#include <gtest/gtest.h>
#include <algorithm>
#include <numeric>
#include <vector>
#include "neighborgrid/grid.hpp"

using namespace neighborgrid;

namespace {

Grid<int> numbered(std::size_t cols, std::size_t rows, int first = 0) {
    std::vector<int> items(cols * rows);
    std::iota(items.begin(), items.end(), first);
    return Grid<int>::from_flat(std::move(items), cols, rows);
}

template<typename Range>
std::vector<int> values(const Range &range) {
    std::vector<int> out;
    for (const int &v: range)
        out.push_back(v);
    return out;
}

//region slots, -1 for a slot outside the grid
template<typename Range>
std::vector<int> slots(const Range &range) {
    std::vector<int> out;
    for (const int *p: range)
        out.push_back(p ? *p : -1);
    return out;
}

} //namespace

TEST(RowIter, YieldsTheWholeRow) {
    const Grid<int> g = numbered(3, 4);
    EXPECT_EQ(values(g.row_iter(4)), (std::vector<int>{ 3, 4, 5 }));
    EXPECT_EQ(values(g.row_iter(Coordinates{ 0, 3 })), (std::vector<int>{ 9, 10, 11 }));
    EXPECT_EQ(g.row_iter(0).size(), 3u);
}

TEST(RowIter, InvalidStartIsEmpty) {
    const Grid<int> g = numbered(3, 4);
    EXPECT_TRUE(g.row_iter(12).empty());
    EXPECT_TRUE(g.row_iter(std::make_pair(-1, 0)).empty());
    EXPECT_TRUE(values(g.row_iter(Coordinates{ 0, -1 })).empty());
}

TEST(RowIter, Restartable) {
    const Grid<int> g = numbered(3, 4);
    auto row = g.row_iter(7);
    EXPECT_EQ(values(row), values(row));
}

TEST(RowIter, MutableWrites) {
    Grid<int> g = numbered(3, 4);
    for (int &v: g.row_iter(Coordinates{ 1, 1 }))
        v = -1;
    EXPECT_EQ(values(g.row_iter(3)), (std::vector<int>{ -1, -1, -1 }));
    EXPECT_EQ(g.at(2), 2);
    EXPECT_EQ(g.at(6), 6);
}

TEST(ColIter, StridesByColumns) {
    const Grid<int> g = numbered(3, 4);
    EXPECT_EQ(values(g.col_iter(4)), (std::vector<int>{ 1, 4, 7, 10 }));
    EXPECT_EQ(values(g.col_iter(Coordinates{ 2, 3 })), (std::vector<int>{ 2, 5, 8, 11 }));
    EXPECT_EQ(g.col_iter(0).size(), 4u);
}

TEST(ColIter, InvalidStartIsEmpty) {
    const Grid<int> g = numbered(3, 4);
    EXPECT_TRUE(g.col_iter(-3).empty());
    EXPECT_TRUE(values(g.col_iter(std::make_pair(3, 0))).empty());
}

TEST(ColIter, MutableWrites) {
    Grid<int> g = numbered(3, 4);
    for (int &v: g.col_iter(0))
        v *= 10;
    EXPECT_EQ(values(g.col_iter(0)), (std::vector<int>{ 0, 30, 60, 90 }));
    EXPECT_EQ(g.at(1), 1);
}

TEST(NrantIter, SudokuBoxes) {
    const Grid<int> g = numbered(9, 9, 1);
    EXPECT_EQ(slots(g.nrant_iter(3, 10)),
            (std::vector<int>{ 1, 2, 3, 10, 11, 12, 19, 20, 21 }));
    EXPECT_EQ(slots(g.nrant_iter(3, 80)),
            (std::vector<int>{ 61, 62, 63, 70, 71, 72, 79, 80, 81 }));
    EXPECT_EQ(slots(g.nrant_iter(3, std::make_pair(4, 4))),
            (std::vector<int>{ 31, 32, 33, 40, 41, 42, 49, 50, 51 }));
    EXPECT_TRUE(g.quadrant_iter(std::make_pair(10, 10)).empty());
}

TEST(NrantIter, RaggedColumns) {
    const Grid<int> g = Grid<int>::from_rows({ { 0, 1, 2 }, { 3, 4, 5 } });
    EXPECT_EQ(slots(g.quadrant_iter(0)), (std::vector<int>{ 0, 1 }));
    EXPECT_EQ(slots(g.quadrant_iter(2)), (std::vector<int>{ 2, -1 }));
    EXPECT_EQ(slots(g.quadrant_iter(5)), (std::vector<int>{ 5, -1 }));
}

TEST(NrantIter, RaggedRowsAndColumns) {
    const Grid<int> g = numbered(5, 5);
    auto last = g.quadrant_iter(24);
    EXPECT_EQ(last.size(), 9u);
    EXPECT_EQ(slots(last),
            (std::vector<int>{ 18, 19, -1, 23, 24, -1, -1, -1, -1 }));
    EXPECT_EQ(slots(g.quadrant_iter(0)),
            (std::vector<int>{ 0, 1, 2, 5, 6, 7, 10, 11, 12 }));
}

TEST(NrantIter, InvalidInputIsEmpty) {
    const Grid<int> g = numbered(3, 3);
    EXPECT_TRUE(g.nrant_iter(0, 0).empty());
    EXPECT_TRUE(g.nrant_iter(4, 0).empty());
    EXPECT_TRUE(g.nrant_iter(3, 9).empty());
    EXPECT_TRUE(slots(g.nrant_iter(2, Coordinates{ -1, 0 })).empty());
}

TEST(NrantIter, CoversEveryCellOnce) {
    for (std::size_t cols = 1; cols <= 6; ++cols) {
        for (std::size_t rows = 1; rows <= 6; ++rows) {
            const Grid<int> g = numbered(cols, rows);
            for (std::size_t d = 1; d <= std::max(cols, rows); ++d) {
                Partitioner p(cols, rows, d);
                std::vector<int> hits(g.size(), 0);
                for (std::size_t r = 0; r < p.num_regions(); ++r) {
                    Rect<std::size_t> b = p.region_bounds(r);
                    if (b.is_empty())
                        continue;
                    auto region = g.nrant_iter(d, b.top * cols + b.left);
                    EXPECT_EQ(region.size(), p.region_width() * p.region_height());
                    for (const int *cell: region)
                        if (cell)
                            ++hits[*cell];
                }
                for (std::size_t i = 0; i < hits.size(); ++i)
                    EXPECT_EQ(hits[i], 1) << cols << "x" << rows << " / " << d << " cell " << i;
            }
        }
    }
}

TEST(NrantIter, MutableWrites) {
    Grid<int> g = numbered(4, 4);
    for (int *cell: g.quadrant_iter(Coordinates{ 3, 3 }))
        if (cell)
            *cell = 0;
    EXPECT_EQ(values(g.row_iter(8)), (std::vector<int>{ 8, 9, 0, 0 }));
    EXPECT_EQ(values(g.row_iter(12)), (std::vector<int>{ 12, 13, 0, 0 }));
    EXPECT_EQ(g.at(3), 3);
}

TEST(WholeGrid, StorageOrder) {
    Grid<int> g = numbered(2, 3);
    EXPECT_EQ(values(g), (std::vector<int>{ 0, 1, 2, 3, 4, 5 }));
    for (int &v: g)
        v += 1;
    EXPECT_EQ(std::accumulate(g.begin(), g.end(), 0), 21);
}
