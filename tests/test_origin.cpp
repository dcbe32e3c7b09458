#include <gtest/gtest.h>
#include <cstdint>
#include <set>
#include "neighborgrid/origin.hpp"

using namespace neighborgrid;

namespace {

const Origin ALL_ORIGINS[] = {
    Origin::UpperLeft, Origin::UpperRight, Origin::Center,
    Origin::LowerLeft, Origin::LowerRight,
};

Layout make_layout(std::size_t cols, std::size_t rows, Origin origin, bool inverted_y) {
    GridOptions options;
    options.origin = origin;
    options.inverted_y = inverted_y;
    return Layout{ rows, cols, options };
}

std::size_t offset_of(const Layout &layout, std::ptrdiff_t x, std::ptrdiff_t y) {
    std::size_t offset = 0;
    EXPECT_TRUE(xy_to_offset(layout, { x, y }, offset)) << "(" << x << ", " << y << ")";
    return offset;
}

bool resolves(const Layout &layout, std::ptrdiff_t x, std::ptrdiff_t y) {
    std::size_t offset;
    return xy_to_offset(layout, { x, y }, offset);
}

} //namespace

TEST(Origin, UpperLeftInverted) {
    Layout l = make_layout(3, 4, Origin::UpperLeft, true);
    EXPECT_EQ(offset_of(l, 0, 0), 0u);
    EXPECT_EQ(offset_of(l, 0, 1), 3u);
    EXPECT_EQ(offset_of(l, 2, 3), 11u);
    EXPECT_FALSE(resolves(l, 0, -1));
    EXPECT_FALSE(resolves(l, 3, 0));
}

TEST(Origin, UpperLeftNotInverted) {
    Layout l = make_layout(3, 4, Origin::UpperLeft, false);
    EXPECT_EQ(offset_of(l, 0, -1), 3u);
    EXPECT_EQ(offset_of(l, 2, -3), 11u);
    EXPECT_FALSE(resolves(l, 0, 1));
    EXPECT_FALSE(resolves(l, 0, -4));
}

TEST(Origin, UpperRight) {
    Layout l = make_layout(3, 4, Origin::UpperRight, true);
    EXPECT_EQ(offset_of(l, 0, 0), 2u);
    EXPECT_EQ(offset_of(l, -1, 0), 1u);
    EXPECT_EQ(offset_of(l, 0, 1), 5u);
    EXPECT_EQ(offset_of(l, -2, 3), 9u);
    EXPECT_FALSE(resolves(l, 1, 0));
    EXPECT_FALSE(resolves(l, -3, 0));
}

TEST(Origin, LowerLeft) {
    Layout l = make_layout(3, 4, Origin::LowerLeft, true);
    EXPECT_EQ(offset_of(l, 0, 0), 9u);
    EXPECT_EQ(offset_of(l, 0, -1), 6u);
    EXPECT_EQ(offset_of(l, 2, -3), 2u);
    EXPECT_FALSE(resolves(l, 0, 1));

    Layout upward = make_layout(3, 4, Origin::LowerLeft, false);
    EXPECT_EQ(offset_of(upward, 0, 1), 6u);
    EXPECT_EQ(offset_of(upward, 2, 3), 2u);
    EXPECT_FALSE(resolves(upward, 0, -1));
}

TEST(Origin, LowerRight) {
    Layout l = make_layout(3, 4, Origin::LowerRight, true);
    EXPECT_EQ(offset_of(l, 0, 0), 11u);
    EXPECT_EQ(offset_of(l, -1, 0), 10u);
    EXPECT_EQ(offset_of(l, 0, -1), 8u);
    EXPECT_EQ(offset_of(l, -2, -3), 0u);
    EXPECT_FALSE(resolves(l, 1, 0));
}

TEST(Origin, Center) {
    Layout l = make_layout(3, 5, Origin::Center, false);
    EXPECT_EQ(offset_of(l, 0, 0), 7u);
    EXPECT_EQ(offset_of(l, -1, 0), 6u);
    EXPECT_EQ(offset_of(l, 1, 0), 8u);
    EXPECT_EQ(offset_of(l, 0, 1), 4u);
    EXPECT_EQ(offset_of(l, -1, 2), 0u);
    EXPECT_FALSE(resolves(l, 2, 0));
    EXPECT_FALSE(resolves(l, -3, 0));
    EXPECT_FALSE(resolves(l, 0, 3));

    Layout inverted = make_layout(3, 5, Origin::Center, true);
    EXPECT_EQ(offset_of(inverted, 0, 0), 7u);
    EXPECT_EQ(offset_of(inverted, 0, -1), 4u);
    EXPECT_EQ(offset_of(inverted, -1, -2), 0u);
}

TEST(Origin, FarOutsideCoordinatesAreRejected) {
    Layout l = make_layout(3, 4, Origin::LowerRight, true);
    const std::ptrdiff_t huge = PTRDIFF_MAX;
    EXPECT_FALSE(resolves(l, huge, 0));
    EXPECT_FALSE(resolves(l, -huge, 0));
    EXPECT_FALSE(resolves(l, 0, huge));
    EXPECT_FALSE(resolves(l, 0, -huge));
}

TEST(Origin, RoundTripAndBijection) {
    for (Origin origin: ALL_ORIGINS) {
        for (bool inverted: { true, false }) {
            Layout l = make_layout(5, 7, origin, inverted);
            std::set<std::size_t> seen;
            std::size_t valid = 0;
            for (std::ptrdiff_t y = -8; y <= 8; ++y) {
                for (std::ptrdiff_t x = -6; x <= 6; ++x) {
                    std::size_t offset;
                    if (!xy_to_offset(l, { x, y }, offset))
                        continue;
                    ++valid;
                    ASSERT_LT(offset, l.size());
                    seen.insert(offset);
                    Coordinates back = offset_to_xy(l, offset);
                    EXPECT_EQ(back, (Coordinates{ x, y }))
                        << origin_name(origin) << " inverted=" << inverted;
                }
            }
            EXPECT_EQ(valid, l.size()) << origin_name(origin);
            EXPECT_EQ(seen.size(), l.size()) << origin_name(origin);
        }
    }
}

TEST(Origin, OffsetRoundTrip) {
    for (Origin origin: ALL_ORIGINS) {
        Layout l = make_layout(3, 5, origin, true);
        for (std::size_t i = 0; i < l.size(); ++i) {
            Coordinates c = offset_to_xy(l, i);
            EXPECT_EQ(offset_of(l, c.x, c.y), i) << origin_name(origin);
        }
    }
}

TEST(Origin, CoordinateRanges) {
    Layout ul = make_layout(3, 4, Origin::UpperLeft, true);
    EXPECT_EQ(min_x(ul), 0);
    EXPECT_EQ(max_x(ul), 2);
    EXPECT_EQ(min_y(ul), 0);
    EXPECT_EQ(max_y(ul), 3);

    Layout ul_up = make_layout(3, 4, Origin::UpperLeft, false);
    EXPECT_EQ(min_y(ul_up), -3);
    EXPECT_EQ(max_y(ul_up), 0);

    Layout lr = make_layout(3, 4, Origin::LowerRight, true);
    EXPECT_EQ(min_x(lr), -2);
    EXPECT_EQ(max_x(lr), 0);
    EXPECT_EQ(min_y(lr), -3);
    EXPECT_EQ(max_y(lr), 0);

    Layout center = make_layout(5, 3, Origin::Center, true);
    EXPECT_EQ(min_x(center), -2);
    EXPECT_EQ(max_x(center), 2);
    EXPECT_EQ(min_y(center), -1);
    EXPECT_EQ(max_y(center), 1);
}

TEST(Origin, RangesMatchResolution) {
    for (Origin origin: ALL_ORIGINS) {
        Layout l = make_layout(5, 3, origin, false);
        EXPECT_TRUE(resolves(l, min_x(l), min_y(l)));
        EXPECT_TRUE(resolves(l, max_x(l), max_y(l)));
        EXPECT_FALSE(resolves(l, max_x(l) + 1, max_y(l)));
        EXPECT_FALSE(resolves(l, min_x(l), min_y(l) - 1));
    }
}

TEST(Origin, Names) {
    for (Origin origin: ALL_ORIGINS) {
        Origin parsed = Origin::UpperLeft;
        EXPECT_TRUE(parse_origin(origin_name(origin), parsed));
        EXPECT_EQ(parsed, origin);
    }

    Origin untouched = Origin::Center;
    EXPECT_FALSE(parse_origin("middle", untouched));
    EXPECT_EQ(untouched, Origin::Center);
}
