#ifndef NEIGHBORGRID_EXAMPLES_LIFE_HPP
#define NEIGHBORGRID_EXAMPLES_LIFE_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "neighborgrid/grid.hpp"

enum class LifeStage : uint8_t {
    Dead = 0,
    Alive,
};

using LifeGrid = neighborgrid::Grid<LifeStage>;

//toroidal board, the way the demos run it
neighborgrid::GridOptions life_options(
        neighborgrid::Origin origin = neighborgrid::Origin::UpperLeft);

//'#' is alive, anything else is dead; throws GridError like Grid::from_rows
LifeGrid parse_life(const std::vector<std::string> &lines,
        const neighborgrid::GridOptions &options = life_options());
std::string render_life(const LifeGrid &grid);

//glider heading for the lower right, top left corner at canonical (1, 0)
void place_glider(LifeGrid &grid);
//every cell alive with probability density
void seed_soup(LifeGrid &grid, float density, uint32_t seed);

//B3/S23
void next_generation(LifeGrid &grid);
std::size_t count_alive(const LifeGrid &grid);

#endif
