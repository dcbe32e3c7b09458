#include "life.hpp"
#include <algorithm>
#include <random>

using namespace neighborgrid;

GridOptions life_options(Origin origin) {
    GridOptions options;
    options.origin = origin;
    options.wrap_x = true;
    options.wrap_y = true;
    return options;
}

LifeGrid parse_life(const std::vector<std::string> &lines, const GridOptions &options) {
    std::vector<std::vector<LifeStage>> rows;
    rows.reserve(lines.size());
    for (const std::string &line: lines) {
        std::vector<LifeStage> row;
        row.reserve(line.size());
        for (char c: line)
            row.push_back(c == '#' ? LifeStage::Alive : LifeStage::Dead);
        rows.push_back(std::move(row));
    }
    return LifeGrid::from_rows(std::move(rows), options);
}

std::string render_life(const LifeGrid &grid) {
    std::string out;
    out.reserve(grid.size() + grid.rows());
    //rows are walked in storage order whatever the origin is
    for (std::size_t j = 0; j < grid.rows(); ++j) {
        for (LifeStage s: grid.row_iter(j * grid.columns()))
            out.push_back(s == LifeStage::Alive ? '#' : '.');
        out.push_back('\n');
    }
    return out;
}

void place_glider(LifeGrid &grid) {
    //(column, row) in storage order
    const std::size_t CELLS[5][2] = {
        { 1, 0 },
        { 2, 1 }, { 3, 1 },
        { 1, 2 }, { 2, 2 },
    };
    for (const auto &c: CELLS) {
        if (c[0] < grid.columns() && c[1] < grid.rows())
            grid.set(c[1] * grid.columns() + c[0], LifeStage::Alive);
    }
}

void seed_soup(LifeGrid &grid, float density, uint32_t seed) {
    std::mt19937 gen(seed);
    std::bernoulli_distribution alive(std::clamp(density, 0.f, 1.f));
    for (LifeStage &s: grid)
        s = alive(gen) ? LifeStage::Alive : LifeStage::Dead;
}

void next_generation(LifeGrid &grid) {
    std::vector<LifeStage> next;
    next.reserve(grid.size());

    for (std::size_t i = 0; i < grid.size(); ++i) {
        auto neighbors = static_cast<const LifeGrid&>(grid).all_around_neighbors(i);
        int n = 0;
        for (const LifeStage *p: neighbors.cells())
            n += p && *p == LifeStage::Alive;

        bool alive = grid.at(i) == LifeStage::Alive;
        next.push_back((n == 3 || (alive && n == 2)) ? LifeStage::Alive : LifeStage::Dead);
    }

    std::copy(next.begin(), next.end(), grid.begin());
}

std::size_t count_alive(const LifeGrid &grid) {
    return static_cast<std::size_t>(std::count(grid.begin(), grid.end(), LifeStage::Alive));
}
