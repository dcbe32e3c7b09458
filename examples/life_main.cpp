#include <cstdlib>
#include <string>
#include "life.hpp"
#include "log_setup.hpp"

using namespace neighborgrid;

const std::size_t DEFAULT_GENERATIONS = 12;
const std::size_t DEFAULT_COLUMNS = 8;
const std::size_t DEFAULT_ROWS = 8;

//positive integer argument, or fallback
std::size_t size_arg(int argc, char **argv, int i, std::size_t fallback) {
    if (argc <= i)
        return fallback;
    char *end = nullptr;
    long v = std::strtol(argv[i], &end, 10);
    if (*end != '\0' || v <= 0) {
        spdlog::warn("ignoring argument '{}', using {}", argv[i], fallback);
        return fallback;
    }
    return static_cast<std::size_t>(v);
}

//life [generations] [columns] [rows] [origin]
int main(int argc, char **argv) {
    configure_logging();

    std::size_t generations = size_arg(argc, argv, 1, DEFAULT_GENERATIONS),
                cols = size_arg(argc, argv, 2, DEFAULT_COLUMNS),
                rows = size_arg(argc, argv, 3, DEFAULT_ROWS);

    Origin origin = Origin::UpperLeft;
    if (argc > 4 && !parse_origin(argv[4], origin))
        spdlog::warn("unknown origin '{}', using {}", argv[4], origin_name(origin));

    try {
        LifeGrid grid(cols, rows, LifeStage::Dead, life_options(origin));
        place_glider(grid);
        spdlog::info("{}x{} torus, origin {}, {} generations",
                cols, rows, origin_name(origin), generations);

        for (std::size_t gen = 0; gen <= generations; ++gen) {
            spdlog::info("generation {}: {} alive\n{}", gen, count_alive(grid), render_life(grid));
            next_generation(grid);
        }
    } catch (const GridError &e) {
        spdlog::error("can't run life on a {}x{} grid: {}", cols, rows, e.what());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
