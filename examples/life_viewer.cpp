#include <SFML/Graphics.hpp>
#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include "grid_painter.hpp"
#include "life.hpp"
#include "log_setup.hpp"
#include "render_buffer.hpp"

using namespace neighborgrid;

using V2f = sf::Vector2f;

const float CELL_SIZE = 12.f;
const sf::Time GENERATION_STEP = sf::milliseconds(100);
const float SOUP_DENSITY = 0.3f;

const sf::Color ALIVE_COLOR(230, 230, 230);
const sf::Color DEAD_COLOR(16, 16, 16);

//Left click toggles a cell, Space pauses, N steps once while paused,
//R reseeds, C clears, Enter toggles the cell lines, Escape quits.
//Hovering outlines the cell, its eight neighbors and its quadrant.
class LifeViewer {
public:
    LifeViewer(sf::RenderWindow &window, std::size_t cols, std::size_t rows)
        : m_window(window),
          m_grid(cols, rows, LifeStage::Dead, life_options()),
          m_buffer(static_cast<unsigned>(cols), static_cast<unsigned>(rows)),
          m_view(sf::FloatRect(0.f, 0.f, cols * CELL_SIZE, rows * CELL_SIZE))
    {
        m_window.setView(m_view);
        m_window.setFramerateLimit(60);

        m_painter.update(cols, rows, CELL_SIZE);
        place_glider(m_grid);
    }

    void run() {
        sf::Clock clk;
        while (m_window.isOpen()) {
            pull_events();

            m_delta_acc += clk.restart();
            while (m_delta_acc > GENERATION_STEP) {
                if (!m_paused)
                    advance();
                m_delta_acc -= GENERATION_STEP;
            }

            render();
        }
    }

private:
    sf::RenderWindow &m_window;
    LifeGrid m_grid;
    RenderBuffer m_buffer;
    GridPainter m_painter;
    sf::View m_view;

    sf::Time m_delta_acc;
    bool m_paused = false;
    std::size_t m_generation = 0;
    uint32_t m_seed = 1;

    void advance() {
        next_generation(m_grid);
        ++m_generation;
    }

    //canonical offset of the cell under the mouse
    bool hovered(std::size_t &offset) const {
        V2f pos = m_window.mapPixelToCoords(sf::Mouse::getPosition(m_window));
        if (pos.x < 0.f || pos.y < 0.f)
            return false;
        std::size_t col = static_cast<std::size_t>(pos.x / CELL_SIZE),
                    row = static_cast<std::size_t>(pos.y / CELL_SIZE);
        if (col >= m_grid.columns() || row >= m_grid.rows())
            return false;
        offset = row * m_grid.columns() + col;
        return true;
    }

    void toggle(std::size_t offset) {
        LifeStage &s = m_grid.at(offset);
        s = s == LifeStage::Alive ? LifeStage::Dead : LifeStage::Alive;
    }

    void pull_events() {
        sf::Event event;
        while (m_window.pollEvent(event)) {
            if (event.type == sf::Event::Closed) {
                m_window.close();
            } else if (event.type == sf::Event::MouseButtonPressed
                    && event.mouseButton.button == sf::Mouse::Left) {
                std::size_t offset;
                if (hovered(offset))
                    toggle(offset);
            } else if (event.type == sf::Event::KeyPressed) {
                switch (event.key.code) {
                case sf::Keyboard::Escape:
                    m_window.close();
                    break;
                case sf::Keyboard::Enter:
                    m_painter.set_lines_visible(!m_painter.lines_visible());
                    break;
                case sf::Keyboard::Space:
                    m_paused = !m_paused;
                    spdlog::info("{} at generation {}", m_paused ? "paused" : "running", m_generation);
                    break;
                case sf::Keyboard::N:
                    if (m_paused)
                        advance();
                    break;
                case sf::Keyboard::R:
                    seed_soup(m_grid, SOUP_DENSITY, m_seed++);
                    m_generation = 0;
                    spdlog::info("reseeded, {} alive", count_alive(m_grid));
                    break;
                case sf::Keyboard::C:
                    std::fill(m_grid.begin(), m_grid.end(), LifeStage::Dead);
                    m_generation = 0;
                    break;
                default:
                    break;
                };
            }
        }
    }

    void select_around(std::size_t offset) {
        const std::size_t cols = m_grid.columns();

        if (Partitioner::valid_divisor(cols, m_grid.rows(), 2)) {
            Partitioner p(cols, m_grid.rows(), 2);
            m_painter.add_rect(p.region_bounds(p.region_of(offset)), sf::Color(0, 120, 255));
        }

        const Direction DIRS[] = {
            Direction::UpLeft, Direction::Up, Direction::UpRight, Direction::Left,
            Direction::Right, Direction::DownLeft, Direction::Down, Direction::DownRight,
        };
        for (Direction d: DIRS) {
            std::size_t n;
            if (m_grid.try_neighbor_offset(offset, d, n))
                m_painter.add_cell(n % cols, n / cols, sf::Color::Yellow);
        }
        m_painter.add_cell(offset % cols, offset / cols, sf::Color::Red);
    }

    void render() {
        m_window.setView(m_view);
        m_window.clear();

        m_buffer.paint(m_grid, ALIVE_COLOR, DEAD_COLOR);
        m_buffer.flush();
        sf::Sprite sp(m_buffer.get_texture());
        sp.setScale(CELL_SIZE, CELL_SIZE);
        m_window.draw(sp);

        std::string title = "life: generation " + std::to_string(m_generation)
            + ", " + std::to_string(count_alive(m_grid)) + " alive";

        m_painter.clear_selection();
        std::size_t offset;
        if (hovered(offset)) {
            select_around(offset);
            Coordinates c = m_grid.coord_of<Coordinates>(offset);
            title += ", cell (" + std::to_string(c.x) + ", " + std::to_string(c.y) + ")";
        }
        m_window.draw(m_painter);

        m_window.setTitle(title);
        m_window.display();
    }
};

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

//life_viewer [columns] [rows]
int main(int argc, char **argv) {
    configure_logging();

    std::size_t cols = size_arg(argc, argv, 1, 64),
                rows = size_arg(argc, argv, 2, 48);

    try {
        sf::RenderWindow window(sf::VideoMode(static_cast<unsigned>(cols * CELL_SIZE),
                    static_cast<unsigned>(rows * CELL_SIZE)), "life");
        LifeViewer viewer(window, cols, rows);
        spdlog::info("{}x{} board, {} px cells", cols, rows, CELL_SIZE);
        viewer.run();
    } catch (const GridError &e) {
        spdlog::error("can't show a {}x{} board: {}", cols, rows, e.what());
        return EXIT_FAILURE;
    } catch (const std::runtime_error &e) {
        spdlog::error("{}", e.what());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
