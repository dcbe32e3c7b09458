#ifndef NEIGHBORGRID_EXAMPLES_GRID_PAINTER_HPP
#define NEIGHBORGRID_EXAMPLES_GRID_PAINTER_HPP

#include <SFML/Graphics/Color.hpp>
#include <SFML/Graphics/Drawable.hpp>
#include <SFML/Graphics/Vertex.hpp>
#include <vector>
#include "neighborgrid/rect.hpp"

//Cell lines of a cols x rows board plus outlined selections.
//All positions are canonical (column, row).
class GridPainter : public sf::Drawable {
public:
    GridPainter() = default;

    void update(std::size_t cols, std::size_t rows, float cell_size,
            const sf::Color &color = sf::Color(40, 40, 40));

    void set_lines_visible(bool visible) { m_show_lines = visible; }
    bool lines_visible() const { return m_show_lines; }

    void clear_selection();
    void add_cell(std::size_t col, std::size_t row, const sf::Color &color = sf::Color::Red);
    void add_rect(const neighborgrid::Rect<std::size_t> &r, const sf::Color &color);

private:
    std::vector<sf::Vertex> m_lines;
    std::vector<sf::Vertex> m_selected;
    std::size_t m_cols = 0, m_rows = 0;
    float m_cell_size = 0.f;
    bool m_show_lines = true;

    void outline(float left, float top, float right, float bottom, const sf::Color &color);

    virtual void draw(sf::RenderTarget &target, sf::RenderStates states) const override;
};

#endif
