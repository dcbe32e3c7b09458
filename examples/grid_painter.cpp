#include "grid_painter.hpp"
#include <SFML/Graphics/RenderTarget.hpp>

using V2f = sf::Vector2f;

void GridPainter::update(std::size_t cols, std::size_t rows, float cell_size,
        const sf::Color &color)
{
    m_cols = cols;
    m_rows = rows;
    m_cell_size = cell_size;

    float width = m_cols * m_cell_size, height = m_rows * m_cell_size;
    m_lines.clear();
    for (std::size_t i = 0; i <= m_cols; ++i) {
        m_lines.emplace_back(V2f(i * m_cell_size, 0.f), color);
        m_lines.emplace_back(V2f(i * m_cell_size, height), color);
    }
    for (std::size_t j = 0; j <= m_rows; ++j) {
        m_lines.emplace_back(V2f(0.f, j * m_cell_size), color);
        m_lines.emplace_back(V2f(width, j * m_cell_size), color);
    }
}

void GridPainter::clear_selection() {
    m_selected.clear();
}

void GridPainter::add_cell(std::size_t col, std::size_t row, const sf::Color &color) {
    add_rect(neighborgrid::Rect<std::size_t>::from_extent(col, row, 1, 1), color);
}

void GridPainter::add_rect(const neighborgrid::Rect<std::size_t> &r, const sf::Color &color) {
    if (r.is_empty())
        return;
    outline(r.left * m_cell_size, r.top * m_cell_size,
            r.right * m_cell_size, r.bottom * m_cell_size, color);
}

void GridPainter::outline(float left, float top, float right, float bottom,
        const sf::Color &color)
{
    m_selected.emplace_back(V2f(left, top), color);
    m_selected.emplace_back(V2f(right, top), color);

    m_selected.emplace_back(V2f(right, top), color);
    m_selected.emplace_back(V2f(right, bottom), color);

    m_selected.emplace_back(V2f(right, bottom), color);
    m_selected.emplace_back(V2f(left, bottom), color);

    m_selected.emplace_back(V2f(left, bottom), color);
    m_selected.emplace_back(V2f(left, top), color);
}

void GridPainter::draw(sf::RenderTarget &target, sf::RenderStates states) const {
    if (m_show_lines)
        target.draw(m_lines.data(), m_lines.size(), sf::Lines, states);
    target.draw(m_selected.data(), m_selected.size(), sf::Lines, states);
}
