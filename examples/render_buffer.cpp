#include "render_buffer.hpp"
#include <stdexcept>

RenderBuffer::RenderBuffer(unsigned width, unsigned height) {
    if (!m_texture.create(width, height))
        throw std::runtime_error("can't create a render texture");
    m_pixels.assign(static_cast<std::size_t>(width) * height, sf::Color::Black);
}

void RenderBuffer::paint(const LifeGrid &grid, const sf::Color &alive, const sf::Color &dead) {
    std::size_t i = 0;
    for (LifeStage s: grid) {
        if (i >= m_pixels.size())
            break;
        m_pixels[i++] = s == LifeStage::Alive ? alive : dead;
    }
}

void RenderBuffer::flush() {
    m_texture.update(reinterpret_cast<const sf::Uint8*>(m_pixels.data()));
}

const sf::Texture& RenderBuffer::get_texture() const {
    return m_texture;
}
