#ifndef NEIGHBORGRID_EXAMPLES_RENDER_BUFFER_HPP
#define NEIGHBORGRID_EXAMPLES_RENDER_BUFFER_HPP

#include <vector>
#include <SFML/Graphics/Color.hpp>
#include <SFML/Graphics/Texture.hpp>
#include <SFML/System/NonCopyable.hpp>
#include "life.hpp"

//One texel per cell, in storage order; scale the sprite to get cell sized squares.
class RenderBuffer : public sf::NonCopyable {
public:
    //throws std::runtime_error if the texture can't be created
    RenderBuffer(unsigned width, unsigned height);

    void paint(const LifeGrid &grid, const sf::Color &alive, const sf::Color &dead);
    void flush();
    const sf::Texture& get_texture() const;

private:
    sf::Texture m_texture;
    std::vector<sf::Color> m_pixels;
};

#endif
