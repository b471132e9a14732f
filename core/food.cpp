#include "food.h"
#include "snake_theme.h"
#include <stdexcept>

Food::Food(const Board& board, std::mt19937& rng) : m_board(&board), m_rng(&rng) {
    relocatePosition();
}

void Food::relocatePosition() {
    std::uniform_int_distribution<> disX(0, m_board->getWidth() - 1);
    std::uniform_int_distribution<> disY(0, m_board->getHeight() - 1);

    int x = disX(*m_rng);
    int y = disY(*m_rng);
    m_position = Cell(x, y);
}

void Food::placeAt(const Cell& cell) {
    if (!m_board->contains(cell)) {
        throw std::out_of_range("Food cell outside the board");
    }
    m_position = cell;
}

RGBColor Food::color() const {
    return SnakeTheme::GameColors::FOOD;
}
