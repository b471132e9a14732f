#pragma once

#include "board.h"
#include "snake_types.h"
#include <random>
#include <vector>

// The apple. Placement ignores the snake, so it may land under the body.
class Food : public Drawable {
public:
    // Starts on a uniformly random cell
    Food(const Board& board, std::mt19937& rng);

    void relocatePosition();

    // Deterministic placement; throws std::out_of_range for a cell off the board
    void placeAt(const Cell& cell);

    Cell getPosition() const { return m_position; }

    std::vector<Cell> occupiedCells() const override { return {m_position}; }
    RGBColor color() const override;

private:
    const Board* m_board;
    std::mt19937* m_rng;
    Cell m_position;
};
