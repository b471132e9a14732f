#pragma once

#include "snake_types.h"

// Wrap a coordinate onto [0, axisLength). Works for any int, negative included.
int wrapCoordinate(int coordinate, int axisLength);

// Below three cells an axis folds onto itself: stepping lands on the head or the neck
constexpr int kMinBoardCells = 3;

// Toroidal cell space: leaving one edge re-enters at the opposite edge
class Board {
public:
    // Throws std::invalid_argument unless both dimensions are >= kMinBoardCells
    Board(int width, int height);

    int getWidth() const { return m_width; }
    int getHeight() const { return m_height; }

    Cell center() const { return Cell(m_width / 2, m_height / 2); }
    bool contains(const Cell& cell) const;

    Cell wrap(const Cell& cell) const;
    Cell step(const Cell& from, Direction direction) const;

    // Manhattan distance of exactly one cell, counting the wrap seam
    bool areAdjacent(const Cell& a, const Cell& b) const;

private:
    int m_width;
    int m_height;
};
