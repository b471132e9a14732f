#include "board.h"
#include <stdexcept>
#include <string>

int wrapCoordinate(int coordinate, int axisLength) {
    int wrapped = coordinate % axisLength;
    return wrapped < 0 ? wrapped + axisLength : wrapped;
}

Board::Board(int width, int height) : m_width(width), m_height(height) {
    if (width < kMinBoardCells || height < kMinBoardCells) {
        throw std::invalid_argument("Board needs at least " + std::to_string(kMinBoardCells) +
                                    " cells per axis, got " +
                                    std::to_string(width) + "x" + std::to_string(height));
    }
}

bool Board::contains(const Cell& cell) const {
    return cell.x >= 0 && cell.x < m_width && cell.y >= 0 && cell.y < m_height;
}

Cell Board::wrap(const Cell& cell) const {
    return Cell(wrapCoordinate(cell.x, m_width), wrapCoordinate(cell.y, m_height));
}

Cell Board::step(const Cell& from, Direction direction) const {
    Cell delta = directionVector(direction);
    return wrap(Cell(from.x + delta.x, from.y + delta.y));
}

bool Board::areAdjacent(const Cell& a, const Cell& b) const {
    int dx = wrapCoordinate(a.x - b.x, m_width);
    int dy = wrapCoordinate(a.y - b.y, m_height);
    // Shorter way around the seam
    if (m_width - dx < dx) dx = m_width - dx;
    if (m_height - dy < dy) dy = m_height - dy;
    return dx + dy == 1;
}
