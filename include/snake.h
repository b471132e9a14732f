#pragma once

#include "board.h"
#include "snake_types.h"
#include <optional>
#include <random>
#include <vector>

// Result of one Snake::advance() call
struct MoveResult {
    Cell head;          // head after the move (board center after a reset)
    bool collided;      // true when the move ran into the body and reset the snake
};

// The player's snake: head-first body on a toroidal board.
//
// Invariants kept by every operation:
//  - body is never empty and body[0] is the head
//  - consecutive segments are wrap-aware neighbours
//  - body length never exceeds the growth target
class Snake : public Drawable {
public:
    // New snake: length 1 at the board center, heading RIGHT
    Snake(const Board& board, std::mt19937& rng);

    // Restore a snake from an explicit body (head first). The growth target is
    // the body length. Throws std::invalid_argument if the body is empty, leaves
    // the board, repeats a cell, has non-adjacent neighbours or heads back onto
    // its neck.
    Snake(const Board& board, std::mt19937& rng, std::vector<Cell> body, Direction direction);

    // Overwrites any direction still waiting for a commit
    void bufferDirection(Direction direction);

    // Once per tick, before advance(). A buffered 180 degree turn is dropped.
    void commitDirection();

    MoveResult advance();
    void grow();
    void reset();

    const std::vector<Cell>& getBody() const { return m_body; }
    Cell getHead() const { return m_body.front(); }
    int getLength() const { return static_cast<int>(m_body.size()); }
    int getGrowthTarget() const { return m_growthTarget; }
    Direction getDirection() const { return m_direction; }
    std::optional<Direction> getPendingDirection() const { return m_pendingDirection; }

    // Tail cell dropped by the latest advance(), if any
    std::optional<Cell> getLastRemoved() const { return m_lastRemoved; }

    std::vector<Cell> occupiedCells() const override { return m_body; }
    RGBColor color() const override;

private:
    const Board* m_board;
    std::mt19937* m_rng;

    std::vector<Cell> m_body;
    Direction m_direction = Direction::RIGHT;
    std::optional<Direction> m_pendingDirection;
    std::optional<Cell> m_lastRemoved;
    int m_growthTarget = 1;
};
