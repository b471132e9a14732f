#include "snake.h"
#include "snake_theme.h"
#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

const char* directionName(Direction d) {
    switch (d) {
        case Direction::UP:    return "UP";
        case Direction::DOWN:  return "DOWN";
        case Direction::LEFT:  return "LEFT";
        case Direction::RIGHT: return "RIGHT";
        default:               return "?";
    }
}

Snake::Snake(const Board& board, std::mt19937& rng)
    : m_board(&board), m_rng(&rng) {
    m_body.push_back(m_board->center());
}

Snake::Snake(const Board& board, std::mt19937& rng, std::vector<Cell> body, Direction direction)
    : m_board(&board), m_rng(&rng), m_body(std::move(body)), m_direction(direction) {
    if (m_body.empty()) {
        throw std::invalid_argument("Snake body must hold at least the head");
    }
    for (size_t i = 0; i < m_body.size(); i++) {
        if (!m_board->contains(m_body[i])) {
            throw std::invalid_argument("Snake segment outside the board");
        }
        if (std::find(m_body.begin() + i + 1, m_body.end(), m_body[i]) != m_body.end()) {
            throw std::invalid_argument("Snake body occupies a cell twice");
        }
        if (i > 0 && !m_board->areAdjacent(m_body[i - 1], m_body[i])) {
            throw std::invalid_argument("Snake segments must be neighbours");
        }
    }
    // The transition rule never points the head back onto the neck
    if (m_body.size() > 1 && m_board->step(m_body[0], m_direction) == m_body[1]) {
        throw std::invalid_argument(std::string("Snake heading ") + directionName(m_direction) +
                                    " would move onto its own neck");
    }
    m_growthTarget = getLength();
}

void Snake::bufferDirection(Direction direction) {
    m_pendingDirection = direction;
}

void Snake::commitDirection() {
    if (!m_pendingDirection) return;

    Direction next = *m_pendingDirection;
    m_pendingDirection.reset();

    // Turning back onto the neck would be an instant self-collision
    if (next == opposite(m_direction)) return;

    m_direction = next;
}

MoveResult Snake::advance() {
    Cell newHead = m_board->step(getHead(), m_direction);

    // Skip head and neck: the neck always touches the new head
    if (m_body.size() > 2 &&
        std::find(m_body.begin() + 2, m_body.end(), newHead) != m_body.end()) {
        reset();
        return MoveResult{getHead(), true};
    }

    m_body.insert(m_body.begin(), newHead);

    if (getLength() > m_growthTarget) {
        m_lastRemoved = m_body.back();
        m_body.pop_back();
    } else {
        m_lastRemoved.reset();
    }

    return MoveResult{newHead, false};
}

void Snake::grow() {
    m_growthTarget++;
}

void Snake::reset() {
    static const Direction kStartDirections[] = {
        Direction::UP, Direction::DOWN, Direction::LEFT, Direction::RIGHT
    };
    std::uniform_int_distribution<int> pick(0, 3);

    m_body.assign(1, m_board->center());
    m_growthTarget = 1;
    m_pendingDirection.reset();
    m_lastRemoved.reset();
    m_direction = kStartDirections[pick(*m_rng)];
}

RGBColor Snake::color() const {
    return SnakeTheme::GameColors::SNAKE;
}
