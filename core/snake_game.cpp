#include "snake_game.h"
#include <iostream>
#include <utility>

SnakeGame::SnakeGame(int gridWidth, int gridHeight, unsigned int seed)
    : m_board(gridWidth, gridHeight),
      m_rng(seed),
      m_snake(m_board, m_rng),
      m_food(m_board, m_rng) {}

void SnakeGame::restoreSnake(std::vector<Cell> body, Direction direction) {
    m_snake = Snake(m_board, m_rng, std::move(body), direction);
}

TickReport SnakeGame::step(const std::vector<InputEvent>& events) {
    TickReport report;

    for (const auto& event : events) {
        if (event.type == InputType::QUIT) {
            report.quit = true;
            return report;
        }
        m_snake.bufferDirection(event.direction);
    }

    m_snake.commitDirection();

    MoveResult move = m_snake.advance();
    if (move.collided) {
        report.reset = true;
        if (m_verbose) {
            std::cout << "🔴 Snake ran into itself, restarting heading "
                      << directionName(m_snake.getDirection()) << std::endl;
        }
        return report;
    }

    if (move.head == m_food.getPosition()) {
        report.ate = true;
        m_snake.grow();
        m_food.relocatePosition();
        if (m_verbose) {
            std::cout << "🍎 Food eaten! Target length: " << m_snake.getGrowthTarget()
                      << ", next food at (" << m_food.getPosition().x << ","
                      << m_food.getPosition().y << ")" << std::endl;
        }
    }

    return report;
}

TickReport SnakeGame::tick(InputSource& input, RenderSink& renderer, TickPacer& pacer) {
    TickReport report = step(input.drainEvents());
    if (report.quit) return report;

    // Food goes on top so it stays visible when it spawns under the body
    renderer.draw({&m_snake, &m_food});
    pacer.waitForNextTick();
    return report;
}

long SnakeGame::run(InputSource& input, RenderSink& renderer, TickPacer& pacer) {
    long ticks = 0;
    while (!tick(input, renderer, pacer).quit) {
        ticks++;
    }
    return ticks;
}
