#pragma once

#include "board.h"
#include "food.h"
#include "snake.h"
#include "snake_types.h"
#include <random>
#include <vector>

// ===== COLLABORATOR INTERFACES =====
// The game core only talks to the platform through these three seams,
// so it runs the same against SDL or against test doubles.

enum class InputType {
    DIRECTION = 0,
    QUIT
};

struct InputEvent {
    InputType type = InputType::DIRECTION;
    Direction direction = Direction::RIGHT;   // meaningful for DIRECTION only

    static InputEvent turn(Direction d) { return InputEvent{InputType::DIRECTION, d}; }
    static InputEvent quit() { return InputEvent{InputType::QUIT, Direction::RIGHT}; }
};

class InputSource {
public:
    virtual ~InputSource() = default;
    // Everything that arrived since the previous call, oldest first
    virtual std::vector<InputEvent> drainEvents() = 0;
};

class RenderSink {
public:
    virtual ~RenderSink() = default;
    // Called once per tick; later drawables are painted over earlier ones
    virtual void draw(const std::vector<const Drawable*>& drawables) = 0;
};

class TickPacer {
public:
    virtual ~TickPacer() = default;
    // Blocks until the next tick boundary
    virtual void waitForNextTick() = 0;
};

// What happened during one tick
struct TickReport {
    bool quit = false;      // QUIT seen; nothing moved or rendered
    bool reset = false;     // self-collision restarted the snake
    bool ate = false;       // head reached the food
};

// ===== GAME DRIVER =====

class SnakeGame {
public:
    SnakeGame(int gridWidth, int gridHeight, unsigned int seed);

    // Non-copyable: snake and food hold references into this object
    SnakeGame(const SnakeGame&) = delete;
    SnakeGame& operator=(const SnakeGame&) = delete;

    // Input, direction commit, move and food check, without collaborators
    TickReport step(const std::vector<InputEvent>& events);

    // One full tick: drain input, step, render, wait
    TickReport tick(InputSource& input, RenderSink& renderer, TickPacer& pacer);

    // Ticks until QUIT; returns the number of ticks that were played
    long run(InputSource& input, RenderSink& renderer, TickPacer& pacer);

    // Replace the snake with an explicit body (see Snake's restoring constructor)
    void restoreSnake(std::vector<Cell> body, Direction direction);

    // Per-tick console messages (resets, food)
    void setVerbose(bool verbose) { m_verbose = verbose; }

    const Board& getBoard() const { return m_board; }
    Snake& getSnake() { return m_snake; }
    const Snake& getSnake() const { return m_snake; }
    Food& getFood() { return m_food; }
    const Food& getFood() const { return m_food; }

private:
    Board m_board;
    std::mt19937 m_rng;
    Snake m_snake;
    Food m_food;
    bool m_verbose = false;
};
