#pragma once

#include "app_config.h"
#include "snake_game.h"
#include <memory>

// ===== SNAKE APP HEADER =====
// SDL2 window + OpenGL context hosting the game.
// Implementation details are in snake_app.cpp

class SnakeApp {
public:
    SnakeApp();
    ~SnakeApp();

    // Non-copyable
    SnakeApp(const SnakeApp&) = delete;
    SnakeApp& operator=(const SnakeApp&) = delete;

    // Core lifecycle. initialize() logs the reason and returns false on failure.
    bool initialize(const AppConfig& config);
    void shutdown();

    // Collaborators for SnakeGame::tick(); valid between initialize() and shutdown()
    InputSource& input();
    RenderSink& renderer();
    TickPacer& pacer();

private:
    // PIMPL pattern - all implementation details are hidden
    class Impl;
    std::unique_ptr<Impl> m_impl;
};
