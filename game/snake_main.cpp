//
// The Snake - SDL2 / OpenGL front end
// Wires the platform collaborators from SnakeApp into the SnakeGame driver
//

#include "app_config.h"
#include "snake_app.h"
#include "snake_game.h"
#include <iostream>
#include <memory>
#include <random>

int main(int argc, char* argv[]) {
    std::cout << "🐍 The Snake" << std::endl;
    std::cout << "==========================================" << std::endl;

    AppConfig config;
    switch (parseCommandLine(argc, argv, config)) {
        case ParseResult::HELP:
            return 0;
        case ParseResult::ERROR:
            printUsage(argv[0]);
            return 1;
        case ParseResult::OK:
            break;
    }

    unsigned int seed = config.seed ? *config.seed : std::random_device{}();

    std::cout << "Grid: " << config.gridWidth() << "x" << config.gridHeight()
              << " cells of " << config.cellSize << " px" << std::endl;
    std::cout << "Speed: " << config.ticksPerSecond << " ticks/s, seed " << seed << std::endl;

    // Create and initialize app infrastructure
    auto app = std::make_unique<SnakeApp>();
    if (!app->initialize(config)) {
        std::cerr << "❌ Failed to initialize app infrastructure" << std::endl;
        return 1;
    }

    SnakeGame game(config.gridWidth(), config.gridHeight(), seed);
    game.setVerbose(true);

    std::cout << "\n🎮 Controls: Arrow Keys/WASD, Esc=Quit" << std::endl;
    std::cout << "==========================================\n" << std::endl;

    long ticks = game.run(app->input(), app->renderer(), app->pacer());
    std::cout << "Played " << ticks << " ticks" << std::endl;

    app->shutdown();

    std::cout << "👋 Thanks for playing!" << std::endl;
    return 0;
}
