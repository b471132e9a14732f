#pragma once

#include <optional>
#include <string>

// Configuration structure. Defaults reproduce the classic 640x480 board
// of 20 px cells running at 20 ticks per second.
struct AppConfig {
    bool fullscreen = false;
    int windowWidth = 640;
    int windowHeight = 480;
    int cellSize = 20;
    int ticksPerSecond = 20;
    std::optional<unsigned int> seed;   // random_device when unset
    std::string shaderDir = "shaders";
    const char* windowTitle = "The Snake";

    // Board dimensions in cells
    int gridWidth() const { return windowWidth / cellSize; }
    int gridHeight() const { return windowHeight / cellSize; }
};

enum class ParseResult {
    OK = 0,
    HELP,       // usage printed, nothing to run
    ERROR       // message already written to std::cerr
};

ParseResult parseCommandLine(int argc, char* argv[], AppConfig& config);

void printUsage(const char* program);
