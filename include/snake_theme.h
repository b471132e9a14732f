#pragma once

#include "snake_types.h"

// ===== SNAKE GAME COLOR THEME =====
// Centralized color definitions for consistency across the snake game

namespace SnakeTheme {

// Basic color palette
namespace Colors {
    constexpr RGBColor RED(1.0f, 0.0f, 0.0f);
    constexpr RGBColor GREEN(0.0f, 1.0f, 0.0f);
    constexpr RGBColor BLACK(0.0f, 0.0f, 0.0f);
}

// Game entity colors
namespace GameColors {
    constexpr RGBColor BOARD_BACKGROUND = Colors::BLACK;
    constexpr RGBColor SNAKE = Colors::GREEN;
    constexpr RGBColor FOOD = Colors::RED;    // the apple
}

} // namespace SnakeTheme
