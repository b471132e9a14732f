#pragma once

// Fundamental types for the snake game
// No SDL / OpenGL dependency here so the game core builds headless

#include <vector>

// One discrete grid position (column x, row y; row 0 is the top row)
struct Cell {
    int x, y;

    constexpr Cell(int x = 0, int y = 0) : x(x), y(y) {}

    constexpr bool operator==(const Cell &other) const {
        return x == other.x && y == other.y;
    }

    constexpr bool operator!=(const Cell &other) const {
        return !(*this == other);
    }
};

struct fx3 {
    union {
        struct { float x, y, z; };
        struct { float r, g, b; };
        float d[3];
    };

    constexpr fx3(float x = 0.0f, float y = 0.0f, float z = 0.0f) : x(x), y(y), z(z) {}

    fx3(const fx3&) = default;
    fx3& operator=(const fx3&) = default;

    inline bool operator==(const fx3 &other) const {
        return x == other.x && y == other.y && z == other.z;
    }
};

// RGB Color structure (inherits from fx3), components in [0, 1]
struct RGBColor : fx3 {
    constexpr RGBColor(float red = 0.f, float green = 0.f, float blue = 0.f) : fx3(red, green, blue) {}
};

// Movement directions. Y grows downward, so UP is (0, -1).
enum class Direction {
    UP = 0,
    DOWN,
    LEFT,
    RIGHT
};

constexpr Cell directionVector(Direction d) {
    return d == Direction::UP    ? Cell(0, -1) :
           d == Direction::DOWN  ? Cell(0, 1)  :
           d == Direction::LEFT  ? Cell(-1, 0) :
           d == Direction::RIGHT ? Cell(1, 0)  : Cell(0, 0);
}

constexpr Direction opposite(Direction d) {
    return d == Direction::UP    ? Direction::DOWN  :
           d == Direction::DOWN  ? Direction::UP    :
           d == Direction::LEFT  ? Direction::RIGHT : Direction::LEFT;
}

const char* directionName(Direction d);

// Anything the renderer can put on the board: a set of cells in one color
class Drawable {
public:
    virtual ~Drawable() = default;
    virtual std::vector<Cell> occupiedCells() const = 0;
    virtual RGBColor color() const = 0;
};
