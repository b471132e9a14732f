#pragma once

#include "snake_dep.h"

namespace SnakeDraw {

// Drawing context structure that holds OpenGL uniform locations and grid dimensions
struct DrawContext {
    // Grid dimensions
    int gridWidth;
    int gridHeight;

    // OpenGL uniform locations
    GLint u_offset;
    GLint u_color;
    GLint u_scale;

    DrawContext(int gw, int gh, GLint offset, GLint color, GLint scale)
        : gridWidth(gw), gridHeight(gh), u_offset(offset), u_color(color), u_scale(scale) {}
};

// Fill the whole viewport with one color
void clearBoard(const RGBColor& color);

// One grid cell; cell (0, 0) is the top-left corner of the window
void drawSquare(int x, int y, const RGBColor& color, const DrawContext& ctx);

// Every cell a drawable occupies, in its own color
void drawCells(const Drawable& drawable, const DrawContext& ctx);

} // namespace SnakeDraw
