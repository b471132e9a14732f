#include "snake_draw.h"
#include "snake_dep.h"

namespace SnakeDraw {

void clearBoard(const RGBColor& color) {
    glClearColor(color.r, color.g, color.b, 1.0f);
    glClear(GL_COLOR_BUFFER_BIT);
}

void drawSquare(int x, int y, const RGBColor& color, const DrawContext& ctx) {
    float cellWidth = 2.0f / ctx.gridWidth;
    float cellHeight = 2.0f / ctx.gridHeight;
    float ndcX = (x * cellWidth) - 1.0f;
    // Rows count down from the top, NDC counts up from the bottom
    float ndcY = 1.0f - ((y + 1) * cellHeight);

    glUniform2f(ctx.u_offset, ndcX, ndcY);
    glUniform2f(ctx.u_scale, cellWidth, cellHeight);
    glUniform3f(ctx.u_color, color.r, color.g, color.b);
    glDrawElements(GL_TRIANGLES, 6, GL_UNSIGNED_INT, 0);
}

void drawCells(const Drawable& drawable, const DrawContext& ctx) {
    RGBColor color = drawable.color();
    for (const Cell& cell : drawable.occupiedCells()) {
        drawSquare(cell.x, cell.y, color, ctx);
    }
}

} // namespace SnakeDraw
