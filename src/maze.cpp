// maze.cpp
#include "maze.h"
#include "config.h"
#include "rng.h"
#include <algorithm>
#include <array>
#include <string>

Maze::Maze(int width, int height) : m_w(width), m_h(height) {
    if (width < 5 || height < 5 || (width % 2) == 0 || (height % 2) == 0)
        throw ConfigError("maze size must be odd and >= 5, got " +
            std::to_string(width) + "x" + std::to_string(height));
    m_grid.assign(size_t(m_w) * size_t(m_h), 1);
}

bool Maze::isWall(int x, int y) const {
    if (x < 0 || y < 0 || x >= m_w || y >= m_h) return true;
    return m_grid[size_t(y) * m_w + x] != 0;
}

void Maze::setWall(int x, int y, bool wall) {
    if (x < 0 || y < 0 || x >= m_w || y >= m_h) return;
    m_grid[size_t(y) * m_w + x] = wall ? 1 : 0;
}

void Maze::generate(RNG& rng) {
    std::fill(m_grid.begin(), m_grid.end(), uint8_t(1));

    // cells live on odd coordinates; step 2 and knock out the wall between
    static const std::array<Cell, 4> STEPS{ Cell(0,2), Cell(2,0), Cell(0,-2), Cell(-2,0) };
    auto inner = [&](int X, int Y) { return X > 0 && Y > 0 && X < m_w - 1 && Y < m_h - 1; };

    std::vector<Cell> stack;
    stack.push_back(Cell(1, 1));
    setWall(1, 1, false);

    std::vector<Cell> neighbors;
    neighbors.reserve(4);
    while (!stack.empty()) {
        Cell cur = stack.back();
        neighbors.clear();
        for (const Cell& s : STEPS) {
            int nx = cur.x + s.x, ny = cur.y + s.y;
            if (inner(nx, ny) && isWall(nx, ny)) neighbors.push_back(Cell(nx, ny));
        }
        if (neighbors.empty()) { stack.pop_back(); continue; }

        Cell next = neighbors[size_t(rng.randint(0, int(neighbors.size()) - 1))];
        setWall(cur.x + (next.x - cur.x) / 2, cur.y + (next.y - cur.y) / 2, false);
        setWall(next.x, next.y, false);
        stack.push_back(next);
    }

    // exit is always reachable
    setWall(m_w - 2, m_h - 2, false);
    setWall(m_w - 3, m_h - 2, false);
}

Cell Maze::findNearestOpen(int cx, int cy) const {
    int maxR = std::min(m_w, m_h) / 2;
    for (int r = 0; r < maxR; ++r) {
        for (int dx = -r; dx <= r; ++dx) {
            for (int dy = -r; dy <= r; ++dy) {
                if (isOpen(cx + dx, cy + dy)) return Cell(cx + dx, cy + dy);
            }
        }
    }
    return Cell(1, 1);
}
