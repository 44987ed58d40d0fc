// maze.h
// Grid maze carved with a randomized depth-first backtracker.
#pragma once
#include "cell.h"
#include <cstdint>
#include <vector>

struct RNG;

class Maze {
public:
    // width/height must be odd and >= 5, throws ConfigError otherwise.
    // Starts as solid wall; call generate() to carve.
    Maze(int width, int height);

    void generate(RNG& rng);

    int width() const { return m_w; }
    int height() const { return m_h; }

    // Outside the grid counts as wall.
    bool isWall(int x, int y) const;
    bool isOpen(int x, int y) const { return !isWall(x, y); }
    bool isOpen(const Cell& c) const { return !isWall(c.x, c.y); }

    Cell exitCell() const { return Cell(m_w - 2, m_h - 2); }

    // First open cell found scanning square rings outward from (cx,cy).
    Cell findNearestOpen(int cx, int cy) const;

    // Test hook: force a cell open or closed.
    void setWall(int x, int y, bool wall);

private:
    int m_w, m_h;
    std::vector<uint8_t> m_grid; // 1 = wall, 0 = open; row-major
};
