// cell.h
#pragma once

struct Cell {
    int x = 0, y = 0;
    Cell() = default; Cell(int X, int Y) :x(X), y(Y) {}
    bool operator==(const Cell& o) const { return x == o.x && y == o.y; }
    bool operator!=(const Cell& o) const { return !(*this == o); }
};

inline int manhattan(const Cell& a, const Cell& b) {
    int dx = a.x - b.x, dy = a.y - b.y;
    return (dx < 0 ? -dx : dx) + (dy < 0 ? -dy : dy);
}
