// direction.h
#pragma once
#include "cell.h"
#include <array>

enum class Direction { Up, Down, Left, Right };

static const std::array<Direction, 4> ALL_DIRS{ Direction::Up, Direction::Down, Direction::Left, Direction::Right };

inline Cell delta(Direction d) {
    switch (d) {
    case Direction::Up:    return Cell(0, -1);
    case Direction::Down:  return Cell(0, 1);
    case Direction::Left:  return Cell(-1, 0);
    case Direction::Right: return Cell(1, 0);
    }
    return Cell(0, 0);
}

inline Cell step(const Cell& c, Direction d) {
    Cell v = delta(d);
    return Cell(c.x + v.x, c.y + v.y);
}
