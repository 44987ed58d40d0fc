// pathfind.cpp
#include "pathfind.h"
#include "maze.h"
#include <cstdlib>
#include <queue>
#include <vector>

std::optional<Direction> nextStepToward(const Maze& maze, const Cell& from, const Cell& to) {
    if (from == to || !maze.isOpen(to) || !maze.isOpen(from)) return std::nullopt;

    const int W = maze.width(), H = maze.height();
    auto index = [W](const Cell& c) { return size_t(c.y) * size_t(W) + size_t(c.x); };

    // BFS from the target back toward the source; the first step out of
    // `from` is then whichever neighbor sits one layer closer to `to`.
    std::vector<int> dist(size_t(W) * size_t(H), -1);
    std::queue<Cell> q;
    dist[index(to)] = 0;
    q.push(to);
    while (!q.empty()) {
        Cell c = q.front();
        q.pop();
        if (c == from) break;
        for (Direction d : ALL_DIRS) {
            Cell n = step(c, d);
            if (!maze.isOpen(n) || dist[index(n)] >= 0) continue;
            dist[index(n)] = dist[index(c)] + 1;
            q.push(n);
        }
    }

    int here = dist[index(from)];
    if (here < 0) return std::nullopt;
    for (Direction d : ALL_DIRS) {
        Cell n = step(from, d);
        if (maze.isOpen(n) && dist[index(n)] == here - 1) return d;
    }
    return std::nullopt;
}

std::optional<Direction> greedyStep(const Maze& maze, const Cell& from, const Cell& to) {
    int dx = to.x - from.x, dy = to.y - from.y;
    Direction h = dx > 0 ? Direction::Right : Direction::Left;
    Direction v = dy > 0 ? Direction::Down : Direction::Up;

    Direction order[2];
    if (std::abs(dx) > std::abs(dy)) { order[0] = h; order[1] = v; }
    else { order[0] = v; order[1] = h; }

    for (Direction d : order) {
        if (maze.isOpen(step(from, d))) return d;
    }
    return std::nullopt;
}
