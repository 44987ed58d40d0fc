#include "config.h"
#include "maze.h"
#include "rng.h"

#include <gtest/gtest.h>
#include <queue>
#include <vector>

namespace {

Maze generated(uint64_t seed, int w = 35, int h = 25) {
    RNG rng(seed);
    Maze m(w, h);
    m.generate(rng);
    return m;
}

int countOpen(const Maze& m) {
    int n = 0;
    for (int y = 0; y < m.height(); ++y)
        for (int x = 0; x < m.width(); ++x)
            if (m.isOpen(x, y)) ++n;
    return n;
}

int countReachable(const Maze& m, const Cell& from) {
    std::vector<bool> seen(size_t(m.width() * m.height()), false);
    std::queue<Cell> q;
    q.push(from);
    seen[size_t(from.y * m.width() + from.x)] = true;
    int n = 0;
    const Cell steps[4] = { Cell(0,-1), Cell(0,1), Cell(-1,0), Cell(1,0) };
    while (!q.empty()) {
        Cell c = q.front();
        q.pop();
        ++n;
        for (const Cell& s : steps) {
            Cell nb(c.x + s.x, c.y + s.y);
            if (!m.isOpen(nb)) continue;
            size_t i = size_t(nb.y * m.width() + nb.x);
            if (seen[i]) continue;
            seen[i] = true;
            q.push(nb);
        }
    }
    return n;
}

} // namespace

TEST(Maze, NewMazeIsSolidWall) {
    Maze m(7, 5);
    EXPECT_EQ(countOpen(m), 0);
}

TEST(Maze, RejectsEvenOrTinyDimensions) {
    EXPECT_THROW(Maze(34, 25), ConfigError);
    EXPECT_THROW(Maze(35, 24), ConfigError);
    EXPECT_THROW(Maze(3, 25), ConfigError);
    EXPECT_NO_THROW(Maze(5, 5));
}

TEST(Maze, OutsideGridIsWall) {
    Maze m = generated(1);
    EXPECT_TRUE(m.isWall(-1, 1));
    EXPECT_TRUE(m.isWall(1, -1));
    EXPECT_TRUE(m.isWall(m.width(), 1));
    EXPECT_TRUE(m.isWall(1, m.height()));
}

TEST(Maze, BorderStaysWall) {
    Maze m = generated(2);
    for (int x = 0; x < m.width(); ++x) {
        EXPECT_TRUE(m.isWall(x, 0));
        EXPECT_TRUE(m.isWall(x, m.height() - 1));
    }
    for (int y = 0; y < m.height(); ++y) {
        EXPECT_TRUE(m.isWall(0, y));
        EXPECT_TRUE(m.isWall(m.width() - 1, y));
    }
}

TEST(Maze, EveryCellOnOddCoordinatesIsCarved) {
    Maze m = generated(3);
    for (int y = 1; y < m.height() - 1; y += 2)
        for (int x = 1; x < m.width() - 1; x += 2)
            EXPECT_TRUE(m.isOpen(x, y)) << x << "," << y;
}

TEST(Maze, AllOpenCellsAreConnected) {
    for (uint64_t seed : { 4u, 5u, 6u }) {
        Maze m = generated(seed);
        EXPECT_EQ(countReachable(m, Cell(1, 1)), countOpen(m)) << "seed " << seed;
    }
}

TEST(Maze, ExitAndApproachAreOpen) {
    Maze m = generated(7, 11, 9);
    EXPECT_EQ(m.exitCell(), Cell(9, 7));
    EXPECT_TRUE(m.isOpen(9, 7));
    EXPECT_TRUE(m.isOpen(8, 7));
}

TEST(Maze, SameSeedSameLayout) {
    Maze a = generated(99);
    Maze b = generated(99);
    for (int y = 0; y < a.height(); ++y)
        for (int x = 0; x < a.width(); ++x)
            ASSERT_EQ(a.isWall(x, y), b.isWall(x, y)) << x << "," << y;
}

TEST(Maze, RegenerateResetsPreviousLayout) {
    RNG rng(8);
    Maze m(9, 9);
    m.generate(rng);
    m.setWall(2, 2, false);
    m.generate(rng);
    EXPECT_EQ(countReachable(m, Cell(1, 1)), countOpen(m));
}

TEST(Maze, NearestOpenScansOutward) {
    Maze m(7, 7);
    m.setWall(4, 3, false);
    EXPECT_EQ(m.findNearestOpen(3, 3), Cell(4, 3));

    m.setWall(3, 3, false);
    EXPECT_EQ(m.findNearestOpen(3, 3), Cell(3, 3));
}

TEST(Maze, NearestOpenPrefersLowerDxWithinRing) {
    Maze m(7, 7);
    m.setWall(4, 3, false);
    m.setWall(2, 4, false);
    // same ring: dx = -1 is scanned before dx = +1
    EXPECT_EQ(m.findNearestOpen(3, 3), Cell(2, 4));
}

TEST(Maze, NearestOpenFallsBackToStart) {
    Maze m(7, 7);
    EXPECT_EQ(m.findNearestOpen(3, 3), Cell(1, 1));
}
