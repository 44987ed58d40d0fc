// entities.h
// Player, adversaries, lasers and explosions. All positions are maze cells;
// lasers travel in fractional cells. Timers count frames.
#pragma once
#include "config.h"
#include "direction.h"
#include "maze.h"
#include <deque>
#include <optional>

struct Laser {
    float x = 0, y = 0;
    float vx = 0, vy = 0;
    bool active = true;
    std::deque<Cell> trail;     // oldest first
    int maxTrail = 8;

    Laser() = default;
    Laser(const Cell& origin, Direction d, float speed, int trailLen);

    // Records the trail, advances, and deactivates on hitting a wall.
    void update(const Maze& maze);
    Cell cell() const { return Cell(int(x), int(y)); }
};

struct Player {
    Cell p;
    Direction gun = Direction::Right;   // independent of movement
    int shootCooldown = 0;
    int moveCooldown = 0;
    int moveFrames = 6;
    int shootFrames = 15;

    Player() = default;
    Player(const Cell& start, const GameConfig& cfg);

    // One cell in `d` if it is open; never passes through walls.
    bool tryMove(Direction d, const Maze& maze);
    bool canMove() const { return moveCooldown <= 0; }
    void rotateGun(Direction d) { gun = d; }
    bool gunReady() const { return shootCooldown <= 0; }

    // Returns a laser and restarts the cooldown when the gun is ready.
    std::optional<Laser> shoot(const GameConfig& cfg);
    void update();
};

struct Adversary {
    Cell p;
    float speed = 1.f;
    int moveTimer = 0;

    Adversary() = default;
    Adversary(const Cell& start, float spd) : p(start), speed(spd) {}

    // Frames between chase steps.
    int moveInterval() const;
    void update(const Player& player, const Maze& maze);
    void chase(const Cell& target, const Maze& maze);
};

struct Explosion {
    Cell p;
    int timer = 20;
    int maxTimer = 20;

    Explosion() = default;
    Explosion(const Cell& at, int frames) : p(at), timer(frames), maxTimer(frames) {}

    // Returns false once the animation has finished.
    bool update() { --timer; return timer > 0; }
    // Grows to one cell at the halfway point, then shrinks back.
    int radius(int cellSize) const;
};
