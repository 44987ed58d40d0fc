// entities.cpp
#include "entities.h"
#include "pathfind.h"
#include <algorithm>

Laser::Laser(const Cell& origin, Direction d, float speed, int trailLen)
    : x(float(origin.x)), y(float(origin.y)), maxTrail(trailLen) {
    Cell v = delta(d);
    vx = v.x * speed;
    vy = v.y * speed;
}

void Laser::update(const Maze& maze) {
    if (!active) return;
    trail.push_back(cell());
    while (int(trail.size()) > maxTrail) trail.pop_front();

    x += vx;
    y += vy;
    if (maze.isWall(int(x), int(y))) active = false;
}

Player::Player(const Cell& start, const GameConfig& cfg)
    : p(start), moveFrames(cfg.playerMoveFrames), shootFrames(cfg.shootCooldownFrames) {}

bool Player::tryMove(Direction d, const Maze& maze) {
    Cell n = step(p, d);
    if (!maze.isOpen(n)) return false;
    p = n;
    return true;
}

std::optional<Laser> Player::shoot(const GameConfig& cfg) {
    if (!gunReady()) return std::nullopt;
    shootCooldown = shootFrames;
    return Laser(p, gun, cfg.laserSpeed, cfg.laserTrailLen);
}

void Player::update() {
    if (shootCooldown > 0) --shootCooldown;
    if (moveCooldown > 0) --moveCooldown;
}

int Adversary::moveInterval() const {
    if (speed <= 0.f) return 60;
    return std::max(1, int(60.f / speed));
}

void Adversary::update(const Player& player, const Maze& maze) {
    if (++moveTimer < moveInterval()) return;
    moveTimer = 0;
    chase(player.p, maze);
}

void Adversary::chase(const Cell& target, const Maze& maze) {
    std::optional<Direction> d = nextStepToward(maze, p, target);
    if (!d) d = greedyStep(maze, p, target);
    if (d) p = step(p, *d);
}

int Explosion::radius(int cellSize) const {
    if (maxTimer <= 0) return 0;
    float progress = 1.f - float(timer) / float(maxTimer);
    if (progress < 0.5f) return int(progress * 2.f * cellSize);
    return int((2.f - progress * 2.f) * cellSize);
}
