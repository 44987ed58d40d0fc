// game.h
// MazeMaster rules: level setup, per-tick simulation, scoring and the
// menu / playing / game-over / level-complete state machine.
//
// Usage:
//   Game game(cfg);
//   each tick: for each key edge game.onKeyPress(k); game.update(input);
//   then drawScene(fb, game);
#pragma once
#include "config.h"
#include "entities.h"
#include "input.h"
#include "maze.h"
#include "rng.h"
#include <vector>

enum class GameState { Menu, Playing, GameOver, LevelComplete };

class Game {
public:
    explicit Game(const GameConfig& cfg);

    // Discrete key-down events (menu navigation, restart, next level).
    void onKeyPress(Key k);
    // One simulation tick. Only does work while Playing.
    void update(const InputState& in);

    // Rebuilds the maze and repopulates it for the current level.
    void resetLevel();
    void restartRun();
    void nextLevel();

    // Number of adversaries and their speed at the start of `level`.
    int adversaryCountFor(int level) const;
    float adversarySpeedFor(int level) const;

    GameState state() const { return m_state; }
    bool quitRequested() const { return m_quit; }
    uint64_t seed() const { return m_seed; }
    int level() const { return m_level; }
    int score() const { return m_score; }
    int adversariesShot() const { return m_shot; }
    int levelsCompleted() const { return m_levelsDone; }

    const GameConfig& config() const { return m_cfg; }
    const Maze& maze() const { return m_maze; }
    const Player& player() const { return m_player; }
    const std::vector<Adversary>& adversaries() const { return m_adversaries; }
    const std::vector<Laser>& lasers() const { return m_lasers; }
    const std::vector<Explosion>& explosions() const { return m_explosions; }

    // Direct access for tests and scripted scenarios.
    Maze& maze() { return m_maze; }
    Player& player() { return m_player; }
    std::vector<Adversary>& adversaries() { return m_adversaries; }
    std::vector<Laser>& lasers() { return m_lasers; }
    void setState(GameState s) { m_state = s; }

private:
    void handleHeldKeys(const InputState& in);
    void resolveLaserHits();
    bool playerCaught() const;
    bool playerAtExit() const;
    void spawnAdversaries();
    void spawnReplacement();
    void endLevel(GameState outcome);

    GameConfig m_cfg;
    uint64_t m_seed;
    RNG m_rng;
    GameState m_state = GameState::Menu;
    GameState m_lastOutcome = GameState::Playing; // GameOver/LevelComplete once a level ends
    bool m_quit = false;

    int m_level = 1;
    int m_score = 0;
    int m_shot = 0;
    int m_levelsDone = 0;

    Maze m_maze;
    Player m_player;
    std::vector<Adversary> m_adversaries;
    std::vector<Laser> m_lasers;
    std::vector<Explosion> m_explosions;
};

const char* stateName(GameState s);
