// game.cpp
#include "game.h"
#include "log.h"
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdio>
#include <random>
#include <string>

const char* stateName(GameState s) {
    switch (s) {
    case GameState::Menu:          return "menu";
    case GameState::Playing:       return "playing";
    case GameState::GameOver:      return "game over";
    case GameState::LevelComplete: return "level complete";
    }
    return "?";
}

static std::string speedText(float speed) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f", speed);
    return buf;
}

static uint64_t pickSeed(const GameConfig& cfg) {
    if (cfg.hasSeed) return cfg.seed;
    std::random_device rd;
    return (uint64_t(rd()) << 32) ^ uint64_t(rd());
}

Game::Game(const GameConfig& cfg)
    : m_cfg(cfg), m_seed(pickSeed(cfg)), m_rng(m_seed),
    m_level(cfg.startLevel), m_maze(cfg.mazeW, cfg.mazeH) {
    logInfo("new run, seed " + std::to_string(m_seed));
    resetLevel();
}

int Game::adversaryCountFor(int level) const {
    if (level <= 1) return 0;
    return std::min(level - 1, m_cfg.maxAdversaries);
}

float Game::adversarySpeedFor(int level) const {
    return m_cfg.adversaryBaseSpeed + float(level - 2) * m_cfg.adversarySpeedStep;
}

void Game::resetLevel() {
    m_maze.generate(m_rng);
    m_player = Player(m_maze.findNearestOpen(m_maze.width() / 2, m_maze.height() / 2), m_cfg);

    m_adversaries.clear();
    m_lasers.clear();
    m_explosions.clear();
    spawnAdversaries();

    std::string msg = "level " + std::to_string(m_level) + ": maze " + std::to_string(m_maze.width()) + "x" +
        std::to_string(m_maze.height()) + ", " + std::to_string(m_adversaries.size()) + " adversaries";
    if (!m_adversaries.empty()) msg += " at speed " + speedText(adversarySpeedFor(m_level));
    logInfo(msg);
}

void Game::spawnAdversaries() {
    int count = adversaryCountFor(m_level);
    float speed = adversarySpeedFor(m_level);
    for (int i = 0; i < count; ++i) {
        bool placed = false;
        for (int attempt = 0; attempt < m_cfg.spawnAttempts && !placed; ++attempt) {
            Cell c(m_rng.randint(1, m_maze.width() - 2), m_rng.randint(1, m_maze.height() - 2));
            if (m_maze.isOpen(c) && manhattan(c, m_player.p) > m_cfg.spawnMinDistance) {
                m_adversaries.push_back(Adversary(c, speed));
                placed = true;
            }
        }
        if (!placed) logWarn("no spawn cell found for adversary " + std::to_string(i + 1));
    }
}

void Game::spawnReplacement() {
    float speed = adversarySpeedFor(m_level);
    for (int attempt = 0; attempt < m_cfg.respawnAttempts; ++attempt) {
        Cell c(m_rng.randint(1, m_cfg.respawnArea), m_rng.randint(1, m_cfg.respawnArea));
        if (m_maze.isOpen(c) && manhattan(c, m_player.p) > m_cfg.respawnMinDistance) {
            m_adversaries.push_back(Adversary(c, speed));
            return;
        }
    }
}

void Game::restartRun() {
    m_level = m_cfg.startLevel;
    m_score = 0;
    m_shot = 0;
    m_levelsDone = 0;
    m_lastOutcome = GameState::Playing;
    logInfo("new run, seed " + std::to_string(m_seed));
    resetLevel();
    m_state = GameState::Playing;
}

void Game::nextLevel() {
    ++m_level;
    m_lastOutcome = GameState::Playing;
    resetLevel();
    m_state = GameState::Playing;
}

void Game::onKeyPress(Key k) {
    switch (m_state) {
    case GameState::Menu:
        if (k == KEY_SPACE) {
            // never resume into a level that already ended
            if (m_lastOutcome == GameState::GameOver) restartRun();
            else if (m_lastOutcome == GameState::LevelComplete) nextLevel();
            else m_state = GameState::Playing;
        }
        else if (k == KEY_ESCAPE) {
            m_quit = true;
        }
        break;
    case GameState::GameOver:
        if (k == KEY_R) restartRun();
        else if (k == KEY_ESCAPE) m_state = GameState::Menu;
        break;
    case GameState::LevelComplete:
        if (k == KEY_SPACE) nextLevel();
        else if (k == KEY_ESCAPE) m_state = GameState::Menu;
        break;
    case GameState::Playing:
        break;
    }
}

void Game::handleHeldKeys(const InputState& in) {
    if (m_player.canMove()) {
        bool moved = false;
        if (in.down(KEY_UP))         moved = m_player.tryMove(Direction::Up, m_maze);
        else if (in.down(KEY_DOWN))  moved = m_player.tryMove(Direction::Down, m_maze);
        else if (in.down(KEY_LEFT))  moved = m_player.tryMove(Direction::Left, m_maze);
        else if (in.down(KEY_RIGHT)) moved = m_player.tryMove(Direction::Right, m_maze);
        if (moved) m_player.moveCooldown = m_player.moveFrames;
    }

    if (in.down(KEY_A))      m_player.rotateGun(Direction::Left);
    else if (in.down(KEY_D)) m_player.rotateGun(Direction::Right);
    else if (in.down(KEY_W)) m_player.rotateGun(Direction::Up);
    else if (in.down(KEY_S)) m_player.rotateGun(Direction::Down);

    if (in.down(KEY_SPACE)) {
        if (std::optional<Laser> l = m_player.shoot(m_cfg)) m_lasers.push_back(std::move(*l));
    }
}

void Game::update(const InputState& in) {
    if (m_state != GameState::Playing) return;

    handleHeldKeys(in);
    m_player.update();

    for (auto& a : m_adversaries) a.update(m_player, m_maze);

    for (auto& l : m_lasers) l.update(m_maze);
    m_lasers.erase(std::remove_if(m_lasers.begin(), m_lasers.end(), [](const Laser& l) { return !l.active; }), m_lasers.end());

    m_explosions.erase(std::remove_if(m_explosions.begin(), m_explosions.end(), [](Explosion& e) { return !e.update(); }), m_explosions.end());

    resolveLaserHits();

    // reaching the exit wins over a catch on the same tick
    if (playerAtExit()) {
        m_score += m_cfg.pointsPerLevel * m_level;
        ++m_levelsDone;
        endLevel(GameState::LevelComplete);
    }
    else if (playerCaught()) {
        endLevel(GameState::GameOver);
    }
}

void Game::resolveLaserHits() {
    for (size_t li = 0; li < m_lasers.size();) {
        const Laser& l = m_lasers[li];
        auto hit = std::find_if(m_adversaries.begin(), m_adversaries.end(), [&](const Adversary& a) {
            return std::abs(l.x - float(a.p.x)) < 1.f && std::abs(l.y - float(a.p.y)) < 1.f;
        });
        if (hit == m_adversaries.end()) { ++li; continue; }

        Cell at = hit->p;
        m_adversaries.erase(hit);
        m_lasers.erase(m_lasers.begin() + std::ptrdiff_t(li));
        m_explosions.push_back(Explosion(at, m_cfg.explosionFrames));
        m_score += m_cfg.pointsPerKill;
        ++m_shot;
        logInfo("adversary shot at (" + std::to_string(at.x) + "," + std::to_string(at.y) + "), score " + std::to_string(m_score));

        if (m_level > 1) spawnReplacement();
    }
}

bool Game::playerCaught() const {
    return std::any_of(m_adversaries.begin(), m_adversaries.end(),
        [this](const Adversary& a) { return manhattan(a.p, m_player.p) <= 1; });
}

bool Game::playerAtExit() const {
    return m_player.p.x >= m_maze.width() - 2 && m_player.p.y >= m_maze.height() - 2;
}

void Game::endLevel(GameState outcome) {
    m_state = outcome;
    m_lastOutcome = outcome;
    logInfo(std::string(stateName(outcome)) + " on level " + std::to_string(m_level) + ", score " + std::to_string(m_score));
}
