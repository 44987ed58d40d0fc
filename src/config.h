// config.h
// Tunable constants for MazeMaster plus command-line overrides.
#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

// Raised for bad command-line values and invalid maze dimensions.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

struct GameConfig {
    // window / view
    int windowW = 800, windowH = 600;
    int cellSize = 20;
    int mazeOffsetY = 50;   // room for the HUD above the maze
    int fps = 60;

    // maze
    int mazeW = 35, mazeH = 25;

    // player
    int playerMoveFrames = 6;
    int shootCooldownFrames = 15;

    // lasers / explosions
    float laserSpeed = 0.5f;
    int laserTrailLen = 8;
    int explosionFrames = 20;

    // adversaries
    int maxAdversaries = 5;
    float adversaryBaseSpeed = 0.5f;
    float adversarySpeedStep = 0.2f;
    int spawnMinDistance = 5;       // Manhattan, level start
    int spawnAttempts = 100;
    int respawnMinDistance = 3;     // Manhattan, replacement near the entrance
    int respawnAttempts = 50;
    int respawnArea = 5;            // replacements spawn in [1,respawnArea]^2

    // scoring
    int pointsPerKill = 100;
    int pointsPerLevel = 1000;      // multiplied by the level number

    // run
    int startLevel = 1;
    bool hasSeed = false;
    uint64_t seed = 0;
    bool showHelp = false;
};

// Parses "--seed=<n>", "--level=<n>" and "--help". Throws ConfigError.
GameConfig parseArgs(const std::vector<std::string>& args, GameConfig cfg = GameConfig{});

// Splits a WinMain style command line on whitespace.
std::vector<std::string> splitCommandLine(const std::string& cmdLine);

const char* usageText();
