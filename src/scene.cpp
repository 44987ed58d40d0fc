// scene.cpp
#include "scene.h"
#include "game.h"
#include "render.h"
#include <algorithm>
#include <string>

static const uint32_t COL_BLACK = RGBA(0, 0, 0);
static const uint32_t COL_WHITE = RGBA(255, 255, 255);
static const uint32_t COL_RED = RGBA(255, 0, 0);
static const uint32_t COL_ORANGE = RGBA(255, 165, 0);
static const uint32_t COL_GREEN = RGBA(0, 255, 0);
static const uint32_t COL_YELLOW = RGBA(255, 255, 0);
static const uint32_t COL_GRAY = RGBA(128, 128, 128);
static const uint32_t COL_DARK_GRAY = RGBA(64, 64, 64);

static const int TITLE_SCALE = 3;
static const int SMALL_SCALE = 2;

void mazeOrigin(const Game& game, int& outX, int& outY) {
    const GameConfig& cfg = game.config();
    outX = (cfg.windowW - game.maze().width() * cfg.cellSize) / 2;
    outY = cfg.mazeOffsetY;
}

static void drawMenu(Framebuffer& fb) {
    drawTextCentered(fb, 200, "MAZEMASTER", TITLE_SCALE, COL_WHITE);
    drawTextCentered(fb, 250, "Press SPACE to Start", SMALL_SCALE, COL_GRAY);
    static const char* INSTRUCTIONS[] = {
        "Arrow Keys: Hold to move continuously",
        "WASD Keys: Rotate gun (W=up, S=down, A=left, D=right)",
        "SPACE: Shoot laser",
        "Escape mazes, avoid orange enemies!",
        "Shoot enemies to clear your path!",
    };
    int y = 320;
    for (const char* line : INSTRUCTIONS) {
        drawTextCentered(fb, y, line, SMALL_SCALE, COL_WHITE);
        y += 30;
    }
}

static void drawMaze(Framebuffer& fb, const Game& game, int ox, int oy) {
    const Maze& m = game.maze();
    const int cs = game.config().cellSize;
    for (int y = 0; y < m.height(); ++y) {
        for (int x = 0; x < m.width(); ++x) {
            fillRect(fb, ox + x * cs, oy + y * cs, cs, cs, m.isWall(x, y) ? COL_WHITE : COL_DARK_GRAY);
        }
    }
    Cell e = m.exitCell();
    fillRect(fb, ox + e.x * cs, oy + e.y * cs, cs, cs, COL_GREEN);
}

static void drawPlayer(Framebuffer& fb, const Player& pl, int cs, int ox, int oy) {
    fillRect(fb, ox + pl.p.x * cs + 2, oy + pl.p.y * cs + 2, cs - 4, cs - 4, COL_RED);
    // gun barrel
    Cell g = delta(pl.gun);
    int sx = ox + pl.p.x * cs + cs / 2, sy = oy + pl.p.y * cs + cs / 2;
    int reach = cs / 2 + 4;
    drawLine(fb, sx, sy, sx + g.x * reach, sy + g.y * reach, 3, COL_WHITE);
}

static void drawLasers(Framebuffer& fb, const std::vector<Laser>& lasers, int cs, int ox, int oy) {
    for (const auto& l : lasers) {
        const int n = int(l.trail.size());
        int i = 0;
        for (const Cell& t : l.trail) {
            uint8_t a = uint8_t(255 * (i + 1) / n);
            blendRect(fb, ox + t.x * cs + cs / 2 - 1, oy + t.y * cs + cs / 2 - 1, 2, 2, COL_YELLOW, a);
            ++i;
        }
        Cell c = l.cell();
        fillRect(fb, ox + c.x * cs + cs / 2 - 2, oy + c.y * cs + cs / 2 - 2, 4, 4, COL_YELLOW);
    }
}

static void drawExplosions(Framebuffer& fb, const std::vector<Explosion>& explosions, int cs, int ox, int oy) {
    static const uint32_t RINGS[] = { COL_YELLOW, COL_ORANGE, COL_RED };
    for (const auto& e : explosions) {
        int r = e.radius(cs);
        if (r <= 0) continue;
        int cx = ox + e.p.x * cs + cs / 2, cy = oy + e.p.y * cs + cs / 2;
        for (int i = 0; i < 3; ++i) {
            int rr = r - i * 2;
            fillCircle(fb, cx, cy, rr < 1 ? 1 : rr, RINGS[i]);
        }
    }
}

static void drawHUD(Framebuffer& fb, const Game& game) {
    const int W = game.config().windowW;
    std::string enemies = "Enemies: " + std::to_string(game.adversaries().size());
    std::string gun = game.player().gunReady() ? "Gun: Ready" : "Gun: Reloading";
    drawText(fb, 10, 10, "Level: " + std::to_string(game.level()), SMALL_SCALE, COL_WHITE);
    drawText(fb, 10, 30, "Score: " + std::to_string(game.score()), SMALL_SCALE, COL_WHITE);
    drawText(fb, W - 10 - textWidth(enemies, SMALL_SCALE), 10, enemies, SMALL_SCALE, COL_WHITE);
    drawText(fb, W - 10 - textWidth(gun, SMALL_SCALE), 30, gun, SMALL_SCALE, COL_WHITE);
}

static void drawGame(Framebuffer& fb, const Game& game) {
    const int cs = game.config().cellSize;
    int ox, oy;
    mazeOrigin(game, ox, oy);

    drawMaze(fb, game, ox, oy);
    drawPlayer(fb, game.player(), cs, ox, oy);
    for (const auto& a : game.adversaries())
        fillRect(fb, ox + a.p.x * cs + 2, oy + a.p.y * cs + 2, cs - 4, cs - 4, COL_ORANGE);
    drawLasers(fb, game.lasers(), cs, ox, oy);
    drawExplosions(fb, game.explosions(), cs, ox, oy);
    drawHUD(fb, game);
}

static void drawBanner(Framebuffer& fb, const Game& game, const std::string& title, uint32_t titleCol,
    const std::string& line1, const std::string& line2) {
    drawGame(fb, game);
    blendRect(fb, 0, 0, fb.w, fb.h, COL_BLACK, 128);

    // outline sized to the widest line, 20 px margin around the text block
    int bw = std::max({ textWidth(title, TITLE_SCALE), textWidth(line1, SMALL_SCALE), textWidth(line2, SMALL_SCALE) }) + 40;
    int top = 250 - 20, bottom = 350 + textHeight(SMALL_SCALE) + 20;
    drawRect(fb, (fb.w - bw) / 2, top, bw, bottom - top, titleCol);

    drawTextCentered(fb, 250, title, TITLE_SCALE, titleCol);
    drawTextCentered(fb, 300, line1, SMALL_SCALE, COL_WHITE);
    drawTextCentered(fb, 350, line2, SMALL_SCALE, COL_GRAY);
}

void drawScene(Framebuffer& fb, const Game& game) {
    clear(fb, COL_BLACK);
    switch (game.state()) {
    case GameState::Menu:
        drawMenu(fb);
        break;
    case GameState::Playing:
        drawGame(fb, game);
        break;
    case GameState::GameOver:
        drawBanner(fb, game, "GAME OVER", COL_RED,
            "Final Score: " + std::to_string(game.score()), "Press R to Restart or ESC to Menu");
        break;
    case GameState::LevelComplete:
        drawBanner(fb, game, "LEVEL COMPLETE!", COL_GREEN,
            "Score: " + std::to_string(game.score()), "Press SPACE for Next Level");
        break;
    }
}
