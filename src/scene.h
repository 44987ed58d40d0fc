// scene.h
// Draws the current game state into a framebuffer.
#pragma once

class Game;
struct Framebuffer;

void drawScene(Framebuffer& fb, const Game& game);

// Top-left pixel of the maze within the window.
void mazeOrigin(const Game& game, int& outX, int& outY);
