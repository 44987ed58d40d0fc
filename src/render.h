// render.h
// Software rendering into a 32-bit framebuffer. Pixels are 0xAARRGGBB, which
// is also the layout of a top-down 32bpp BI_RGB DIB, so the frontend can blit
// the buffer as is. Every primitive clips to the buffer.
#pragma once
#include <cstdint>
#include <string>
#include <vector>

inline uint32_t RGBA(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255) {
    return (uint32_t(a) << 24) | (uint32_t(r) << 16) | (uint32_t(g) << 8) | uint32_t(b);
}

struct Framebuffer {
    int w = 0, h = 0;
    std::vector<uint32_t> px;

    Framebuffer(int W, int H) : w(W), h(H), px(size_t(W) * size_t(H), 0) {}
    uint32_t at(int x, int y) const { return px[size_t(y) * size_t(w) + size_t(x)]; }
};

void clear(Framebuffer& fb, uint32_t color);
void putpx(Framebuffer& fb, int x, int y, uint32_t c);
void fillRect(Framebuffer& fb, int x, int y, int w, int h, uint32_t c);
void drawRect(Framebuffer& fb, int x, int y, int w, int h, uint32_t c);
void fillCircle(Framebuffer& fb, int cx, int cy, int r, uint32_t c);
// Bresenham line stamped with a thick x thick square.
void drawLine(Framebuffer& fb, int x0, int y0, int x1, int y1, int thick, uint32_t c);
// Mixes `c` over the rect with weight alpha/255.
void blendRect(Framebuffer& fb, int x, int y, int w, int h, uint32_t c, uint8_t alpha);

// 5x7 bitmap text, 1px spacing, scaled by an integer factor. Lowercase is
// drawn as uppercase; characters outside ' '..'Z' render as blanks.
void drawText(Framebuffer& fb, int x, int y, const std::string& s, int scale, uint32_t c);
int textWidth(const std::string& s, int scale);
int textHeight(int scale);
void drawTextCentered(Framebuffer& fb, int y, const std::string& s, int scale, uint32_t c);
