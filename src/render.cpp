// render.cpp
#include "render.h"
#include <algorithm>
#include <cstdlib>

void clear(Framebuffer& fb, uint32_t color) {
    std::fill(fb.px.begin(), fb.px.end(), color);
}

void putpx(Framebuffer& fb, int x, int y, uint32_t c) {
    if ((unsigned)x < (unsigned)fb.w && (unsigned)y < (unsigned)fb.h)
        fb.px[size_t(y) * size_t(fb.w) + size_t(x)] = c;
}

void fillRect(Framebuffer& fb, int x, int y, int w, int h, uint32_t c) {
    int x0 = std::max(0, x), y0 = std::max(0, y);
    int x1 = std::min(fb.w, x + w), y1 = std::min(fb.h, y + h);
    for (int j = y0; j < y1; ++j) {
        uint32_t* row = fb.px.data() + size_t(j) * size_t(fb.w);
        for (int i = x0; i < x1; ++i) row[i] = c;
    }
}

void drawRect(Framebuffer& fb, int x, int y, int w, int h, uint32_t c) {
    for (int i = x; i < x + w; ++i) { putpx(fb, i, y, c); putpx(fb, i, y + h - 1, c); }
    for (int j = y; j < y + h; ++j) { putpx(fb, x, j, c); putpx(fb, x + w - 1, j, c); }
}

void fillCircle(Framebuffer& fb, int cx, int cy, int r, uint32_t c) {
    if (r <= 0) return;
    int r2 = r * r;
    int x = r;
    // walk rows outward from the center, shrinking the half-width as we go
    for (int y = 0; y <= r; ++y) {
        while (x * x + y * y > r2) --x;
        fillRect(fb, cx - x, cy + y, 2 * x + 1, 1, c);
        if (y) fillRect(fb, cx - x, cy - y, 2 * x + 1, 1, c);
    }
}

void drawLine(Framebuffer& fb, int x0, int y0, int x1, int y1, int thick, uint32_t c) {
    int half = thick / 2;
    int dx = std::abs(x1 - x0), dy = -std::abs(y1 - y0);
    int sx = x0 < x1 ? 1 : -1, sy = y0 < y1 ? 1 : -1;
    int err = dx + dy;
    for (;;) {
        fillRect(fb, x0 - half, y0 - half, thick, thick, c);
        if (x0 == x1 && y0 == y1) break;
        int e2 = 2 * err;
        if (e2 >= dy) { err += dy; x0 += sx; }
        if (e2 <= dx) { err += dx; y0 += sy; }
    }
}

static uint32_t mix(uint32_t dst, uint32_t src, unsigned a) {
    unsigned inv = 255 - a;
    unsigned r = (((src >> 16) & 0xFF) * a + ((dst >> 16) & 0xFF) * inv) / 255;
    unsigned g = (((src >> 8) & 0xFF) * a + ((dst >> 8) & 0xFF) * inv) / 255;
    unsigned b = ((src & 0xFF) * a + (dst & 0xFF) * inv) / 255;
    return 0xFF000000u | (r << 16) | (g << 8) | b;
}

void blendRect(Framebuffer& fb, int x, int y, int w, int h, uint32_t c, uint8_t alpha) {
    int x0 = std::max(0, x), y0 = std::max(0, y);
    int x1 = std::min(fb.w, x + w), y1 = std::min(fb.h, y + h);
    for (int j = y0; j < y1; ++j) {
        uint32_t* row = fb.px.data() + size_t(j) * size_t(fb.w);
        for (int i = x0; i < x1; ++i) row[i] = mix(row[i], c, alpha);
    }
}

// ASCII 32..90, one byte per column, bit 0 = top row
static const uint8_t FONT5X7[][5] = {
    {0x00,0x00,0x00,0x00,0x00}, // ' '
    {0x00,0x00,0x5F,0x00,0x00}, // '!'
    {0x00,0x07,0x00,0x07,0x00}, // '"'
    {0x14,0x7F,0x14,0x7F,0x14}, // '#'
    {0x24,0x2A,0x7F,0x2A,0x12}, // '$'
    {0x23,0x13,0x08,0x64,0x62}, // '%'
    {0x36,0x49,0x55,0x22,0x50}, // '&'
    {0x00,0x05,0x03,0x00,0x00}, // '''
    {0x00,0x1C,0x22,0x41,0x00}, // '('
    {0x00,0x41,0x22,0x1C,0x00}, // ')'
    {0x14,0x08,0x3E,0x08,0x14}, // '*'
    {0x08,0x08,0x3E,0x08,0x08}, // '+'
    {0x00,0x50,0x30,0x00,0x00}, // ','
    {0x08,0x08,0x08,0x08,0x08}, // '-'
    {0x00,0x60,0x60,0x00,0x00}, // '.'
    {0x20,0x10,0x08,0x04,0x02}, // '/'
    {0x3E,0x51,0x49,0x45,0x3E}, // '0'
    {0x00,0x42,0x7F,0x40,0x00}, // '1'
    {0x42,0x61,0x51,0x49,0x46}, // '2'
    {0x21,0x41,0x45,0x4B,0x31}, // '3'
    {0x18,0x14,0x12,0x7F,0x10}, // '4'
    {0x27,0x45,0x45,0x45,0x39}, // '5'
    {0x3C,0x4A,0x49,0x49,0x30}, // '6'
    {0x01,0x71,0x09,0x05,0x03}, // '7'
    {0x36,0x49,0x49,0x49,0x36}, // '8'
    {0x06,0x49,0x49,0x29,0x1E}, // '9'
    {0x00,0x36,0x36,0x00,0x00}, // ':'
    {0x00,0x56,0x36,0x00,0x00}, // ';'
    {0x08,0x14,0x22,0x41,0x00}, // '<'
    {0x14,0x14,0x14,0x14,0x14}, // '='
    {0x00,0x41,0x22,0x14,0x08}, // '>'
    {0x02,0x01,0x51,0x09,0x06}, // '?'
    {0x32,0x49,0x79,0x41,0x3E}, // '@'
    {0x7E,0x11,0x11,0x11,0x7E}, // 'A'
    {0x7F,0x49,0x49,0x49,0x36}, // 'B'
    {0x3E,0x41,0x41,0x41,0x22}, // 'C'
    {0x7F,0x41,0x41,0x22,0x1C}, // 'D'
    {0x7F,0x49,0x49,0x49,0x41}, // 'E'
    {0x7F,0x09,0x09,0x09,0x01}, // 'F'
    {0x3E,0x41,0x49,0x49,0x7A}, // 'G'
    {0x7F,0x08,0x08,0x08,0x7F}, // 'H'
    {0x00,0x41,0x7F,0x41,0x00}, // 'I'
    {0x20,0x40,0x41,0x3F,0x01}, // 'J'
    {0x7F,0x08,0x14,0x22,0x41}, // 'K'
    {0x7F,0x40,0x40,0x40,0x40}, // 'L'
    {0x7F,0x02,0x0C,0x02,0x7F}, // 'M'
    {0x7F,0x04,0x08,0x10,0x7F}, // 'N'
    {0x3E,0x41,0x41,0x41,0x3E}, // 'O'
    {0x7F,0x09,0x09,0x09,0x06}, // 'P'
    {0x3E,0x41,0x51,0x21,0x5E}, // 'Q'
    {0x7F,0x09,0x19,0x29,0x46}, // 'R'
    {0x46,0x49,0x49,0x49,0x31}, // 'S'
    {0x01,0x01,0x7F,0x01,0x01}, // 'T'
    {0x3F,0x40,0x40,0x40,0x3F}, // 'U'
    {0x1F,0x20,0x40,0x20,0x1F}, // 'V'
    {0x7F,0x20,0x18,0x20,0x7F}, // 'W'
    {0x63,0x14,0x08,0x14,0x63}, // 'X'
    {0x03,0x04,0x78,0x04,0x03}, // 'Y'
    {0x61,0x51,0x49,0x45,0x43}, // 'Z'
};

static const int GLYPH_W = 5, GLYPH_H = 7, GLYPH_ADVANCE = 6;

static void drawChar(Framebuffer& fb, int x, int y, char ch, int scale, uint32_t c) {
    if (ch >= 'a' && ch <= 'z') ch = char(ch - 'a' + 'A');
    if (ch < ' ' || ch > 'Z') ch = ' ';
    const uint8_t* cols = FONT5X7[ch - ' '];
    for (int cx = 0; cx < GLYPH_W; ++cx) {
        for (int cy = 0; cy < GLYPH_H; ++cy) {
            if ((cols[cx] >> cy) & 1)
                fillRect(fb, x + cx * scale, y + cy * scale, scale, scale, c);
        }
    }
}

void drawText(Framebuffer& fb, int x, int y, const std::string& s, int scale, uint32_t c) {
    if (scale < 1) scale = 1;
    for (char ch : s) {
        drawChar(fb, x, y, ch, scale, c);
        x += GLYPH_ADVANCE * scale;
    }
}

int textWidth(const std::string& s, int scale) {
    if (s.empty()) return 0;
    if (scale < 1) scale = 1;
    // no trailing gap after the last glyph
    return (int(s.size()) * GLYPH_ADVANCE - 1) * scale;
}

int textHeight(int scale) {
    return GLYPH_H * (scale < 1 ? 1 : scale);
}

void drawTextCentered(Framebuffer& fb, int y, const std::string& s, int scale, uint32_t c) {
    drawText(fb, (fb.w - textWidth(s, scale)) / 2, y, s, scale, c);
}
