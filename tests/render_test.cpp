#include "render.h"

#include <gtest/gtest.h>

TEST(Render, PacksAsArgb) {
    EXPECT_EQ(RGBA(1, 2, 3), 0xFF010203u);
    EXPECT_EQ(RGBA(255, 0, 0, 0), 0x00FF0000u);
}

TEST(Render, ClearFillsEveryPixel) {
    Framebuffer fb(4, 3);
    clear(fb, RGBA(9, 9, 9));
    for (uint32_t p : fb.px) EXPECT_EQ(p, RGBA(9, 9, 9));
}

TEST(Render, PutPixelIgnoresOutOfRange) {
    Framebuffer fb(4, 4);
    putpx(fb, -1, 0, 1);
    putpx(fb, 0, 4, 1);
    putpx(fb, 4, 0, 1);
    for (uint32_t p : fb.px) EXPECT_EQ(p, 0u);
    putpx(fb, 3, 3, 7);
    EXPECT_EQ(fb.at(3, 3), 7u);
}

TEST(Render, FillRectClips) {
    Framebuffer fb(10, 10);
    const uint32_t c = RGBA(255, 0, 0);
    fillRect(fb, -5, -5, 8, 8, c);
    EXPECT_EQ(fb.at(0, 0), c);
    EXPECT_EQ(fb.at(2, 2), c);
    EXPECT_EQ(fb.at(3, 3), 0u);
    EXPECT_EQ(fb.at(3, 0), 0u);

    fillRect(fb, 8, 8, 100, 100, c);
    EXPECT_EQ(fb.at(9, 9), c);
}

TEST(Render, DrawRectIsAnOutline) {
    Framebuffer fb(10, 10);
    drawRect(fb, 1, 1, 5, 5, 3);
    EXPECT_EQ(fb.at(1, 1), 3u);
    EXPECT_EQ(fb.at(5, 5), 3u);
    EXPECT_EQ(fb.at(5, 1), 3u);
    EXPECT_EQ(fb.at(3, 3), 0u);
}

TEST(Render, FillCircleCoversRadius) {
    Framebuffer fb(21, 21);
    fillCircle(fb, 10, 10, 5, 1);
    EXPECT_EQ(fb.at(10, 10), 1u);
    EXPECT_EQ(fb.at(15, 10), 1u);
    EXPECT_EQ(fb.at(10, 5), 1u);
    EXPECT_EQ(fb.at(13, 13), 1u);
    EXPECT_EQ(fb.at(14, 14), 0u);
    EXPECT_EQ(fb.at(16, 10), 0u);
}

TEST(Render, FillCircleWithZeroRadiusDrawsNothing) {
    Framebuffer fb(5, 5);
    fillCircle(fb, 2, 2, 0, 1);
    EXPECT_EQ(fb.at(2, 2), 0u);
}

TEST(Render, ThickLine) {
    Framebuffer fb(12, 12);
    drawLine(fb, 2, 5, 8, 5, 3, 1);
    EXPECT_EQ(fb.at(5, 4), 1u);
    EXPECT_EQ(fb.at(5, 5), 1u);
    EXPECT_EQ(fb.at(5, 6), 1u);
    EXPECT_EQ(fb.at(5, 7), 0u);
    EXPECT_EQ(fb.at(9, 5), 1u);
    EXPECT_EQ(fb.at(10, 5), 0u);
}

TEST(Render, BlendRectMixesTowardColor) {
    Framebuffer fb(2, 2);
    clear(fb, RGBA(255, 255, 255));
    blendRect(fb, 0, 0, 1, 1, RGBA(0, 0, 0), 128);
    EXPECT_EQ(fb.at(0, 0), RGBA(127, 127, 127));
    EXPECT_EQ(fb.at(1, 1), RGBA(255, 255, 255));

    blendRect(fb, 1, 1, 1, 1, RGBA(10, 20, 30), 255);
    EXPECT_EQ(fb.at(1, 1), RGBA(10, 20, 30));
}

TEST(Render, TextMetrics) {
    EXPECT_EQ(textWidth("", 2), 0);
    EXPECT_EQ(textWidth("A", 1), 5);
    EXPECT_EQ(textWidth("AB", 1), 11);
    EXPECT_EQ(textWidth("AB", 2), 22);
    EXPECT_EQ(textHeight(3), 21);
}

TEST(Render, GlyphPixels) {
    Framebuffer fb(8, 8);
    const uint32_t c = RGBA(0, 255, 0);
    drawText(fb, 0, 0, "I", 1, c);
    for (int y = 0; y < 7; ++y) EXPECT_EQ(fb.at(2, y), c);
    EXPECT_EQ(fb.at(0, 3), 0u);
    EXPECT_EQ(fb.at(1, 0), c);
    EXPECT_EQ(fb.at(1, 3), 0u);
}

TEST(Render, LowercaseMatchesUppercase) {
    Framebuffer a(8, 8), b(8, 8);
    drawText(a, 0, 0, "g", 1, 1);
    drawText(b, 0, 0, "G", 1, 1);
    EXPECT_EQ(a.px, b.px);
}

TEST(Render, UnknownCharactersAreBlank) {
    Framebuffer fb(16, 16);
    drawText(fb, 0, 0, "~", 2, 1);
    for (uint32_t p : fb.px) EXPECT_EQ(p, 0u);
}

TEST(Render, CenteredText) {
    Framebuffer fb(21, 8);
    drawTextCentered(fb, 0, "I", 1, 1);
    // 5px glyph centered in 21px starts at x = 8; the I stem is column 2
    EXPECT_EQ(fb.at(10, 3), 1u);
}
