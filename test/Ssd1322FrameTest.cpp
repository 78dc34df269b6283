#include <gtest/gtest.h>

#include <cstring>
#include <vector>

#include "Ssd1322Frame.h"

using SmallFrame = Ssd1322Frame<8, 4>;

TEST(Ssd1322FrameTest, BufferSize) {
  EXPECT_EQ(8192u, ssd1322BufferSize(256, 64));
  EXPECT_EQ(30720u, ssd1322BufferSize(480, 128));

  Ssd1322Frame<256, 64> frame;
  EXPECT_EQ(8192u, frame.size());
  EXPECT_EQ(256, frame.width());
  EXPECT_EQ(64, frame.height());
}

TEST(Ssd1322FrameTest, StartsBlack) {
  SmallFrame frame;
  for (size_t i = 0; i < frame.size(); i++) {
    EXPECT_EQ(0, frame.data()[i]);
  }
}

TEST(Ssd1322FrameTest, EvenPixelInHighNibble) {
  SmallFrame frame;
  frame.setPixel(0, 0, 5);
  frame.setPixel(1, 0, 9);
  EXPECT_EQ(0x59, frame.data()[0]);
}

TEST(Ssd1322FrameTest, WritingOnePixelKeepsItsNeighbour) {
  SmallFrame frame;
  frame.setPixel(0, 0, 0xA);
  frame.setPixel(1, 0, 0x3);
  EXPECT_EQ(0xA3, frame.data()[0]);

  frame.setPixel(1, 0, 0xC);
  EXPECT_EQ(0xAC, frame.data()[0]);

  frame.setPixel(0, 0, 0x1);
  EXPECT_EQ(0x1C, frame.data()[0]);
}

TEST(Ssd1322FrameTest, RowMajorAddressing) {
  SmallFrame frame;
  // (y * 8 + x) / 2 = 9, odd x
  frame.setPixel(3, 2, 0x7);
  EXPECT_EQ(0x07, frame.data()[9]);
  EXPECT_EQ(0x7, frame.getPixel(3, 2));

  frame.setPixel(6, 3, 0xF);
  EXPECT_EQ(0xF0, frame.data()[15]);
}

TEST(Ssd1322FrameTest, GrayIsMaskedToFourBits) {
  SmallFrame frame;
  frame.setPixel(0, 0, 0xF3);
  frame.setPixel(1, 0, 0x25);
  EXPECT_EQ(0x35, frame.data()[0]);
}

TEST(Ssd1322FrameTest, OutOfBoundsWritesAreDropped) {
  SmallFrame frame;
  frame.clear(0x4);
  const std::vector<uint8_t> before(frame.data(), frame.data() + frame.size());

  frame.setPixel(8, 0, 0xF);
  frame.setPixel(0, 4, 0xF);
  frame.setPixel(-1, 0, 0xF);
  frame.setPixel(0, -1, 0xF);
  frame.setPixel(INT16_MAX, INT16_MAX, 0xF);
  frame.setPixel(INT16_MIN, 2, 0xF);

  const std::vector<uint8_t> after(frame.data(), frame.data() + frame.size());
  EXPECT_EQ(before, after);
  EXPECT_EQ(0, frame.getPixel(-1, 0));
  EXPECT_EQ(0, frame.getPixel(8, 3));
}

TEST(Ssd1322FrameTest, ClearFillsEveryPixel) {
  SmallFrame frame;
  frame.setPixel(2, 2, 0x9);
  frame.clear(0xB);

  for (int16_t y = 0; y < 4; y++) {
    for (int16_t x = 0; x < 8; x++) {
      EXPECT_EQ(0xB, frame.getPixel(x, y)) << "x=" << x << " y=" << y;
    }
  }
  for (size_t i = 0; i < frame.size(); i++) {
    EXPECT_EQ(0xBB, frame.data()[i]);
  }
}

TEST(Ssd1322FrameTest, ClearIsIdempotent) {
  SmallFrame frame;
  frame.clear(0x6);
  const std::vector<uint8_t> once(frame.data(), frame.data() + frame.size());
  frame.clear(0x6);
  const std::vector<uint8_t> twice(frame.data(), frame.data() + frame.size());
  EXPECT_EQ(once, twice);
}

TEST(Ssd1322FrameTest, ClearMasksGray) {
  SmallFrame frame;
  frame.clear(0x1F);
  EXPECT_EQ(0xFF, frame.data()[0]);
  frame.clear();
  EXPECT_EQ(0x00, frame.data()[0]);
}

TEST(Ssd1322FrameTest, DrawPixelsClipsEachPixel) {
  SmallFrame frame;
  const Ssd1322Pixel pixels[] = {{0, 0, 0x1}, {7, 3, 0x2}, {8, 0, 0x3}, {-2, 1, 0x4}, {4, 1, 0x5}};
  frame.drawPixels(pixels, sizeof(pixels) / sizeof(pixels[0]));

  EXPECT_EQ(0x1, frame.getPixel(0, 0));
  EXPECT_EQ(0x2, frame.getPixel(7, 3));
  EXPECT_EQ(0x5, frame.getPixel(4, 1));

  size_t lit = 0;
  for (int16_t y = 0; y < 4; y++) {
    for (int16_t x = 0; x < 8; x++) {
      if (frame.getPixel(x, y) != 0) lit++;
    }
  }
  EXPECT_EQ(3u, lit);
}

TEST(Ssd1322FrameTest, DrawPixelsIgnoresNull) {
  SmallFrame frame;
  frame.drawPixels(nullptr, 4);
  EXPECT_EQ(0, frame.data()[0]);
}
