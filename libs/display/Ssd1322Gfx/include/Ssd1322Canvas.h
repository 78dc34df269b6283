#pragma once
#include <Adafruit_GFX.h>

#include "Ssd1322Frame.h"

/**
 * Adafruit_GFX drawing target backed by an Ssd1322Frame.
 *
 * Colors are 4-bit gray levels (0 = black, 15 = full brightness); higher bits
 * of the 16-bit GFX color are ignored. The frame is not owned so two frames
 * can be swapped under one canvas with setFrame().
 */
template <uint16_t Width, uint16_t Height>
class Ssd1322Canvas : public Adafruit_GFX {
 public:
  using Frame = Ssd1322Frame<Width, Height>;

  explicit Ssd1322Canvas(Frame& frame) : Adafruit_GFX(Width, Height), frame(&frame) {}

  void setFrame(Frame& next) { frame = &next; }
  Frame& getFrame() const { return *frame; }

  void drawPixel(int16_t x, int16_t y, uint16_t color) override {
    if (x < 0 || y < 0 || x >= width() || y >= height()) {
      return;
    }

    // Map rotated coordinates back onto the frame
    int16_t t;
    switch (getRotation()) {
      case 1:
        t = x;
        x = WIDTH - 1 - y;
        y = t;
        break;
      case 2:
        x = WIDTH - 1 - x;
        y = HEIGHT - 1 - y;
        break;
      case 3:
        t = x;
        x = y;
        y = HEIGHT - 1 - t;
        break;
    }

    frame->setPixel(x, y, static_cast<uint8_t>(color & 0x0F));
  }

  void fillScreen(uint16_t color) override { frame->clear(static_cast<uint8_t>(color & 0x0F)); }

 private:
  Frame* frame;
};
