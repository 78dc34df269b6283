#pragma once
#include <cstddef>
#include <cstdint>
#include <cstring>

// Bytes needed to hold a 4bpp image of the given size
constexpr size_t ssd1322BufferSize(const uint16_t width, const uint16_t height) {
  return static_cast<size_t>(width) * height / 2;
}

// One pixel write coming from a drawing layer
struct Ssd1322Pixel {
  int16_t x;
  int16_t y;
  uint8_t gray;
};

/**
 * Packed 4-bit grayscale frame buffer in the SSD1322 RAM layout.
 *
 * Each byte holds two horizontally adjacent pixels: the even x coordinate in
 * the high nibble and the odd one in the low nibble. The buffer is sized at
 * compile time and starts out all black (level 0).
 */
template <uint16_t Width, uint16_t Height>
class Ssd1322Frame {
 public:
  static_assert(Width > 0 && Height > 0, "frame must not be empty");
  static_assert(Width % 4 == 0, "width must be a multiple of 4 (one RAM column address)");
  static_assert(Width <= 480, "width exceeds the controller RAM");
  static_assert(Height <= 128, "height exceeds the controller RAM");

  static constexpr uint16_t WIDTH = Width;
  static constexpr uint16_t HEIGHT = Height;
  static constexpr size_t BUFFER_SIZE = ssd1322BufferSize(Width, Height);

  Ssd1322Frame() { memset(buffer, 0, BUFFER_SIZE); }

  uint16_t width() const { return Width; }
  uint16_t height() const { return Height; }
  size_t size() const { return BUFFER_SIZE; }

  const uint8_t* data() const { return buffer; }
  uint8_t* data() { return buffer; }

  /**
   * Sets one pixel. Coordinates outside the frame are dropped silently since
   * drawing primitives routinely clip at the edges.
   *
   * @param x column, 0 at the left
   * @param y row, 0 at the top
   * @param gray gray level, only the low 4 bits are used
   */
  void setPixel(const int16_t x, const int16_t y, uint8_t gray) {
    if (x < 0 || y < 0 || x >= Width || y >= Height) {
      return;
    }

    const size_t idx = (static_cast<size_t>(y) * Width + static_cast<size_t>(x)) / 2;
    gray &= 0x0F;

    if (x % 2 == 0) {
      // Even x in the high nibble
      buffer[idx] = static_cast<uint8_t>((buffer[idx] & 0x0F) | (gray << 4));
    } else {
      buffer[idx] = static_cast<uint8_t>((buffer[idx] & 0xF0) | gray);
    }
  }

  // Gray level of one pixel, 0 outside the frame
  uint8_t getPixel(const int16_t x, const int16_t y) const {
    if (x < 0 || y < 0 || x >= Width || y >= Height) {
      return 0;
    }

    const size_t idx = (static_cast<size_t>(y) * Width + static_cast<size_t>(x)) / 2;
    return (x % 2 == 0) ? static_cast<uint8_t>(buffer[idx] >> 4) : static_cast<uint8_t>(buffer[idx] & 0x0F);
  }

  void drawPixels(const Ssd1322Pixel* pixels, const size_t count) {
    if (!pixels) return;
    for (size_t i = 0; i < count; i++) {
      setPixel(pixels[i].x, pixels[i].y, pixels[i].gray);
    }
  }

  // Fills the whole frame with one gray level
  void clear(uint8_t gray = 0) {
    gray &= 0x0F;
    memset(buffer, (gray << 4) | gray, BUFFER_SIZE);
  }

 private:
  uint8_t buffer[BUFFER_SIZE];
};
