#pragma once
#include <cstddef>
#include <cstdint>

// Serial channel to the controller. Writes are ordered and all-or-nothing.
class Ssd1322Transport {
 public:
  virtual ~Ssd1322Transport() = default;

  // Returns 0 on success, otherwise a transport-specific error code
  virtual int32_t write(const uint8_t* data, size_t length) = 0;
};

// Digital output line (data/command select, reset, power enable).
class Ssd1322Pin {
 public:
  virtual ~Ssd1322Pin() = default;

  virtual bool setHigh() = 0;
  virtual bool setLow() = 0;
};

class Ssd1322Delay {
 public:
  virtual ~Ssd1322Delay() = default;

  virtual void delayMs(uint32_t ms) = 0;
};
