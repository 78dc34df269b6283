#pragma once

// Serial logging in the SDK format: "[millis] [SSD1322] message".
// Host builds have no Serial port and compile the calls out.
#ifdef ARDUINO
#include <Arduino.h>
#define SSD1322_LOG(fmt, ...)                                                        \
  do {                                                                               \
    if (Serial) Serial.printf("[%lu] [SSD1322] " fmt "\n", millis(), ##__VA_ARGS__); \
  } while (0)
#else
#define SSD1322_LOG(fmt, ...) \
  do {                        \
  } while (0)
#endif
