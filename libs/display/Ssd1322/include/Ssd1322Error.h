#pragma once
#include <cstdint>

// Status codes returned by every fallible SSD1322 operation.
enum Ssd1322Error : uint8_t {
  SSD1322_OK = 0,
  SSD1322_OUT_OF_RANGE,      // Parameter outside the controller's documented bounds
  SSD1322_BAD_TABLE_LENGTH,  // Gray scale table upload with the wrong number of entries
  SSD1322_COMM_FAILURE,      // Transport write failed (see Ssd1322Display::lastTransportError())
  SSD1322_PIN_FAILURE,       // Output pin could not be driven
  SSD1322_NOT_INITIALIZED    // Operation requires initialize() to have completed
};

const char* ssd1322ErrorName(Ssd1322Error error);
