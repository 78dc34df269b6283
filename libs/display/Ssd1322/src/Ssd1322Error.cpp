#include "Ssd1322Error.h"

const char* ssd1322ErrorName(const Ssd1322Error error) {
  switch (error) {
    case SSD1322_OK:
      return "OK";
    case SSD1322_OUT_OF_RANGE:
      return "OUT_OF_RANGE";
    case SSD1322_BAD_TABLE_LENGTH:
      return "BAD_TABLE_LENGTH";
    case SSD1322_COMM_FAILURE:
      return "COMM_FAILURE";
    case SSD1322_PIN_FAILURE:
      return "PIN_FAILURE";
    case SSD1322_NOT_INITIALIZED:
      return "NOT_INITIALIZED";
  }
  return "UNKNOWN";
}
