#include "Ssd1322ArduinoBus.h"

ArduinoSpiTransport::ArduinoSpiTransport(SPIClass& spi, int8_t sclk, int8_t mosi, int8_t cs, uint32_t frequency)
    : spi(spi), _sclk(sclk), _mosi(mosi), _cs(cs), frequency(frequency) {}

void ArduinoSpiTransport::begin() {
  // Write-only bus, MISO unused
  spi.begin(_sclk, -1, _mosi, _cs);
  spiSettings = SPISettings(frequency, MSBFIRST, SPI_MODE0);

  pinMode(_cs, OUTPUT);
  digitalWrite(_cs, HIGH);

  if (Serial) Serial.printf("[%lu] [SSD1322] SPI initialized at %lu Hz, Mode 0\n", millis(),
                            static_cast<unsigned long>(frequency));
}

int32_t ArduinoSpiTransport::write(const uint8_t* data, const size_t length) {
  if (length == 0) {
    return 0;
  }

  spi.beginTransaction(spiSettings);
  digitalWrite(_cs, LOW);                               // Select chip
  spi.writeBytes(data, static_cast<uint32_t>(length));  // Transfer all bytes
  digitalWrite(_cs, HIGH);                              // Deselect chip
  spi.endTransaction();
  return 0;
}

ArduinoOutputPin::ArduinoOutputPin(const int8_t pin, const uint8_t initialLevel)
    : _pin(pin), initialLevel(initialLevel) {}

void ArduinoOutputPin::begin() {
  pinMode(_pin, OUTPUT);
  digitalWrite(_pin, initialLevel);
}

bool ArduinoOutputPin::setHigh() {
  digitalWrite(_pin, HIGH);
  return true;
}

bool ArduinoOutputPin::setLow() {
  digitalWrite(_pin, LOW);
  return true;
}
