#pragma once
#include <Arduino.h>
#include <SPI.h>

#include "Ssd1322Bus.h"

// SPI transport with a dedicated chip select line (mode 0, MSB first).
class ArduinoSpiTransport : public Ssd1322Transport {
 public:
  static constexpr uint32_t DEFAULT_FREQUENCY = 10000000;

  ArduinoSpiTransport(SPIClass& spi, int8_t sclk, int8_t mosi, int8_t cs, uint32_t frequency = DEFAULT_FREQUENCY);

  // Configures the bus and the chip select pin
  void begin();

  int32_t write(const uint8_t* data, size_t length) override;

 private:
  SPIClass& spi;
  int8_t _sclk, _mosi, _cs;
  uint32_t frequency;
  SPISettings spiSettings;
};

class ArduinoOutputPin : public Ssd1322Pin {
 public:
  explicit ArduinoOutputPin(int8_t pin, uint8_t initialLevel = LOW);

  void begin();

  bool setHigh() override;
  bool setLow() override;

 private:
  int8_t _pin;
  uint8_t initialLevel;
};

// Blocking millisecond delay; yields to the scheduler on FreeRTOS cores
class ArduinoDelay : public Ssd1322Delay {
 public:
  void delayMs(uint32_t ms) override { delay(ms); }
};
