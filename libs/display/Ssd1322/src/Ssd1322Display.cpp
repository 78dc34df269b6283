#include "Ssd1322Display.h"

#include "Ssd1322Log.h"

Ssd1322Display::Ssd1322Display(Ssd1322Transport& transport, Ssd1322Pin& dc, Ssd1322Pin& rst, Ssd1322Pin& power)
    : Ssd1322Display(transport, dc, rst, power, Config()) {}

Ssd1322Display::Ssd1322Display(Ssd1322Transport& transport, Ssd1322Pin& dc, Ssd1322Pin& rst, Ssd1322Pin& power,
                               const Config& config)
    : transport(transport),
      dc(dc),
      rst(rst),
      power(power),
      inverted(config.invertedColour),
      orientation(config.orientation),
      state(STATE_UNINITIALIZED),
      transportError(0) {}

// ============================================================================
// Power-on and configuration
// ============================================================================

Ssd1322Error Ssd1322Display::hardReset(Ssd1322Delay& delay) {
  SSD1322_LOG("Resetting display...");
  state = STATE_UNINITIALIZED;

  delay.delayMs(RESET_STEP_DELAY_MS);
  if (!rst.setLow()) return fail(SSD1322_PIN_FAILURE, "hardReset");
  delay.delayMs(RESET_STEP_DELAY_MS);
  if (!rst.setHigh()) return fail(SSD1322_PIN_FAILURE, "hardReset");
  delay.delayMs(RESET_STEP_DELAY_MS);
  if (!power.setHigh()) return fail(SSD1322_PIN_FAILURE, "hardReset");
  delay.delayMs(RESET_STEP_DELAY_MS);

  state = STATE_RESET;
  SSD1322_LOG("Display reset complete");
  return SSD1322_OK;
}

Ssd1322Error Ssd1322Display::initialize(Ssd1322Delay& delay) {
  const Ssd1322Command profile[DEFAULT_PROFILE_LENGTH] = {
      Ssd1322Command::setCommandLock(false),
      Ssd1322Command::setSleepMode(true),
      Ssd1322Command::setRemapping(remappingFor(STANDARD_ORIENTATION)),
      Ssd1322Command::setStartLine(0),
      Ssd1322Command::setDisplayOffset(0),
      Ssd1322Command::setDisplayMode(inverted ? Ssd1322Command::MODE_INVERSE : Ssd1322Command::MODE_NORMAL),
      Ssd1322Command::functionSelect(Ssd1322Command::INTERNAL_VDD),
      Ssd1322Command::setPhaseLengths(DEFAULT_PHASE1_LENGTH, DEFAULT_PHASE2_LENGTH),
      Ssd1322Command::setClockFoscDivset(DEFAULT_FOSC, DEFAULT_DIVSET),
      Ssd1322Command::setDisplayEnhancements(true, true),
      Ssd1322Command::setSecondPrechargePeriod(DEFAULT_SECOND_PRECHARGE_PERIOD),
      Ssd1322Command::setDefaultGrayScaleTable(),
      Ssd1322Command::setPrechargeVoltage(DEFAULT_PRECHARGE_VOLTAGE),
      Ssd1322Command::setComDeselectVoltage(DEFAULT_COM_DESELECT_VOLTAGE),
      Ssd1322Command::setContrastCurrent(DEFAULT_CONTRAST_CURRENT),
      Ssd1322Command::setMasterContrast(DEFAULT_MASTER_CONTRAST),
      Ssd1322Command::setMuxRatio(DEFAULT_MUX_RATIO),
      Ssd1322Command::disablePartialDisplay(),
      // Display enhancement B is left at its reset value
      Ssd1322Command::setSleepMode(false),
  };

  return initialize(delay, profile, DEFAULT_PROFILE_LENGTH);
}

Ssd1322Error Ssd1322Display::initialize(Ssd1322Delay& delay, const Ssd1322Command* profile, const size_t count) {
  // Reject a bad list before the pins or the bus are touched
  Ssd1322Error err = validateProfile(profile, count);
  if (err != SSD1322_OK) {
    return fail(err, "initialize");
  }

  err = hardReset(delay);
  if (err != SSD1322_OK) {
    return err;
  }

  SSD1322_LOG("Initializing SSD1322 controller (%u commands)...", static_cast<unsigned>(count));
  err = runProfile(profile, count);
  if (err != SSD1322_OK) {
    return fail(err, "initialize");
  }

  state = STATE_READY;
  err = setOrientation(orientation);
  if (err != SSD1322_OK) {
    return err;
  }

  SSD1322_LOG("SSD1322 controller initialized");
  return SSD1322_OK;
}

Ssd1322Error Ssd1322Display::validateProfile(const Ssd1322Command* profile, const size_t count) {
  if (count > 0 && !profile) {
    return SSD1322_OUT_OF_RANGE;
  }

  Ssd1322CommandData prepared;
  for (size_t i = 0; i < count; i++) {
    const Ssd1322Error err = profile[i].prepare(prepared);
    if (err != SSD1322_OK) {
      SSD1322_LOG("Init command %u rejected", static_cast<unsigned>(i));
      return err;
    }
  }
  return SSD1322_OK;
}

Ssd1322Error Ssd1322Display::runProfile(const Ssd1322Command* profile, const size_t count) {
  Ssd1322CommandData prepared;
  for (size_t i = 0; i < count; i++) {
    const Ssd1322Error err = profile[i].prepare(prepared);
    if (err != SSD1322_OK) {
      return err;
    }
    const Ssd1322Error sent = sendPrepared(prepared);
    if (sent != SSD1322_OK) {
      return sent;
    }
  }
  return SSD1322_OK;
}

Ssd1322Command::Remapping Ssd1322Display::remappingFor(const Orientation orientation) {
  Ssd1322Command::Remapping remapping = {Ssd1322Command::INCREMENT_HORIZONTAL, Ssd1322Command::COLUMN_FORWARD,
                                         Ssd1322Command::NIBBLE_FORWARD, Ssd1322Command::ROW_ZERO_LAST,
                                         Ssd1322Command::COM_DUAL_PROGRESSIVE};
  if (orientation == INVERTED_ORIENTATION) {
    remapping.columnRemap = Ssd1322Command::COLUMN_REVERSE;
    remapping.comScanDirection = Ssd1322Command::ROW_ZERO_FIRST;
  }
  return remapping;
}

Ssd1322Error Ssd1322Display::setOrientation(const Orientation orientation) {
  if (state != STATE_READY) {
    return SSD1322_NOT_INITIALIZED;
  }

  this->orientation = orientation;
  SSD1322_LOG("Orientation: %s", orientation == INVERTED_ORIENTATION ? "inverted" : "standard");

  const Ssd1322Error err = sendCommand(Ssd1322Command::setRemapping(remappingFor(orientation)));
  if (err != SSD1322_OK) {
    return fail(err, "setOrientation");
  }
  return SSD1322_OK;
}

Ssd1322Error Ssd1322Display::setInverted(const bool inverted) {
  if (state != STATE_READY) {
    return SSD1322_NOT_INITIALIZED;
  }

  this->inverted = inverted;
  const Ssd1322Error err = sendCommand(
      Ssd1322Command::setDisplayMode(inverted ? Ssd1322Command::MODE_INVERSE : Ssd1322Command::MODE_NORMAL));
  if (err != SSD1322_OK) {
    return fail(err, "setInverted");
  }
  return SSD1322_OK;
}

Ssd1322Error Ssd1322Display::setContrast(const uint8_t current) {
  if (state != STATE_READY) {
    return SSD1322_NOT_INITIALIZED;
  }

  const Ssd1322Error err = sendCommand(Ssd1322Command::setContrastCurrent(current));
  if (err != SSD1322_OK) {
    return fail(err, "setContrast");
  }
  return SSD1322_OK;
}

Ssd1322Error Ssd1322Display::setMasterContrast(const uint8_t contrast) {
  if (state != STATE_READY) {
    return SSD1322_NOT_INITIALIZED;
  }

  const Ssd1322Error err = sendCommand(Ssd1322Command::setMasterContrast(contrast));
  if (err != SSD1322_OK) {
    return fail(err, "setMasterContrast");
  }
  return SSD1322_OK;
}

Ssd1322Error Ssd1322Display::sleep() {
  if (state != STATE_READY) {
    return SSD1322_NOT_INITIALIZED;
  }

  SSD1322_LOG("Entering sleep mode");
  const Ssd1322Error err = sendCommand(Ssd1322Command::setSleepMode(true));
  if (err != SSD1322_OK) {
    return fail(err, "sleep");
  }
  return SSD1322_OK;
}

Ssd1322Error Ssd1322Display::wake() {
  if (state != STATE_READY) {
    return SSD1322_NOT_INITIALIZED;
  }

  SSD1322_LOG("Leaving sleep mode");
  const Ssd1322Error err = sendCommand(Ssd1322Command::setSleepMode(false));
  if (err != SSD1322_OK) {
    return fail(err, "wake");
  }
  return SSD1322_OK;
}

Ssd1322Error Ssd1322Display::setGrayScaleTable(const uint8_t* table, const size_t length) {
  if (state != STATE_READY) {
    return SSD1322_NOT_INITIALIZED;
  }

  uint8_t levels[Ssd1322Command::GRAY_SCALE_TABLE_LENGTH];
  Ssd1322Error err = Ssd1322Command::prepareGrayScaleTable(table, length, levels);
  if (err != SSD1322_OK) {
    return fail(err, "setGrayScaleTable");
  }

  const uint8_t cmd = Ssd1322Command::CMD_SET_GRAY_SCALE_TABLE;
  err = startCommand();
  if (err == SSD1322_OK) err = transmit(&cmd, 1);
  if (err == SSD1322_OK) err = startData();
  if (err == SSD1322_OK) err = transmit(levels, sizeof(levels));
  if (err == SSD1322_OK) err = sendCommand(Ssd1322Command::enableGrayScaleTable());
  if (err != SSD1322_OK) {
    return fail(err, "setGrayScaleTable");
  }

  SSD1322_LOG("Custom gray scale table loaded");
  return SSD1322_OK;
}

// ============================================================================
// Frame transfer
// ============================================================================

Ssd1322Error Ssd1322Display::setAddressWindow(const uint16_t startX, const uint16_t startY, const uint16_t width,
                                              const uint16_t height) {
  if (state != STATE_READY) {
    return SSD1322_NOT_INITIALIZED;
  }

  // Centre the window in the 480 pixel RAM, 4 pixels per column address
  const int32_t offset = (static_cast<int32_t>(Ssd1322Command::NUM_PIXEL_COLS) - width + startX) / 2;
  const int32_t columnStart = offset / 4;
  const int32_t columnEnd = columnStart + width / 4 - 1;
  const int32_t rowStart = startY;
  const int32_t rowEnd = rowStart + height - 1;

  // Empty windows would leave an end address below its start
  if (width < 4 || height == 0 || columnEnd < columnStart) {
    return fail(SSD1322_OUT_OF_RANGE, "setAddressWindow");
  }
  if (offset < 0 || columnStart > Ssd1322Command::BUF_COL_MAX || columnEnd < 0 ||
      columnEnd > Ssd1322Command::BUF_COL_MAX || rowStart > Ssd1322Command::PIXEL_ROW_MAX || rowEnd < 0 ||
      rowEnd > Ssd1322Command::PIXEL_ROW_MAX) {
    return fail(SSD1322_OUT_OF_RANGE, "setAddressWindow");
  }

  Ssd1322Error err = sendCommand(
      Ssd1322Command::setColumnAddress(static_cast<uint8_t>(columnStart), static_cast<uint8_t>(columnEnd)));
  if (err == SSD1322_OK) {
    err = sendCommand(Ssd1322Command::setRowAddress(static_cast<uint8_t>(rowStart), static_cast<uint8_t>(rowEnd)));
  }
  if (err != SSD1322_OK) {
    return fail(err, "setAddressWindow");
  }
  return SSD1322_OK;
}

Ssd1322Error Ssd1322Display::writeData(const uint8_t* data, const size_t length) {
  if (state != STATE_READY) {
    return SSD1322_NOT_INITIALIZED;
  }

  Ssd1322Error err = startData();
  if (err == SSD1322_OK) err = transmit(data, length);
  if (err != SSD1322_OK) {
    return fail(err, "writeData");
  }
  return SSD1322_OK;
}

Ssd1322Error Ssd1322Display::flushBuffer(const uint8_t* data, const size_t length) {
  if (state != STATE_READY) {
    return SSD1322_NOT_INITIALIZED;
  }

  const Ssd1322Error err = sendCommand(Ssd1322Command::writeRam());
  if (err != SSD1322_OK) {
    return fail(err, "flushBuffer");
  }
  return writeData(data, length);
}

Ssd1322Error Ssd1322Display::flushPixels(const uint16_t width, const uint16_t height, const uint8_t* data,
                                         const size_t length) {
  if (state != STATE_READY) {
    return SSD1322_NOT_INITIALIZED;
  }

  const Ssd1322Error err = setAddressWindow(0, 0, width, height);
  if (err != SSD1322_OK) {
    return err;
  }
  return flushBuffer(data, length);
}

// ============================================================================
// Low-level display control
// ============================================================================

Ssd1322Error Ssd1322Display::sendCommand(const Ssd1322Command& command) {
  if (state == STATE_UNINITIALIZED) {
    return SSD1322_NOT_INITIALIZED;
  }

  Ssd1322CommandData prepared;
  const Ssd1322Error err = command.prepare(prepared);
  if (err != SSD1322_OK) {
    return err;
  }
  return sendPrepared(prepared);
}

Ssd1322Error Ssd1322Display::sendPrepared(const Ssd1322CommandData& command) {
  Ssd1322Error err = startCommand();
  if (err == SSD1322_OK) err = transmit(&command.cmd, 1);
  if (err != SSD1322_OK || command.len == 0) {
    return err;
  }

  err = startData();
  if (err == SSD1322_OK) err = transmit(command.data, command.len);
  return err;
}

Ssd1322Error Ssd1322Display::startCommand() {
  return dc.setLow() ? SSD1322_OK : SSD1322_PIN_FAILURE;  // Command mode
}

Ssd1322Error Ssd1322Display::startData() {
  return dc.setHigh() ? SSD1322_OK : SSD1322_PIN_FAILURE;  // Data mode
}

Ssd1322Error Ssd1322Display::transmit(const uint8_t* data, const size_t length) {
  const int32_t result = transport.write(data, length);
  if (result != 0) {
    transportError = result;
    return SSD1322_COMM_FAILURE;
  }
  return SSD1322_OK;
}

Ssd1322Error Ssd1322Display::fail(const Ssd1322Error error, const char* operation) {
  if (error == SSD1322_COMM_FAILURE || error == SSD1322_PIN_FAILURE) {
    // Address pointer and DC state are unknown now; only a new initialize() recovers
    state = STATE_UNINITIALIZED;
  }

  if (error == SSD1322_COMM_FAILURE) {
    SSD1322_LOG("ERROR: %s failed: %s (transport error %ld)", operation, ssd1322ErrorName(error),
                static_cast<long>(transportError));
  } else {
    SSD1322_LOG("ERROR: %s failed: %s", operation, ssd1322ErrorName(error));
  }
  return error;
}
