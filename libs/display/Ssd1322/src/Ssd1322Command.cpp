#include "Ssd1322Command.h"

// SSD1322 command definitions
// Addressing and RAM access
#define CMD_ENABLE_GRAY_SCALE_TABLE 0x00  // Enable custom gray scale table
#define CMD_SET_COLUMN_ADDRESS 0x15       // Set column address range
#define CMD_WRITE_RAM 0x5C                // Write RAM
#define CMD_READ_RAM 0x5D                 // Read RAM
#define CMD_SET_ROW_ADDRESS 0x75          // Set row address range
#define CMD_SET_REMAP 0xA0                // Set re-map and dual COM line mode
#define CMD_SET_START_LINE 0xA1           // Set display start line
#define CMD_SET_DISPLAY_OFFSET 0xA2       // Set display offset

// Display mode
#define CMD_DISPLAY_BLANK_DARK 0xA4    // Entire display OFF (GS0)
#define CMD_DISPLAY_BLANK_BRIGHT 0xA5  // Entire display ON (GS15)
#define CMD_DISPLAY_NORMAL 0xA6        // Normal display
#define CMD_DISPLAY_INVERSE 0xA7       // Inverse display
#define CMD_ENABLE_PARTIAL 0xA8        // Enable partial display
#define CMD_DISABLE_PARTIAL 0xA9       // Exit partial display
#define CMD_FUNCTION_SELECT 0xAB       // VDD regulator selection
#define CMD_SLEEP_ON 0xAE              // Sleep mode ON (display off)
#define CMD_SLEEP_OFF 0xAF             // Sleep mode OFF (display on)

// Timing and analog settings
#define CMD_SET_PHASE_LENGTH 0xB1            // Reset / first pre-charge phase lengths
#define CMD_SET_CLOCK 0xB3                   // Front clock divider and oscillator frequency
#define CMD_DISPLAY_ENHANCEMENT_A 0xB4       // External VSL / low gray scale quality
#define CMD_SET_SECOND_PRECHARGE 0xB6        // Second pre-charge period
#define CMD_SET_DEFAULT_GRAY_SCALE 0xB9      // Select default linear gray scale table
#define CMD_SET_PRECHARGE_VOLTAGE 0xBB       // Pre-charge voltage
#define CMD_SET_COM_DESELECT_VOLTAGE 0xBE    // VCOMH
#define CMD_SET_CONTRAST_CURRENT 0xC1        // Contrast current
#define CMD_SET_MASTER_CONTRAST 0xC7         // Master contrast current control
#define CMD_SET_MUX_RATIO 0xCA               // Multiplex ratio
#define CMD_SET_COMMAND_LOCK 0xFD            // Command lock

// Parameter values
#define COMMAND_LOCK_ON 0x16
#define COMMAND_LOCK_OFF 0x12
#define VSL_EXTERNAL 0xA0
#define VSL_INTERNAL 0xA2
#define LOW_GRAY_SCALE_ENHANCED 0xFD
#define LOW_GRAY_SCALE_NORMAL 0xB5

namespace {
// Remap byte 1 bit fields
constexpr uint8_t REMAP_VERTICAL_INCREMENT = 0x01;
constexpr uint8_t REMAP_COLUMN_REVERSE = 0x02;
constexpr uint8_t REMAP_NIBBLE_FORWARD = 0x04;
constexpr uint8_t REMAP_COM_SCAN_ROW_ZERO_LAST = 0x10;
constexpr uint8_t REMAP_COM_INTERLACED = 0x20;
// Remap byte 2
constexpr uint8_t REMAP_SINGLE_COM = 0x01;
constexpr uint8_t REMAP_DUAL_COM = 0x11;

void setResult(Ssd1322CommandData& out, const uint8_t cmd) {
  out.cmd = cmd;
  out.data[0] = 0;
  out.data[1] = 0;
  out.len = 0;
}

void setResult(Ssd1322CommandData& out, const uint8_t cmd, const uint8_t arg0) {
  setResult(out, cmd);
  out.data[0] = arg0;
  out.len = 1;
}

void setResult(Ssd1322CommandData& out, const uint8_t cmd, const uint8_t arg0, const uint8_t arg1) {
  setResult(out, cmd);
  out.data[0] = arg0;
  out.data[1] = arg1;
  out.len = 2;
}

bool inRange(const uint8_t value, const uint8_t min, const uint8_t max) { return value >= min && value <= max; }
}  // namespace

Ssd1322Command::Ssd1322Command(const Kind kind, const uint8_t arg0, const uint8_t arg1)
    : _kind(kind),
      _arg0(arg0),
      _arg1(arg1),
      _remapping{INCREMENT_HORIZONTAL, COLUMN_FORWARD, NIBBLE_FORWARD, ROW_ZERO_LAST, COM_DUAL_PROGRESSIVE} {}

Ssd1322Command Ssd1322Command::enableGrayScaleTable() { return Ssd1322Command(ENABLE_GRAY_SCALE_TABLE); }

Ssd1322Command Ssd1322Command::setColumnAddress(const uint8_t start, const uint8_t end) {
  return Ssd1322Command(SET_COLUMN_ADDRESS, start, end);
}

Ssd1322Command Ssd1322Command::writeRam() { return Ssd1322Command(WRITE_RAM); }

Ssd1322Command Ssd1322Command::readRam() { return Ssd1322Command(READ_RAM); }

Ssd1322Command Ssd1322Command::setRowAddress(const uint8_t start, const uint8_t end) {
  return Ssd1322Command(SET_ROW_ADDRESS, start, end);
}

Ssd1322Command Ssd1322Command::setRemapping(const IncrementAxis incrementAxis, const ColumnRemap columnRemap,
                                            const NibbleRemap nibbleRemap, const ComScanDirection comScanDirection,
                                            const ComLayout comLayout) {
  Ssd1322Command command(SET_REMAPPING);
  command._remapping = {incrementAxis, columnRemap, nibbleRemap, comScanDirection, comLayout};
  return command;
}

Ssd1322Command Ssd1322Command::setRemapping(const Remapping& remapping) {
  return setRemapping(remapping.incrementAxis, remapping.columnRemap, remapping.nibbleRemap,
                      remapping.comScanDirection, remapping.comLayout);
}

Ssd1322Command Ssd1322Command::setStartLine(const uint8_t line) { return Ssd1322Command(SET_START_LINE, line); }

Ssd1322Command Ssd1322Command::setDisplayOffset(const uint8_t line) {
  return Ssd1322Command(SET_DISPLAY_OFFSET, line);
}

Ssd1322Command Ssd1322Command::setDisplayMode(const DisplayMode mode) {
  return Ssd1322Command(SET_DISPLAY_MODE, mode);
}

Ssd1322Command Ssd1322Command::enablePartialDisplay(const uint8_t start, const uint8_t end) {
  return Ssd1322Command(ENABLE_PARTIAL_DISPLAY, start, end);
}

Ssd1322Command Ssd1322Command::disablePartialDisplay() { return Ssd1322Command(DISABLE_PARTIAL_DISPLAY); }

Ssd1322Command Ssd1322Command::functionSelect(const FunctionSelection selection) {
  return Ssd1322Command(FUNCTION_SELECT, selection);
}

Ssd1322Command Ssd1322Command::setSleepMode(const bool enabled) { return Ssd1322Command(SET_SLEEP_MODE, enabled); }

Ssd1322Command Ssd1322Command::setPhaseLengths(const uint8_t phase1, const uint8_t phase2) {
  return Ssd1322Command(SET_PHASE_LENGTHS, phase1, phase2);
}

Ssd1322Command Ssd1322Command::setClockFoscDivset(const uint8_t fosc, const uint8_t divset) {
  return Ssd1322Command(SET_CLOCK_FOSC_DIVSET, fosc, divset);
}

Ssd1322Command Ssd1322Command::setDisplayEnhancements(const bool externalVsl, const bool enhancedLowGrayScale) {
  return Ssd1322Command(SET_DISPLAY_ENHANCEMENTS, externalVsl, enhancedLowGrayScale);
}

Ssd1322Command Ssd1322Command::setSecondPrechargePeriod(const uint8_t period) {
  return Ssd1322Command(SET_SECOND_PRECHARGE_PERIOD, period);
}

Ssd1322Command Ssd1322Command::setDefaultGrayScaleTable() { return Ssd1322Command(SET_DEFAULT_GRAY_SCALE_TABLE); }

Ssd1322Command Ssd1322Command::setPrechargeVoltage(const uint8_t voltage) {
  return Ssd1322Command(SET_PRECHARGE_VOLTAGE, voltage);
}

Ssd1322Command Ssd1322Command::setComDeselectVoltage(const uint8_t voltage) {
  return Ssd1322Command(SET_COM_DESELECT_VOLTAGE, voltage);
}

Ssd1322Command Ssd1322Command::setContrastCurrent(const uint8_t current) {
  return Ssd1322Command(SET_CONTRAST_CURRENT, current);
}

Ssd1322Command Ssd1322Command::setMasterContrast(const uint8_t contrast) {
  return Ssd1322Command(SET_MASTER_CONTRAST, contrast);
}

Ssd1322Command Ssd1322Command::setMuxRatio(const uint8_t ratio) { return Ssd1322Command(SET_MUX_RATIO, ratio); }

Ssd1322Command Ssd1322Command::setCommandLock(const bool locked) { return Ssd1322Command(SET_COMMAND_LOCK, locked); }

Ssd1322Error Ssd1322Command::prepare(Ssd1322CommandData& out) const {
  Ssd1322CommandData result;

  switch (_kind) {
    case ENABLE_GRAY_SCALE_TABLE:
      setResult(result, CMD_ENABLE_GRAY_SCALE_TABLE);
      break;

    case SET_COLUMN_ADDRESS:
      if (_arg0 > BUF_COL_MAX || _arg1 > BUF_COL_MAX) return SSD1322_OUT_OF_RANGE;
      setResult(result, CMD_SET_COLUMN_ADDRESS, _arg0, _arg1);
      break;

    case WRITE_RAM:
      setResult(result, CMD_WRITE_RAM);
      break;

    case READ_RAM:
      setResult(result, CMD_READ_RAM);
      break;

    case SET_ROW_ADDRESS:
      if (_arg0 > PIXEL_ROW_MAX || _arg1 > PIXEL_ROW_MAX) return SSD1322_OUT_OF_RANGE;
      setResult(result, CMD_SET_ROW_ADDRESS, _arg0, _arg1);
      break;

    case SET_REMAPPING: {
      uint8_t first = 0;
      uint8_t second = REMAP_SINGLE_COM;
      if (_remapping.incrementAxis == INCREMENT_VERTICAL) first |= REMAP_VERTICAL_INCREMENT;
      if (_remapping.columnRemap == COLUMN_REVERSE) first |= REMAP_COLUMN_REVERSE;
      if (_remapping.nibbleRemap == NIBBLE_FORWARD) first |= REMAP_NIBBLE_FORWARD;
      if (_remapping.comScanDirection == ROW_ZERO_LAST) first |= REMAP_COM_SCAN_ROW_ZERO_LAST;
      switch (_remapping.comLayout) {
        case COM_PROGRESSIVE:
          break;
        case COM_INTERLACED:
          first |= REMAP_COM_INTERLACED;
          break;
        case COM_DUAL_PROGRESSIVE:
          second = REMAP_DUAL_COM;
          break;
      }
      setResult(result, CMD_SET_REMAP, first, second);
      break;
    }

    case SET_START_LINE:
      if (_arg0 > PIXEL_ROW_MAX) return SSD1322_OUT_OF_RANGE;
      setResult(result, CMD_SET_START_LINE, _arg0);
      break;

    case SET_DISPLAY_OFFSET:
      if (_arg0 > PIXEL_ROW_MAX) return SSD1322_OUT_OF_RANGE;
      setResult(result, CMD_SET_DISPLAY_OFFSET, _arg0);
      break;

    case SET_DISPLAY_MODE:
      switch (_arg0) {
        case MODE_BLANK_DARK:
          setResult(result, CMD_DISPLAY_BLANK_DARK);
          break;
        case MODE_BLANK_BRIGHT:
          setResult(result, CMD_DISPLAY_BLANK_BRIGHT);
          break;
        case MODE_NORMAL:
          setResult(result, CMD_DISPLAY_NORMAL);
          break;
        case MODE_INVERSE:
          setResult(result, CMD_DISPLAY_INVERSE);
          break;
        default:
          return SSD1322_OUT_OF_RANGE;
      }
      break;

    case ENABLE_PARTIAL_DISPLAY:
      if (_arg0 > PIXEL_ROW_MAX || _arg1 > PIXEL_ROW_MAX || _arg0 > _arg1) return SSD1322_OUT_OF_RANGE;
      setResult(result, CMD_ENABLE_PARTIAL, _arg0, _arg1);
      break;

    case DISABLE_PARTIAL_DISPLAY:
      setResult(result, CMD_DISABLE_PARTIAL);
      break;

    case FUNCTION_SELECT:
      setResult(result, CMD_FUNCTION_SELECT, _arg0 == INTERNAL_VDD ? 0x01 : 0x00);
      break;

    case SET_SLEEP_MODE:
      setResult(result, _arg0 ? CMD_SLEEP_ON : CMD_SLEEP_OFF);
      break;

    case SET_PHASE_LENGTHS: {
      if (!inRange(_arg0, 5, 31) || !inRange(_arg1, 3, 15)) return SSD1322_OUT_OF_RANGE;
      // Phase 1 is programmed in units of 2 DCLKs, phase 2 in the high nibble
      const uint8_t phase1 = static_cast<uint8_t>((_arg0 - 1) >> 1);
      const uint8_t phase2 = static_cast<uint8_t>((_arg1 << 4) & 0xF0);
      setResult(result, CMD_SET_PHASE_LENGTH, phase1 | phase2);
      break;
    }

    case SET_CLOCK_FOSC_DIVSET:
      if (_arg0 > 15 || _arg1 > 10) return SSD1322_OUT_OF_RANGE;
      setResult(result, CMD_SET_CLOCK, static_cast<uint8_t>(_arg0 << 4 | _arg1));
      break;

    case SET_DISPLAY_ENHANCEMENTS:
      setResult(result, CMD_DISPLAY_ENHANCEMENT_A, _arg0 ? VSL_EXTERNAL : VSL_INTERNAL,
                _arg1 ? LOW_GRAY_SCALE_ENHANCED : LOW_GRAY_SCALE_NORMAL);
      break;

    case SET_SECOND_PRECHARGE_PERIOD:
      if (_arg0 > 15) return SSD1322_OUT_OF_RANGE;
      setResult(result, CMD_SET_SECOND_PRECHARGE, _arg0);
      break;

    case SET_DEFAULT_GRAY_SCALE_TABLE:
      setResult(result, CMD_SET_DEFAULT_GRAY_SCALE);
      break;

    case SET_PRECHARGE_VOLTAGE:
      if (_arg0 > 31) return SSD1322_OUT_OF_RANGE;
      setResult(result, CMD_SET_PRECHARGE_VOLTAGE, _arg0);
      break;

    case SET_COM_DESELECT_VOLTAGE:
      if (_arg0 > 7) return SSD1322_OUT_OF_RANGE;
      setResult(result, CMD_SET_COM_DESELECT_VOLTAGE, _arg0);
      break;

    case SET_CONTRAST_CURRENT:
      setResult(result, CMD_SET_CONTRAST_CURRENT, _arg0);
      break;

    case SET_MASTER_CONTRAST:
      if (_arg0 > 15) return SSD1322_OUT_OF_RANGE;
      setResult(result, CMD_SET_MASTER_CONTRAST, _arg0);
      break;

    case SET_MUX_RATIO:
      // Controller expects the number of active rows minus one
      if (!inRange(_arg0, 16, NUM_PIXEL_ROWS)) return SSD1322_OUT_OF_RANGE;
      setResult(result, CMD_SET_MUX_RATIO, static_cast<uint8_t>(_arg0 - 1));
      break;

    case SET_COMMAND_LOCK:
      setResult(result, CMD_SET_COMMAND_LOCK, _arg0 ? COMMAND_LOCK_ON : COMMAND_LOCK_OFF);
      break;

    default:
      return SSD1322_OUT_OF_RANGE;
  }

  out = result;
  return SSD1322_OK;
}

Ssd1322Error Ssd1322Command::prepareGrayScaleTable(const uint8_t* table, const size_t length,
                                                   uint8_t (&out)[GRAY_SCALE_TABLE_LENGTH]) {
  if (table == nullptr || length != GRAY_SCALE_TABLE_LENGTH) {
    return SSD1322_BAD_TABLE_LENGTH;
  }

  for (size_t i = 0; i < length; i++) {
    if (table[i] > GRAY_SCALE_LEVEL_MAX) return SSD1322_OUT_OF_RANGE;
    if (i > 0 && table[i] <= table[i - 1]) return SSD1322_OUT_OF_RANGE;
  }

  for (size_t i = 0; i < length; i++) {
    out[i] = table[i];
  }
  return SSD1322_OK;
}
