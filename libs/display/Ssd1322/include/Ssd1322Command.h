#pragma once
#include <cstddef>
#include <cstdint>

#include "Ssd1322Error.h"

// Encoded form of one controller command: the opcode byte followed by
// `len` parameter bytes. Bytes of `data` past `len` are never transmitted.
struct Ssd1322CommandData {
  uint8_t cmd;
  uint8_t data[2];
  uint8_t len;
};

/**
 * A single SSD1322 instruction together with its parameters.
 *
 * Commands are built with the static factory functions below and turned into
 * wire bytes with prepare(). Building a command never validates; prepare()
 * checks every parameter against the controller limits and reports
 * SSD1322_OUT_OF_RANGE before anything can reach the bus.
 */
class Ssd1322Command {
 public:
  // Display geometry supported by the controller RAM
  static constexpr uint16_t NUM_PIXEL_COLS = 480;
  static constexpr uint8_t NUM_PIXEL_ROWS = 128;
  static constexpr uint8_t NUM_BUF_COLS = NUM_PIXEL_COLS / 4;  // 4 pixels per column address
  static constexpr uint16_t PIXEL_COL_MAX = NUM_PIXEL_COLS - 1;
  static constexpr uint8_t PIXEL_ROW_MAX = NUM_PIXEL_ROWS - 1;
  static constexpr uint8_t BUF_COL_MAX = NUM_BUF_COLS - 1;

  // Custom gray scale table: GS1..GS15 pulse widths
  static constexpr size_t GRAY_SCALE_TABLE_LENGTH = 15;
  static constexpr uint8_t GRAY_SCALE_LEVEL_MAX = 180;

  enum Kind : uint8_t {
    ENABLE_GRAY_SCALE_TABLE,
    SET_COLUMN_ADDRESS,
    WRITE_RAM,
    READ_RAM,
    SET_ROW_ADDRESS,
    SET_REMAPPING,
    SET_START_LINE,
    SET_DISPLAY_OFFSET,
    SET_DISPLAY_MODE,
    ENABLE_PARTIAL_DISPLAY,
    DISABLE_PARTIAL_DISPLAY,
    FUNCTION_SELECT,
    SET_SLEEP_MODE,
    SET_PHASE_LENGTHS,
    SET_CLOCK_FOSC_DIVSET,
    SET_DISPLAY_ENHANCEMENTS,
    SET_SECOND_PRECHARGE_PERIOD,
    SET_DEFAULT_GRAY_SCALE_TABLE,
    SET_PRECHARGE_VOLTAGE,
    SET_COM_DESELECT_VOLTAGE,
    SET_CONTRAST_CURRENT,
    SET_MASTER_CONTRAST,
    SET_MUX_RATIO,
    SET_COMMAND_LOCK
  };

  // Address auto-increment direction while image data is written
  enum IncrementAxis : uint8_t { INCREMENT_HORIZONTAL, INCREMENT_VERTICAL };

  // Direction of mapping RAM column addresses 0..119 onto pixel column groups
  enum ColumnRemap : uint8_t { COLUMN_FORWARD, COLUMN_REVERSE };

  // Order of the 4 pixels stored in the 2-byte word at each column address
  enum NibbleRemap : uint8_t { NIBBLE_REVERSE, NIBBLE_FORWARD };

  // COM scan order; toggling flips the image vertically
  enum ComScanDirection : uint8_t { ROW_ZERO_FIRST, ROW_ZERO_LAST };

  // How the module wires COM lines to display rows. Dictated by the panel.
  enum ComLayout : uint8_t { COM_PROGRESSIVE, COM_INTERLACED, COM_DUAL_PROGRESSIVE };

  enum DisplayMode : uint8_t { MODE_BLANK_DARK, MODE_BLANK_BRIGHT, MODE_NORMAL, MODE_INVERSE };

  enum FunctionSelection : uint8_t { EXTERNAL_VDD, INTERNAL_VDD };

  struct Remapping {
    IncrementAxis incrementAxis;
    ColumnRemap columnRemap;
    NibbleRemap nibbleRemap;
    ComScanDirection comScanDirection;
    ComLayout comLayout;
  };

  static Ssd1322Command enableGrayScaleTable();
  // Column address range (0-119) for the following RAM access
  static Ssd1322Command setColumnAddress(uint8_t start, uint8_t end);
  static Ssd1322Command writeRam();
  static Ssd1322Command readRam();
  // Row address range (0-127) for the following RAM access
  static Ssd1322Command setRowAddress(uint8_t start, uint8_t end);
  static Ssd1322Command setRemapping(IncrementAxis incrementAxis, ColumnRemap columnRemap, NibbleRemap nibbleRemap,
                                     ComScanDirection comScanDirection, ComLayout comLayout);
  static Ssd1322Command setRemapping(const Remapping& remapping);
  // RAM row shown on the first display row (0-127), applied before the mux ratio
  static Ssd1322Command setStartLine(uint8_t line);
  // COM line offset (0-127), applied after the mux ratio
  static Ssd1322Command setDisplayOffset(uint8_t line);
  static Ssd1322Command setDisplayMode(DisplayMode mode);
  // Inclusive active row range, start <= end
  static Ssd1322Command enablePartialDisplay(uint8_t start, uint8_t end);
  static Ssd1322Command disablePartialDisplay();
  static Ssd1322Command functionSelect(FunctionSelection selection);
  // true powers down the multiplexer and drivers (display off)
  static Ssd1322Command setSleepMode(bool enabled);
  // Reset phase 5-31 DCLKs, first pre-charge phase 3-15 DCLKs
  static Ssd1322Command setPhaseLengths(uint8_t phase1, uint8_t phase2);
  // Oscillator frequency 0-15, DCLK = Fosc / 2^divset with divset 0-10
  static Ssd1322Command setClockFoscDivset(uint8_t fosc, uint8_t divset);
  static Ssd1322Command setDisplayEnhancements(bool externalVsl, bool enhancedLowGrayScale);
  // 0-15 DCLKs
  static Ssd1322Command setSecondPrechargePeriod(uint8_t period);
  static Ssd1322Command setDefaultGrayScaleTable();
  // 0.2*Vcc to 0.6*Vcc, 0-31
  static Ssd1322Command setPrechargeVoltage(uint8_t voltage);
  // 0.72*Vcc to 0.86*Vcc, 0-7
  static Ssd1322Command setComDeselectVoltage(uint8_t voltage);
  static Ssd1322Command setContrastCurrent(uint8_t current);
  // 0 (maximum dimming) to 15 (normal)
  static Ssd1322Command setMasterContrast(uint8_t contrast);
  // Number of active COM lines, 16-128
  static Ssd1322Command setMuxRatio(uint8_t ratio);
  // A locked controller ignores everything except another lock command
  static Ssd1322Command setCommandLock(bool locked);

  Kind kind() const { return _kind; }

  /**
   * Encodes the command for transmission.
   *
   * @param out receives opcode and parameter bytes; untouched on failure
   * @return SSD1322_OK or SSD1322_OUT_OF_RANGE
   */
  Ssd1322Error prepare(Ssd1322CommandData& out) const;

  /**
   * Validates a custom gray scale table for the 0xB8 upload.
   *
   * The table holds the pulse widths of gray levels GS1..GS15 (GS0 is fixed
   * by the controller). Entries must be strictly ascending and at most 180.
   *
   * @param table gray level pulse widths
   * @param length number of entries in table, must be 15
   * @param out receives the bytes to send as data after the opcode
   * @return SSD1322_OK, SSD1322_BAD_TABLE_LENGTH or SSD1322_OUT_OF_RANGE
   */
  static Ssd1322Error prepareGrayScaleTable(const uint8_t* table, size_t length,
                                            uint8_t (&out)[GRAY_SCALE_TABLE_LENGTH]);

  // Opcode of the gray scale table upload; the table follows as data bytes
  static constexpr uint8_t CMD_SET_GRAY_SCALE_TABLE = 0xB8;

 private:
  explicit Ssd1322Command(Kind kind, uint8_t arg0 = 0, uint8_t arg1 = 0);

  Kind _kind;
  uint8_t _arg0;
  uint8_t _arg1;
  Remapping _remapping;
};
