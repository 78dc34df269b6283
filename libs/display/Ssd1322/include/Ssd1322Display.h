#pragma once
#include <cstddef>
#include <cstdint>

#include "Ssd1322Bus.h"
#include "Ssd1322Command.h"
#include "Ssd1322Error.h"
#include "Ssd1322Frame.h"

class Ssd1322Display {
 public:
  // Display orientations supported by the remapping presets
  enum Orientation : uint8_t {
    STANDARD_ORIENTATION,  // Columns forward, row 0 scanned last
    INVERTED_ORIENTATION   // Columns reversed, row 0 scanned first (rotated 180 degrees)
  };

  enum State : uint8_t {
    STATE_UNINITIALIZED,  // Electrical state unknown, hardReset() required
    STATE_RESET,          // Reset sequence done, controller not configured yet
    STATE_READY           // initialize() completed
  };

  struct Config {
    bool invertedColour = false;
    Orientation orientation = STANDARD_ORIENTATION;
  };

  // Default initialization profile
  static constexpr uint8_t DEFAULT_PHASE1_LENGTH = 5;
  static constexpr uint8_t DEFAULT_PHASE2_LENGTH = 15;
  static constexpr uint8_t DEFAULT_FOSC = 10;
  static constexpr uint8_t DEFAULT_DIVSET = 1;
  static constexpr uint8_t DEFAULT_SECOND_PRECHARGE_PERIOD = 8;
  static constexpr uint8_t DEFAULT_PRECHARGE_VOLTAGE = 31;
  static constexpr uint8_t DEFAULT_COM_DESELECT_VOLTAGE = 7;
  static constexpr uint8_t DEFAULT_CONTRAST_CURRENT = 0x3C;
  static constexpr uint8_t DEFAULT_MASTER_CONTRAST = 0x0A;
  static constexpr uint8_t DEFAULT_MUX_RATIO = 63;
  static constexpr size_t DEFAULT_PROFILE_LENGTH = 19;

  // Delay between the steps of the power-on sequence
  static constexpr uint32_t RESET_STEP_DELAY_MS = 1;

  // The transport and pins are used exclusively by this display for its lifetime
  Ssd1322Display(Ssd1322Transport& transport, Ssd1322Pin& dc, Ssd1322Pin& rst, Ssd1322Pin& power);
  Ssd1322Display(Ssd1322Transport& transport, Ssd1322Pin& dc, Ssd1322Pin& rst, Ssd1322Pin& power,
                 const Config& config);
  ~Ssd1322Display() = default;

  Ssd1322Display(const Ssd1322Display&) = delete;
  Ssd1322Display& operator=(const Ssd1322Display&) = delete;

  /**
   * Power-on sequence from section 8.9 of the SSD1322 datasheet.
   *
   * RES# is pulled low for at least 100us, released, and VCC is switched on
   * at least 100us later. Each step is separated by RESET_STEP_DELAY_MS. The
   * display is left in sleep mode; initialize() configures it before turning
   * it on.
   */
  Ssd1322Error hardReset(Ssd1322Delay& delay);

  /**
   * Resets the controller and sends the default configuration, then applies
   * the configured orientation. In most cases this is all that is needed to
   * bring up the panel.
   *
   * Every command is validated before the reset pulse and before the first
   * byte is sent. The sequence stops at the first failure.
   */
  Ssd1322Error initialize(Ssd1322Delay& delay);

  /**
   * Same as initialize(delay) with a caller-supplied configuration list.
   *
   * The list should unlock the controller, enter sleep before configuring and
   * leave sleep as its last command. The configured orientation is applied
   * afterwards.
   */
  Ssd1322Error initialize(Ssd1322Delay& delay, const Ssd1322Command* profile, size_t count);

  // Stores the orientation and sends the matching remapping preset
  Ssd1322Error setOrientation(Orientation orientation);

  /**
   * Selects the RAM region written by the following data. The window is
   * centred in the 480 pixel wide controller RAM.
   *
   * @return SSD1322_OUT_OF_RANGE if a computed column or row address lies
   *         outside the controller RAM; nothing is sent in that case
   */
  Ssd1322Error setAddressWindow(uint16_t startX, uint16_t startY, uint16_t width, uint16_t height);

  // Streams raw pixel data into the current address window
  Ssd1322Error writeData(const uint8_t* data, size_t length);

  // Sends WRITE RAM followed by the buffer. The address window must already be set.
  Ssd1322Error flushBuffer(const uint8_t* data, size_t length);

  // Writes a whole frame at the origin of the panel
  template <uint16_t Width, uint16_t Height>
  Ssd1322Error flushFrame(const Ssd1322Frame<Width, Height>& frame) {
    return flushPixels(frame.width(), frame.height(), frame.data(), frame.size());
  }

  // Encodes and sends one command; usable once hardReset() has run
  Ssd1322Error sendCommand(const Ssd1322Command& command);

  Ssd1322Error setInverted(bool inverted);
  Ssd1322Error setContrast(uint8_t current);
  Ssd1322Error setMasterContrast(uint8_t contrast);
  Ssd1322Error sleep();
  Ssd1322Error wake();

  /**
   * Uploads a custom gray scale table (GS1..GS15) and enables it.
   *
   * @param table 15 strictly ascending pulse widths, each at most 180
   * @param length number of entries in table
   */
  Ssd1322Error setGrayScaleTable(const uint8_t* table, size_t length);

  State getState() const { return state; }
  bool isReady() const { return state == STATE_READY; }
  bool isInverted() const { return inverted; }
  Orientation getOrientation() const { return orientation; }

  // Code reported by the transport for the last SSD1322_COMM_FAILURE
  int32_t lastTransportError() const { return transportError; }

  static Ssd1322Command::Remapping remappingFor(Orientation orientation);

 private:
  Ssd1322Transport& transport;
  Ssd1322Pin& dc;
  Ssd1322Pin& rst;
  Ssd1322Pin& power;

  bool inverted;
  Orientation orientation;
  State state;
  int32_t transportError;

  Ssd1322Error flushPixels(uint16_t width, uint16_t height, const uint8_t* data, size_t length);
  Ssd1322Error validateProfile(const Ssd1322Command* profile, size_t count);
  Ssd1322Error runProfile(const Ssd1322Command* profile, size_t count);

  // Low-level framing
  Ssd1322Error sendPrepared(const Ssd1322CommandData& command);
  Ssd1322Error startCommand();
  Ssd1322Error startData();
  Ssd1322Error transmit(const uint8_t* data, size_t length);
  Ssd1322Error fail(Ssd1322Error error, const char* operation);
};
