#include <gtest/gtest.h>

#include <cstring>

#include "Ssd1322Command.h"

namespace {

Ssd1322CommandData prepareOk(const Ssd1322Command& command) {
  Ssd1322CommandData out;
  memset(&out, 0, sizeof(out));
  EXPECT_EQ(SSD1322_OK, command.prepare(out));
  return out;
}

Ssd1322Error prepareError(const Ssd1322Command& command) {
  Ssd1322CommandData out;
  return command.prepare(out);
}

void expectEncoding(const Ssd1322Command& command, uint8_t cmd) {
  const Ssd1322CommandData out = prepareOk(command);
  EXPECT_EQ(cmd, out.cmd);
  EXPECT_EQ(0, out.len);
}

void expectEncoding(const Ssd1322Command& command, uint8_t cmd, uint8_t data0) {
  const Ssd1322CommandData out = prepareOk(command);
  EXPECT_EQ(cmd, out.cmd);
  ASSERT_EQ(1, out.len);
  EXPECT_EQ(data0, out.data[0]);
}

void expectEncoding(const Ssd1322Command& command, uint8_t cmd, uint8_t data0, uint8_t data1) {
  const Ssd1322CommandData out = prepareOk(command);
  EXPECT_EQ(cmd, out.cmd);
  ASSERT_EQ(2, out.len);
  EXPECT_EQ(data0, out.data[0]);
  EXPECT_EQ(data1, out.data[1]);
}

}  // namespace

TEST(Ssd1322CommandTest, OpcodesWithoutParameters) {
  expectEncoding(Ssd1322Command::enableGrayScaleTable(), 0x00);
  expectEncoding(Ssd1322Command::writeRam(), 0x5C);
  expectEncoding(Ssd1322Command::readRam(), 0x5D);
  expectEncoding(Ssd1322Command::disablePartialDisplay(), 0xA9);
  expectEncoding(Ssd1322Command::setSleepMode(true), 0xAE);
  expectEncoding(Ssd1322Command::setSleepMode(false), 0xAF);
  expectEncoding(Ssd1322Command::setDefaultGrayScaleTable(), 0xB9);
}

TEST(Ssd1322CommandTest, DisplayModes) {
  expectEncoding(Ssd1322Command::setDisplayMode(Ssd1322Command::MODE_BLANK_DARK), 0xA4);
  expectEncoding(Ssd1322Command::setDisplayMode(Ssd1322Command::MODE_BLANK_BRIGHT), 0xA5);
  expectEncoding(Ssd1322Command::setDisplayMode(Ssd1322Command::MODE_NORMAL), 0xA6);
  expectEncoding(Ssd1322Command::setDisplayMode(Ssd1322Command::MODE_INVERSE), 0xA7);
}

TEST(Ssd1322CommandTest, ColumnAddressAcceptsWholeRam) {
  for (int start = 0; start <= Ssd1322Command::BUF_COL_MAX; start++) {
    for (int end = 0; end <= Ssd1322Command::BUF_COL_MAX; end++) {
      Ssd1322CommandData out;
      ASSERT_EQ(SSD1322_OK,
                Ssd1322Command::setColumnAddress(static_cast<uint8_t>(start), static_cast<uint8_t>(end)).prepare(out));
      ASSERT_EQ(0x15, out.cmd);
      ASSERT_EQ(2, out.len);
      ASSERT_EQ(start, out.data[0]);
      ASSERT_EQ(end, out.data[1]);
    }
  }
}

TEST(Ssd1322CommandTest, ColumnAddressRejectsPastRam) {
  EXPECT_EQ(SSD1322_OUT_OF_RANGE, prepareError(Ssd1322Command::setColumnAddress(120, 0)));
  EXPECT_EQ(SSD1322_OUT_OF_RANGE, prepareError(Ssd1322Command::setColumnAddress(0, 120)));
  EXPECT_EQ(SSD1322_OUT_OF_RANGE, prepareError(Ssd1322Command::setColumnAddress(255, 255)));
}

TEST(Ssd1322CommandTest, RowAddressRange) {
  expectEncoding(Ssd1322Command::setRowAddress(0, 127), 0x75, 0x00, 0x7F);
  expectEncoding(Ssd1322Command::setRowAddress(10, 3), 0x75, 10, 3);
  EXPECT_EQ(SSD1322_OUT_OF_RANGE, prepareError(Ssd1322Command::setRowAddress(128, 0)));
  EXPECT_EQ(SSD1322_OUT_OF_RANGE, prepareError(Ssd1322Command::setRowAddress(0, 128)));
}

TEST(Ssd1322CommandTest, MuxRatioIsSentMinusOne) {
  for (int ratio = 16; ratio <= 128; ratio++) {
    Ssd1322CommandData out;
    ASSERT_EQ(SSD1322_OK, Ssd1322Command::setMuxRatio(static_cast<uint8_t>(ratio)).prepare(out));
    ASSERT_EQ(0xCA, out.cmd);
    ASSERT_EQ(1, out.len);
    ASSERT_EQ(ratio - 1, out.data[0]);
  }

  EXPECT_EQ(SSD1322_OUT_OF_RANGE, prepareError(Ssd1322Command::setMuxRatio(0)));
  EXPECT_EQ(SSD1322_OUT_OF_RANGE, prepareError(Ssd1322Command::setMuxRatio(15)));
  EXPECT_EQ(SSD1322_OUT_OF_RANGE, prepareError(Ssd1322Command::setMuxRatio(129)));
}

TEST(Ssd1322CommandTest, RemappingPresets) {
  // Standard panel orientation
  expectEncoding(Ssd1322Command::setRemapping(Ssd1322Command::INCREMENT_HORIZONTAL, Ssd1322Command::COLUMN_FORWARD,
                                              Ssd1322Command::NIBBLE_FORWARD, Ssd1322Command::ROW_ZERO_LAST,
                                              Ssd1322Command::COM_DUAL_PROGRESSIVE),
                 0xA0, 0x14, 0x11);

  // Rotated 180 degrees
  expectEncoding(Ssd1322Command::setRemapping(Ssd1322Command::INCREMENT_HORIZONTAL, Ssd1322Command::COLUMN_REVERSE,
                                              Ssd1322Command::NIBBLE_FORWARD, Ssd1322Command::ROW_ZERO_FIRST,
                                              Ssd1322Command::COM_DUAL_PROGRESSIVE),
                 0xA0, 0x06, 0x11);
}

TEST(Ssd1322CommandTest, RemappingBits) {
  expectEncoding(Ssd1322Command::setRemapping(Ssd1322Command::INCREMENT_VERTICAL, Ssd1322Command::COLUMN_REVERSE,
                                              Ssd1322Command::NIBBLE_REVERSE, Ssd1322Command::ROW_ZERO_FIRST,
                                              Ssd1322Command::COM_INTERLACED),
                 0xA0, 0x23, 0x01);
  expectEncoding(Ssd1322Command::setRemapping(Ssd1322Command::INCREMENT_HORIZONTAL, Ssd1322Command::COLUMN_FORWARD,
                                              Ssd1322Command::NIBBLE_REVERSE, Ssd1322Command::ROW_ZERO_FIRST,
                                              Ssd1322Command::COM_PROGRESSIVE),
                 0xA0, 0x00, 0x01);

  const Ssd1322Command::Remapping remapping = {Ssd1322Command::INCREMENT_HORIZONTAL, Ssd1322Command::COLUMN_FORWARD,
                                               Ssd1322Command::NIBBLE_FORWARD, Ssd1322Command::ROW_ZERO_LAST,
                                               Ssd1322Command::COM_DUAL_PROGRESSIVE};
  expectEncoding(Ssd1322Command::setRemapping(remapping), 0xA0, 0x14, 0x11);
}

TEST(Ssd1322CommandTest, StartLineAndOffset) {
  expectEncoding(Ssd1322Command::setStartLine(0), 0xA1, 0x00);
  expectEncoding(Ssd1322Command::setStartLine(127), 0xA1, 0x7F);
  expectEncoding(Ssd1322Command::setDisplayOffset(127), 0xA2, 0x7F);
  EXPECT_EQ(SSD1322_OUT_OF_RANGE, prepareError(Ssd1322Command::setStartLine(128)));
  EXPECT_EQ(SSD1322_OUT_OF_RANGE, prepareError(Ssd1322Command::setDisplayOffset(128)));
}

TEST(Ssd1322CommandTest, PartialDisplay) {
  expectEncoding(Ssd1322Command::enablePartialDisplay(10, 20), 0xA8, 10, 20);
  expectEncoding(Ssd1322Command::enablePartialDisplay(5, 5), 0xA8, 5, 5);
  EXPECT_EQ(SSD1322_OUT_OF_RANGE, prepareError(Ssd1322Command::enablePartialDisplay(20, 10)));
  EXPECT_EQ(SSD1322_OUT_OF_RANGE, prepareError(Ssd1322Command::enablePartialDisplay(0, 128)));
}

TEST(Ssd1322CommandTest, FunctionSelect) {
  expectEncoding(Ssd1322Command::functionSelect(Ssd1322Command::EXTERNAL_VDD), 0xAB, 0x00);
  expectEncoding(Ssd1322Command::functionSelect(Ssd1322Command::INTERNAL_VDD), 0xAB, 0x01);
}

TEST(Ssd1322CommandTest, PhaseLengthsPacking) {
  expectEncoding(Ssd1322Command::setPhaseLengths(5, 15), 0xB1, 0xF2);
  expectEncoding(Ssd1322Command::setPhaseLengths(31, 3), 0xB1, 0x3F);
  expectEncoding(Ssd1322Command::setPhaseLengths(5, 3), 0xB1, 0x32);

  EXPECT_EQ(SSD1322_OUT_OF_RANGE, prepareError(Ssd1322Command::setPhaseLengths(4, 3)));
  EXPECT_EQ(SSD1322_OUT_OF_RANGE, prepareError(Ssd1322Command::setPhaseLengths(32, 3)));
  EXPECT_EQ(SSD1322_OUT_OF_RANGE, prepareError(Ssd1322Command::setPhaseLengths(5, 2)));
  EXPECT_EQ(SSD1322_OUT_OF_RANGE, prepareError(Ssd1322Command::setPhaseLengths(5, 16)));
}

TEST(Ssd1322CommandTest, ClockPacking) {
  expectEncoding(Ssd1322Command::setClockFoscDivset(10, 1), 0xB3, 0xA1);
  expectEncoding(Ssd1322Command::setClockFoscDivset(15, 10), 0xB3, 0xFA);
  expectEncoding(Ssd1322Command::setClockFoscDivset(0, 0), 0xB3, 0x00);

  EXPECT_EQ(SSD1322_OUT_OF_RANGE, prepareError(Ssd1322Command::setClockFoscDivset(16, 0)));
  EXPECT_EQ(SSD1322_OUT_OF_RANGE, prepareError(Ssd1322Command::setClockFoscDivset(0, 11)));
}

TEST(Ssd1322CommandTest, DisplayEnhancements) {
  expectEncoding(Ssd1322Command::setDisplayEnhancements(true, true), 0xB4, 0xA0, 0xFD);
  expectEncoding(Ssd1322Command::setDisplayEnhancements(false, false), 0xB4, 0xA2, 0xB5);
  expectEncoding(Ssd1322Command::setDisplayEnhancements(true, false), 0xB4, 0xA0, 0xB5);
}

TEST(Ssd1322CommandTest, VoltageAndTimingLimits) {
  expectEncoding(Ssd1322Command::setSecondPrechargePeriod(15), 0xB6, 15);
  expectEncoding(Ssd1322Command::setPrechargeVoltage(31), 0xBB, 0x1F);
  expectEncoding(Ssd1322Command::setComDeselectVoltage(7), 0xBE, 0x07);
  expectEncoding(Ssd1322Command::setMasterContrast(15), 0xC7, 0x0F);

  EXPECT_EQ(SSD1322_OUT_OF_RANGE, prepareError(Ssd1322Command::setSecondPrechargePeriod(16)));
  EXPECT_EQ(SSD1322_OUT_OF_RANGE, prepareError(Ssd1322Command::setPrechargeVoltage(32)));
  EXPECT_EQ(SSD1322_OUT_OF_RANGE, prepareError(Ssd1322Command::setComDeselectVoltage(8)));
  EXPECT_EQ(SSD1322_OUT_OF_RANGE, prepareError(Ssd1322Command::setMasterContrast(16)));
}

TEST(Ssd1322CommandTest, ContrastCurrentTakesAnyByte) {
  expectEncoding(Ssd1322Command::setContrastCurrent(0x00), 0xC1, 0x00);
  expectEncoding(Ssd1322Command::setContrastCurrent(0xFF), 0xC1, 0xFF);
}

TEST(Ssd1322CommandTest, CommandLock) {
  expectEncoding(Ssd1322Command::setCommandLock(false), 0xFD, 0x12);
  expectEncoding(Ssd1322Command::setCommandLock(true), 0xFD, 0x16);
}

TEST(Ssd1322CommandTest, KindIsKept) {
  EXPECT_EQ(Ssd1322Command::SET_MUX_RATIO, Ssd1322Command::setMuxRatio(64).kind());
  EXPECT_EQ(Ssd1322Command::WRITE_RAM, Ssd1322Command::writeRam().kind());
}

TEST(Ssd1322CommandTest, FailedPrepareLeavesOutputUntouched) {
  Ssd1322CommandData out = {0x42, {0x01, 0x02}, 2};
  EXPECT_EQ(SSD1322_OUT_OF_RANGE, Ssd1322Command::setMuxRatio(200).prepare(out));
  EXPECT_EQ(0x42, out.cmd);
  EXPECT_EQ(0x01, out.data[0]);
  EXPECT_EQ(0x02, out.data[1]);
  EXPECT_EQ(2, out.len);
}

TEST(Ssd1322CommandTest, GrayScaleTableValid) {
  const uint8_t table[15] = {1, 2, 3, 5, 8, 13, 21, 34, 45, 60, 80, 100, 130, 160, 180};
  uint8_t out[Ssd1322Command::GRAY_SCALE_TABLE_LENGTH] = {};
  ASSERT_EQ(SSD1322_OK, Ssd1322Command::prepareGrayScaleTable(table, sizeof(table), out));
  EXPECT_EQ(0, memcmp(table, out, sizeof(table)));
}

TEST(Ssd1322CommandTest, GrayScaleTableLength) {
  const uint8_t table[16] = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15, 16};
  uint8_t out[Ssd1322Command::GRAY_SCALE_TABLE_LENGTH];
  EXPECT_EQ(SSD1322_BAD_TABLE_LENGTH, Ssd1322Command::prepareGrayScaleTable(table, 14, out));
  EXPECT_EQ(SSD1322_BAD_TABLE_LENGTH, Ssd1322Command::prepareGrayScaleTable(table, 16, out));
  EXPECT_EQ(SSD1322_BAD_TABLE_LENGTH, Ssd1322Command::prepareGrayScaleTable(nullptr, 15, out));
}

TEST(Ssd1322CommandTest, GrayScaleTableValues) {
  uint8_t out[Ssd1322Command::GRAY_SCALE_TABLE_LENGTH];

  const uint8_t tooBright[15] = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 181};
  EXPECT_EQ(SSD1322_OUT_OF_RANGE, Ssd1322Command::prepareGrayScaleTable(tooBright, 15, out));

  const uint8_t repeated[15] = {1, 2, 3, 4, 5, 6, 7, 7, 9, 10, 11, 12, 13, 14, 15};
  EXPECT_EQ(SSD1322_OUT_OF_RANGE, Ssd1322Command::prepareGrayScaleTable(repeated, 15, out));

  const uint8_t descending[15] = {15, 14, 13, 12, 11, 10, 9, 8, 7, 6, 5, 4, 3, 2, 1};
  EXPECT_EQ(SSD1322_OUT_OF_RANGE, Ssd1322Command::prepareGrayScaleTable(descending, 15, out));
}

TEST(Ssd1322ErrorTest, Names) {
  EXPECT_STREQ("OK", ssd1322ErrorName(SSD1322_OK));
  EXPECT_STREQ("OUT_OF_RANGE", ssd1322ErrorName(SSD1322_OUT_OF_RANGE));
  EXPECT_STREQ("COMM_FAILURE", ssd1322ErrorName(SSD1322_COMM_FAILURE));
}
