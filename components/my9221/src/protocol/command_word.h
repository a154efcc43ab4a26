// SPDX-FileCopyrightText: 2025 Stuart Parmenter
// SPDX-License-Identifier: MIT

// @file command_word.h
// @brief MY9221 word layout and protocol timing
//
// Frame layout (per chip, 208 bits, MSB first, one bit per DCKI edge):
//   [command:16][ch0:16][ch1:16] ... [ch11:16]
//
// Command word:
//   15..11  reserved (0)
//   10      hspd    - fast output current slew
//   9..8    bs      - grayscale resolution (00=8, 01=12, 10=14, 11=16 bit)
//   7..5    gck     - internal oscillator divider
//   4       sep     - APDM waveform
//   3       osc     - external grayscale clock
//   2       pol     - PWM generator polarity
//   1       cntset  - counter reset
//   0       onest   - one-shot frame
//
// Grayscale word: intensity right-aligned, upper bits fixed at 0.

#pragma once

#include "my9221_types.h"
#include "my9221_config.h"
#include <stdint.h>

namespace my9221 {

constexpr unsigned WORD_BITS = 16;
constexpr unsigned WORDS_PER_CHIP = 1 + MY9221_CHANNELS_PER_CHIP;
constexpr unsigned BITS_PER_CHIP = WORDS_PER_CHIP * WORD_BITS;

static_assert(BITS_PER_CHIP == 208, "datasheet says one chip frame is 208 bits");
static_assert(BITS_PER_CHIP % 2 == 0, "DCKI must return to rest level after every chip block");

// ============================================================================
// Timing (microseconds)
// ============================================================================

// Data setup before, and hold after, each DCKI edge (datasheet minimums are tens of ns)
constexpr uint32_t BIT_SETUP_US = 1;
constexpr uint32_t BIT_HOLD_US = 1;

// Internal latch: DCKI static and DI low for Tstart, then 4 DI pulses, then Tstop
constexpr uint32_t LATCH_START_US = 220;
constexpr unsigned LATCH_PULSES = 4;
constexpr uint32_t LATCH_PULSE_HIGH_US = 1;
constexpr uint32_t LATCH_PULSE_LOW_US = 1;
constexpr uint32_t LATCH_STOP_US = 1;

// Quiet period that opens every show() so framing restarts from a known state
constexpr uint32_t RESET_QUIET_US = LATCH_START_US;

static_assert(220 <= LATCH_START_US, "datasheet says Tstart must be >= 220us");
static_assert(LATCH_PULSES == 4, "datasheet says the internal latch is exactly 4 DI pulses");

// ============================================================================
// Word Encoding
// ============================================================================

constexpr bool is_valid_resolution(My9221GrayscaleResolution resolution) {
  switch (resolution) {
    case My9221GrayscaleResolution::BITS_8:
    case My9221GrayscaleResolution::BITS_12:
    case My9221GrayscaleResolution::BITS_14:
    case My9221GrayscaleResolution::BITS_16:
      return true;
    default:
      return false;
  }
}

constexpr bool is_valid_command(const My9221Command &cmd) {
  return is_valid_resolution(cmd.resolution) && static_cast<uint8_t>(cmd.clock_divider) <= 0b111;
}

constexpr uint16_t resolution_bits(My9221GrayscaleResolution resolution) {
  switch (resolution) {
    case My9221GrayscaleResolution::BITS_8:
      return 0b00;
    case My9221GrayscaleResolution::BITS_12:
      return 0b01;
    case My9221GrayscaleResolution::BITS_14:
      return 0b10;
    case My9221GrayscaleResolution::BITS_16:
      return 0b11;
    default:
      return 0b00;
  }
}

class CommandWord {
 public:
  static MY9221_CONST constexpr uint16_t encode(const My9221Command &cmd) {
    return static_cast<uint16_t>((cmd.high_speed ? 1u : 0u) << 10 | resolution_bits(cmd.resolution) << 8 |
                                 (static_cast<uint16_t>(cmd.clock_divider) & 0b111) << 5 |
                                 (cmd.apdm_waveform ? 1u : 0u) << 4 | (cmd.external_clock ? 1u : 0u) << 3 |
                                 (cmd.pwm_polarity ? 1u : 0u) << 2 | (cmd.counter_reset ? 1u : 0u) << 1 |
                                 (cmd.one_shot ? 1u : 0u));
  }

  // Mask of the intensity field of a grayscale word
  static MY9221_CONST constexpr uint16_t intensity_mask(My9221GrayscaleResolution resolution) {
    return static_cast<uint16_t>((1UL << static_cast<uint8_t>(resolution)) - 1);
  }

  // Caller guarantees value fits the resolution; header bits stay 0
  static MY9221_CONST constexpr uint16_t grayscale(uint16_t value, My9221GrayscaleResolution resolution) {
    return value & intensity_mask(resolution);
  }
};

// ============================================================================
// Compile-Time Validation
// ============================================================================

namespace {  // Anonymous namespace for compile-time validation

consteval bool test_default_command_is_zero() { return CommandWord::encode(My9221Command{}) == 0x0000; }

consteval bool test_command_fields() {
  My9221Command cmd{};
  cmd.high_speed = true;
  cmd.resolution = My9221GrayscaleResolution::BITS_16;
  cmd.clock_divider = My9221ClockDivider::DIV_256;
  cmd.one_shot = true;
  return CommandWord::encode(cmd) == 0x07E1;
}

consteval bool test_grayscale_header_bits() {
  return CommandWord::grayscale(0xFF, My9221GrayscaleResolution::BITS_8) == 0x00FF &&
         CommandWord::grayscale(0xFFF, My9221GrayscaleResolution::BITS_12) == 0x0FFF &&
         CommandWord::grayscale(0xFFFF, My9221GrayscaleResolution::BITS_16) == 0xFFFF;
}

static_assert(test_default_command_is_zero(), "Default command must encode to 0x0000");
static_assert(test_command_fields(), "Command word fields are misplaced");
static_assert(test_grayscale_header_bits(), "Grayscale header bits must be zero");

}  // namespace

}  // namespace my9221
