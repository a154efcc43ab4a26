// SPDX-FileCopyrightText: 2025 Stuart Parmenter
// SPDX-License-Identifier: MIT

// @file my9221_transmitter.h
// @brief Bit-banged MY9221 protocol transmitter

#pragma once

#include "my9221_types.h"
#include "my9221_lines.h"
#include "my9221_frame_buffer.h"
#include <memory>
#include <stddef.h>
#include <stdint.h>

namespace my9221 {

/**
 * @brief Serializes frames onto the DCKI/DI lines of a MY9221 cascade
 *
 * Owns both lines and the delay for its whole lifetime. Every show() runs the
 * same state sequence:
 *
 *   IDLE → RESET → WORD_CLOCKING → LATCH → IDLE
 *
 * RESET always re-drives both lines low and holds them quiet, so a show that
 * was aborted by a line fault never leaves the next one mid-frame. A fault
 * aborts immediately and is returned; retry with a full show().
 */
class Transmitter {
 public:
  enum class State {
    IDLE,
    RESET,
    WORD_CLOCKING,
    LATCH,
  };

  /**
   * @brief Take ownership of the lines and delay
   * @param clock DCKI line
   * @param data DI line
   * @param delay Microsecond delay
   * @param command Command word sent to every chip
   */
  Transmitter(std::unique_ptr<OutputLine> clock, std::unique_ptr<OutputLine> data,
              std::unique_ptr<DelayProvider> delay, const My9221Command &command = {});

  Transmitter(const Transmitter &) = delete;
  Transmitter &operator=(const Transmitter &) = delete;

  /**
   * @brief Validate handles and drive both lines to rest (low)
   * @return ESP_OK, ESP_ERR_INVALID_ARG (missing handle / bad command), or a line fault
   */
  esp_err_t init();

  /**
   * @brief Transmit a frame and latch it
   *
   * The frame's resolution must match the command word.
   * @return ESP_OK, ESP_ERR_INVALID_STATE, ESP_ERR_INVALID_ARG, ESP_ERR_INVALID_SIZE,
   *         or the line/delay fault that aborted the sequence
   */
  esp_err_t show(const FrameBuffer &frame);

  /**
   * @brief Transmit raw intensities (already in transmission order) and latch them
   *
   * Every value is checked against the intensity domain before the first edge.
   * @return As show(frame), plus MY9221_ERR_OUT_OF_RANGE
   */
  esp_err_t show(const uint16_t *values, size_t count);

  /**
   * @brief Transmit an all-off frame of `channels` channels
   */
  esp_err_t blank(size_t channels);

  /**
   * @brief Hold for `ms` milliseconds using the owned delay (scheduler-friendly on target)
   */
  esp_err_t wait_ms(uint32_t ms);

  // ========================================================================
  // Information
  // ========================================================================

  State state() const { return state_; }
  bool is_initialized() const { return initialized_; }
  uint16_t command_word() const { return command_word_; }
  My9221GrayscaleResolution resolution() const { return command_.resolution; }
  uint16_t max_intensity() const { return max_intensity_for(command_.resolution); }

  /**
   * @brief Chips needed to carry `channels` grayscale words
   */
  static size_t chips_for(size_t channels) {
    return (channels + MY9221_CHANNELS_PER_CHIP - 1) / MY9221_CHANNELS_PER_CHIP;
  }

  static const char *state_name(State state);

 private:
  std::unique_ptr<OutputLine> clock_;
  std::unique_ptr<OutputLine> data_;
  std::unique_ptr<DelayProvider> delay_;
  My9221Command command_;
  uint16_t command_word_;
  State state_;
  bool initialized_;
  bool clock_level_;  // Last level driven on DCKI

  // Source is an input iterator over intensities in transmission order;
  // it is dereferenced exactly `count` times
  template<typename Source> esp_err_t transmit(Source value, size_t count);

  esp_err_t check_ready(size_t channels) const;
  esp_err_t reset_lines();
  esp_err_t send_word(uint16_t word);
  esp_err_t latch();
};

}  // namespace my9221
