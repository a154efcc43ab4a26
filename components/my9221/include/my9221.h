// SPDX-FileCopyrightText: 2025 Stuart Parmenter
// SPDX-License-Identifier: MIT

// @file my9221.h
// @brief Main public API for the MY9221 LED matrix driver
//
// Bit-banged driver for LED matrices built from cascaded MY9221 12-channel
// constant-current drivers (e.g. Grove RGB LED Matrix). Two GPIOs: DCKI, DI.

#pragma once

#include "my9221_types.h"
#include "my9221_config.h"
#include "my9221_lines.h"
#include "my9221_frame_buffer.h"
#include "my9221_transmitter.h"
#include "my9221_animation.h"
#include <memory>
#include <stdint.h>
#include <stdbool.h>
#include <stddef.h>

#ifdef __cplusplus

/**
 * @brief Main MY9221 driver class
 *
 * Owns the frame buffer and the transmitter. Pixel coordinates are logical:
 * they follow the configured rotation. The display offset is applied when a
 * frame is transmitted, so the buffer keeps the unshifted image.
 */
class My9221Driver {
 public:
  /**
   * @brief Construct a driver that opens the GPIOs in config.pins on begin()
   * @param config Driver configuration
   */
  explicit My9221Driver(const My9221Config &config);

  /**
   * @brief Construct a driver bound to caller-supplied lines and delay
   *
   * Ownership of all three handles moves into the driver.
   */
  My9221Driver(const My9221Config &config, std::unique_ptr<my9221::OutputLine> clock,
               std::unique_ptr<my9221::OutputLine> data, std::unique_ptr<my9221::DelayProvider> delay);

  /**
   * @brief Destructor - blanks the display if running
   */
  ~My9221Driver();

  My9221Driver(const My9221Driver &) = delete;
  My9221Driver &operator=(const My9221Driver &) = delete;

  /**
   * @brief Validate configuration, allocate the frame and prepare the lines
   * @return ESP_OK, ESP_ERR_INVALID_ARG (bad config), ESP_ERR_NOT_SUPPORTED (no
   *         lines on a host target), or a line fault
   */
  esp_err_t begin();

  /**
   * @brief Blank the display and stop accepting show() calls
   */
  void end();

  // ========================================================================
  // Pixel API
  // ========================================================================

  /**
   * @brief Set a single monochrome pixel
   * @return ESP_OK, MY9221_ERR_OUT_OF_BOUNDS, MY9221_ERR_OUT_OF_RANGE,
   *         ESP_ERR_NOT_SUPPORTED (RGB matrix), ESP_ERR_INVALID_STATE (before begin)
   */
  esp_err_t set_pixel(uint16_t row, uint16_t column, uint16_t value);

  esp_err_t get_pixel(uint16_t row, uint16_t column, uint16_t *value) const;

  /**
   * @brief Set a single RGB pixel
   */
  esp_err_t set_pixel_rgb(uint16_t row, uint16_t column, uint16_t r, uint16_t g, uint16_t b);

  esp_err_t get_pixel_rgb(uint16_t row, uint16_t column, uint16_t *r, uint16_t *g, uint16_t *b) const;

  /**
   * @brief Set every channel to `value`
   */
  esp_err_t fill(uint16_t value);

  /**
   * @brief Set every pixel of an RGB matrix to one color
   */
  esp_err_t fill_rgb(uint16_t r, uint16_t g, uint16_t b);

  /**
   * @brief Clear the frame buffer (takes effect on the next show())
   */
  void clear();

  // ========================================================================
  // Display
  // ========================================================================

  /**
   * @brief Transmit the frame buffer and latch it
   */
  esp_err_t show();

  /**
   * @brief Turn every output off without touching the frame buffer
   */
  esp_err_t blank();

  /**
   * @brief Show every animation frame for its duration, `repeat` times
   *
   * Frames are logical images (get_height() x get_width(), this driver's format
   * and resolution). Each one goes out through this driver's rotation, offset,
   * scan order and color order. MY9221_REPEAT_FOREVER only returns on error.
   * @return ESP_OK, ESP_ERR_INVALID_STATE (not running / empty),
   *         ESP_ERR_INVALID_ARG (frame geometry), or the first transmit/hold error
   */
  esp_err_t play(const my9221::Animation &animation, uint32_t repeat = 1);

  // ========================================================================
  // Orientation
  // ========================================================================

  /**
   * @brief Set display rotation
   * @note Applies to subsequent pixel calls; buffer content is not moved.
   */
  void set_rotation(My9221Rotation rotation);

  My9221Rotation get_rotation() const { return config_.rotation; }

  /**
   * @brief Shift the displayed image by whole pixels (logical coordinates)
   * @return ESP_OK, or ESP_ERR_INVALID_ARG if a component is not smaller than
   *         the logical height / width
   */
  esp_err_t set_offset(My9221Offset offset);

  My9221Offset get_offset() const { return config_.offset; }

  // ========================================================================
  // Information
  // ========================================================================

  /**
   * @brief Logical width (columns after rotation)
   */
  uint16_t get_width() const;

  /**
   * @brief Logical height (rows after rotation)
   */
  uint16_t get_height() const;

  const my9221::FrameBuffer &frame() const { return frame_; }

  /**
   * @brief Check if driver is running
   */
  bool is_running() const { return running_; }

 private:
  My9221Config config_;
  bool running_;
  my9221::FrameBuffer frame_;
  my9221::FrameBuffer staging_;  // Shifted / animation frame as it goes on the wire

  // Held until begin() hands them to the transmitter
  std::unique_ptr<my9221::OutputLine> clock_;
  std::unique_ptr<my9221::OutputLine> data_;
  std::unique_ptr<my9221::DelayProvider> delay_;

  std::unique_ptr<my9221::Transmitter> transmitter_;

  esp_err_t validate_config() const;
  esp_err_t open_gpio_lines();
  esp_err_t to_physical(uint16_t row, uint16_t column, My9221Coords *out) const;
  bool valid_offset(My9221Offset offset) const;
  esp_err_t render(const my9221::FrameBuffer &source, bool source_is_physical);
};

#endif  // __cplusplus
