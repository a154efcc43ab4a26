// SPDX-FileCopyrightText: 2025 Stuart Parmenter
// SPDX-License-Identifier: MIT

// @file my9221_frame_buffer.h
// @brief Fixed-capacity frame buffer with scan-order iteration

#pragma once

#include "my9221_types.h"
#include "my9221_config.h"
#include <array>
#include <cstddef>
#include <iterator>
#include <stdint.h>

namespace my9221 {

/**
 * @brief Grid of channel intensities representing the next display state
 *
 * Storage is a fixed array of MY9221_MAX_CHANNELS entries; dimensions are
 * fixed by init() and never change afterwards. Every mutator validates its
 * arguments first and leaves the buffer untouched on failure.
 */
class FrameBuffer {
 public:
  /**
   * @brief Lazy sequence of channel values in transmission order
   *
   * Holds a reference to the buffer; each begin() restarts from the first
   * channel. Elements are computed on dereference.
   */
  class ScanSequence {
   public:
    class iterator {
     public:
      using iterator_category = std::input_iterator_tag;
      using value_type = uint16_t;
      using difference_type = std::ptrdiff_t;
      using pointer = const uint16_t *;
      using reference = uint16_t;

      iterator() = default;
      iterator(const FrameBuffer *buffer, size_t index) : buffer_(buffer), index_(index) {}

      uint16_t operator*() const { return buffer_->scan_value(index_); }
      iterator &operator++() {
        ++index_;
        return *this;
      }
      iterator operator++(int) {
        iterator prev = *this;
        ++index_;
        return prev;
      }
      bool operator==(const iterator &other) const { return buffer_ == other.buffer_ && index_ == other.index_; }
      bool operator!=(const iterator &other) const { return !(*this == other); }

     private:
      const FrameBuffer *buffer_ = nullptr;
      size_t index_ = 0;
    };

    explicit ScanSequence(const FrameBuffer &buffer) : buffer_(buffer) {}

    iterator begin() const { return iterator(&buffer_, 0); }
    iterator end() const { return iterator(&buffer_, buffer_.channel_count()); }
    size_t size() const { return buffer_.channel_count(); }

   private:
    const FrameBuffer &buffer_;
  };

  /**
   * @brief Construct an empty (0x0) buffer; call init() before use
   */
  FrameBuffer() = default;

  /**
   * @brief Set geometry and fill every channel
   * @param config Geometry, pixel format, resolution and scan order
   * @param fill Initial intensity for every channel
   * @return ESP_OK, ESP_ERR_INVALID_ARG (bad geometry) or MY9221_ERR_OUT_OF_RANGE (bad fill)
   */
  esp_err_t init(const My9221FrameConfig &config, uint16_t fill = 0);

  /**
   * @brief Monochrome, 8-bit, row-major shorthand for init()
   */
  esp_err_t init(uint16_t rows, uint16_t columns, uint16_t fill = 0);

  // ========================================================================
  // Pixel Access
  // ========================================================================

  /**
   * @brief Write one monochrome pixel
   * @return ESP_OK, MY9221_ERR_OUT_OF_BOUNDS, MY9221_ERR_OUT_OF_RANGE, or
   *         ESP_ERR_NOT_SUPPORTED on an RGB buffer
   */
  esp_err_t set(uint16_t row, uint16_t column, uint16_t value);

  /**
   * @brief Read one monochrome pixel
   * @param[out] value Current intensity (untouched on failure)
   */
  esp_err_t get(uint16_t row, uint16_t column, uint16_t *value) const;

  /**
   * @brief Write one RGB pixel (all components validated before writing)
   */
  esp_err_t set_rgb(uint16_t row, uint16_t column, uint16_t r, uint16_t g, uint16_t b);

  /**
   * @brief Read one RGB pixel
   */
  esp_err_t get_rgb(uint16_t row, uint16_t column, uint16_t *r, uint16_t *g, uint16_t *b) const;

  /**
   * @brief Set every channel to the same intensity
   */
  esp_err_t fill(uint16_t value);

  /**
   * @brief Set every pixel of an RGB buffer to the same color
   * @return ESP_OK, MY9221_ERR_OUT_OF_RANGE, or ESP_ERR_NOT_SUPPORTED on a mono buffer
   */
  esp_err_t fill_rgb(uint16_t r, uint16_t g, uint16_t b);

  /**
   * @brief Set every channel to 0
   */
  void clear();

  // ========================================================================
  // Scan Order
  // ========================================================================

  /**
   * @brief Channel values in the order the chip cascade expects them
   *
   * Yields rows * columns * channels_per_pixel values. RGB pixels contribute
   * their three channels consecutively in color order.
   */
  ScanSequence scan() const { return ScanSequence(*this); }

  // ========================================================================
  // Information
  // ========================================================================

  uint16_t rows() const { return config_.rows; }
  uint16_t columns() const { return config_.columns; }
  My9221PixelFormat format() const { return config_.format; }
  My9221GrayscaleResolution resolution() const { return config_.resolution; }
  My9221ColorOrder color_order() const { return config_.color_order; }
  My9221ScanOrder scan_order() const { return config_.scan_order; }
  uint8_t channels_per_pixel() const { return static_cast<uint8_t>(config_.format); }
  size_t channel_count() const { return channel_count_; }
  uint16_t max_intensity() const { return max_intensity_; }

 private:
  My9221FrameConfig config_{.rows = 0, .columns = 0};
  size_t channel_count_ = 0;
  uint16_t max_intensity_ = 0;
  std::array<uint16_t, MY9221_MAX_CHANNELS> channels_{};

  // Channel value at a transmission index; only the scan iterator calls this,
  // always with index < channel_count()
  uint16_t scan_value(size_t index) const;

  bool in_bounds(uint16_t row, uint16_t column) const { return row < config_.rows && column < config_.columns; }

  // Storage offset of a pixel's first channel (row-major, RGB stored R,G,B)
  size_t pixel_offset(uint16_t row, uint16_t column) const {
    return (static_cast<size_t>(row) * config_.columns + column) * channels_per_pixel();
  }
};

/**
 * @brief Largest intensity representable at a grayscale resolution
 */
constexpr uint16_t max_intensity_for(My9221GrayscaleResolution resolution) {
  return static_cast<uint16_t>((1UL << static_cast<uint8_t>(resolution)) - 1);
}

}  // namespace my9221
