// SPDX-FileCopyrightText: 2025 Stuart Parmenter
// SPDX-License-Identifier: MIT
//
// @file frame_buffer.cpp
// @brief Frame buffer implementation

#include "my9221_frame_buffer.h"
#include "scan_order.h"
#include "../protocol/command_word.h"  // For is_valid_resolution
#include <esp_log.h>
#include <algorithm>

static const char *const TAG = "FrameBuffer";

namespace my9221 {

namespace {

// Component (0=R, 1=G, 2=B) sent in each transmission slot, per color order
constexpr uint8_t COLOR_SLOTS[][3] = {
    {0, 1, 2},  // RGB
    {0, 2, 1},  // RBG
    {1, 0, 2},  // GRB
    {1, 2, 0},  // GBR
    {2, 0, 1},  // BRG
    {2, 1, 0},  // BGR
};

static_assert(sizeof(COLOR_SLOTS) / sizeof(COLOR_SLOTS[0]) == static_cast<size_t>(My9221ColorOrder::BGR) + 1,
              "Color slot table must cover every color order");

// Every index must land on a distinct in-bounds pixel
bool valid_custom_scan(const My9221FrameConfig &config) {
  std::array<bool, MY9221_MAX_CHANNELS> seen{};
  const uint16_t pixels = config.rows * config.columns;
  for (uint16_t i = 0; i < pixels; i++) {
    My9221Coords c = config.custom_scan(i, config.rows, config.columns);
    if (c.row >= config.rows || c.column >= config.columns) {
      return false;
    }
    size_t cell = static_cast<size_t>(c.row) * config.columns + c.column;
    if (seen[cell]) {
      return false;
    }
    seen[cell] = true;
  }
  return true;
}

}  // namespace

// ============================================================================
// Initialization
// ============================================================================

esp_err_t FrameBuffer::init(const My9221FrameConfig &config, uint16_t fill) {
  if (config.rows == 0 || config.columns == 0) {
    ESP_LOGE(TAG, "Invalid dimensions %ux%u", (unsigned int) config.rows, (unsigned int) config.columns);
    return ESP_ERR_INVALID_ARG;
  }
  if (config.rows > MY9221_MAX_ROWS || config.columns > MY9221_MAX_COLUMNS) {
    ESP_LOGE(TAG, "Dimensions %ux%u exceed limit %ux%u", (unsigned int) config.rows, (unsigned int) config.columns,
             (unsigned int) MY9221_MAX_ROWS, (unsigned int) MY9221_MAX_COLUMNS);
    return ESP_ERR_INVALID_ARG;
  }
  if (config.format != My9221PixelFormat::MONO && config.format != My9221PixelFormat::RGB) {
    ESP_LOGE(TAG, "Invalid pixel format %d", (int) config.format);
    return ESP_ERR_INVALID_ARG;
  }
  if (static_cast<size_t>(config.color_order) > static_cast<size_t>(My9221ColorOrder::BGR)) {
    ESP_LOGE(TAG, "Invalid color order %d", (int) config.color_order);
    return ESP_ERR_INVALID_ARG;
  }
  if (!is_valid_resolution(config.resolution)) {
    ESP_LOGE(TAG, "Invalid grayscale resolution %d", (int) config.resolution);
    return ESP_ERR_INVALID_ARG;
  }
  if (config.scan_order == My9221ScanOrder::CUSTOM && config.custom_scan == nullptr) {
    ESP_LOGE(TAG, "CUSTOM scan order requires a scan function");
    return ESP_ERR_INVALID_ARG;
  }

  size_t channels = static_cast<size_t>(config.rows) * config.columns * static_cast<uint8_t>(config.format);
  if (channels > MY9221_MAX_CHANNELS) {
    ESP_LOGE(TAG, "%u channels exceed MY9221_MAX_CHANNELS (%u)", (unsigned int) channels,
             (unsigned int) MY9221_MAX_CHANNELS);
    return ESP_ERR_INVALID_ARG;
  }

  if (config.scan_order == My9221ScanOrder::CUSTOM && !valid_custom_scan(config)) {
    ESP_LOGE(TAG, "Custom scan function is not a bijection over the %ux%u grid", (unsigned int) config.rows,
             (unsigned int) config.columns);
    return ESP_ERR_INVALID_ARG;
  }

  uint16_t max_value = max_intensity_for(config.resolution);
  if (fill > max_value) {
    ESP_LOGE(TAG, "Fill value %u exceeds %u", (unsigned int) fill, (unsigned int) max_value);
    return MY9221_ERR_OUT_OF_RANGE;
  }

  config_ = config;
  channel_count_ = channels;
  max_intensity_ = max_value;
  channels_.fill(0);
  std::fill_n(channels_.begin(), channel_count_, fill);

  ESP_LOGD(TAG, "Frame %ux%u, %u channels, max intensity %u", (unsigned int) config_.rows,
           (unsigned int) config_.columns, (unsigned int) channel_count_, (unsigned int) max_intensity_);
  return ESP_OK;
}

esp_err_t FrameBuffer::init(uint16_t rows, uint16_t columns, uint16_t fill) {
  My9221FrameConfig config{};
  config.rows = rows;
  config.columns = columns;
  return init(config, fill);
}

// ============================================================================
// Pixel Access
// ============================================================================

esp_err_t FrameBuffer::set(uint16_t row, uint16_t column, uint16_t value) {
  if (config_.format != My9221PixelFormat::MONO) {
    return ESP_ERR_NOT_SUPPORTED;
  }
  if (!in_bounds(row, column)) {
    return MY9221_ERR_OUT_OF_BOUNDS;
  }
  if (value > max_intensity_) {
    return MY9221_ERR_OUT_OF_RANGE;
  }

  channels_[pixel_offset(row, column)] = value;
  return ESP_OK;
}

esp_err_t FrameBuffer::get(uint16_t row, uint16_t column, uint16_t *value) const {
  if (value == nullptr) {
    return ESP_ERR_INVALID_ARG;
  }
  if (config_.format != My9221PixelFormat::MONO) {
    return ESP_ERR_NOT_SUPPORTED;
  }
  if (!in_bounds(row, column)) {
    return MY9221_ERR_OUT_OF_BOUNDS;
  }

  *value = channels_[pixel_offset(row, column)];
  return ESP_OK;
}

esp_err_t FrameBuffer::set_rgb(uint16_t row, uint16_t column, uint16_t r, uint16_t g, uint16_t b) {
  if (config_.format != My9221PixelFormat::RGB) {
    return ESP_ERR_NOT_SUPPORTED;
  }
  if (!in_bounds(row, column)) {
    return MY9221_ERR_OUT_OF_BOUNDS;
  }
  if (r > max_intensity_ || g > max_intensity_ || b > max_intensity_) {
    return MY9221_ERR_OUT_OF_RANGE;
  }

  size_t offset = pixel_offset(row, column);
  channels_[offset] = r;
  channels_[offset + 1] = g;
  channels_[offset + 2] = b;
  return ESP_OK;
}

esp_err_t FrameBuffer::get_rgb(uint16_t row, uint16_t column, uint16_t *r, uint16_t *g, uint16_t *b) const {
  if (r == nullptr || g == nullptr || b == nullptr) {
    return ESP_ERR_INVALID_ARG;
  }
  if (config_.format != My9221PixelFormat::RGB) {
    return ESP_ERR_NOT_SUPPORTED;
  }
  if (!in_bounds(row, column)) {
    return MY9221_ERR_OUT_OF_BOUNDS;
  }

  size_t offset = pixel_offset(row, column);
  *r = channels_[offset];
  *g = channels_[offset + 1];
  *b = channels_[offset + 2];
  return ESP_OK;
}

esp_err_t FrameBuffer::fill(uint16_t value) {
  if (value > max_intensity_) {
    return MY9221_ERR_OUT_OF_RANGE;
  }
  std::fill_n(channels_.begin(), channel_count_, value);
  return ESP_OK;
}

esp_err_t FrameBuffer::fill_rgb(uint16_t r, uint16_t g, uint16_t b) {
  if (config_.format != My9221PixelFormat::RGB) {
    return ESP_ERR_NOT_SUPPORTED;
  }
  if (r > max_intensity_ || g > max_intensity_ || b > max_intensity_) {
    return MY9221_ERR_OUT_OF_RANGE;
  }

  for (size_t offset = 0; offset < channel_count_; offset += 3) {
    channels_[offset] = r;
    channels_[offset + 1] = g;
    channels_[offset + 2] = b;
  }
  return ESP_OK;
}

void FrameBuffer::clear() { std::fill_n(channels_.begin(), channel_count_, 0); }

// ============================================================================
// Scan Order
// ============================================================================

uint16_t FrameBuffer::scan_value(size_t index) const {
  const uint8_t per_pixel = channels_per_pixel();
  const uint16_t pixel_index = static_cast<uint16_t>(index / per_pixel);
  const uint8_t slot = static_cast<uint8_t>(index % per_pixel);

  My9221Coords c = config_.scan_order == My9221ScanOrder::CUSTOM
                       ? config_.custom_scan(pixel_index, config_.rows, config_.columns)
                       : ScanOrderRemap::remap(pixel_index, config_.scan_order, config_.rows, config_.columns);

  size_t offset = pixel_offset(c.row, c.column);
  if (per_pixel == 1) {
    return channels_[offset];
  }
  return channels_[offset + COLOR_SLOTS[static_cast<size_t>(config_.color_order)][slot]];
}

}  // namespace my9221
