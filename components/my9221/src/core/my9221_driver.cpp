// SPDX-FileCopyrightText: 2025 Stuart Parmenter
// SPDX-License-Identifier: MIT
//
// @file my9221_driver.cpp
// @brief Main driver implementation

#include <sdkconfig.h>

#include "my9221.h"
#include "../buffer/scan_order.h"
#include "../protocol/command_word.h"

#ifndef CONFIG_IDF_TARGET_LINUX
#include "my9221_gpio.h"
#endif

#include <esp_log.h>
#include <stdlib.h>
#include <utility>

static const char *const TAG = "MY9221";

using namespace my9221;

namespace {

// Copy every channel of one pixel; both buffers share format and resolution
esp_err_t copy_pixel(const FrameBuffer &src, My9221Coords from, FrameBuffer &dst, My9221Coords to) {
  esp_err_t err;
  if (src.format() == My9221PixelFormat::RGB) {
    uint16_t r, g, b;
    err = src.get_rgb(from.row, from.column, &r, &g, &b);
    if (err != ESP_OK) {
      return err;
    }
    return dst.set_rgb(to.row, to.column, r, g, b);
  }

  uint16_t value;
  err = src.get(from.row, from.column, &value);
  if (err != ESP_OK) {
    return err;
  }
  return dst.set(to.row, to.column, value);
}

}  // namespace

// ============================================================================
// Constructor / Destructor
// ============================================================================

My9221Driver::My9221Driver(const My9221Config &config) : config_(config), running_(false) {
  ESP_LOGI(TAG, "Driver created for GPIO DCKI=%d DI=%d", config_.pins.clock, config_.pins.data);
  ESP_LOGI(TAG, "Matrix: %ux%u %s, rotation %d", (unsigned int) config_.rows, (unsigned int) config_.columns,
           config_.format == My9221PixelFormat::RGB ? "RGB" : "mono", (int) config_.rotation * 90);
}

My9221Driver::My9221Driver(const My9221Config &config, std::unique_ptr<OutputLine> clock,
                           std::unique_ptr<OutputLine> data, std::unique_ptr<DelayProvider> delay)
    : config_(config),
      running_(false),
      clock_(std::move(clock)),
      data_(std::move(data)),
      delay_(std::move(delay)) {
  ESP_LOGI(TAG, "Driver created with external lines");
  ESP_LOGI(TAG, "Matrix: %ux%u %s, rotation %d", (unsigned int) config_.rows, (unsigned int) config_.columns,
           config_.format == My9221PixelFormat::RGB ? "RGB" : "mono", (int) config_.rotation * 90);
}

My9221Driver::~My9221Driver() { end(); }

// ============================================================================
// Initialization
// ============================================================================

esp_err_t My9221Driver::begin() {
  if (running_) {
    ESP_LOGW(TAG, "Already running");
    return ESP_OK;
  }

  ESP_LOGI(TAG, "Initializing MY9221 driver...");

  esp_err_t err = validate_config();
  if (err != ESP_OK) {
    return err;
  }

  // Frame geometry and encoding
  My9221FrameConfig frame_config{};
  frame_config.rows = config_.rows;
  frame_config.columns = config_.columns;
  frame_config.format = config_.format;
  frame_config.color_order = config_.color_order;
  frame_config.resolution = config_.command.resolution;
  frame_config.scan_order = config_.scan_order;
  frame_config.custom_scan = config_.custom_scan;

  err = frame_.init(frame_config, 0);
  if (err == ESP_OK) {
    err = staging_.init(frame_config, 0);
  }
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "Frame buffer initialization failed: %s", my9221_err_to_name(err));
    return err;
  }

  // Lines are handed over once; a restart after end() reuses the transmitter
  if (!transmitter_) {
    if (!clock_ && !data_ && !delay_) {
      err = open_gpio_lines();
      if (err != ESP_OK) {
        return err;
      }
    }
    transmitter_ = std::make_unique<Transmitter>(std::move(clock_), std::move(data_), std::move(delay_),
                                                 config_.command);
  }

  err = transmitter_->init();
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "Transmitter initialization failed: %s", my9221_err_to_name(err));
    return err;
  }

  running_ = true;
  ESP_LOGI(TAG, "Driver started (%u channels, %u chips)", (unsigned int) frame_.channel_count(),
           (unsigned int) Transmitter::chips_for(frame_.channel_count()));
  return ESP_OK;
}

void My9221Driver::end() {
  if (!running_) {
    return;
  }

  ESP_LOGI(TAG, "Stopping driver...");

  esp_err_t err = blank();
  if (err != ESP_OK) {
    ESP_LOGW(TAG, "Failed to blank display on stop: %s", my9221_err_to_name(err));
  }

  running_ = false;
  ESP_LOGI(TAG, "MY9221 driver stopped");
}

esp_err_t My9221Driver::validate_config() const {
  if (config_.rows == 0 || config_.columns == 0) {
    ESP_LOGE(TAG, "Invalid matrix dimensions");
    return ESP_ERR_INVALID_ARG;
  }
  if (!is_valid_command(config_.command)) {
    ESP_LOGE(TAG, "Invalid command configuration");
    return ESP_ERR_INVALID_ARG;
  }
  if (config_.rotation < My9221Rotation::DEG_0 || config_.rotation > My9221Rotation::DEG_270) {
    ESP_LOGE(TAG, "Invalid rotation %d", (int) config_.rotation);
    return ESP_ERR_INVALID_ARG;
  }
  if (!valid_offset(config_.offset)) {
    ESP_LOGE(TAG, "Invalid offset (%d,%d)", config_.offset.row, config_.offset.column);
    return ESP_ERR_INVALID_ARG;
  }
  return ESP_OK;
}

esp_err_t My9221Driver::open_gpio_lines() {
#ifndef CONFIG_IDF_TARGET_LINUX
  if (config_.pins.clock < 0 || config_.pins.data < 0 || config_.pins.clock == config_.pins.data) {
    ESP_LOGE(TAG, "Invalid pins DCKI=%d DI=%d", config_.pins.clock, config_.pins.data);
    return ESP_ERR_INVALID_ARG;
  }

  auto clock = std::make_unique<GpioLine>(config_.pins.clock);
  auto data = std::make_unique<GpioLine>(config_.pins.data);

  esp_err_t err = clock->init();
  if (err == ESP_OK) {
    err = data->init();
  }
  if (err != ESP_OK) {
    return err;
  }

  clock_ = std::move(clock);
  data_ = std::move(data);
  delay_ = std::make_unique<RomDelay>();
  return ESP_OK;
#else
  ESP_LOGE(TAG, "No GPIO backend on this target; construct the driver with explicit lines");
  return ESP_ERR_NOT_SUPPORTED;
#endif
}

// ============================================================================
// Pixel API
// ============================================================================

esp_err_t My9221Driver::to_physical(uint16_t row, uint16_t column, My9221Coords *out) const {
  if (frame_.channel_count() == 0) {
    return ESP_ERR_INVALID_STATE;
  }
  if (row >= get_height() || column >= get_width()) {
    return MY9221_ERR_OUT_OF_BOUNDS;
  }
  *out = RotationRemap::remap({row, column}, config_.rotation, frame_.rows(), frame_.columns());
  return ESP_OK;
}

esp_err_t My9221Driver::set_pixel(uint16_t row, uint16_t column, uint16_t value) {
  My9221Coords c;
  esp_err_t err = to_physical(row, column, &c);
  if (err != ESP_OK) {
    return err;
  }
  return frame_.set(c.row, c.column, value);
}

esp_err_t My9221Driver::get_pixel(uint16_t row, uint16_t column, uint16_t *value) const {
  My9221Coords c;
  esp_err_t err = to_physical(row, column, &c);
  if (err != ESP_OK) {
    return err;
  }
  return frame_.get(c.row, c.column, value);
}

esp_err_t My9221Driver::set_pixel_rgb(uint16_t row, uint16_t column, uint16_t r, uint16_t g, uint16_t b) {
  My9221Coords c;
  esp_err_t err = to_physical(row, column, &c);
  if (err != ESP_OK) {
    return err;
  }
  return frame_.set_rgb(c.row, c.column, r, g, b);
}

esp_err_t My9221Driver::get_pixel_rgb(uint16_t row, uint16_t column, uint16_t *r, uint16_t *g, uint16_t *b) const {
  My9221Coords c;
  esp_err_t err = to_physical(row, column, &c);
  if (err != ESP_OK) {
    return err;
  }
  return frame_.get_rgb(c.row, c.column, r, g, b);
}

esp_err_t My9221Driver::fill(uint16_t value) {
  if (frame_.channel_count() == 0) {
    return ESP_ERR_INVALID_STATE;
  }
  return frame_.fill(value);
}

esp_err_t My9221Driver::fill_rgb(uint16_t r, uint16_t g, uint16_t b) {
  if (frame_.channel_count() == 0) {
    return ESP_ERR_INVALID_STATE;
  }
  return frame_.fill_rgb(r, g, b);
}

void My9221Driver::clear() { frame_.clear(); }

// ============================================================================
// Display
// ============================================================================

esp_err_t My9221Driver::show() {
  if (!running_) {
    ESP_LOGE(TAG, "show() called but driver not running");
    return ESP_ERR_INVALID_STATE;
  }
  if (config_.offset.row == 0 && config_.offset.column == 0) {
    return transmitter_->show(frame_);
  }

  esp_err_t err = render(frame_, true);
  if (err != ESP_OK) {
    return err;
  }
  return transmitter_->show(staging_);
}

esp_err_t My9221Driver::blank() {
  if (!running_) {
    return ESP_ERR_INVALID_STATE;
  }
  return transmitter_->blank(frame_.channel_count());
}

esp_err_t My9221Driver::play(const Animation &animation, uint32_t repeat) {
  if (!running_) {
    ESP_LOGE(TAG, "play() called but driver not running");
    return ESP_ERR_INVALID_STATE;
  }
  if (animation.empty()) {
    ESP_LOGW(TAG, "play() called with empty animation");
    return ESP_ERR_INVALID_STATE;
  }

  // Every frame shares frame 0's geometry (Animation::add_frame)
  const FrameBuffer &first = *animation.frame(0).buffer;
  if (first.rows() != get_height() || first.columns() != get_width() || first.format() != frame_.format() ||
      first.resolution() != frame_.resolution()) {
    ESP_LOGE(TAG, "Animation frames are %ux%u, display is %ux%u", (unsigned int) first.rows(),
             (unsigned int) first.columns(), (unsigned int) get_height(), (unsigned int) get_width());
    return ESP_ERR_INVALID_ARG;
  }

  for (uint32_t pass = 0; repeat == MY9221_REPEAT_FOREVER || pass < repeat; pass++) {
    for (size_t i = 0; i < animation.size(); i++) {
      const Animation::Frame &frame = animation.frame(i);
      esp_err_t err = render(*frame.buffer, false);
      if (err == ESP_OK) {
        err = transmitter_->show(staging_);
      }
      if (err == ESP_OK) {
        err = transmitter_->wait_ms(frame.duration_ms);
      }
      if (err != ESP_OK) {
        ESP_LOGE(TAG, "Animation frame %u failed: %s", (unsigned int) i, my9221_err_to_name(err));
        return err;
      }
    }
  }
  return ESP_OK;
}

// Fill staging_ with `source` as it should appear on the matrix: offset applied,
// then mapped through rotation. A physical source (frame_) is read back through
// the rotation; a logical source (animation frame) is read as-is.
esp_err_t My9221Driver::render(const FrameBuffer &source, bool source_is_physical) {
  staging_.clear();

  const int height = get_height();
  const int width = get_width();
  for (int row = 0; row < height; row++) {
    const int src_row = row - config_.offset.row;
    if (src_row < 0 || src_row >= height) {
      continue;
    }
    for (int column = 0; column < width; column++) {
      const int src_column = column - config_.offset.column;
      if (src_column < 0 || src_column >= width) {
        continue;
      }

      My9221Coords from = {static_cast<uint16_t>(src_row), static_cast<uint16_t>(src_column)};
      if (source_is_physical) {
        from = RotationRemap::remap(from, config_.rotation, frame_.rows(), frame_.columns());
      }
      My9221Coords to = RotationRemap::remap({static_cast<uint16_t>(row), static_cast<uint16_t>(column)},
                                             config_.rotation, frame_.rows(), frame_.columns());

      esp_err_t err = copy_pixel(source, from, staging_, to);
      if (err != ESP_OK) {
        return err;
      }
    }
  }
  return ESP_OK;
}

// ============================================================================
// Orientation / Information
// ============================================================================

void My9221Driver::set_rotation(My9221Rotation rotation) { config_.rotation = rotation; }

bool My9221Driver::valid_offset(My9221Offset offset) const {
  return abs(offset.row) < get_height() && abs(offset.column) < get_width();
}

esp_err_t My9221Driver::set_offset(My9221Offset offset) {
  if (!valid_offset(offset)) {
    ESP_LOGE(TAG, "Offset (%d,%d) exceeds %ux%u display", offset.row, offset.column, (unsigned int) get_height(),
             (unsigned int) get_width());
    return ESP_ERR_INVALID_ARG;
  }
  config_.offset = offset;
  return ESP_OK;
}

uint16_t My9221Driver::get_width() const {
  return RotationRemap::swaps_axes(config_.rotation) ? config_.rows : config_.columns;
}

uint16_t My9221Driver::get_height() const {
  return RotationRemap::swaps_axes(config_.rotation) ? config_.columns : config_.rows;
}
