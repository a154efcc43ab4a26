// SPDX-FileCopyrightText: 2025 Stuart Parmenter
// SPDX-License-Identifier: MIT
//
// @file animation.cpp
// @brief Timed frame sequences

#include "my9221_animation.h"
#include <esp_log.h>

static const char *const TAG = "Animation";

namespace my9221 {

esp_err_t Animation::add_frame(const FrameBuffer &frame, uint32_t duration_ms) {
  if (frame.channel_count() == 0) {
    ESP_LOGE(TAG, "Frame is not initialized");
    return ESP_ERR_INVALID_ARG;
  }
  if (count_ == frames_.size()) {
    ESP_LOGE(TAG, "Animation full (%u frames)", (unsigned int) frames_.size());
    return ESP_ERR_NO_MEM;
  }
  if (count_ > 0) {
    const FrameBuffer &first = *frames_[0].buffer;
    if (frame.rows() != first.rows() || frame.columns() != first.columns() || frame.format() != first.format() ||
        frame.resolution() != first.resolution()) {
      ESP_LOGE(TAG, "Frame %u geometry differs from frame 0", (unsigned int) count_);
      return ESP_ERR_INVALID_ARG;
    }
  }

  frames_[count_++] = {.buffer = &frame, .duration_ms = duration_ms};
  return ESP_OK;
}

uint32_t Animation::total_duration_ms() const {
  uint32_t total = 0;
  for (size_t i = 0; i < count_; i++) {
    total += frames_[i].duration_ms;
  }
  return total;
}

}  // namespace my9221
