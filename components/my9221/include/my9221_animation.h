// SPDX-FileCopyrightText: 2025 Stuart Parmenter
// SPDX-License-Identifier: MIT

// @file my9221_animation.h
// @brief Timed frame sequences

#pragma once

#include "my9221_types.h"
#include "my9221_config.h"
#include "my9221_frame_buffer.h"
#include <array>
#include <stddef.h>
#include <stdint.h>

namespace my9221 {

/**
 * @brief Fixed-capacity list of frames with per-frame hold times
 *
 * Frames are borrowed, not copied: every FrameBuffer added must outlive the
 * animation. All frames share the first frame's geometry and resolution.
 * Frames are images in display coordinates; My9221Driver::play() maps them
 * through its own rotation, offset and wiring, so a frame's scan and color
 * order do not matter.
 */
class Animation {
 public:
  struct Frame {
    const FrameBuffer *buffer;
    uint32_t duration_ms;
  };

  /**
   * @brief Append a frame
   * @return ESP_OK, ESP_ERR_NO_MEM (MY9221_MAX_ANIMATION_FRAMES reached), or
   *         ESP_ERR_INVALID_ARG (uninitialized frame or geometry mismatch)
   */
  esp_err_t add_frame(const FrameBuffer &frame, uint32_t duration_ms);

  void clear() { count_ = 0; }

  size_t size() const { return count_; }
  bool empty() const { return count_ == 0; }
  const Frame &frame(size_t index) const { return frames_[index]; }

  /**
   * @brief Sum of all frame durations
   */
  uint32_t total_duration_ms() const;

 private:
  std::array<Frame, MY9221_MAX_ANIMATION_FRAMES> frames_{};
  size_t count_ = 0;
};

}  // namespace my9221
