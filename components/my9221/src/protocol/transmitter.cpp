// SPDX-FileCopyrightText: 2025 Stuart Parmenter
// SPDX-License-Identifier: MIT
//
// @file transmitter.cpp
// @brief MY9221 bit-banged transmitter

#include "my9221_transmitter.h"
#include "command_word.h"
#include <esp_log.h>
#include <utility>

static const char *const TAG = "MY9221_TX";

namespace my9221 {

namespace {

// Endless run of zero-intensity words (blank frames)
struct ZeroSource {
  uint16_t operator*() const { return 0; }
  ZeroSource &operator++() { return *this; }
};

}  // namespace

Transmitter::Transmitter(std::unique_ptr<OutputLine> clock, std::unique_ptr<OutputLine> data,
                         std::unique_ptr<DelayProvider> delay, const My9221Command &command)
    : clock_(std::move(clock)),
      data_(std::move(data)),
      delay_(std::move(delay)),
      command_(command),
      command_word_(CommandWord::encode(command)),
      state_(State::IDLE),
      initialized_(false),
      clock_level_(false) {}

// ============================================================================
// Initialization
// ============================================================================

esp_err_t Transmitter::init() {
  if (!clock_ || !data_ || !delay_) {
    ESP_LOGE(TAG, "Clock line, data line and delay are all required");
    return ESP_ERR_INVALID_ARG;
  }
  if (!is_valid_command(command_)) {
    ESP_LOGE(TAG, "Invalid command configuration");
    return ESP_ERR_INVALID_ARG;
  }

  esp_err_t err = clock_->set_level(false);
  if (err == ESP_OK) {
    err = data_->set_level(false);
  }
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "Failed to drive lines to rest: %s", my9221_err_to_name(err));
    return err;
  }

  clock_level_ = false;
  state_ = State::IDLE;
  initialized_ = true;
  ESP_LOGI(TAG, "Transmitter ready (command 0x%04x, %u-bit grayscale)", (unsigned int) command_word_,
           (unsigned int) command_.resolution);
  return ESP_OK;
}

// ============================================================================
// Show
// ============================================================================

esp_err_t Transmitter::show(const FrameBuffer &frame) {
  if (frame.resolution() != command_.resolution) {
    ESP_LOGE(TAG, "Frame resolution %u-bit does not match command %u-bit", (unsigned int) frame.resolution(),
             (unsigned int) command_.resolution);
    return ESP_ERR_INVALID_ARG;
  }

  esp_err_t err = check_ready(frame.channel_count());
  if (err != ESP_OK) {
    return err;
  }

  return transmit(frame.scan().begin(), frame.channel_count());
}

esp_err_t Transmitter::show(const uint16_t *values, size_t count) {
  if (values == nullptr) {
    return ESP_ERR_INVALID_ARG;
  }

  esp_err_t err = check_ready(count);
  if (err != ESP_OK) {
    return err;
  }

  const uint16_t max_value = max_intensity();
  for (size_t i = 0; i < count; i++) {
    if (values[i] > max_value) {
      ESP_LOGE(TAG, "Value %u at index %u exceeds %u", (unsigned int) values[i], (unsigned int) i,
               (unsigned int) max_value);
      return MY9221_ERR_OUT_OF_RANGE;
    }
  }

  return transmit(values, count);
}

esp_err_t Transmitter::blank(size_t channels) {
  esp_err_t err = check_ready(channels);
  if (err != ESP_OK) {
    return err;
  }
  return transmit(ZeroSource{}, channels);
}

esp_err_t Transmitter::check_ready(size_t channels) const {
  if (!initialized_) {
    ESP_LOGE(TAG, "show() called before init()");
    return ESP_ERR_INVALID_STATE;
  }
  if (channels == 0 || chips_for(channels) > MY9221_MAX_CHIPS) {
    ESP_LOGE(TAG, "%u channels need %u chips (max %u)", (unsigned int) channels, (unsigned int) chips_for(channels),
             (unsigned int) MY9221_MAX_CHIPS);
    return ESP_ERR_INVALID_SIZE;
  }
  return ESP_OK;
}

template<typename Source> esp_err_t Transmitter::transmit(Source value, size_t count) {
  const size_t chips = chips_for(count);
  esp_err_t err = ESP_OK;

  // 1. Reset: known line levels, quiet period
  state_ = State::RESET;
  err = reset_lines();

  // 2. Word clocking: [command][12 x grayscale] per chip, tail padded with zero words
  if (err == ESP_OK) {
    state_ = State::WORD_CLOCKING;
    size_t index = 0;
    for (size_t chip = 0; chip < chips && err == ESP_OK; chip++) {
      err = send_word(command_word_);
      for (unsigned ch = 0; ch < MY9221_CHANNELS_PER_CHIP && err == ESP_OK; ch++, index++) {
        uint16_t word = 0;
        if (index < count) {
          word = CommandWord::grayscale(*value, command_.resolution);
          ++value;
        }
        err = send_word(word);
      }
    }
  }

  // 3. Latch
  if (err == ESP_OK) {
    state_ = State::LATCH;
    err = latch();
  }

  if (err != ESP_OK) {
    ESP_LOGE(TAG, "Show aborted in %s: %s", state_name(state_), my9221_err_to_name(err));
  } else {
    ESP_LOGD(TAG, "Sent %u channels over %u chips", (unsigned int) count, (unsigned int) chips);
  }

  state_ = State::IDLE;
  return err;
}

// ============================================================================
// Line Sequences
// ============================================================================

esp_err_t Transmitter::reset_lines() {
  esp_err_t err = clock_->set_level(false);
  if (err != ESP_OK) {
    return err;
  }
  clock_level_ = false;

  err = data_->set_level(false);
  if (err != ESP_OK) {
    return err;
  }

  return delay_->delay_us(RESET_QUIET_US);
}

esp_err_t Transmitter::send_word(uint16_t word) {
  for (int bit = WORD_BITS - 1; bit >= 0; bit--) {
    esp_err_t err = data_->set_level((word >> bit) & 1);
    if (err != ESP_OK) {
      return err;
    }
    err = delay_->delay_us(BIT_SETUP_US);
    if (err != ESP_OK) {
      return err;
    }

    // Chip samples DI on both DCKI edges: one toggle per bit
    const bool next_level = !clock_level_;
    err = clock_->set_level(next_level);
    if (err != ESP_OK) {
      return err;
    }
    clock_level_ = next_level;

    err = delay_->delay_us(BIT_HOLD_US);
    if (err != ESP_OK) {
      return err;
    }
  }
  return ESP_OK;
}

esp_err_t Transmitter::latch() {
  // DCKI stays static for the whole sequence
  esp_err_t err = data_->set_level(false);
  if (err != ESP_OK) {
    return err;
  }
  err = delay_->delay_us(LATCH_START_US);
  if (err != ESP_OK) {
    return err;
  }

  for (unsigned i = 0; i < LATCH_PULSES; i++) {
    err = data_->set_level(true);
    if (err != ESP_OK) {
      return err;
    }
    err = delay_->delay_us(LATCH_PULSE_HIGH_US);
    if (err != ESP_OK) {
      return err;
    }
    err = data_->set_level(false);
    if (err != ESP_OK) {
      return err;
    }
    err = delay_->delay_us(LATCH_PULSE_LOW_US);
    if (err != ESP_OK) {
      return err;
    }
  }

  return delay_->delay_us(LATCH_STOP_US);
}

esp_err_t Transmitter::wait_ms(uint32_t ms) {
  if (!initialized_) {
    return ESP_ERR_INVALID_STATE;
  }
  if (ms == 0) {
    return ESP_OK;
  }
  return delay_->delay_ms(ms);
}

const char *Transmitter::state_name(State state) {
  switch (state) {
    case State::IDLE:
      return "IDLE";
    case State::RESET:
      return "RESET";
    case State::WORD_CLOCKING:
      return "WORD_CLOCKING";
    case State::LATCH:
      return "LATCH";
    default:
      return "UNKNOWN";
  }
}

}  // namespace my9221
