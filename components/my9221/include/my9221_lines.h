// SPDX-FileCopyrightText: 2025 Stuart Parmenter
// SPDX-License-Identifier: MIT
//
// @file my9221_lines.h
// @brief Output line and delay abstractions consumed by the transmitter
//
// The transmitter never touches GPIO or timers directly. Hardware backends
// (GpioLine, RomDelay) and test recorders implement these interfaces.

#pragma once

#include <esp_err.h>
#include <stdint.h>

namespace my9221 {

/**
 * @brief One digital output line (DCKI or DI)
 */
class OutputLine {
 public:
  virtual ~OutputLine() = default;

  /**
   * @brief Drive the line
   * @param high true for logic high
   * @return ESP_OK, or the hardware error reported by the backend
   */
  virtual esp_err_t set_level(bool high) = 0;
};

/**
 * @brief Blocking delays: microsecond edge timing and millisecond holds
 */
class DelayProvider {
 public:
  virtual ~DelayProvider() = default;

  /**
   * @brief Block for at least `us` microseconds
   * @return ESP_OK, or the error reported by the backend
   */
  virtual esp_err_t delay_us(uint32_t us) = 0;

  /**
   * @brief Hold for at least `ms` milliseconds between frames
   *
   * No edge timing depends on this; backends may block in the scheduler.
   * @return ESP_OK, or the error reported by the backend
   */
  virtual esp_err_t delay_ms(uint32_t ms) = 0;
};

}  // namespace my9221
