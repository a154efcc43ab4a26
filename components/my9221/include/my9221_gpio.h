// SPDX-FileCopyrightText: 2025 Stuart Parmenter
// SPDX-License-Identifier: MIT
//
// @file my9221_gpio.h
// @brief ESP32 GPIO and ROM-delay backends for the line abstractions
//
// GpioLine is only built for chip targets; RomDelay works on every target.

#pragma once

#include "my9221_lines.h"

namespace my9221 {

/**
 * @brief Push-pull GPIO output
 */
class GpioLine : public OutputLine {
 public:
  explicit GpioLine(int pin) : pin_(pin) {}

  /**
   * @brief Reset the pin, make it an output and drive it low
   */
  esp_err_t init();

  esp_err_t set_level(bool high) override;

  int pin() const { return pin_; }

 private:
  int pin_;
};

/**
 * @brief Busy-wait esp_rom_delay_us() for edge timing
 *
 * Millisecond holds go through vTaskDelay() on chip targets so the calling
 * task yields to IDLE (task watchdog); host builds busy-wait.
 */
class RomDelay : public DelayProvider {
 public:
  esp_err_t delay_us(uint32_t us) override;
  esp_err_t delay_ms(uint32_t ms) override;
};

}  // namespace my9221
