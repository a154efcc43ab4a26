// SPDX-FileCopyrightText: 2025 Stuart Parmenter
// SPDX-License-Identifier: MIT
//
// @file gpio_line.cpp
// @brief GPIO output line backend (chip targets only)

#include <sdkconfig.h>

#ifndef CONFIG_IDF_TARGET_LINUX

#include "my9221_gpio.h"
#include "my9221_types.h"
#include <driver/gpio.h>
#include <esp_log.h>

static const char *const TAG = "GpioLine";

namespace my9221 {

esp_err_t GpioLine::init() {
  if (!GPIO_IS_VALID_OUTPUT_GPIO(pin_)) {
    ESP_LOGE(TAG, "GPIO %d is not a valid output", pin_);
    return ESP_ERR_INVALID_ARG;
  }

  esp_err_t err = gpio_reset_pin((gpio_num_t) pin_);
  if (err == ESP_OK) {
    err = gpio_set_direction((gpio_num_t) pin_, GPIO_MODE_OUTPUT);
  }
  if (err == ESP_OK) {
    err = gpio_set_level((gpio_num_t) pin_, 0);
  }
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "Failed to configure GPIO %d: %s", pin_, my9221_err_to_name(err));
    return err;
  }

  ESP_LOGI(TAG, "GPIO %d configured as output", pin_);
  return ESP_OK;
}

esp_err_t GpioLine::set_level(bool high) { return gpio_set_level((gpio_num_t) pin_, high ? 1 : 0); }

}  // namespace my9221

#endif  // CONFIG_IDF_TARGET_LINUX
