// SPDX-FileCopyrightText: 2025 Stuart Parmenter
// SPDX-License-Identifier: MIT
//
// @file rom_delay.cpp
// @brief ROM busy-wait delay backend

#include <sdkconfig.h>

#include "my9221_gpio.h"
#include <esp_rom_sys.h>
#include <algorithm>

#ifndef CONFIG_IDF_TARGET_LINUX
#include <freertos/FreeRTOS.h>  // NOLINT(misc-header-include-cycle)
#include <freertos/task.h>
#endif

namespace my9221 {

esp_err_t RomDelay::delay_us(uint32_t us) {
  esp_rom_delay_us(us);
  return ESP_OK;
}

esp_err_t RomDelay::delay_ms(uint32_t ms) {
#ifndef CONFIG_IDF_TARGET_LINUX
  const TickType_t ticks = pdMS_TO_TICKS(ms);
  if (ticks > 0) {
    vTaskDelay(ticks);
    ms -= ticks * portTICK_PERIOD_MS;
  }
#endif
  // Sub-tick remainder (or the whole hold on host builds), 1 s chunks so ms * 1000 never overflows
  while (ms > 0) {
    const uint32_t chunk = std::min<uint32_t>(ms, 1000);
    esp_rom_delay_us(chunk * 1000);
    ms -= chunk;
  }
  return ESP_OK;
}

}  // namespace my9221
