// SPDX-FileCopyrightText: 2025 Stuart Parmenter
// SPDX-License-Identifier: MIT

// @file board_config.h
// @brief Helper to load menuconfig settings into My9221Config

#pragma once

#include "my9221.h"
#include "sdkconfig.h"
#include <esp_log.h>
#include <cstdio>

static const char *const TAG_CONFIG = "board_config";

// Defaults for builds whose sdkconfig has no MY9221 entries
#ifndef CONFIG_MY9221_MATRIX_ROWS
#define CONFIG_MY9221_MATRIX_ROWS 8
#endif
#ifndef CONFIG_MY9221_MATRIX_COLUMNS
#define CONFIG_MY9221_MATRIX_COLUMNS 8
#endif
#ifndef CONFIG_MY9221_PIN_DCKI
#define CONFIG_MY9221_PIN_DCKI 4
#endif
#ifndef CONFIG_MY9221_PIN_DI
#define CONFIG_MY9221_PIN_DI 5
#endif

// Load configuration from menuconfig (CONFIG_* defines)
static inline My9221Config getMenuConfigSettings() {
  My9221Config config = {};

  // Matrix dimensions
  config.rows = CONFIG_MY9221_MATRIX_ROWS;
  config.columns = CONFIG_MY9221_MATRIX_COLUMNS;

  // Pixel format
#if defined(CONFIG_MY9221_FORMAT_RGB)
  config.format = My9221PixelFormat::RGB;
#else
  config.format = My9221PixelFormat::MONO;
#endif

#if defined(CONFIG_MY9221_COLOR_ORDER_RBG)
  config.color_order = My9221ColorOrder::RBG;
#elif defined(CONFIG_MY9221_COLOR_ORDER_GRB)
  config.color_order = My9221ColorOrder::GRB;
#elif defined(CONFIG_MY9221_COLOR_ORDER_GBR)
  config.color_order = My9221ColorOrder::GBR;
#elif defined(CONFIG_MY9221_COLOR_ORDER_BRG)
  config.color_order = My9221ColorOrder::BRG;
#elif defined(CONFIG_MY9221_COLOR_ORDER_BGR)
  config.color_order = My9221ColorOrder::BGR;
#else
  config.color_order = My9221ColorOrder::RGB;
#endif

  // Wiring
#if defined(CONFIG_MY9221_SCAN_COLUMN_MAJOR)
  config.scan_order = My9221ScanOrder::COLUMN_MAJOR;
#elif defined(CONFIG_MY9221_SCAN_SERPENTINE_ROWS)
  config.scan_order = My9221ScanOrder::SERPENTINE_ROWS;
#elif defined(CONFIG_MY9221_SCAN_SERPENTINE_COLUMNS)
  config.scan_order = My9221ScanOrder::SERPENTINE_COLUMNS;
#endif

  // Rotation
#if defined(CONFIG_MY9221_ROTATION_90)
  config.rotation = My9221Rotation::DEG_90;
#elif defined(CONFIG_MY9221_ROTATION_180)
  config.rotation = My9221Rotation::DEG_180;
#elif defined(CONFIG_MY9221_ROTATION_270)
  config.rotation = My9221Rotation::DEG_270;
#endif

  // Display offset
#ifdef CONFIG_MY9221_OFFSET_ROW
  config.offset.row = CONFIG_MY9221_OFFSET_ROW;
#endif
#ifdef CONFIG_MY9221_OFFSET_COLUMN
  config.offset.column = CONFIG_MY9221_OFFSET_COLUMN;
#endif

  // Grayscale resolution
#if defined(CONFIG_MY9221_GRAYSCALE_12BIT)
  config.command.resolution = My9221GrayscaleResolution::BITS_12;
#elif defined(CONFIG_MY9221_GRAYSCALE_14BIT)
  config.command.resolution = My9221GrayscaleResolution::BITS_14;
#elif defined(CONFIG_MY9221_GRAYSCALE_16BIT)
  config.command.resolution = My9221GrayscaleResolution::BITS_16;
#endif

  // Pins
  config.pins.clock = CONFIG_MY9221_PIN_DCKI;
  config.pins.data = CONFIG_MY9221_PIN_DI;
  ESP_LOGI(TAG_CONFIG, "Matrix %dx%d on DCKI=%d DI=%d", config.rows, config.columns, config.pins.clock,
           config.pins.data);

  return config;
}

// Helper: Print pin configuration (for debugging)
static inline void printPinConfig(const My9221Pins &pins) {
  printf("MY9221 Pin Configuration:\n");
  printf("  DCKI=%d, DI=%d\n", pins.clock, pins.data);
}
