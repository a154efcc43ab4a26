// SPDX-FileCopyrightText: 2025 Stuart Parmenter
// SPDX-License-Identifier: MIT

// @file my9221_types.h
// @brief Common types, enums and error codes for MY9221 driver

#pragma once

#include <esp_err.h>
#include <stdint.h>
#include <stdbool.h>

/**
 * @brief Component error codes
 *
 * Generic failures use the ESP-IDF codes (ESP_ERR_INVALID_ARG, ESP_ERR_INVALID_STATE, ...).
 */
#define MY9221_ERR_BASE 0x9220
#define MY9221_ERR_OUT_OF_BOUNDS (MY9221_ERR_BASE + 1)  // (row, column) outside the grid
#define MY9221_ERR_OUT_OF_RANGE (MY9221_ERR_BASE + 2)   // Intensity outside the grayscale domain

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief esp_err_to_name() that also knows the MY9221 codes
 */
const char *my9221_err_to_name(esp_err_t code);

#ifdef __cplusplus
}
#endif

/**
 * @brief Grayscale resolution (command word bits 9..8)
 *
 * Also fixes the intensity domain: 0 .. 2^bits - 1.
 */
enum class My9221GrayscaleResolution : uint8_t {
  BITS_8 = 8,    // 0-255 (default)
  BITS_12 = 12,  // 0-4095
  BITS_14 = 14,  // 0-16383
  BITS_16 = 16,  // 0-65535
};

/**
 * @brief Internal oscillator divider (command word bits 7..5)
 */
enum class My9221ClockDivider : uint8_t {
  DIV_1 = 0,  // 8.6 MHz
  DIV_2 = 1,
  DIV_4 = 2,
  DIV_8 = 3,
  DIV_16 = 4,
  DIV_64 = 5,
  DIV_128 = 6,
  DIV_256 = 7,
};

/**
 * @brief Chip command word settings
 *
 * Defaults encode to 0x0000 (8-bit, slow, internal oscillator, repeat).
 */
struct My9221Command {
  bool high_speed = false;  // hspd: fast output current slew
  My9221GrayscaleResolution resolution = My9221GrayscaleResolution::BITS_8;
  My9221ClockDivider clock_divider = My9221ClockDivider::DIV_1;
  bool apdm_waveform = false;   // sep: APDM instead of MY-PWM
  bool external_clock = false;  // osc: grayscale clock from DCKI
  bool pwm_polarity = false;    // pol: PWM generator polarity
  bool counter_reset = false;   // cntset
  bool one_shot = false;        // onest
};

/**
 * @brief Pixel layout of a frame buffer
 */
enum class My9221PixelFormat : uint8_t {
  MONO = 1,  // One channel per pixel
  RGB = 3,   // Three channels per pixel
};

/**
 * @brief Order in which the channels of an RGB pixel are wired (transmitted)
 */
enum class My9221ColorOrder {
  RGB,
  RBG,
  GRB,
  GBR,
  BRG,
  BGR,
};

/**
 * @brief Scan order - how logical pixels map onto the chip cascade
 *
 * Scan index N is the N-th grayscale word transmitted. Word N lands in block N / 12;
 * the first block shifted out ends up in the chip farthest from the controller.
 */
enum class My9221ScanOrder {
  ROW_MAJOR,           // Left→right, top→bottom
  COLUMN_MAJOR,        // Top→bottom, left→right
  SERPENTINE_ROWS,     // Even rows left→right, odd rows right→left
  SERPENTINE_COLUMNS,  // Even columns top→bottom, odd columns bottom→top
  CUSTOM,              // Caller-supplied My9221ScanFn
};

/**
 * @brief Display rotation (clockwise)
 */
enum class My9221Rotation {
  DEG_0 = 0,
  DEG_90 = 1,
  DEG_180 = 2,
  DEG_270 = 3,
};

/**
 * @brief Grid position
 */
struct My9221Coords {
  uint16_t row;
  uint16_t column;
};

/**
 * @brief Display offset in logical pixels
 *
 * Positive values move the image down / right. Pixels shifted past an edge
 * are not shown; uncovered pixels are off.
 */
struct My9221Offset {
  int16_t row = 0;
  int16_t column = 0;
};

/**
 * @brief Custom scan order: pixel index in transmission order → grid position
 *
 * Must be a bijection over [0, rows * columns).
 */
using My9221ScanFn = My9221Coords (*)(uint16_t index, uint16_t rows, uint16_t columns);

/**
 * @brief Frame buffer geometry and encoding
 */
struct My9221FrameConfig {
  uint16_t rows = 8;
  uint16_t columns = 8;
  My9221PixelFormat format = My9221PixelFormat::MONO;
  My9221ColorOrder color_order = My9221ColorOrder::RGB;
  My9221GrayscaleResolution resolution = My9221GrayscaleResolution::BITS_8;
  My9221ScanOrder scan_order = My9221ScanOrder::ROW_MAJOR;
  My9221ScanFn custom_scan = nullptr;  // Required when scan_order == CUSTOM
};

/**
 * @brief GPIO assignment for the two-wire interface
 */
struct My9221Pins {
  int8_t clock = -1;  // DCKI
  int8_t data = -1;   // DI
};

/**
 * @brief Driver configuration
 */
struct My9221Config {
  // ========================================
  // Matrix Geometry
  // ========================================

  // Physical rows/columns of the matrix (before rotation)
  uint16_t rows = 8;
  uint16_t columns = 8;

  My9221PixelFormat format = My9221PixelFormat::MONO;
  My9221ColorOrder color_order = My9221ColorOrder::RGB;

  // How the matrix is wired onto the chip outputs
  My9221ScanOrder scan_order = My9221ScanOrder::ROW_MAJOR;
  My9221ScanFn custom_scan = nullptr;

  My9221Rotation rotation = My9221Rotation::DEG_0;
  My9221Offset offset{};

  // ========================================
  // Chip
  // ========================================

  My9221Command command{};

  // ========================================
  // Pin Configuration
  // ========================================

  My9221Pins pins{};
};
