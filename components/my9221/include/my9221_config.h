// SPDX-FileCopyrightText: 2025 Stuart Parmenter
// SPDX-License-Identifier: MIT

// @file my9221_config.h
// @brief Compile-time configuration for MY9221 driver

#pragma once

#ifdef __cplusplus
extern "C" {
#endif

/**
 * Compiler optimization attributes
 */
#define MY9221_CONST __attribute__((const))  // Pure math, no memory access

/**
 * Output channels per MY9221 chip
 */
#define MY9221_CHANNELS_PER_CHIP 12

/**
 * Maximum cascaded chips
 * Bounds the frame buffer storage (no heap allocation)
 * Set via menuconfig or override: -DMY9221_MAX_CHIPS=32
 */
#ifndef MY9221_MAX_CHIPS
#ifdef CONFIG_MY9221_MAX_CHIPS
#define MY9221_MAX_CHIPS CONFIG_MY9221_MAX_CHIPS
#else
#define MY9221_MAX_CHIPS 16  // 8x8 RGB matrix
#endif
#endif

#define MY9221_MAX_CHANNELS (MY9221_MAX_CHIPS * MY9221_CHANNELS_PER_CHIP)

/**
 * Matrix dimension limits
 */
#ifndef MY9221_MAX_ROWS
#ifdef CONFIG_MY9221_MAX_ROWS
#define MY9221_MAX_ROWS CONFIG_MY9221_MAX_ROWS
#else
#define MY9221_MAX_ROWS 32
#endif
#endif

#ifndef MY9221_MAX_COLUMNS
#ifdef CONFIG_MY9221_MAX_COLUMNS
#define MY9221_MAX_COLUMNS CONFIG_MY9221_MAX_COLUMNS
#else
#define MY9221_MAX_COLUMNS 32
#endif
#endif

/**
 * Maximum frames per animation
 */
#ifndef MY9221_MAX_ANIMATION_FRAMES
#ifdef CONFIG_MY9221_MAX_ANIMATION_FRAMES
#define MY9221_MAX_ANIMATION_FRAMES CONFIG_MY9221_MAX_ANIMATION_FRAMES
#else
#define MY9221_MAX_ANIMATION_FRAMES 16
#endif
#endif

/**
 * Repeat count for play() meaning "until an error occurs"
 */
#define MY9221_REPEAT_FOREVER 0

#ifdef __cplusplus
}
#endif
