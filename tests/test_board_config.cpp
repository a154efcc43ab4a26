// SPDX-FileCopyrightText: 2025 Stuart Parmenter
// SPDX-License-Identifier: MIT

// Board config: menuconfig symbols map onto My9221Config.
// Built once per color order with CONFIG_MY9221_COLOR_ORDER_<X> and
// EXPECTED_COLOR_ORDER set by the build.
#define CONFIG_MY9221_FORMAT_RGB 1
#define CONFIG_MY9221_ROTATION_90 1
#define CONFIG_MY9221_OFFSET_ROW 1
#define CONFIG_MY9221_OFFSET_COLUMN -2
#define CONFIG_MY9221_GRAYSCALE_12BIT 1

#include <cassert>
#include <iostream>
#include "board_config.h"

int main() {
  My9221Config config = getMenuConfigSettings();

  assert(config.color_order == EXPECTED_COLOR_ORDER);
  assert(config.format == My9221PixelFormat::RGB);
  assert(config.rotation == My9221Rotation::DEG_90);
  assert(config.offset.row == 1 && config.offset.column == -2);
  assert(config.command.resolution == My9221GrayscaleResolution::BITS_12);
  assert(config.rows == 8 && config.columns == 8);
  assert(config.pins.clock == 4 && config.pins.data == 5);

  std::cout << "Test board_config passed\n";
  return 0;
}
