// SPDX-FileCopyrightText: 2025 Stuart Parmenter
// SPDX-License-Identifier: MIT

// @file scan_order.h
// @brief Scan order and rotation coordinate remapping
//
// This is the only place where knowledge of the physical matrix wiring lives.
// Everything upstream addresses pixels by (row, column); the transmitter only
// sees the linear sequence these remaps produce.

#pragma once

#include "my9221_types.h"
#include "my9221_config.h"

namespace my9221 {

// Scan order coordinate remapping
// Transforms a pixel index in transmission order to its grid position
//
// Example (3x4 grid, SERPENTINE_ROWS):
//   ┌────┬────┬────┬────┐
//   │ 0→ │ 1→ │ 2→ │ 3  │
//   ├────┼────┼────┼────┤
//   │ 7  │ ←6 │ ←5 │ ←4 │
//   ├────┼────┼────┼────┤
//   │ 8→ │ 9→ │10→ │ 11 │
//   └────┴────┴────┴────┘
class ScanOrderRemap {
 public:
  // Remap a transmission index to grid coordinates
  // @param index Pixel index in transmission order (< rows * columns)
  // @param order Scan order type (CUSTOM is resolved by the caller)
  // @param rows Grid rows
  // @param columns Grid columns
  // @return Grid coordinates
  static MY9221_CONST constexpr My9221Coords remap(uint16_t index, My9221ScanOrder order, uint16_t rows,
                                                   uint16_t columns) {
    switch (order) {
      case My9221ScanOrder::ROW_MAJOR:
        return {static_cast<uint16_t>(index / columns), static_cast<uint16_t>(index % columns)};

      case My9221ScanOrder::COLUMN_MAJOR:
        return {static_cast<uint16_t>(index % rows), static_cast<uint16_t>(index / rows)};

      case My9221ScanOrder::SERPENTINE_ROWS: {
        uint16_t row = index / columns;
        uint16_t column = index % columns;
        if ((row & 1) == 1) {  // Odd rows run right→left
          column = columns - 1 - column;
        }
        return {row, column};
      }

      case My9221ScanOrder::SERPENTINE_COLUMNS: {
        uint16_t column = index / rows;
        uint16_t row = index % rows;
        if ((column & 1) == 1) {  // Odd columns run bottom→top
          row = rows - 1 - row;
        }
        return {row, column};
      }

      default:
        // Fallback: row-major
        return {static_cast<uint16_t>(index / columns), static_cast<uint16_t>(index % columns)};
    }
  }
};

// Rotation coordinate remapping
// Transforms logical (rotated) coordinates to physical buffer coordinates
//
// rows/columns are the PHYSICAL dimensions. For 90/270 the logical grid is
// columns high and rows wide.
class RotationRemap {
 public:
  static MY9221_CONST constexpr My9221Coords remap(My9221Coords c, My9221Rotation rotation, uint16_t rows,
                                                   uint16_t columns) {
    switch (rotation) {
      case My9221Rotation::DEG_0:
        return c;

      case My9221Rotation::DEG_90:
        return {c.column, static_cast<uint16_t>(columns - 1 - c.row)};

      case My9221Rotation::DEG_180:
        return {static_cast<uint16_t>(rows - 1 - c.row), static_cast<uint16_t>(columns - 1 - c.column)};

      case My9221Rotation::DEG_270:
        return {static_cast<uint16_t>(rows - 1 - c.column), c.row};

      default:
        return c;
    }
  }

  // True if the rotation swaps logical width and height
  static constexpr bool swaps_axes(My9221Rotation rotation) {
    return rotation == My9221Rotation::DEG_90 || rotation == My9221Rotation::DEG_270;
  }
};

// ============================================================================
// Compile-Time Validation
// ============================================================================

namespace {  // Anonymous namespace for compile-time validation

consteval bool coords_equal(My9221Coords a, My9221Coords b) { return (a.row == b.row) && (a.column == b.column); }

// Row-major and column-major agree on the diagonal
consteval bool test_linear_orders() {
  return coords_equal(ScanOrderRemap::remap(9, My9221ScanOrder::ROW_MAJOR, 8, 8), {1, 1}) &&
         coords_equal(ScanOrderRemap::remap(9, My9221ScanOrder::COLUMN_MAJOR, 8, 8), {1, 1}) &&
         coords_equal(ScanOrderRemap::remap(11, My9221ScanOrder::ROW_MAJOR, 3, 4), {2, 3}) &&
         coords_equal(ScanOrderRemap::remap(11, My9221ScanOrder::COLUMN_MAJOR, 3, 4), {2, 3});
}

// Serpentine rows reverse every odd row
consteval bool test_serpentine_rows() {
  return coords_equal(ScanOrderRemap::remap(7, My9221ScanOrder::SERPENTINE_ROWS, 8, 8), {0, 7}) &&
         coords_equal(ScanOrderRemap::remap(8, My9221ScanOrder::SERPENTINE_ROWS, 8, 8), {1, 7}) &&
         coords_equal(ScanOrderRemap::remap(15, My9221ScanOrder::SERPENTINE_ROWS, 8, 8), {1, 0}) &&
         coords_equal(ScanOrderRemap::remap(16, My9221ScanOrder::SERPENTINE_ROWS, 8, 8), {2, 0});
}

// Serpentine columns reverse every odd column
consteval bool test_serpentine_columns() {
  return coords_equal(ScanOrderRemap::remap(8, My9221ScanOrder::SERPENTINE_COLUMNS, 8, 8), {7, 1}) &&
         coords_equal(ScanOrderRemap::remap(15, My9221ScanOrder::SERPENTINE_COLUMNS, 8, 8), {0, 1});
}

// Rotations on a non-square (4x8) grid stay in bounds
consteval bool test_rotation_corners() {
  constexpr uint16_t rows = 4, columns = 8;
  return coords_equal(RotationRemap::remap({0, 0}, My9221Rotation::DEG_0, rows, columns), {0, 0}) &&
         coords_equal(RotationRemap::remap({0, 0}, My9221Rotation::DEG_90, rows, columns), {0, 7}) &&
         coords_equal(RotationRemap::remap({7, 3}, My9221Rotation::DEG_90, rows, columns), {3, 0}) &&
         coords_equal(RotationRemap::remap({0, 0}, My9221Rotation::DEG_180, rows, columns), {3, 7}) &&
         coords_equal(RotationRemap::remap({0, 0}, My9221Rotation::DEG_270, rows, columns), {3, 0}) &&
         coords_equal(RotationRemap::remap({7, 3}, My9221Rotation::DEG_270, rows, columns), {0, 7});
}

static_assert(test_linear_orders(), "Row/column-major scan produces wrong coordinates");
static_assert(test_serpentine_rows(), "Serpentine row scan produces wrong coordinates");
static_assert(test_serpentine_columns(), "Serpentine column scan produces wrong coordinates");
static_assert(test_rotation_corners(), "Rotation produces out-of-bounds coordinates");

}  // namespace

}  // namespace my9221
