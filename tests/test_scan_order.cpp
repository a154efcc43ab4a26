// SPDX-FileCopyrightText: 2025 Stuart Parmenter
// SPDX-License-Identifier: MIT

// Scan order: element count, restartable iteration, wiring variants, RGB color order
#include <cassert>
#include <iostream>
#include <vector>
#include "my9221_frame_buffer.h"

using my9221::FrameBuffer;

// Channel reads by transmission index only happen through scan()
template<typename T>
concept HasIndexedScanRead = requires(const T &buffer) { buffer.scan_value(size_t{0}); };
static_assert(!HasIndexedScanRead<FrameBuffer>, "scan_value must not be callable from outside the buffer");

// Each pixel holds its row-major index so the scan output shows the visiting order
static void label_pixels(FrameBuffer &fb) {
  for (uint16_t r = 0; r < fb.rows(); r++) {
    for (uint16_t c = 0; c < fb.columns(); c++) {
      assert(fb.set(r, c, static_cast<uint16_t>(r * fb.columns() + c)) == ESP_OK);
    }
  }
}

static std::vector<uint16_t> collect(const FrameBuffer &fb) {
  std::vector<uint16_t> out;
  for (uint16_t v : fb.scan()) {
    out.push_back(v);
  }
  return out;
}

static FrameBuffer make(uint16_t rows, uint16_t columns, My9221ScanOrder order, My9221ScanFn fn = nullptr) {
  FrameBuffer fb;
  My9221FrameConfig config{};
  config.rows = rows;
  config.columns = columns;
  config.scan_order = order;
  config.custom_scan = fn;
  assert(fb.init(config) == ESP_OK);
  label_pixels(fb);
  return fb;
}

static void test_count_and_restart() {
  FrameBuffer fb = make(3, 5, My9221ScanOrder::SERPENTINE_ROWS);
  auto seq = fb.scan();
  assert(seq.size() == 15);

  std::vector<uint16_t> first(seq.begin(), seq.end());
  std::vector<uint16_t> second(seq.begin(), seq.end());
  assert(first.size() == 15);
  assert(first == second);
  assert(collect(fb) == first);

  // Walking the sequence never goes past its end
  size_t steps = 0;
  for (auto it = seq.begin(); it != seq.end(); ++it) {
    steps++;
  }
  assert(steps == seq.size());
}

static void test_row_major() {
  FrameBuffer fb = make(3, 4, My9221ScanOrder::ROW_MAJOR);
  std::vector<uint16_t> expected = {0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11};
  assert(collect(fb) == expected);
}

static void test_column_major() {
  FrameBuffer fb = make(3, 4, My9221ScanOrder::COLUMN_MAJOR);
  std::vector<uint16_t> expected = {0, 4, 8, 1, 5, 9, 2, 6, 10, 3, 7, 11};
  assert(collect(fb) == expected);
}

static void test_serpentine_rows() {
  FrameBuffer fb = make(3, 4, My9221ScanOrder::SERPENTINE_ROWS);
  std::vector<uint16_t> expected = {0, 1, 2, 3, 7, 6, 5, 4, 8, 9, 10, 11};
  assert(collect(fb) == expected);
}

static void test_serpentine_columns() {
  FrameBuffer fb = make(3, 4, My9221ScanOrder::SERPENTINE_COLUMNS);
  std::vector<uint16_t> expected = {0, 4, 8, 9, 5, 1, 2, 6, 10, 11, 7, 3};
  assert(collect(fb) == expected);
}

static My9221Coords reverse_scan(uint16_t index, uint16_t rows, uint16_t columns) {
  uint16_t reversed = static_cast<uint16_t>(rows * columns - 1 - index);
  return {static_cast<uint16_t>(reversed / columns), static_cast<uint16_t>(reversed % columns)};
}

static My9221Coords broken_scan(uint16_t, uint16_t, uint16_t) { return {0, 0}; }

static void test_custom_scan() {
  FrameBuffer fb = make(2, 3, My9221ScanOrder::CUSTOM, reverse_scan);
  std::vector<uint16_t> expected = {5, 4, 3, 2, 1, 0};
  assert(collect(fb) == expected);

  FrameBuffer bad;
  My9221FrameConfig config{};
  config.rows = 2;
  config.columns = 3;
  config.scan_order = My9221ScanOrder::CUSTOM;
  config.custom_scan = broken_scan;
  assert(bad.init(config) == ESP_ERR_INVALID_ARG);
}

static void test_rgb_color_order() {
  FrameBuffer fb;
  My9221FrameConfig config{};
  config.rows = 1;
  config.columns = 2;
  config.format = My9221PixelFormat::RGB;
  config.color_order = My9221ColorOrder::GRB;
  assert(fb.init(config) == ESP_OK);
  assert(fb.set_rgb(0, 0, 10, 20, 30) == ESP_OK);
  assert(fb.set_rgb(0, 1, 40, 50, 60) == ESP_OK);

  std::vector<uint16_t> expected = {20, 10, 30, 50, 40, 60};
  assert(collect(fb) == expected);

  FrameBuffer bgr;
  config.color_order = My9221ColorOrder::BGR;
  assert(bgr.init(config) == ESP_OK);
  assert(bgr.set_rgb(0, 0, 1, 2, 3) == ESP_OK);
  std::vector<uint16_t> out = collect(bgr);
  assert(out.size() == 6);
  assert(out[0] == 3 && out[1] == 2 && out[2] == 1);
}

int main() {
  test_count_and_restart();
  test_row_major();
  test_column_major();
  test_serpentine_rows();
  test_serpentine_columns();
  test_custom_scan();
  test_rgb_color_order();
  std::cout << "Test scan_order passed\n";
  return 0;
}
