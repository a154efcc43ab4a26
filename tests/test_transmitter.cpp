// SPDX-FileCopyrightText: 2025 Stuart Parmenter
// SPDX-License-Identifier: MIT

// Transmitter: word layout, latch sequence, fault recovery, argument checks
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include "my9221_gpio.h"
#include "my9221_transmitter.h"
#include "recording_lines.h"

using my9221::FrameBuffer;
using my9221::Transmitter;
using my9221_test::decode;
using my9221_test::EventLog;
using my9221_test::LineEvent;
using my9221_test::RecordingDelay;
using my9221_test::RecordingLine;
using my9221_test::Waveform;

// Calls made by one single-chip show: reset, 13 words, latch
static constexpr long RESET_CALLS = 3;
static constexpr long WORD_CALLS = 16 * 4;
static constexpr long LATCH_CALLS = 2 + 4 * 4 + 1;

static std::unique_ptr<Transmitter> make_tx(const std::shared_ptr<EventLog> &log, const My9221Command &command = {}) {
  auto tx = std::make_unique<Transmitter>(std::make_unique<RecordingLine>(log, LineEvent::CLOCK),
                                          std::make_unique<RecordingLine>(log, LineEvent::DATA),
                                          std::make_unique<RecordingDelay>(log), command);
  assert(tx->init() == ESP_OK);
  log->reset();
  return tx;
}

static bool is(const LineEvent &e, LineEvent::Kind kind, uint32_t value) { return e.kind == kind && e.value == value; }

static void test_init_drives_lines_low() {
  auto log = std::make_shared<EventLog>();
  Transmitter tx(std::make_unique<RecordingLine>(log, LineEvent::CLOCK),
                 std::make_unique<RecordingLine>(log, LineEvent::DATA), std::make_unique<RecordingDelay>(log));
  assert(!tx.is_initialized());
  assert(tx.init() == ESP_OK);
  assert(tx.is_initialized());
  assert(tx.state() == Transmitter::State::IDLE);
  assert(log->events.size() == 2);
  assert(is(log->events[0], LineEvent::CLOCK, 0));
  assert(is(log->events[1], LineEvent::DATA, 0));
}

static void test_all_zero_frame() {
  auto log = std::make_shared<EventLog>();
  auto tx = make_tx(log);
  FrameBuffer fb;
  assert(fb.init(8, 8) == ESP_OK);

  assert(tx->show(fb) == ESP_OK);
  assert(tx->state() == Transmitter::State::IDLE);

  Waveform w = decode(log->events);
  // 64 channels: 6 chips of 13 words
  assert(w.words.size() == 78);
  assert(w.trailing_bits == 0);
  for (uint16_t word : w.words) {
    assert(word == 0x0000);
  }
  assert(w.clock_ends_low);
  assert(w.latch_pulses == 4);
  assert(w.latch_quiet_us >= 220);
  assert(w.reset_quiet_us >= 220);

  // Starts with reset
  assert(is(log->events[0], LineEvent::CLOCK, 0));
  assert(is(log->events[1], LineEvent::DATA, 0));
  assert(is(log->events[2], LineEvent::DELAY, 220));
}

static void test_latch_tail() {
  auto log = std::make_shared<EventLog>();
  auto tx = make_tx(log);
  std::vector<uint16_t> values(12, 0xFF);
  assert(tx->show(values.data(), values.size()) == ESP_OK);

  size_t last_clock = 0;
  for (size_t i = 0; i < log->events.size(); i++) {
    if (log->events[i].kind == LineEvent::CLOCK) {
      last_clock = i;
    }
  }

  std::vector<LineEvent> expected = {{LineEvent::DELAY, 1}, {LineEvent::DATA, 0}, {LineEvent::DELAY, 220}};
  for (int i = 0; i < 4; i++) {
    expected.push_back({LineEvent::DATA, 1});
    expected.push_back({LineEvent::DELAY, 1});
    expected.push_back({LineEvent::DATA, 0});
    expected.push_back({LineEvent::DELAY, 1});
  }
  expected.push_back({LineEvent::DELAY, 1});

  assert(log->events.size() - last_clock - 1 == expected.size());
  for (size_t i = 0; i < expected.size(); i++) {
    assert(is(log->events[last_clock + 1 + i], expected[i].kind, expected[i].value));
  }
}

static void test_all_max_frame() {
  auto log = std::make_shared<EventLog>();
  auto tx = make_tx(log);
  FrameBuffer fb;
  assert(fb.init(8, 8, 255) == ESP_OK);
  assert(tx->show(fb) == ESP_OK);

  Waveform w = decode(log->events);
  assert(w.words.size() == 78);
  for (size_t i = 0; i < w.words.size(); i++) {
    if (i % 13 == 0) {
      assert(w.words[i] == 0x0000);
    } else if (i / 13 * 12 + i % 13 - 1 < 64) {
      assert(w.words[i] == 0x00FF);
    } else {
      assert(w.words[i] == 0x0000);
    }
  }
}

static void test_successive_shows_are_independent() {
  auto log = std::make_shared<EventLog>();
  auto tx = make_tx(log);
  std::vector<uint16_t> a(24, 0x11);
  std::vector<uint16_t> b(24, 0x22);

  assert(tx->show(a.data(), a.size()) == ESP_OK);
  std::vector<LineEvent> first = log->events;
  log->reset();
  assert(tx->show(b.data(), b.size()) == ESP_OK);
  std::vector<LineEvent> second = log->events;

  assert(first.size() == second.size());
  for (const auto *events : {&first, &second}) {
    assert(is((*events)[0], LineEvent::CLOCK, 0));
    assert(is((*events)[1], LineEvent::DATA, 0));
    assert(is((*events)[2], LineEvent::DELAY, 220));
  }

  Waveform wb = decode(second);
  assert(wb.words.size() == 26);
  assert(wb.words[1] == 0x22 && wb.words[25] == 0x22);
  assert(wb.latch_pulses == 4);
}

static void test_fault_aborts_and_recovers() {
  auto log = std::make_shared<EventLog>();
  auto tx = make_tx(log);
  std::vector<uint16_t> values(12, 0x55);

  // Fault on the very first call: nothing reaches the lines
  log->fail_at = 0;
  assert(tx->show(values.data(), values.size()) == ESP_FAIL);
  assert(log->events.empty());
  assert(tx->state() == Transmitter::State::IDLE);

  // Fault mid-word: the sequence stops right there
  log->reset();
  log->fail_at = RESET_CALLS + 50;
  log->fault = ESP_ERR_TIMEOUT;
  assert(tx->show(values.data(), values.size()) == ESP_ERR_TIMEOUT);
  assert(log->events.size() == static_cast<size_t>(RESET_CALLS + 50));
  assert(tx->state() == Transmitter::State::IDLE);

  // Fault inside the latch
  log->reset();
  log->fail_at = RESET_CALLS + 13 * WORD_CALLS + 5;
  log->fault = ESP_FAIL;
  assert(tx->show(values.data(), values.size()) == ESP_FAIL);
  assert(decode(log->events).latch_pulses < 4);
  assert(tx->state() == Transmitter::State::IDLE);

  // Next show is complete and starts from reset
  log->reset();
  assert(tx->show(values.data(), values.size()) == ESP_OK);
  assert(log->events.size() == static_cast<size_t>(RESET_CALLS + 13 * WORD_CALLS + LATCH_CALLS));
  assert(is(log->events[0], LineEvent::CLOCK, 0));
  Waveform w = decode(log->events);
  assert(w.words.size() == 13);
  assert(w.words[12] == 0x55);
  assert(w.latch_pulses == 4);
}

static void test_argument_errors() {
  auto log = std::make_shared<EventLog>();
  FrameBuffer fb;
  assert(fb.init(8, 8) == ESP_OK);

  // Before init
  Transmitter idle(std::make_unique<RecordingLine>(log, LineEvent::CLOCK),
                   std::make_unique<RecordingLine>(log, LineEvent::DATA), std::make_unique<RecordingDelay>(log));
  assert(idle.show(fb) == ESP_ERR_INVALID_STATE);
  assert(idle.wait_ms(1) == ESP_ERR_INVALID_STATE);
  assert(log->events.empty());

  // Missing handle
  Transmitter missing(nullptr, std::make_unique<RecordingLine>(log, LineEvent::DATA),
                      std::make_unique<RecordingDelay>(log));
  assert(missing.init() == ESP_ERR_INVALID_ARG);

  // Bad command
  My9221Command bad{};
  bad.resolution = static_cast<My9221GrayscaleResolution>(9);
  Transmitter bad_tx(std::make_unique<RecordingLine>(log, LineEvent::CLOCK),
                     std::make_unique<RecordingLine>(log, LineEvent::DATA), std::make_unique<RecordingDelay>(log), bad);
  assert(bad_tx.init() == ESP_ERR_INVALID_ARG);

  auto tx = make_tx(log);

  // Resolution mismatch
  FrameBuffer wide;
  My9221FrameConfig config{};
  config.resolution = My9221GrayscaleResolution::BITS_12;
  assert(wide.init(config) == ESP_OK);
  assert(tx->show(wide) == ESP_ERR_INVALID_ARG);

  // Empty and oversized streams
  std::vector<uint16_t> many((MY9221_MAX_CHIPS + 1) * MY9221_CHANNELS_PER_CHIP, 0);
  assert(tx->show(many.data(), 0) == ESP_ERR_INVALID_SIZE);
  assert(tx->show(many.data(), many.size()) == ESP_ERR_INVALID_SIZE);
  assert(tx->show(nullptr, 4) == ESP_ERR_INVALID_ARG);

  // Out-of-range value anywhere: rejected before the first edge
  std::vector<uint16_t> values(30, 1);
  values[29] = 256;
  assert(tx->show(values.data(), values.size()) == MY9221_ERR_OUT_OF_RANGE);
  assert(log->events.empty());
}

static void test_msb_first() {
  auto log = std::make_shared<EventLog>();
  auto tx = make_tx(log);
  uint16_t value = 0x81;
  assert(tx->show(&value, 1) == ESP_OK);

  Waveform w = decode(log->events);
  assert(w.words.size() == 13);
  assert(w.words[1] == 0x0081);

  // Word 1 starts after 16 bits; its bit 15 is 0 and bit 7 is 1
  std::vector<uint32_t> bits;
  bool clock = false;
  uint32_t data = 0;
  for (const LineEvent &e : log->events) {
    if (e.kind == LineEvent::DATA) {
      data = e.value;
    } else if (e.kind == LineEvent::CLOCK && (e.value != 0) != clock) {
      clock = e.value != 0;
      bits.push_back(data);
    }
  }
  assert(bits.size() == 13 * 16);
  assert(bits[16] == 0);
  assert(bits[16 + 8] == 1);
  assert(bits[16 + 15] == 1);
}

static void test_twelve_bit_command() {
  auto log = std::make_shared<EventLog>();
  My9221Command command{};
  command.resolution = My9221GrayscaleResolution::BITS_12;
  auto tx = make_tx(log, command);
  assert(tx->command_word() == 0x0100);
  assert(tx->max_intensity() == 4095);

  uint16_t values[2] = {0x0ABC, 0x0FFF};
  assert(tx->show(values, 2) == ESP_OK);
  Waveform w = decode(log->events);
  assert(w.words[0] == 0x0100);
  assert(w.words[1] == 0x0ABC);
  assert(w.words[2] == 0x0FFF);
  assert(w.words[3] == 0x0000);

  values[1] = 0x1000;
  assert(tx->show(values, 2) == MY9221_ERR_OUT_OF_RANGE);
}

static void test_partial_chip_padding() {
  auto log = std::make_shared<EventLog>();
  auto tx = make_tx(log);
  std::vector<uint16_t> values(13);
  for (size_t i = 0; i < values.size(); i++) {
    values[i] = static_cast<uint16_t>(i + 1);
  }
  assert(Transmitter::chips_for(13) == 2);
  assert(tx->show(values.data(), values.size()) == ESP_OK);

  Waveform w = decode(log->events);
  assert(w.words.size() == 26);
  assert(w.words[0] == 0x0000 && w.words[13] == 0x0000);
  for (size_t i = 1; i <= 12; i++) {
    assert(w.words[i] == i);
  }
  assert(w.words[14] == 13);
  for (size_t i = 15; i < 26; i++) {
    assert(w.words[i] == 0);
  }
}

static void test_blank() {
  auto log = std::make_shared<EventLog>();
  auto tx = make_tx(log);
  assert(tx->blank(24) == ESP_OK);
  Waveform w = decode(log->events);
  assert(w.words.size() == 26);
  for (uint16_t word : w.words) {
    assert(word == 0);
  }
  assert(w.latch_pulses == 4);
  assert(tx->blank(0) == ESP_ERR_INVALID_SIZE);
}

static void test_wait_ms_holds() {
  auto log = std::make_shared<EventLog>();
  auto tx = make_tx(log);
  // Frame holds never go through the microsecond edge delay
  assert(tx->wait_ms(2500) == ESP_OK);
  assert(log->events.size() == 1);
  assert(is(log->events[0], LineEvent::HOLD, 2500));

  log->reset();
  assert(tx->wait_ms(0) == ESP_OK);
  assert(log->events.empty());

  log->reset();
  log->fail_at = 0;
  assert(tx->wait_ms(10) == ESP_FAIL);
}

static void test_rom_delay_holds() {
  my9221::RomDelay delay;
  auto start = std::chrono::steady_clock::now();
  assert(delay.delay_ms(3) == ESP_OK);
  assert(delay.delay_us(500) == ESP_OK);
  auto elapsed = std::chrono::steady_clock::now() - start;
  assert(elapsed >= std::chrono::microseconds(3500));
  assert(delay.delay_ms(0) == ESP_OK);
}

static void test_state_names() {
  assert(std::string(Transmitter::state_name(Transmitter::State::IDLE)) == "IDLE");
  assert(std::string(Transmitter::state_name(Transmitter::State::WORD_CLOCKING)) == "WORD_CLOCKING");
  assert(std::string(Transmitter::state_name(Transmitter::State::LATCH)) == "LATCH");
}

int main() {
  test_init_drives_lines_low();
  test_all_zero_frame();
  test_latch_tail();
  test_all_max_frame();
  test_successive_shows_are_independent();
  test_fault_aborts_and_recovers();
  test_argument_errors();
  test_msb_first();
  test_twelve_bit_command();
  test_partial_chip_padding();
  test_blank();
  test_wait_ms_holds();
  test_rom_delay_holds();
  test_state_names();
  std::cout << "Test transmitter passed\n";
  return 0;
}
