// SPDX-FileCopyrightText: 2025 Stuart Parmenter
// SPDX-License-Identifier: MIT
//
// @file my9221_err.cpp
// @brief Error code names

#include "my9221_types.h"

extern "C" const char *my9221_err_to_name(esp_err_t code) {
  switch (code) {
    case MY9221_ERR_OUT_OF_BOUNDS:
      return "MY9221_ERR_OUT_OF_BOUNDS";
    case MY9221_ERR_OUT_OF_RANGE:
      return "MY9221_ERR_OUT_OF_RANGE";
    default:
      return esp_err_to_name(code);
  }
}
