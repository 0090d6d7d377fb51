/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "runtime/runtime_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(minichain::runtime, RuntimeError, e) {
  using E = minichain::runtime::RuntimeError;
  switch (e) {
    case E::BLOCK_NUMBER_MISMATCH:
      return "Invalid block number";
  }
  return "Unknown RuntimeError";
}
