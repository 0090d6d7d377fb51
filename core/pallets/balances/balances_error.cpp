/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "pallets/balances/balances_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(minichain::balances, BalancesError, e) {
  using E = minichain::balances::BalancesError;
  switch (e) {
    case E::InsufficientBalance:
      return "Insufficient balance";
    case E::InsufficientFunds:
      return "Insufficient funds to pay fees";
    case E::OverflowInCalculation:
      return "Overflow in calculating transfer costs";
    case E::OverflowInTransfer:
      return "Overflow in transfer calculation";
    case E::InvalidAmount:
      return "Invalid amount specified";
  }
  return "Unknown BalancesError";
}
