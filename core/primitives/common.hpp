/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/blob.hpp"

namespace minichain::primitives {
  /// Opaque 32-byte identifier of a finalized block
  using BlockHash = common::Hash256;
}  // namespace minichain::primitives
