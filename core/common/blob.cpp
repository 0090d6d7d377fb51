/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/blob.hpp"

namespace minichain::common {

  template class Blob<32ul>;

}  // namespace minichain::common
