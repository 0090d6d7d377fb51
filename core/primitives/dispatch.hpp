/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace minichain::primitives {

  /**
   * Result of a dispatched call. The error keeps the category of the module
   * which rejected the call, error().message() is its textual form.
   */
  using DispatchResult = outcome::result<void>;

  /**
   * @brief Uniform entry point of a module: executes a call on behalf of a
   * caller, mutating the module's own state only
   */
  template <typename CallerT, typename CallT>
  class Dispatch {
   public:
    using Caller = CallerT;
    using Call = CallT;

    virtual ~Dispatch() = default;

    /**
     * Executes \arg call on behalf of \arg caller
     * @return success, or the module error which rejected the call; expected
     * failures never throw
     */
    virtual DispatchResult dispatch(const Caller &caller, Call call) = 0;
  };

}  // namespace minichain::primitives
