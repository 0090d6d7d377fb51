/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "runtime/runtime_config.hpp"

namespace minichain::application {

  /**
   * Parse and store application config. Runtime parameters set here take
   * precedence over the ones of the chain spec.
   */
  class AppConfiguration {
   public:
    virtual ~AppConfiguration() = default;

    /**
     * @return file path with the chain specification
     */
    virtual const std::filesystem::path &chainSpecPath() const = 0;

    /**
     * @return logging system tuning config, entries are either a level or
     * group=level
     */
    virtual const std::vector<std::string> &log() const = 0;

    /// @return flat fee charged per transfer
    virtual const std::optional<runtime::Balance> &baseFee() const = 0;

    /// @return account credited with the fees, burnt if not set
    virtual const std::optional<runtime::AccountId> &feeRecipient() const = 0;

    virtual const std::optional<runtime::Balance> &minimumStake() const = 0;

    /// @return reward per block, in thousandths of the staked amount
    virtual const std::optional<runtime::Balance> &rewardRate() const = 0;

    /// @return blocks a stake stays locked
    virtual std::optional<runtime::BlockNumber> unstakingPeriod() const = 0;

    virtual std::optional<uint32_t> maxValidators() const = 0;
  };

}  // namespace minichain::application
