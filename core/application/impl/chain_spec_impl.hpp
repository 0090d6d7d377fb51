/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "application/chain_spec.hpp"

#include <memory>
#include <string_view>

#include <boost/property_tree/ptree.hpp>

#include "log/logger.hpp"

namespace minichain::application {

  enum class ChainSpecError {
    MISSING_ENTRY = 1,
    PARSER_ERROR,
    UNKNOWN_CALL,
    INVALID_VALUE,
  };

  class ChainSpecImpl : public ChainSpec {
   public:
    static outcome::result<std::shared_ptr<ChainSpecImpl>> loadFrom(
        const std::string &config_path);

    ~ChainSpecImpl() override = default;

    const std::string &name() const override {
      return name_;
    }

    const std::string &id() const override {
      return id_;
    }

    const runtime::GenesisConfig &genesis() const override {
      return genesis_;
    }

    const staking::Parameters<runtime::RuntimeConfig> &stakingParameters()
        const override {
      return staking_parameters_;
    }

    const std::vector<BlockTransactions> &blocks() const override {
      return blocks_;
    }

   private:
    using ptree = boost::property_tree::ptree;

    outcome::result<void> loadFromJson(const std::string &file_path);
    outcome::result<void> loadFields(const ptree &tree);
    outcome::result<void> loadGenesis(const ptree &tree);
    outcome::result<void> loadStakingParameters(const ptree &tree);
    outcome::result<void> loadBlocks(const ptree &tree);
    outcome::result<runtime::Transaction> loadTransaction(const ptree &tree);

    outcome::result<runtime::Balance> loadBalance(std::string_view entry_name,
                                                  const ptree &tree);
    outcome::result<uint32_t> loadU32(std::string_view entry_name,
                                      const ptree &tree);
    outcome::result<std::string> loadString(std::string_view entry_name,
                                            const ptree &tree);

    template <typename T>
    outcome::result<std::decay_t<T>> ensure(std::string_view entry_name,
                                            boost::optional<T> opt_entry) {
      if (not opt_entry) {
        SL_ERROR(log_,
                 "Required '{}' entry not found in the chain spec",
                 entry_name);
        return ChainSpecError::MISSING_ENTRY;
      }
      return opt_entry.value();
    }

    ChainSpecImpl() = default;

    std::string name_;
    std::string id_;
    runtime::GenesisConfig genesis_;
    staking::Parameters<runtime::RuntimeConfig> staking_parameters_;
    std::vector<BlockTransactions> blocks_;
    log::Logger log_ = log::createLogger("ChainSpec", "application");
  };

}  // namespace minichain::application

OUTCOME_HPP_DECLARE_ERROR(minichain::application, ChainSpecError);
