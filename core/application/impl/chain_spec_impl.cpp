/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/chain_spec_impl.hpp"

#include <limits>

#include <boost/property_tree/json_parser.hpp>

#include "application/impl/util.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(minichain::application, ChainSpecError, e) {
  using E = minichain::application::ChainSpecError;
  switch (e) {
    case E::MISSING_ENTRY:
      return "A required entry is missing in the chain spec";
    case E::PARSER_ERROR:
      return "Internal parser error";
    case E::UNKNOWN_CALL:
      return "Unknown call name in a block of the chain spec";
    case E::INVALID_VALUE:
      return "Entry of the chain spec has an invalid value";
  }
  return "Unknown error in ChainSpecImpl";
}

namespace minichain::application {

  namespace pt = boost::property_tree;

  outcome::result<std::shared_ptr<ChainSpecImpl>> ChainSpecImpl::loadFrom(
      const std::string &path) {
    // done so because of private constructor
    std::shared_ptr<ChainSpecImpl> chain_spec{new ChainSpecImpl};
    OUTCOME_TRY(chain_spec->loadFromJson(path));

    return chain_spec;
  }

  outcome::result<void> ChainSpecImpl::loadFromJson(
      const std::string &file_path) {
    pt::ptree tree;
    try {
      pt::read_json(file_path, tree);
    } catch (pt::json_parser_error &e) {
      SL_ERROR(log_,
               "Parser error: {}, line {}: {}",
               e.filename(),
               e.line(),
               e.message());
      return ChainSpecError::PARSER_ERROR;
    }

    OUTCOME_TRY(loadFields(tree));
    OUTCOME_TRY(loadGenesis(tree));
    OUTCOME_TRY(loadBlocks(tree));

    SL_VERBOSE(log_,
               "Chain spec '{}' loaded: {} accounts, {} validators, {} blocks",
               id_,
               genesis_.balances.size(),
               genesis_.validators.size(),
               blocks_.size());
    return outcome::success();
  }

  outcome::result<void> ChainSpecImpl::loadFields(const ptree &tree) {
    OUTCOME_TRY(name, ensure("name", tree.get_child_optional("name")));
    name_ = name.get<std::string>("");

    OUTCOME_TRY(id, ensure("id", tree.get_child_optional("id")));
    id_ = id.get<std::string>("");

    return outcome::success();
  }

  outcome::result<runtime::Balance> ChainSpecImpl::loadBalance(
      std::string_view entry_name, const ptree &tree) {
    const auto value = tree.get_value<std::string>();
    auto res = util::parseBalance(value);
    if (res.has_error()) {
      SL_ERROR(log_,
               "Entry '{}' of the chain spec is not a valid balance: '{}'",
               entry_name,
               value);
      return ChainSpecError::INVALID_VALUE;
    }
    return res.value();
  }

  outcome::result<uint32_t> ChainSpecImpl::loadU32(std::string_view entry_name,
                                                   const ptree &tree) {
    const auto value = tree.get_value<std::string>();
    auto res = util::parseU32(value);
    if (res.has_error()) {
      SL_ERROR(log_,
               "Entry '{}' of the chain spec is not a valid number: '{}'",
               entry_name,
               value);
      return ChainSpecError::INVALID_VALUE;
    }
    return res.value();
  }

  outcome::result<std::string> ChainSpecImpl::loadString(
      std::string_view entry_name, const ptree &tree) {
    auto value = tree.get_value<std::string>();
    if (value.empty()) {
      SL_ERROR(log_, "Entry '{}' of the chain spec is empty", entry_name);
      return ChainSpecError::INVALID_VALUE;
    }
    return value;
  }

  outcome::result<void> ChainSpecImpl::loadGenesis(const ptree &tree) {
    OUTCOME_TRY(genesis_tree,
                ensure("genesis", tree.get_child_optional("genesis")));

    OUTCOME_TRY(balances_tree,
                ensure("genesis/balances",
                       genesis_tree.get_child_optional("balances")));
    for (const auto &[account, amount_tree] : balances_tree) {
      OUTCOME_TRY(amount, loadBalance(account, amount_tree));
      genesis_.balances.emplace_back(account, std::move(amount));
    }

    if (auto base_fee = genesis_tree.get_child_optional("baseFee")) {
      OUTCOME_TRY(fee, loadBalance("genesis/baseFee", base_fee.value()));
      genesis_.base_fee = std::move(fee);
    }

    if (auto recipient = genesis_tree.get_child_optional("feeRecipient")) {
      auto value = recipient.value().get_value<std::string>();
      if (not value.empty() and value != "null") {
        genesis_.fee_recipient = std::move(value);
      }
    }

    if (auto staking_tree = genesis_tree.get_child_optional("staking")) {
      OUTCOME_TRY(loadStakingParameters(staking_tree.value()));
    }

    if (auto validators_tree = genesis_tree.get_child_optional("validators")) {
      for (const auto &[_, validator_tree] : validators_tree.value()) {
        OUTCOME_TRY(id_tree,
                    ensure("genesis/validators/id",
                           validator_tree.get_child_optional("id")));
        OUTCOME_TRY(id, loadString("genesis/validators/id", id_tree));

        staking::Commission commission = 0;
        if (auto commission_tree =
                validator_tree.get_child_optional("commission")) {
          OUTCOME_TRY(value,
                      loadU32("genesis/validators/commission",
                              commission_tree.value()));
          if (value > staking::kMaxCommission) {
            SL_ERROR(log_,
                     "Commission of genesis validator {} exceeds {}%",
                     id,
                     staking::kMaxCommission);
            return ChainSpecError::INVALID_VALUE;
          }
          commission = static_cast<staking::Commission>(value);
        }
        genesis_.validators.push_back({std::move(id), commission});
      }
    }

    return outcome::success();
  }

  outcome::result<void> ChainSpecImpl::loadStakingParameters(
      const ptree &tree) {
    if (auto entry = tree.get_child_optional("minimumStake")) {
      OUTCOME_TRY(value, loadBalance("staking/minimumStake", entry.value()));
      staking_parameters_.minimum_stake = std::move(value);
    }
    if (auto entry = tree.get_child_optional("rewardRate")) {
      OUTCOME_TRY(value, loadBalance("staking/rewardRate", entry.value()));
      staking_parameters_.reward_rate = std::move(value);
    }
    if (auto entry = tree.get_child_optional("unstakingPeriod")) {
      OUTCOME_TRY(value, loadU32("staking/unstakingPeriod", entry.value()));
      staking_parameters_.unstaking_period = value;
    }
    if (auto entry = tree.get_child_optional("maxValidators")) {
      OUTCOME_TRY(value, loadU32("staking/maxValidators", entry.value()));
      staking_parameters_.max_validators = value;
    }
    return outcome::success();
  }

  outcome::result<void> ChainSpecImpl::loadBlocks(const ptree &tree) {
    auto blocks_opt = tree.get_child_optional("blocks");
    if (not blocks_opt.has_value()) {
      return outcome::success();
    }
    for (const auto &[_, block_tree] : blocks_opt.value()) {
      BlockTransactions block;
      for (const auto &[_tx, transaction_tree] : block_tree) {
        OUTCOME_TRY(transaction, loadTransaction(transaction_tree));
        block.emplace_back(std::move(transaction));
      }
      blocks_.emplace_back(std::move(block));
    }
    return outcome::success();
  }

  outcome::result<runtime::Transaction> ChainSpecImpl::loadTransaction(
      const ptree &tree) {
    OUTCOME_TRY(call, ensure("call", tree.get_optional<std::string>("call")));

    auto account = [&](const char *entry) -> outcome::result<std::string> {
      OUTCOME_TRY(entry_tree, ensure(entry, tree.get_child_optional(entry)));
      return loadString(entry, entry_tree);
    };
    auto amount = [&]() -> outcome::result<runtime::Balance> {
      OUTCOME_TRY(entry_tree,
                  ensure("amount", tree.get_child_optional("amount")));
      return loadBalance("amount", entry_tree);
    };

    using namespace runtime::transactions;
    if (call == "transfer") {
      OUTCOME_TRY(from, account("from"));
      OUTCOME_TRY(to, account("to"));
      OUTCOME_TRY(value, amount());
      return runtime::Transaction{
          Transfer{std::move(from), std::move(to), std::move(value)}};
    }
    if (call == "set_balance") {
      OUTCOME_TRY(who, account("who"));
      OUTCOME_TRY(value, amount());
      return runtime::Transaction{SetBalance{std::move(who), std::move(value)}};
    }
    if (call == "add_validator") {
      OUTCOME_TRY(validator, account("validator"));
      OUTCOME_TRY(commission_tree,
                  ensure("commission", tree.get_child_optional("commission")));
      OUTCOME_TRY(commission, loadU32("commission", commission_tree));
      if (commission > std::numeric_limits<staking::Commission>::max()) {
        SL_ERROR(log_, "Commission {} is out of range", commission);
        return ChainSpecError::INVALID_VALUE;
      }
      return runtime::Transaction{AddValidator{
          std::move(validator), static_cast<staking::Commission>(commission)}};
    }
    if (call == "stake") {
      OUTCOME_TRY(who, account("who"));
      OUTCOME_TRY(value, amount());
      OUTCOME_TRY(validator, account("validator"));
      return runtime::Transaction{
          Stake{std::move(who), std::move(value), std::move(validator)}};
    }
    if (call == "unstake") {
      OUTCOME_TRY(who, account("who"));
      return runtime::Transaction{Unstake{std::move(who)}};
    }
    if (call == "claim_rewards") {
      OUTCOME_TRY(who, account("who"));
      return runtime::Transaction{ClaimRewards{std::move(who)}};
    }

    SL_ERROR(log_, "Unknown call '{}' in the chain spec", call);
    return ChainSpecError::UNKNOWN_CALL;
  }

}  // namespace minichain::application
