/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstdlib>
#include <filesystem>
#include <iostream>

#include <soralog/impl/configurator_from_yaml.hpp>

#include "application/impl/app_configuration_impl.hpp"
#include "application/impl/chain_spec_impl.hpp"
#include "log/configurator.hpp"
#include "log/logger.hpp"
#include "runtime/runtime.hpp"

// NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)

using minichain::application::AppConfiguration;
using minichain::application::AppConfigurationImpl;
using minichain::application::ChainSpecImpl;
using minichain::runtime::Runtime;
using minichain::runtime::RuntimeConfig;

namespace {
  /// Values given on the command line or in the config file win over the
  /// chain spec
  void applyOverrides(
      const AppConfiguration &configuration,
      minichain::runtime::GenesisConfig &genesis,
      minichain::staking::Parameters<RuntimeConfig> &parameters) {
    if (auto &base_fee = configuration.baseFee()) {
      genesis.base_fee = base_fee.value();
    }
    if (auto &fee_recipient = configuration.feeRecipient()) {
      genesis.fee_recipient = fee_recipient.value();
    }
    if (auto &minimum_stake = configuration.minimumStake()) {
      parameters.minimum_stake = minimum_stake.value();
    }
    if (auto &reward_rate = configuration.rewardRate()) {
      parameters.reward_rate = reward_rate.value();
    }
    if (auto unstaking_period = configuration.unstakingPeriod()) {
      parameters.unstaking_period = unstaking_period.value();
    }
    if (auto max_validators = configuration.maxValidators()) {
      parameters.max_validators = max_validators.value();
    }
  }

  void logFinalState(const minichain::log::Logger &logger,
                     const Runtime &runtime) {
    for (const auto &[who, balance] : runtime.balances().accounts()) {
      SL_INFO(logger,
              "Account {}: balance {}, nonce {}",
              who,
              balance,
              runtime.system().nonce(who));
    }
    if (auto issuance = runtime.balances().totalIssuance()) {
      SL_INFO(logger, "Total issuance: {}", issuance.value());
    }

    const auto stats = runtime.staking().getStakingStats();
    SL_INFO(logger,
            "Staking: {} staked by {} stakers (average {}), "
            "{} of {} validators active",
            stats.total_staked,
            stats.total_stakers,
            stats.average_stake,
            stats.active_validators,
            stats.total_validators);
  }

  int run_node(int argc, const char **argv) {
    auto configuration = std::make_shared<AppConfigurationImpl>(
        minichain::log::createLogger("AppConfiguration", "application"));

    if (not configuration->initializeFromArgs(argc, argv)) {
      return EXIT_FAILURE;
    }

    minichain::log::tuneLoggingSystem(configuration->log());

    auto logger = minichain::log::createLogger(
        "Main", minichain::log::defaultGroupName);

    auto chain_spec_res =
        ChainSpecImpl::loadFrom(configuration->chainSpecPath().string());
    if (chain_spec_res.has_error()) {
      SL_ERROR(logger,
               "Chain spec {} can not be loaded: {}",
               configuration->chainSpecPath().string(),
               chain_spec_res.error());
      return EXIT_FAILURE;
    }
    auto &chain_spec = chain_spec_res.value();

    auto genesis = chain_spec->genesis();
    auto parameters = chain_spec->stakingParameters();
    applyOverrides(*configuration, genesis, parameters);

    Runtime runtime{{}, parameters};
    if (auto res = runtime.applyGenesis(genesis); res.has_error()) {
      SL_ERROR(logger, "Genesis can not be applied: {}", res.error());
      return EXIT_FAILURE;
    }

    SL_INFO(logger,
            "Chain '{}' ({}) started, {} blocks to execute",
            chain_spec->name(),
            chain_spec->id(),
            chain_spec->blocks().size());

    for (const auto &transactions : chain_spec->blocks()) {
      auto res = runtime.createBlock(transactions);
      if (res.has_error()) {
        SL_ERROR(logger, "Block can not be executed: {}", res.error());
        return EXIT_FAILURE;
      }
      for (const auto &failed : res.value().failed) {
        SL_INFO(logger,
                "Block #{}: transaction #{} failed: {}",
                res.value().block_number,
                failed.index,
                failed.error.message());
      }
    }

    logFinalState(logger, runtime);

    const auto integrity = runtime.verifyChainIntegrity();
    SL_INFO(logger,
            "Chain at block #{}, integrity {}",
            runtime.blockNumber(),
            integrity ? "verified" : "broken");
    logger->flush();

    return integrity ? EXIT_SUCCESS : EXIT_FAILURE;
  }

}  // namespace

int main(int argc, const char **argv) {
  // Logging system
  auto logging_system = [&] {
    auto custom_log_config_path =
        minichain::log::Configurator::getLogConfigFile(argc, argv);
    if (custom_log_config_path.has_value()) {
      if (not std::filesystem::is_regular_file(
              custom_log_config_path.value())) {
        std::cerr << "Provided wrong path to config file of logging\n";
        exit(EXIT_FAILURE);
      }
    }

    auto minichain_log_configurator =
        custom_log_config_path.has_value()
            ? std::make_shared<minichain::log::Configurator>(
                  std::make_shared<minichain::log::Configurator>(),
                  custom_log_config_path.value())
            : std::make_shared<minichain::log::Configurator>();

    return std::make_shared<soralog::LoggingSystem>(
        std::move(minichain_log_configurator));
  }();

  auto r = logging_system->configure();
  if (not r.message.empty()) {
    (r.has_error ? std::cerr : std::cout) << r.message << '\n';
  }
  if (r.has_error) {
    return EXIT_FAILURE;
  }

  minichain::log::setLoggingSystem(logging_system);

  int exit_code = EXIT_FAILURE;

  if (argc <= 1) {
    std::cerr << "Wrong usage.\n"
                 "Run with `--help' argument to print usage\n";
  } else {
    exit_code = run_node(argc, argv);
  }

  auto logger = minichain::log::createLogger(
      "Main", minichain::log::defaultGroupName);
  SL_INFO(logger, "All components are stopped");
  logger->flush();

  return exit_code;
}

// NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)
