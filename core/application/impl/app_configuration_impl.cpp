/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/app_configuration_impl.hpp"

#include <array>
#include <cassert>
#include <iostream>
#include <limits>
#include <string>

#include <rapidjson/error/en.h>
#include <rapidjson/filereadstream.h>
#include <boost/program_options.hpp>

#include "application/impl/util.hpp"

namespace {
  namespace fs = std::filesystem;

  template <typename T, typename Func>
  void find_argument(boost::program_options::variables_map &vm,
                     const char *name,
                     Func &&f) {
    assert(nullptr != name);
    if (auto it = vm.find(name); it != vm.end()) {
      if (it->second.defaulted()) {
        return;
      }
      std::forward<Func>(f)(it->second.as<T>());
    }
  }

  template <typename T>
  std::optional<T> find_argument(boost::program_options::variables_map &vm,
                                 const std::string &name) {
    if (auto it = vm.find(name); it != vm.end()) {
      if (!it->second.defaulted()) {
        return it->second.as<T>();
      }
    }
    return std::nullopt;
  }

  inline bool chainspecExists(const fs::path &path) {
    std::error_code ec;
    return not path.empty() and fs::exists(path, ec)
       and fs::is_regular_file(path, ec);
  }
}  // namespace

namespace minichain::application {

  AppConfigurationImpl::AppConfigurationImpl(log::Logger logger)
      : logger_(std::move(logger)) {}

  AppConfigurationImpl::FilePtr AppConfigurationImpl::open_file(
      const std::string &filepath) {
    assert(!filepath.empty());
    return AppConfigurationImpl::FilePtr(std::fopen(filepath.c_str(), "r"),
                                         &std::fclose);
  }

  bool AppConfigurationImpl::load_ms(const rapidjson::Value &val,
                                     const char *name,
                                     std::vector<std::string> &target) {
    auto it = val.FindMember(name);
    if (it == val.MemberEnd()) {
      return false;
    }
    if (it->value.IsString()) {
      target.emplace_back(it->value.GetString(), it->value.GetStringLength());
      return true;
    }
    if (not it->value.IsArray()) {
      return false;
    }
    for (auto &value : it->value.GetArray()) {
      if (not value.IsString()) {
        return false;
      }
      target.emplace_back(value.GetString(), value.GetStringLength());
    }
    return not target.empty();
  }

  bool AppConfigurationImpl::load_str(const rapidjson::Value &val,
                                      const char *name,
                                      std::string &target) {
    auto m = val.FindMember(name);
    if (val.MemberEnd() != m && m->value.IsString()) {
      target.assign(m->value.GetString(), m->value.GetStringLength());
      return true;
    }
    return false;
  }

  bool AppConfigurationImpl::load_u32(const rapidjson::Value &val,
                                      const char *name,
                                      std::optional<uint32_t> &target) {
    if (auto m = val.FindMember(name);
        val.MemberEnd() != m && m->value.IsUint()) {
      target = m->value.GetUint();
      return true;
    }
    return false;
  }

  bool AppConfigurationImpl::load_balance(
      const rapidjson::Value &val,
      const char *name,
      std::optional<runtime::Balance> &target) {
    auto m = val.FindMember(name);
    if (val.MemberEnd() == m) {
      return false;
    }
    // large balances do not fit into a JSON number and come as strings
    if (m->value.IsUint64()) {
      target = runtime::Balance(m->value.GetUint64());
      return true;
    }
    if (m->value.IsString()) {
      auto res = util::parseBalance(
          {m->value.GetString(), m->value.GetStringLength()});
      if (res.has_value()) {
        target = std::move(res.value());
        return true;
      }
      SL_ERROR(logger_,
               "Invalid value of '{}' in configuration file: {}",
               name,
               res.error());
    }
    config_file_valid_ = false;
    return false;
  }

  void AppConfigurationImpl::parse_general_segment(
      const rapidjson::Value &val) {
    load_ms(val, "log", logger_tuning_config_);
  }

  void AppConfigurationImpl::parse_blockchain_segment(
      const rapidjson::Value &val) {
    std::string chain_spec_path_str;
    if (load_str(val, "chain", chain_spec_path_str)) {
      chain_spec_path_ = fs::path(chain_spec_path_str);
    }
  }

  void AppConfigurationImpl::parse_fees_segment(const rapidjson::Value &val) {
    load_balance(val, "base-fee", base_fee_);
    std::string fee_recipient;
    if (load_str(val, "fee-recipient", fee_recipient)) {
      fee_recipient_ = std::move(fee_recipient);
    }
  }

  void AppConfigurationImpl::parse_staking_segment(
      const rapidjson::Value &val) {
    load_balance(val, "minimum-stake", minimum_stake_);
    load_balance(val, "reward-rate", reward_rate_);
    load_u32(val, "unstaking-period", unstaking_period_);
    load_u32(val, "max-validators", max_validators_);
  }

  bool AppConfigurationImpl::validate_config() {
    if (not config_file_valid_) {
      return false;
    }

    if (not chainspecExists(chain_spec_path_)) {
      SL_ERROR(logger_,
               "Chain spec {} does not exist, "
               "please specify a valid path with --chain option",
               chain_spec_path_.string());
      return false;
    }

    if (max_validators_.has_value() and max_validators_.value() == 0) {
      SL_ERROR(logger_,
               "Max validators is 0, "
               "please specify a positive value with --max-validators option");
      return false;
    }
    return true;
  }

  bool AppConfigurationImpl::read_config_from_file(
      const std::string &filepath) {
    assert(!filepath.empty());

    auto file = open_file(filepath);
    if (!file) {
      SL_ERROR(logger_,
               "Configuration file path is invalid: {}, "
               "please specify a valid path with -c option",
               filepath);
      return false;
    }

    using FileReadStream = rapidjson::FileReadStream;
    using Document = rapidjson::Document;

    std::array<char, 1024> buffer_size{};
    FileReadStream input_stream(
        file.get(), buffer_size.data(), buffer_size.size());

    Document document;
    document.ParseStream(input_stream);
    if (document.HasParseError()) {
      SL_ERROR(logger_,
               "Configuration file {} parse failed with error {}",
               filepath,
               GetParseError_En(document.GetParseError()));
      return false;
    }
    if (not document.IsObject()) {
      SL_ERROR(logger_, "Configuration file {} is not a JSON object", filepath);
      return false;
    }

    for (auto &handler : handlers_) {
      auto it = document.FindMember(handler.segment_name);
      if (document.MemberEnd() != it) {
        handler.handler(it->value);
      }
    }
    return true;
  }

  bool AppConfigurationImpl::initializeFromArgs(int argc, const char **argv) {
    namespace po = boost::program_options;

    // clang-format off
    po::options_description desc("General options");
    desc.add_options()
        ("help,h", "show this help message")
        ("log,l", po::value<std::vector<std::string>>(),
          "Sets a custom logging filter. Syntax is `<target>=<level>`, e.g. -lstaking=debug.\n"
          "Log levels (most to least verbose) are trace, debug, verbose, info, warn, error, critical, off. By default, all targets log `info`.\n"
          "The global log level can be set with -l<level>.")
        ("logcfg", po::value<std::string>(), "Filepath to a YAML logging configuration")
        ("config-file,c", po::value<std::string>(), "Filepath to load configuration from.")
        ;

    po::options_description blockchain_desc("Blockchain options");
    blockchain_desc.add_options()
        ("chain", po::value<std::string>(), "required, chainspec file path")
        ;

    po::options_description runtime_desc("Runtime options");
    runtime_desc.add_options()
        ("base-fee", po::value<std::string>(), "flat fee charged per transfer")
        ("fee-recipient", po::value<std::string>(), "account credited with the transfer fees, fees are burnt if not set")
        ("minimum-stake", po::value<std::string>(), "minimal amount accepted by a stake")
        ("reward-rate", po::value<std::string>(), "reward per block, in thousandths of the staked amount")
        ("unstaking-period", po::value<uint32_t>(), "number of blocks a stake stays locked")
        ("max-validators", po::value<uint32_t>(), "maximal number of registered validators")
        ;
    // clang-format on

    po::variables_map vm;
    // first-run parse to read only general options and to lookup for "help"
    // all the rest options are ignored
    try {
      po::parsed_options parsed = po::command_line_parser(argc, argv)
                                      .options(desc)
                                      .allow_unregistered()
                                      .run();
      po::store(parsed, vm);
      po::notify(vm);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information"
                << std::endl;
      return false;
    }

    desc.add(blockchain_desc).add(runtime_desc);

    if (vm.count("help") > 0) {
      std::cout << desc << std::endl;
      return false;
    }

    try {
      // second-run parse to gather all known options
      // with reporting about any unrecognized input
      po::store(po::parse_command_line(argc, argv, desc), vm);
      po::notify(vm);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information"
                << std::endl;
      return false;
    }

    if (auto path = find_argument<std::string>(vm, "config-file");
        path.has_value()) {
      if (not read_config_from_file(path.value())) {
        return false;
      }
    }

    find_argument<std::vector<std::string>>(
        vm, "log", [&](const std::vector<std::string> &val) {
          logger_tuning_config_ = val;
        });

    find_argument<std::string>(vm, "chain", [&](const std::string &val) {
      chain_spec_path_ = val;
    });

    bool valid_args = true;
    auto load_balance_arg = [&](const char *name,
                                std::optional<runtime::Balance> &target) {
      find_argument<std::string>(vm, name, [&](const std::string &val) {
        auto res = util::parseBalance(val);
        if (res.has_error()) {
          SL_ERROR(logger_, "Invalid --{} '{}': {}", name, val, res.error());
          valid_args = false;
          return;
        }
        target = std::move(res.value());
      });
    };
    load_balance_arg("base-fee", base_fee_);
    load_balance_arg("minimum-stake", minimum_stake_);
    load_balance_arg("reward-rate", reward_rate_);

    find_argument<std::string>(vm, "fee-recipient", [&](const std::string &val) {
      fee_recipient_ = val;
    });
    find_argument<uint32_t>(vm, "unstaking-period", [&](uint32_t val) {
      unstaking_period_ = val;
    });
    find_argument<uint32_t>(vm, "max-validators", [&](uint32_t val) {
      max_validators_ = val;
    });

    if (not valid_args) {
      return false;
    }

    // if something wrong with config print help message
    if (not validate_config()) {
      std::cout << desc << std::endl;
      return false;
    }
    return true;
  }

}  // namespace minichain::application
