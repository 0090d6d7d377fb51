/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "application/app_configuration.hpp"

#define RAPIDJSON_NO_SIZETYPEDEFINE
namespace rapidjson {
  using SizeType = ::std::size_t;
}
#include <rapidjson/document.h>
#undef RAPIDJSON_NO_SIZETYPEDEFINE

#include <cstdio>
#include <functional>
#include <memory>

#include "log/logger.hpp"

namespace minichain::application {

  // clang-format off
  /**
   * Reads app configuration from multiple sources with the given priority:
   *
   *      COMMAND LINE ARGUMENTS          <- max priority
   *                V
   *        CONFIGURATION FILE
   *                V
   *            CHAIN SPEC                <- low priority
   */
  // clang-format on

  class AppConfigurationImpl final : public AppConfiguration {
    using FilePtr = std::unique_ptr<std::FILE, decltype(&std::fclose)>;

   public:
    explicit AppConfigurationImpl(log::Logger logger);
    ~AppConfigurationImpl() override = default;

    AppConfigurationImpl(const AppConfigurationImpl &) = delete;
    AppConfigurationImpl &operator=(const AppConfigurationImpl &) = delete;

    /**
     * @return false if the application should not be started: help was
     * requested or the configuration is invalid
     */
    [[nodiscard]] bool initializeFromArgs(int argc, const char **argv);

    const std::filesystem::path &chainSpecPath() const override {
      return chain_spec_path_;
    }

    const std::vector<std::string> &log() const override {
      return logger_tuning_config_;
    }

    const std::optional<runtime::Balance> &baseFee() const override {
      return base_fee_;
    }

    const std::optional<runtime::AccountId> &feeRecipient() const override {
      return fee_recipient_;
    }

    const std::optional<runtime::Balance> &minimumStake() const override {
      return minimum_stake_;
    }

    const std::optional<runtime::Balance> &rewardRate() const override {
      return reward_rate_;
    }

    std::optional<runtime::BlockNumber> unstakingPeriod() const override {
      return unstaking_period_;
    }

    std::optional<uint32_t> maxValidators() const override {
      return max_validators_;
    }

   private:
    void parse_general_segment(const rapidjson::Value &val);
    void parse_blockchain_segment(const rapidjson::Value &val);
    void parse_fees_segment(const rapidjson::Value &val);
    void parse_staking_segment(const rapidjson::Value &val);

    struct SegmentHandler {
      using Handler = std::function<void(const rapidjson::Value &)>;
      const char *segment_name;
      Handler handler;
    };

    // clang-format off
    std::vector<SegmentHandler> handlers_ = {
        SegmentHandler{"general",    [this](const rapidjson::Value &val) { parse_general_segment(val); }},
        SegmentHandler{"blockchain", [this](const rapidjson::Value &val) { parse_blockchain_segment(val); }},
        SegmentHandler{"fees",       [this](const rapidjson::Value &val) { parse_fees_segment(val); }},
        SegmentHandler{"staking",    [this](const rapidjson::Value &val) { parse_staking_segment(val); }},
    };
    // clang-format on

    bool validate_config();

    /// @return false if the file can not be read or parsed
    bool read_config_from_file(const std::string &filepath);

    bool load_ms(const rapidjson::Value &val,
                 const char *name,
                 std::vector<std::string> &target);
    bool load_str(const rapidjson::Value &val,
                  const char *name,
                  std::string &target);
    bool load_u32(const rapidjson::Value &val,
                  const char *name,
                  std::optional<uint32_t> &target);
    bool load_balance(const rapidjson::Value &val,
                      const char *name,
                      std::optional<runtime::Balance> &target);

    FilePtr open_file(const std::string &filepath);

    log::Logger logger_;

    std::filesystem::path chain_spec_path_;
    std::vector<std::string> logger_tuning_config_;
    std::optional<runtime::Balance> base_fee_;
    std::optional<runtime::AccountId> fee_recipient_;
    std::optional<runtime::Balance> minimum_stake_;
    std::optional<runtime::Balance> reward_rate_;
    std::optional<runtime::BlockNumber> unstaking_period_;
    std::optional<uint32_t> max_validators_;
    bool config_file_valid_ = true;
  };

}  // namespace minichain::application
