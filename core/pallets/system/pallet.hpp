/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <map>
#include <optional>

#include "log/logger.hpp"
#include "pallets/system/config.hpp"
#include "primitives/common.hpp"

namespace minichain::system {

  /**
   * Block progression, per-account nonces and the chain of finalized block
   * hashes. None of the operations fail.
   */
  template <Config T>
  class Pallet {
   public:
    using AccountId = typename T::AccountId;
    using BlockNumber = typename T::BlockNumber;
    using Nonce = typename T::Nonce;
    using BlockHashes = std::map<BlockNumber, primitives::BlockHash>;

    BlockNumber blockNumber() const {
      return block_number_;
    }

    /// Advances the block number by one, saturating at the maximum
    void incBlockNumber() {
      block_number_ =
          math::sat_add_unsigned(block_number_, math::one<BlockNumber>());
      SL_TRACE(logger_, "Block number is now {}", block_number_);
    }

    void incNonce(const AccountId &who) {
      auto &nonce = nonces_[who];
      nonce = math::sat_add_unsigned(nonce, math::one<Nonce>());
    }

    /// @return nonce of \arg who, zero for unknown accounts
    Nonce nonce(const AccountId &who) const {
      if (auto it = nonces_.find(who); it != nonces_.end()) {
        return it->second;
      }
      return math::zero<Nonce>();
    }

    const std::map<AccountId, Nonce> &nonces() const {
      return nonces_;
    }

    /**
     * Seals the current block: computes its hash and files it under the
     * current block number. Finalizing again without advancing the block
     * number overwrites the stored hash.
     * @return hash of the current block
     */
    primitives::BlockHash finalizeBlock() {
      auto hash = generateBlockHash();
      block_hashes_[block_number_] = hash;
      SL_DEBUG(logger_, "Block #{} finalized, hash {:l}", block_number_, hash);
      return hash;
    }

    std::optional<primitives::BlockHash> getBlockHash(
        const BlockNumber &block_number) const {
      if (auto it = block_hashes_.find(block_number);
          it != block_hashes_.end()) {
        return it->second;
      }
      return std::nullopt;
    }

    /// @return hash of the current block if it is finalized
    std::optional<primitives::BlockHash> currentBlockHash() const {
      return getBlockHash(block_number_);
    }

    std::optional<primitives::BlockHash> parentBlockHash() const {
      if (block_number_ > math::zero<BlockNumber>()) {
        return getBlockHash(block_number_ - math::one<BlockNumber>());
      }
      return std::nullopt;
    }

    std::optional<primitives::BlockHash> genesisHash() const {
      return getBlockHash(math::zero<BlockNumber>());
    }

    const BlockHashes &allBlockHashes() const {
      return block_hashes_;
    }

   private:
    template <typename Number>
    static uint32_t lowBits(const Number &value) {
      return static_cast<uint32_t>(value & Number(0xFFFFFFFFu));
    }

    static void putBigEndian(uint32_t value, uint8_t *out) {
      out[0] = static_cast<uint8_t>(value >> 24);
      out[1] = static_cast<uint8_t>(value >> 16);
      out[2] = static_cast<uint8_t>(value >> 8);
      out[3] = static_cast<uint8_t>(value);
    }

    /**
     * Placeholder, non-cryptographic hash. Depends on the block number, the
     * sum of all nonces and the hash filed for the previous block number:
     * [0..4) block number, [4..8) nonce sum, [8..16) parent hash prefix,
     * [16..32) filler derived from the block number
     */
    primitives::BlockHash generateBlockHash() const {
      primitives::BlockHash hash;

      const auto number = lowBits(block_number_);
      putBigEndian(number, hash.data());

      uint32_t nonce_sum = 0;
      for (const auto &[_, nonce] : nonces_) {
        nonce_sum += lowBits(nonce);
      }
      putBigEndian(nonce_sum, hash.data() + 4);

      const auto parent_number =
          math::sat_sub_unsigned(block_number_, math::one<BlockNumber>());
      if (auto parent = getBlockHash(parent_number); parent.has_value()) {
        std::copy_n(parent->begin(), 8, hash.begin() + 8);
      }

      for (size_t i = 16; i < hash.size(); ++i) {
        hash[i] = static_cast<uint8_t>((i + number) % 256);
      }

      return hash;
    }

    BlockNumber block_number_ = math::zero<BlockNumber>();
    std::map<AccountId, Nonce> nonces_;
    BlockHashes block_hashes_;

    log::Logger logger_ = log::createLogger("System", "system");
  };

}  // namespace minichain::system
