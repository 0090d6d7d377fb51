/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <optional>

#include "common/visitor.hpp"
#include "log/logger.hpp"
#include "pallets/balances/balances_error.hpp"
#include "pallets/balances/calls.hpp"
#include "primitives/dispatch.hpp"

namespace minichain::balances {

  /**
   * Flat fee charged per transfer. The fee is credited to the recipient if
   * one is set, otherwise it is burnt.
   */
  template <Config T>
  struct FeeConfig {
    typename T::Balance base_fee = math::zero<typename T::Balance>();
    std::optional<typename T::AccountId> fee_recipient{};
  };

  /**
   * Canonical account -> balance ledger. Absent accounts hold zero.
   */
  template <Config T>
  class Pallet : public primitives::Dispatch<typename T::AccountId, Call<T>> {
   public:
    using AccountId = typename T::AccountId;
    using Balance = typename T::Balance;
    using Ledger = std::map<AccountId, Balance>;

    Pallet() = default;

    explicit Pallet(FeeConfig<T> fee_config)
        : base_fee_{std::move(fee_config.base_fee)},
          fee_recipient_{std::move(fee_config.fee_recipient)} {}

    ~Pallet() override = default;

    Balance balance(const AccountId &who) const {
      if (auto it = balances_.find(who); it != balances_.end()) {
        return it->second;
      }
      return math::zero<Balance>();
    }

    /// Unconditional overwrite, used for issuance and genesis
    void setBalance(const AccountId &who, Balance amount) {
      SL_DEBUG(logger_, "Balance of {} set to {}", who, amount);
      balances_[who] = std::move(amount);
    }

    const Ledger &accounts() const {
      return balances_;
    }

    /// @return sum of all balances
    outcome::result<Balance> totalIssuance() const {
      auto total = math::zero<Balance>();
      for (const auto &[_, amount] : balances_) {
        OUTCOME_TRY(sum,
                    math::checked_add(
                        total, amount, BalancesError::OverflowInCalculation));
        total = std::move(sum);
      }
      return total;
    }

    void setTransactionFee(Balance fee) {
      base_fee_ = std::move(fee);
    }

    const Balance &getTransactionFee() const {
      return base_fee_;
    }

    void setFeeRecipient(std::optional<AccountId> recipient) {
      fee_recipient_ = std::move(recipient);
    }

    const std::optional<AccountId> &getFeeRecipient() const {
      return fee_recipient_;
    }

    /// @return amount plus the fee charged for transferring it
    outcome::result<Balance> getTransferCost(const Balance &amount) const {
      return math::checked_add(
          amount, calculateFee(amount), BalancesError::OverflowInCalculation);
    }

    /**
     * Moves \arg amount from \arg sender to \arg receiver and charges the
     * sender the transaction fee. Every check happens before the ledger is
     * touched, so a failed transfer leaves all balances unchanged.
     */
    outcome::result<void> transfer(const AccountId &sender,
                                   const AccountId &receiver,
                                   const Balance &amount) {
      const auto fee = calculateFee(amount);
      const auto sender_balance = balance(sender);

      OUTCOME_TRY(total_needed,
                  math::checked_add(
                      amount, fee, BalancesError::OverflowInCalculation));
      if (sender_balance < total_needed) {
        return BalancesError::InsufficientBalance;
      }

      // sender, receiver and fee recipient may be the same account
      Ledger staged;
      auto staged_balance = [&](const AccountId &who) {
        if (auto it = staged.find(who); it != staged.end()) {
          return it->second;
        }
        return balance(who);
      };

      OUTCOME_TRY(sender_after_amount,
                  math::checked_sub(sender_balance,
                                    amount,
                                    BalancesError::InsufficientFunds));
      staged[sender] = std::move(sender_after_amount);

      OUTCOME_TRY(receiver_after,
                  math::checked_add(staged_balance(receiver),
                                    amount,
                                    BalancesError::OverflowInTransfer));
      staged[receiver] = std::move(receiver_after);

      OUTCOME_TRY(stageFeePayment(staged, staged_balance, sender, fee));

      for (auto &[who, new_balance] : staged) {
        balances_[who] = std::move(new_balance);
      }

      SL_DEBUG(logger_,
               "Transfer {} -> {} of {} (fee {})",
               sender,
               receiver,
               amount,
               fee);
      return outcome::success();
    }

    /// Debits \arg amount from \arg who, e.g. to lock it for staking
    outcome::result<void> withdraw(const AccountId &who,
                                   const Balance &amount) {
      OUTCOME_TRY(
          new_balance,
          math::checked_sub(
              balance(who), amount, BalancesError::InsufficientBalance));
      balances_[who] = std::move(new_balance);
      return outcome::success();
    }

    /// Credits \arg amount to \arg who, e.g. unlocked stake or rewards
    outcome::result<void> deposit(const AccountId &who, const Balance &amount) {
      OUTCOME_TRY(new_balance, balanceAfterDeposit(who, amount));
      balances_[who] = std::move(new_balance);
      return outcome::success();
    }

    /// Fails the way deposit() would, without touching the ledger
    outcome::result<void> checkDeposit(const AccountId &who,
                                       const Balance &amount) const {
      OUTCOME_TRY(balanceAfterDeposit(who, amount));
      return outcome::success();
    }

    primitives::DispatchResult dispatch(const AccountId &caller,
                                        Call<T> call) override {
      return visit_in_place(
          call,
          [&](const Transfer<T> &transfer_call) -> primitives::DispatchResult {
            return transfer(caller, transfer_call.to, transfer_call.amount);
          },
          [&](const SetBalance<T> &set_call) -> primitives::DispatchResult {
            setBalance(set_call.who, set_call.amount);
            return outcome::success();
          });
    }

   private:
    outcome::result<Balance> balanceAfterDeposit(const AccountId &who,
                                                 const Balance &amount) const {
      return math::checked_add(
          balance(who), amount, BalancesError::OverflowInTransfer);
    }

    /// Flat fee policy: every transfer costs the configured base fee
    Balance calculateFee(const Balance &) const {
      return base_fee_;
    }

    template <typename StagedBalance>
    outcome::result<void> stageFeePayment(Ledger &staged,
                                          StagedBalance &&staged_balance,
                                          const AccountId &payer,
                                          const Balance &fee) const {
      OUTCOME_TRY(payer_after,
                  math::checked_sub(staged_balance(payer),
                                    fee,
                                    BalancesError::InsufficientFunds));
      staged[payer] = std::move(payer_after);

      if (fee_recipient_.has_value()) {
        const auto &recipient = fee_recipient_.value();
        OUTCOME_TRY(recipient_after,
                    math::checked_add(staged_balance(recipient),
                                      fee,
                                      BalancesError::OverflowInCalculation));
        staged[recipient] = std::move(recipient_after);
      }
      return outcome::success();
    }

    Ledger balances_;
    Balance base_fee_ = math::zero<Balance>();
    std::optional<AccountId> fee_recipient_;

    log::Logger logger_ = log::createLogger("Balances", "balances");
  };

}  // namespace minichain::balances
