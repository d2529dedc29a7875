#pragma once

#include "../common/rewardbankcommon.hpp"
#include <eosio/crypto.hpp>
#include <eosio/eosio.hpp>
#include <eosio/system.hpp>

namespace rewardeco {
using namespace eosio;
using std::string;

// Tunables read from the rewardconfig contract at the start of an action
struct reward_config {
  name operator_account;
  uint64_t daily_rate = 0;   // percent per day
  int64_t signup_bonus = 0;  // RWD base units
  uint64_t swap_rate = 0;    // stable units per 100 tokens
  std::vector<uint16_t> referral_percents;
  bool operations_paused = false;
  bool withdrawals_paused = false;
};

/**
 * @defgroup rewardbank rewardbank contract
 * @ingroup eosiocontracts
 *
 * rewardbank contract
 *
 * @details rewardbank keeps the account ledger of the RWD reward economy:
 * signup bonuses, USDT to RWD swaps, staking interest and the referral
 * cascade. Token balances live in the external token contracts; this
 * contract only holds them in custody.
 * @{
 */
class[[eosio::contract("rewardbank")]] rewardbank : public contract {
public:
  using contract::contract;

  /**
   * version action.
   *
   * @details Prints the version of this contract.
   */
  [[eosio::action]] void version();

  /**
   * signup action.
   *
   * @details Registers the user, records the referrer and pays the signup
   * bonus in RWD.
   *
   * @param user - the account to be registered,
   * @param referrer - the referring account. An empty name, or the user
   * itself, makes the operator the referrer.
   *
   * @pre Requires permission of the user account
   * @pre The user must not be registered already
   */
  [[eosio::action]] void signup(const name &user, const name &referrer);

  /**
   * Incoming transfer handler.
   *
   * @details RWD received with memo "stake" is staked for the sender. USDT
   * received with memo "swap" is swapped for RWD. Any other transfer from the
   * configured ledgers tops up custody.
   */
  [[eosio::on_notify("*::transfer")]] void on_transfer(
      name from, name to, asset quantity, std::string memo);

  /**
   * unstake action.
   *
   * @details Settles pending interest, then returns the quantity of staked
   * RWD to the user.
   *
   * @param user - the staking account,
   * @param quantity - the amount of RWD to release.
   *
   * @pre Requires permission of the user account
   * @pre The staked balance must cover the quantity
   */
  [[eosio::action]] void unstake(const name &user, const asset &quantity);

  /**
   * claim action.
   *
   * @details Settles the pending interest of any user into their claimable
   * balance. Anyone may relay a claim on behalf of a user.
   *
   * @param caller - the account pushing the action,
   * @param user - the account to settle.
   */
  [[eosio::action]] void claim(const name &caller, const name &user);

  /**
   * withdraw action.
   *
   * @details Pays out claimable USDT, less the operator fee.
   *
   * @param user - the account withdrawing,
   * @param quantity - the amount of USDT deducted from the claimable balance.
   */
  [[eosio::action]] void withdraw(const name &user, const asset &quantity);

  /**
   * distribute action.
   *
   * @details Settles the first `count` registered users in registration order.
   * Callers process large registries over several transactions.
   *
   * @param caller - the account pushing the action,
   * @param count - how many registered users to settle.
   *
   * @return the percentage of the registry covered by `count`
   */
  [[eosio::action]] uint32_t distribute(const name &caller, uint32_t count);

  /**
   * setbalance action.
   *
   * @details Migration path: force-sets the claimable balance and referrer of
   * a user and marks the user registered. No interest is settled.
   *
   * @pre Requires permission of the operator account
   */
  [[eosio::action]] void setbalance(const name &user, const asset &amount,
                                    const name &referrer);

  /**
   * sweep action.
   *
   * @details Moves a balance held by this contract on any token contract to
   * `to`.
   *
   * @pre Requires permission of the operator account
   */
  [[eosio::action]] void sweep(const name &token_contract,
                               const asset &quantity, const name &to);

  /**
   * pending action.
   *
   * @details Returns the USDT a claim would add at the current block time.
   */
  [[eosio::action, eosio::read_only]] asset pending(const name &user);

  struct account_view {
    user record;
    asset referral_earnings;
    asset pending;
  };

  /**
   * getaccount action.
   *
   * @details Returns the account record, its referral earnings and the
   * interest a claim would add now.
   */
  [[eosio::action, eosio::read_only]] account_view getaccount(const name &user);

  // event log actions - only this contract may push them
  [[eosio::action]] void signuplog(const name &user, const name &referrer,
                                   const asset &bonus);
  [[eosio::action]] void swaplog(const name &user, const asset &paid,
                                 const asset &received, const asset &fee);
  [[eosio::action]] void stakelog(const name &user, const asset &quantity,
                                  const asset &staked);
  [[eosio::action]] void unstakelog(const name &user, const asset &quantity,
                                    const asset &staked);
  [[eosio::action]] void claimlog(const name &user, const asset &accrued,
                                  uint32_t elapsed);
  [[eosio::action]] void withdrawlog(const name &user, const asset &quantity,
                                     const asset &fee);
  [[eosio::action]] void referrallog(const name &referrer, const name &source,
                                     uint8_t level, const asset &reward);
  [[eosio::action]] void balsetlog(const name &user, const asset &amount,
                                   const name &referrer);

  using signuplog_action =
      eosio::action_wrapper<"signuplog"_n, &rewardbank::signuplog>;
  using swaplog_action =
      eosio::action_wrapper<"swaplog"_n, &rewardbank::swaplog>;
  using stakelog_action =
      eosio::action_wrapper<"stakelog"_n, &rewardbank::stakelog>;
  using unstakelog_action =
      eosio::action_wrapper<"unstakelog"_n, &rewardbank::unstakelog>;
  using claimlog_action =
      eosio::action_wrapper<"claimlog"_n, &rewardbank::claimlog>;
  using withdrawlog_action =
      eosio::action_wrapper<"withdrawlog"_n, &rewardbank::withdrawlog>;
  using referrallog_action =
      eosio::action_wrapper<"referrallog"_n, &rewardbank::referrallog>;
  using balsetlog_action =
      eosio::action_wrapper<"balsetlog"_n, &rewardbank::balsetlog>;

  /**
   * Get balance method.
   *
   * @details Get the balance for a token `sym_code` created by
   * `token_contract_account` account, for account `owner`.
   *
   * @param token_contract_account - the token creator account,
   * @param owner - the account for which the token balance is returned,
   * @param currency_symbol - the token for which the balance is returned.
   */
  static asset get_balance(const name &token_contract_account,
                           const name &owner, const symbol &currency_symbol) {
    asset return_balance =
        asset(0, currency_symbol); // default if accounts record does not exist

    accounts accountstable(token_contract_account, owner.value);
    const auto &ac = accountstable.find(currency_symbol.code().raw());
    if (ac != accountstable.end()) {
      return_balance = ac->balance;
    }

    return return_balance;
  }

  /**
   * Accrual method.
   *
   * @details Interest earned by `staked` base units over `elapsed` seconds at
   * `daily_rate` percent per day. Fractions of a unit are dropped.
   */
  static int64_t accrued_interest(int64_t staked, uint64_t daily_rate,
                                  uint32_t elapsed) {
    // staked < 2^62, rate <= 100 and elapsed < 2^32 keep the product in range
    check(staked >= 0 && staked <= asset::max_amount,
          "staked amount is out of range");
    check(daily_rate <= MAX_DAILY_RATE, "daily rate is out of range");

    int128_t amount = (int128_t)staked * daily_rate * elapsed / 100 /
                      SECONDS_PER_DAY;
    check(amount >= 0 && amount <= asset::max_amount,
          "overflow in interest calculation");
    return (int64_t)amount;
  }

  /**
   * Referral credit method.
   *
   * @details Credit for one referral level: `reward` scaled by a per-mille
   * percentage, rounded down.
   */
  static int64_t referral_credit(int64_t reward, uint16_t permille) {
    return (int64_t)((int128_t)reward * permille / PERMILLE);
  }

private:
  // Holds the reentrancy flag in the statistics row for the lifetime of an
  // operation
  class reentry_guard {
  public:
    explicit reentry_guard(const name &self);
    ~reentry_guard();

  private:
    name _self;
  };

  reward_config load_config();
  std::string get_parameter(const name &paramname, const std::string &fallback);

  void require_plain_account(const name &caller);

  users_index::const_iterator find_or_create_user(users_index &users_table,
                                                  const name &owner);
  name resolve_referrer(const name &user, const name &referrer,
                        const reward_config &config);
  void append_to_registry(const name &user);
  uint32_t get_user_count();
  void adjust_total_staked(const asset &delta);
  asset available_rewards();
  uint32_t elapsed_since(const time_point_sec &last_claim);

  static statistic_index::const_iterator
  statistics_row(statistic_index &statistic_table, const name &self);

  int64_t settle(users_index &users_table,
                 users_index::const_iterator user_iterator,
                 const reward_config &config);
  void credit_referrals(const name &source, const name &first_referrer,
                        int64_t reward, const reward_config &config);

  void stake(const name &user, const asset &quantity,
             const reward_config &config);
  void swap(const name &user, const asset &quantity,
            const reward_config &config);

  void send_tokens(const name &token_contract, const name &to,
                   const asset &quantity, const string &memo);
};
/** @}*/ // end of @defgroup rewardbank rewardbank contract

} // namespace rewardeco
