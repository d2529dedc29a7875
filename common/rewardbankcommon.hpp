#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/time.hpp>
#include <string>
#include <vector>

using namespace eosio;

#define _STRINGIZE(x) #x
#define STRINGIZE(x) _STRINGIZE(x)

std::string rewardbank_acct = STRINGIZE(REWARDBANK);
std::string rewardconfig_acct = STRINGIZE(REWARDCONFIG);
std::string rewardtokens_acct = STRINGIZE(REWARDTOKENS);
std::string stabletokens_acct = STRINGIZE(STABLETOKENS);

// currency symbols handled by the bank
const std::string REWARD_CURRENCY_CODE = "RWD";
const std::string STABLE_CURRENCY_CODE = "USDT";
const uint8_t CURRENCY_PRECISION = 4;

const uint64_t SECONDS_PER_DAY = 86400;

// bounds accepted for the rate parameters
const uint64_t MAX_DAILY_RATE = 100;           // percent per day
const uint64_t MAX_SWAP_RATE = 1000000000000;  // stable units per 100 tokens

// fee forwarded to the operator on swaps and withdrawals, in percent
const int64_t OPERATOR_FEE_PERCENT = 5;

// the referral table always has this many levels, in per-mille
const size_t REFERRAL_LEVELS = 5;
const uint16_t PERMILLE = 1000;

// memos recognised on incoming ledger transfers
const std::string STAKE_MEMO = "stake";
const std::string SWAP_MEMO = "swap";

// common error/notification messages
const std::string msg_operations_paused =
    "rewardbank operations are paused. Please try later";
const std::string msg_withdrawals_paused =
    "rewardbank withdrawals are paused. Please try later";
const std::string msg_contract_caller = "contract accounts may not call this action";
const std::string msg_already_registered = "account is already registered";
const std::string msg_nothing_staked = "account has nothing staked";
const std::string msg_insufficient_staked = "insufficient staked balance";
const std::string msg_insufficient_claimable = "insufficient claimable balance";
const std::string msg_count_exceeds_users = "count exceeds the number of registered users";
const std::string msg_reentrant_call = "reentrant call rejected";
const std::string msg_insufficient_custody = "insufficient balance held by rewardbank";

namespace rewardeco {

// Table definitions

// token ledger balances - code: rewardtokens or stabletokens, scope: owner
struct account {
  asset balance;

  uint64_t primary_key() const { return balance.symbol.code().raw(); }
};
typedef eosio::multi_index<"accounts"_n, account> accounts;

// rewardbank contract
// the account store - one row per identity
struct[[ eosio::table("users"), eosio::contract("rewardbank") ]] user {
  name owner;
  bool registered;       // set once by signup or setbalance
  asset staked;          // RWD held in custody for this account
  asset claimable;       // USDT the account may withdraw
  time_point_sec last_claim; // start of the current accrual window
  name referrer;         // fixed at registration

  uint64_t primary_key() const { return owner.value; }
};
using users_index = eosio::multi_index<"users"_n, user>;

// append-only registration order, keyed by sequence number
struct[[ eosio::table("registry"), eosio::contract("rewardbank") ]] registrant {
  uint64_t sequence;
  name owner;

  uint64_t primary_key() const { return sequence; }
};
using registry_index = eosio::multi_index<"registry"_n, registrant>;

// cumulative referral earnings - audit trail only, not spendable
struct[[ eosio::table("refearnings"), eosio::contract("rewardbank") ]] refearning {
  name owner;
  asset earned;

  uint64_t primary_key() const { return owner.value; }
};
using refearnings_index = eosio::multi_index<"refearnings"_n, refearning>;

struct[[ eosio::table("statistics"), eosio::contract("rewardbank") ]] statistic {
  uint32_t usercount;
  asset totalstaked;
  bool locked;

  uint64_t primary_key() const {
    return 0;
  } // return a constant (0 in this case) to ensure a single-row table
};
using statistic_index = eosio::multi_index<"statistics"_n, statistic>;

// rewardconfig contract
// miscellaneous parameters table
struct[
    [ eosio::table("parameters"), eosio::contract("rewardconfig") ]] parameter {
  name virtualtable;
  name paramname;
  std::string value;

  uint64_t primary_key() const { return paramname.value; }
  uint64_t get_secondary() const { return virtualtable.value; }
};
using parameters_index = eosio::multi_index<
    "parameters"_n, parameter,
    indexed_by<"virtualtable"_n,
               const_mem_fun<parameter, uint64_t, &parameter::get_secondary>>>;

// referral percentages, one per-mille entry per level
struct[
    [ eosio::table("referrals"), eosio::contract("rewardconfig") ]] referral {
  std::vector<uint16_t> percents;

  uint64_t primary_key() const {
    return 0;
  } // return a constant (0 in this case) to ensure a single-row table
};
using referrals_index = eosio::multi_index<"referrals"_n, referral>;

} // namespace rewardeco
