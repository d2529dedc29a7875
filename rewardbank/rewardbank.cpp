#include "rewardbank.hpp"
#include <eosio/asset.hpp>
#include <eosio/system.hpp>

namespace rewardeco {

using namespace eosio;

const std::string VERSION = "1.0.3";

// ACTION
void rewardbank::version() {
  std::string version_message = rewardbank_acct + "/" + rewardconfig_acct +
                                "/" + rewardtokens_acct + "/" +
                                stabletokens_acct + " version = " + VERSION;

  check(false, version_message);
}

// the single statistics record, created on first use
statistic_index::const_iterator
rewardbank::statistics_row(statistic_index &statistic_table, const name &self) {
  auto statistic_iterator = statistic_table.begin();

  if (statistic_iterator == statistic_table.end()) {
    statistic_iterator = statistic_table.emplace(self, [&](auto &stat) {
      stat.usercount = 0;
      stat.totalstaked =
          asset(0, symbol(REWARD_CURRENCY_CODE, CURRENCY_PRECISION));
      stat.locked = false;
    });
  }

  return statistic_iterator;
}

// reentrancy guard

rewardbank::reentry_guard::reentry_guard(const name &self) : _self(self) {
  statistic_index statistic_table(_self, _self.value);
  auto statistic_iterator = statistics_row(statistic_table, _self);

  check(!statistic_iterator->locked, msg_reentrant_call);
  statistic_table.modify(statistic_iterator, _self,
                         [&](auto &stat) { stat.locked = true; });
}

rewardbank::reentry_guard::~reentry_guard() {
  statistic_index statistic_table(_self, _self.value);
  auto statistic_iterator = statistic_table.begin();

  if (statistic_iterator != statistic_table.end()) {
    statistic_table.modify(statistic_iterator, _self,
                           [&](auto &stat) { stat.locked = false; });
  }
}

// configuration

std::string rewardbank::get_parameter(const name &paramname,
                                      const std::string &fallback) {
  parameters_index parameters_table(name(rewardconfig_acct),
                                    name(rewardconfig_acct).value);
  auto parameter_iterator = parameters_table.find(paramname.value);

  if (parameter_iterator == parameters_table.end()) {
    return fallback;
  }

  return parameter_iterator->value;
}

// read the tunables once per action - every operation works from this copy
reward_config rewardbank::load_config() {
  reward_config config;

  config.operator_account =
      name(get_parameter("operator"_n, get_self().to_string()));
  config.daily_rate = std::stoull(get_parameter("dailyrate"_n, "0"));
  config.signup_bonus = std::stoll(get_parameter("signupbonus"_n, "0"));
  config.swap_rate = std::stoull(get_parameter("swaprate"_n, "0"));
  config.operations_paused = get_parameter("opspaused"_n, "0").compare("1") == 0;
  config.withdrawals_paused = get_parameter("wdpaused"_n, "0").compare("1") == 0;

  check(config.signup_bonus >= 0, "signup bonus must not be negative");
  check(config.daily_rate <= MAX_DAILY_RATE, "daily rate is out of range");

  referrals_index referrals_table(name(rewardconfig_acct),
                                  name(rewardconfig_acct).value);
  auto referral_iterator = referrals_table.begin();
  if (referral_iterator != referrals_table.end()) {
    config.referral_percents = referral_iterator->percents;
  }

  // never walk more levels than the cascade allows
  if (config.referral_percents.size() > REFERRAL_LEVELS) {
    config.referral_percents.resize(REFERRAL_LEVELS);
  }

  return config;
}

// admission control - reject accounts that have a contract deployed
void rewardbank::require_plain_account(const name &caller) {
  check(get_code_hash(caller) == checksum256(), msg_contract_caller);
}

// account store

users_index::const_iterator
rewardbank::find_or_create_user(users_index &users_table, const name &owner) {
  auto user_iterator = users_table.find(owner.value);

  if (user_iterator == users_table.end()) {
    user_iterator = users_table.emplace(get_self(), [&](auto &u) {
      u.owner = owner;
      u.registered = false;
      u.staked = asset(0, symbol(REWARD_CURRENCY_CODE, CURRENCY_PRECISION));
      u.claimable = asset(0, symbol(STABLE_CURRENCY_CODE, CURRENCY_PRECISION));
      u.last_claim = time_point_sec(current_time_point());
      u.referrer = name();
    });
  }

  return user_iterator;
}

// an absent referrer, or the user referring itself, falls back to the operator
name rewardbank::resolve_referrer(const name &user, const name &referrer,
                                  const reward_config &config) {
  if (referrer == name() || referrer == user) {
    return config.operator_account;
  }

  return referrer;
}

void rewardbank::append_to_registry(const name &user) {
  uint32_t sequence;

  statistic_index statistic_table(get_self(), get_self().value);
  auto statistic_iterator = statistics_row(statistic_table, get_self());

  statistic_table.modify(statistic_iterator, get_self(), [&](auto &stat) {
    sequence = stat.usercount;
    stat.usercount = stat.usercount + 1;
  });

  registry_index registry_table(get_self(), get_self().value);
  registry_table.emplace(get_self(), [&](auto &r) {
    r.sequence = sequence;
    r.owner = user;
  });
}

uint32_t rewardbank::get_user_count() {
  statistic_index statistic_table(get_self(), get_self().value);
  auto statistic_iterator = statistic_table.begin();

  if (statistic_iterator == statistic_table.end()) {
    return 0;
  }

  return statistic_iterator->usercount;
}

void rewardbank::adjust_total_staked(const asset &delta) {
  statistic_index statistic_table(get_self(), get_self().value);
  auto statistic_iterator = statistics_row(statistic_table, get_self());

  statistic_table.modify(statistic_iterator, get_self(),
                         [&](auto &stat) { stat.totalstaked += delta; });
}

// RWD held in custody that is not backing a stake
asset rewardbank::available_rewards() {
  statistic_index statistic_table(get_self(), get_self().value);
  auto statistic_iterator = statistics_row(statistic_table, get_self());

  asset held = get_balance(name(rewardtokens_acct), get_self(),
                           statistic_iterator->totalstaked.symbol);

  return held - statistic_iterator->totalstaked;
}

uint32_t rewardbank::elapsed_since(const time_point_sec &last_claim) {
  time_point_sec now = time_point_sec(current_time_point());

  if (now <= last_claim) {
    return 0;
  }

  return now.sec_since_epoch() - last_claim.sec_since_epoch();
}

// ACTION
void rewardbank::signup(const name &user, const name &referrer) {
  require_auth(user);

  reward_config config = load_config();
  check(!config.operations_paused, msg_operations_paused);
  require_plain_account(user);

  check(referrer == name() || is_account(referrer),
        "referrer does not have an account on the network");

  reentry_guard guard(get_self());

  users_index users_table(get_self(), get_self().value);
  auto user_iterator = users_table.find(user.value);
  check(user_iterator == users_table.end() || !user_iterator->registered,
        msg_already_registered);

  user_iterator = find_or_create_user(users_table, user);
  name resolved_referrer = resolve_referrer(user, referrer, config);

  users_table.modify(user_iterator, get_self(), [&](auto &u) {
    u.registered = true;
    u.last_claim = time_point_sec(current_time_point());
    u.referrer = resolved_referrer;
  });

  append_to_registry(user);

  // pay the signup bonus out of custody
  asset bonus = asset(config.signup_bonus,
                      symbol(REWARD_CURRENCY_CODE, CURRENCY_PRECISION));
  if (bonus.amount > 0) {
    check(available_rewards() >= bonus, msg_insufficient_custody);

    send_tokens(name(rewardtokens_acct), user, bonus,
                std::string("rewardbank signup bonus"));
  }

  signuplog_action signup_log{get_self(), {get_self(), "active"_n}};
  signup_log.send(user, resolved_referrer, bonus);
}

// incoming transfers
void rewardbank::on_transfer(name from, name to, asset quantity,
                             std::string memo) {
  // ignore our own outgoing transfers
  if (from == get_self() || to != get_self()) {
    return;
  }

  name ledger = get_first_receiver();

  if (memo == STAKE_MEMO) {
    check(ledger == name(rewardtokens_acct) &&
              quantity.symbol == symbol(REWARD_CURRENCY_CODE, CURRENCY_PRECISION),
          "only RWD can be staked");

    reward_config config = load_config();
    stake(from, quantity, config);

  } else if (memo == SWAP_MEMO) {
    check(ledger == name(stabletokens_acct) &&
              quantity.symbol == symbol(STABLE_CURRENCY_CODE, CURRENCY_PRECISION),
          "only USDT can be swapped");

    reward_config config = load_config();
    swap(from, quantity, config);
  }

  // anything else is a custody top-up and is simply held
}

void rewardbank::stake(const name &user, const asset &quantity,
                       const reward_config &config) {
  check(!config.operations_paused, msg_operations_paused);
  require_plain_account(user);
  check(quantity.amount > 0, "must stake positive quantity");

  reentry_guard guard(get_self());

  users_index users_table(get_self(), get_self().value);
  auto user_iterator = find_or_create_user(users_table, user);

  // staking more restarts the accrual window for the whole balance
  users_table.modify(user_iterator, get_self(), [&](auto &u) {
    u.staked += quantity;
    u.last_claim = time_point_sec(current_time_point());
  });

  adjust_total_staked(quantity);

  stakelog_action stake_log{get_self(), {get_self(), "active"_n}};
  stake_log.send(user, quantity, user_iterator->staked);
}

void rewardbank::swap(const name &user, const asset &quantity,
                      const reward_config &config) {
  check(!config.operations_paused, msg_operations_paused);
  require_plain_account(user);
  check(quantity.amount > 0, "must swap positive quantity");
  check(config.swap_rate > 0, "swap rate is not configured");

  reentry_guard guard(get_self());

  int128_t token_amount_wide = (int128_t)quantity.amount * 100 / config.swap_rate;
  check(token_amount_wide <= asset::max_amount,
        "swap exceeds the maximum token amount");
  int64_t token_amount = (int64_t)token_amount_wide;
  check(token_amount > 0, "swap quantity is too small");

  asset tokens =
      asset(token_amount, symbol(REWARD_CURRENCY_CODE, CURRENCY_PRECISION));
  asset fee = asset(
      (int64_t)((int128_t)quantity.amount * OPERATOR_FEE_PERCENT / 100),
      quantity.symbol);

  check(available_rewards() >= tokens, msg_insufficient_custody);

  std::string memo = std::string("swap by ") + user.to_string();

  if (fee.amount > 0) {
    send_tokens(name(stabletokens_acct), config.operator_account, fee,
                std::string("swap fee: ") + memo);
  }

  send_tokens(name(rewardtokens_acct), user, tokens, memo);

  // only accounts with a referrer start a cascade
  users_index users_table(get_self(), get_self().value);
  auto user_iterator = users_table.find(user.value);
  if (user_iterator != users_table.end() &&
      user_iterator->referrer != name()) {
    credit_referrals(user, user_iterator->referrer, token_amount, config);
  }

  swaplog_action swap_log{get_self(), {get_self(), "active"_n}};
  swap_log.send(user, quantity, tokens, fee);
}

// interest accrual

// move the interest accrued since last_claim into the claimable balance and
// restart the window. Returns the amount credited.
int64_t rewardbank::settle(users_index &users_table,
                           users_index::const_iterator user_iterator,
                           const reward_config &config) {
  uint32_t elapsed = elapsed_since(user_iterator->last_claim);
  int64_t interest =
      accrued_interest(user_iterator->staked.amount, config.daily_rate, elapsed);

  users_table.modify(user_iterator, get_self(), [&](auto &u) {
    u.claimable += asset(interest, u.claimable.symbol);
    u.last_claim = time_point_sec(current_time_point());
  });

  return interest;
}

// ACTION
void rewardbank::claim(const name &caller, const name &user) {
  require_auth(caller);

  reward_config config = load_config();
  check(!config.operations_paused, msg_operations_paused);
  require_plain_account(caller);

  reentry_guard guard(get_self());

  users_index users_table(get_self(), get_self().value);
  auto user_iterator = users_table.find(user.value);
  check(user_iterator != users_table.end() &&
            user_iterator->staked.amount > 0,
        msg_nothing_staked);

  uint32_t elapsed = elapsed_since(user_iterator->last_claim);
  int64_t interest = settle(users_table, user_iterator, config);

  print("settled ", interest, " for ", user, " over ", elapsed, " seconds");

  claimlog_action claim_log{get_self(), {get_self(), "active"_n}};
  claim_log.send(user,
                 asset(interest, symbol(STABLE_CURRENCY_CODE, CURRENCY_PRECISION)),
                 elapsed);
}

// ACTION
void rewardbank::unstake(const name &user, const asset &quantity) {
  require_auth(user);

  reward_config config = load_config();
  check(!config.operations_paused, msg_operations_paused);
  require_plain_account(user);

  check(quantity.is_valid(), "invalid quantity");
  check(quantity.symbol == symbol(REWARD_CURRENCY_CODE, CURRENCY_PRECISION),
        "only RWD can be unstaked");
  check(quantity.amount > 0, "must unstake positive quantity");

  reentry_guard guard(get_self());

  users_index users_table(get_self(), get_self().value);
  auto user_iterator = users_table.find(user.value);
  check(user_iterator != users_table.end() &&
            user_iterator->staked >= quantity,
        msg_insufficient_staked);

  // the departing stake earns up to this instant
  settle(users_table, user_iterator, config);

  users_table.modify(user_iterator, get_self(),
                     [&](auto &u) { u.staked -= quantity; });

  adjust_total_staked(-quantity);

  send_tokens(name(rewardtokens_acct), user, quantity,
              std::string("rewardbank unstake"));

  unstakelog_action unstake_log{get_self(), {get_self(), "active"_n}};
  unstake_log.send(user, quantity, user_iterator->staked);
}

// ACTION
void rewardbank::withdraw(const name &user, const asset &quantity) {
  require_auth(user);

  // withdrawals have their own switch, independent of operations
  reward_config config = load_config();
  check(!config.withdrawals_paused, msg_withdrawals_paused);
  require_plain_account(user);

  check(quantity.is_valid(), "invalid quantity");
  check(quantity.symbol == symbol(STABLE_CURRENCY_CODE, CURRENCY_PRECISION),
        "only USDT can be withdrawn");
  check(quantity.amount > 0, "must withdraw positive quantity");

  reentry_guard guard(get_self());

  users_index users_table(get_self(), get_self().value);
  auto user_iterator = users_table.find(user.value);
  check(user_iterator != users_table.end() &&
            user_iterator->claimable >= quantity,
        msg_insufficient_claimable);

  users_table.modify(user_iterator, get_self(),
                     [&](auto &u) { u.claimable -= quantity; });

  asset fee = asset(
      (int64_t)((int128_t)quantity.amount * OPERATOR_FEE_PERCENT / 100),
      quantity.symbol);
  asset payout = quantity - fee;

  std::string memo = std::string("withdrawal by ") + user.to_string();

  if (fee.amount > 0) {
    send_tokens(name(stabletokens_acct), config.operator_account, fee,
                std::string("withdrawal fee: ") + memo);
  }
  if (payout.amount > 0) {
    send_tokens(name(stabletokens_acct), user, payout, memo);
  }

  withdrawlog_action withdraw_log{get_self(), {get_self(), "active"_n}};
  withdraw_log.send(user, quantity, fee);
}

// ACTION
uint32_t rewardbank::distribute(const name &caller, uint32_t count) {
  require_auth(caller);

  reward_config config = load_config();
  check(!config.operations_paused, msg_operations_paused);
  require_plain_account(caller);

  uint32_t number_of_users = get_user_count();
  check(count <= number_of_users, msg_count_exceeds_users);

  reentry_guard guard(get_self());

  users_index users_table(get_self(), get_self().value);
  registry_index registry_table(get_self(), get_self().value);

  auto registry_iterator = registry_table.begin();
  for (uint32_t i = 0; i < count && registry_iterator != registry_table.end();
       i++, registry_iterator++) {
    auto user_iterator = users_table.find(registry_iterator->owner.value);
    if (user_iterator != users_table.end()) {
      settle(users_table, user_iterator, config);
    }
  }

  uint32_t percentage =
      number_of_users == 0 ? 0 : (uint64_t)count * 100 / number_of_users;

  print("distributed to ", count, " of ", number_of_users, " users (",
        percentage, "%)");

  return percentage;
}

// referral cascade

// walk at most one hop per table entry, so cycles created by setbalance still
// terminate
void rewardbank::credit_referrals(const name &source, const name &first_referrer,
                                  int64_t reward, const reward_config &config) {
  users_index users_table(get_self(), get_self().value);
  refearnings_index refearnings_table(get_self(), get_self().value);

  name current = first_referrer;

  for (size_t level = 0; level < config.referral_percents.size(); level++) {
    if (current == name()) {
      break;
    }

    asset credit =
        asset(referral_credit(reward, config.referral_percents[level]),
              symbol(STABLE_CURRENCY_CODE, CURRENCY_PRECISION));

    auto referrer_iterator = find_or_create_user(users_table, current);
    users_table.modify(referrer_iterator, get_self(),
                       [&](auto &u) { u.claimable += credit; });

    auto earning_iterator = refearnings_table.find(current.value);
    if (earning_iterator == refearnings_table.end()) {
      refearnings_table.emplace(get_self(), [&](auto &e) {
        e.owner = current;
        e.earned = credit;
      });
    } else {
      refearnings_table.modify(earning_iterator, get_self(),
                               [&](auto &e) { e.earned += credit; });
    }

    referrallog_action referral_log{get_self(), {get_self(), "active"_n}};
    referral_log.send(current, source, (uint8_t)(level + 1), credit);

    current = referrer_iterator->referrer;
  }
}

// administrative

// ACTION
void rewardbank::setbalance(const name &user, const asset &amount,
                            const name &referrer) {
  reward_config config = load_config();
  require_auth(config.operator_account);

  check(is_account(user), "user does not have an account on the network");
  check(amount.is_valid(), "invalid amount");
  check(amount.symbol == symbol(STABLE_CURRENCY_CODE, CURRENCY_PRECISION),
        "balance must be in USDT");
  check(amount.amount >= 0, "balance must not be negative");

  users_index users_table(get_self(), get_self().value);
  auto user_iterator = find_or_create_user(users_table, user);
  bool was_registered = user_iterator->registered;
  name resolved_referrer = resolve_referrer(user, referrer, config);

  users_table.modify(user_iterator, get_self(), [&](auto &u) {
    u.registered = true;
    u.claimable = amount;
    u.referrer = resolved_referrer;
  });

  if (!was_registered) {
    append_to_registry(user);
  }

  balsetlog_action balset_log{get_self(), {get_self(), "active"_n}};
  balset_log.send(user, amount, resolved_referrer);
}

// ACTION
void rewardbank::sweep(const name &token_contract, const asset &quantity,
                       const name &to) {
  reward_config config = load_config();
  require_auth(config.operator_account);

  check(quantity.is_valid(), "invalid quantity");
  check(quantity.amount > 0, "must sweep positive quantity");
  check(is_account(to), "to account does not exist");

  asset held = get_balance(token_contract, get_self(), quantity.symbol);
  if (token_contract == name(rewardtokens_acct) &&
      quantity.symbol == symbol(REWARD_CURRENCY_CODE, CURRENCY_PRECISION)) {
    // staked RWD belongs to the stakers
    held = available_rewards();
  }
  check(held >= quantity, msg_insufficient_custody);

  send_tokens(token_contract, to, quantity, std::string("rewardbank sweep"));
}

// read-only views

asset rewardbank::pending(const name &user) {
  reward_config config = load_config();
  asset result = asset(0, symbol(STABLE_CURRENCY_CODE, CURRENCY_PRECISION));

  users_index users_table(get_self(), get_self().value);
  auto user_iterator = users_table.find(user.value);
  if (user_iterator == users_table.end()) {
    return result;
  }

  result.amount =
      accrued_interest(user_iterator->staked.amount, config.daily_rate,
                       elapsed_since(user_iterator->last_claim));

  return result;
}

rewardbank::account_view rewardbank::getaccount(const name &user) {
  users_index users_table(get_self(), get_self().value);
  const auto &record = users_table.get(user.value, "account is not known");

  account_view view;
  view.record = record;
  view.referral_earnings =
      asset(0, symbol(STABLE_CURRENCY_CODE, CURRENCY_PRECISION));
  view.pending = pending(user);

  refearnings_index refearnings_table(get_self(), get_self().value);
  auto earning_iterator = refearnings_table.find(user.value);
  if (earning_iterator != refearnings_table.end()) {
    view.referral_earnings = earning_iterator->earned;
  }

  return view;
}

// event logs

void rewardbank::signuplog(const name &user, const name &referrer,
                           const asset &bonus) {
  require_auth(get_self());
  require_recipient(user);
}

void rewardbank::swaplog(const name &user, const asset &paid,
                         const asset &received, const asset &fee) {
  require_auth(get_self());
  require_recipient(user);
}

void rewardbank::stakelog(const name &user, const asset &quantity,
                          const asset &staked) {
  require_auth(get_self());
  require_recipient(user);
}

void rewardbank::unstakelog(const name &user, const asset &quantity,
                            const asset &staked) {
  require_auth(get_self());
  require_recipient(user);
}

void rewardbank::claimlog(const name &user, const asset &accrued,
                          uint32_t elapsed) {
  require_auth(get_self());
  require_recipient(user);
}

void rewardbank::withdrawlog(const name &user, const asset &quantity,
                             const asset &fee) {
  require_auth(get_self());
  require_recipient(user);
}

void rewardbank::referrallog(const name &referrer, const name &source,
                             uint8_t level, const asset &reward) {
  require_auth(get_self());
  require_recipient(referrer);
}

void rewardbank::balsetlog(const name &user, const asset &amount,
                           const name &referrer) {
  require_auth(get_self());
  require_recipient(user);
}

// ledger plumbing

void rewardbank::send_tokens(const name &token_contract, const name &to,
                             const asset &quantity, const string &memo) {
  action transfer = action(permission_level{get_self(), "active"_n},
                           token_contract, "transfer"_n,
                           std::make_tuple(get_self(), to, quantity, memo));

  transfer.send();
}

} // namespace rewardeco
