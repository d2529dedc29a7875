#include "rewardconfig.hpp"
#include "../common/rewardbankcommon.hpp"
#include <cctype>

namespace rewardeco {

const std::string VERSION = "1.0.1";

// ACTION
void rewardconfig::version() {
  std::string version_message = rewardbank_acct + "/" + rewardconfig_acct +
                                "/" + rewardtokens_acct + "/" +
                                stabletokens_acct + " version = " + VERSION;

  check(false, version_message);
}

// ACTION
void rewardconfig::paramupsert(name virtualtable, name paramname,
                               std::string value) {

  require_auth(_self);

  validate_parameter(paramname, value);
  param_set(virtualtable, paramname, value);
}

// erase parameter from the table
// ACTION
void rewardconfig::paramerase(name paramname) {
  require_auth(_self);

  parameters_index parameters_table(get_self(), get_self().value);
  auto parameter_iterator = parameters_table.find(paramname.value);

  // check if the parameter is in the table or not
  check(parameter_iterator != parameters_table.end(),
        "config parameter does not exist");

  // the parameter is in the table, so delete
  parameters_table.erase(parameter_iterator);
}

// ACTION
void rewardconfig::refupsert(std::vector<uint16_t> percents) {
  require_auth(_self);

  check(percents.size() == REFERRAL_LEVELS,
        "referral table must have exactly 5 levels");
  for (auto percent : percents) {
    check(percent <= PERMILLE, "referral percentage must not exceed 1000");
  }

  referrals_index referrals_table(get_self(), get_self().value);
  auto referral_iterator = referrals_table.begin();

  // check if the record exists in the table
  if (referral_iterator == referrals_table.end()) {
    // the record is not in the table, so insert
    referrals_table.emplace(_self,
                            [&](auto &referral) { referral.percents = percents; });

  } else {
    // the record is in the table, so update
    referrals_table.modify(referral_iterator, _self,
                           [&](auto &referral) { referral.percents = percents; });
  }
}

// erase the referral table
// ACTION
void rewardconfig::referase() {
  require_auth(_self);

  referrals_index referrals_table(get_self(), get_self().value);
  auto referral_iterator = referrals_table.begin();

  // check if the record is in the table
  check(referral_iterator != referrals_table.end(),
        "referral record does not exist");

  referrals_table.erase(referral_iterator);
}

// ACTION
void rewardconfig::pause(bool operations, bool withdrawals) {
  require_auth(_self);

  param_set("switches"_n, "opspaused"_n, operations ? "1" : "0");
  param_set("switches"_n, "wdpaused"_n, withdrawals ? "1" : "0");
}

void rewardconfig::param_set(name virtualtable, name paramname,
                             const std::string &value) {
  parameters_index parameters_table(get_self(), get_self().value);
  auto parameter_iterator = parameters_table.find(paramname.value);

  // check if the parameter is in the table or not
  if (parameter_iterator == parameters_table.end()) {
    // the parameter is not in the table, so insert
    parameters_table.emplace(_self, [&](auto &parameter) {
      parameter.virtualtable = virtualtable;
      parameter.paramname = paramname;
      parameter.value = value;
    });

  } else {
    // the parameter is in the table, so update
    parameters_table.modify(parameter_iterator, _self, [&](auto &parameter) {
      parameter.virtualtable = virtualtable;
      parameter.value = value;
    });
  }
}

// rewardbank parses these parameters, so reject values it could not read
void rewardconfig::validate_parameter(name paramname, const std::string &value) {
  if (paramname == "dailyrate"_n || paramname == "signupbonus"_n ||
      paramname == "swaprate"_n) {
    check(!value.empty() && value.size() <= 18,
          "parameter must be a non-negative integer");
    for (char c : value) {
      check(isdigit(c), "parameter must be a non-negative integer");
    }

    uint64_t number = std::stoull(value);
    if (paramname == "dailyrate"_n) {
      check(number <= MAX_DAILY_RATE, "daily rate must not exceed 100");
    } else if (paramname == "swaprate"_n) {
      check(number >= 1 && number <= MAX_SWAP_RATE,
            "swap rate must be between 1 and 1000000000000");
    }
  } else if (paramname == "opspaused"_n || paramname == "wdpaused"_n) {
    check(value == "0" || value == "1", "switch parameter must be 0 or 1");
  } else if (paramname == "operator"_n) {
    check(is_account(name(value)), "operator account does not exist");
  }
}

} // namespace rewardeco
