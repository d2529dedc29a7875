#pragma once

#include <eosio/eosio.hpp>

namespace rewardeco {

using namespace eosio;

/**
 * @defgroup rewardconfig rewardconfig contract
 * @ingroup eosiocontracts
 *
 * rewardconfig contract
 *
 * @details Defines the structures and tables that allow the operator to
 * maintain the rewardbank tunables: interest rate, signup bonus, swap rate,
 * referral percentages and the pause switches.
 * @{
 */
class[[eosio::contract("rewardconfig")]] rewardconfig : public eosio::contract {
public:
  /**
   * @details contract constructor
   */
  rewardconfig(name receiver, name code, datastream<const char *> ds)
      : contract(receiver, code, ds){}

  /**
   * version action.
   *
   * @details Prints the version of this contract.
   */
  [[eosio::action]] void
  version();

  /**
   * paramupsert action
   *
   * @details This action creates a new parameter or modifies an existing
   * parameter in the 'parameters' table.
   *
   * @param virtualtable - a way to group related parameters together, accessed
   * as a secondary index,
   * @param paramname - the name of the parameter. Value must be unique as it
   * forms the primary index,
   * @param value - the value of the parameter
   *
   * @pre requires permission of the contract account
   *
   */
  [[eosio::action]] void paramupsert(name virtualtable, name paramname,
                                     std::string value);

  /**
   * paramerase action.
   *
   * @details This action deletes a parameter from the 'parameters' table.
   *
   * @param paramname - the name of the parameter.
   *
   * @pre requires permission of the contract account
   */
  [[eosio::action]] void paramerase(name paramname);

  /**
   * refupsert action.
   *
   * @details This action creates, or replaces, the (single) record in the
   * 'referrals' table.
   *
   * @param percents - the per-mille share of a reward paid to each referral
   * level, starting with the direct referrer. Exactly 5 entries.
   *
   * @pre requires permission of the contract account
   */
  [[eosio::action]] void refupsert(std::vector<uint16_t> percents);

  /**
   * referase action.
   *
   * @details This action deletes the (single) record from the 'referrals'
   * table. Referral rewards stop until a new table is set.
   *
   * @pre requires permission of the contract account
   */
  [[eosio::action]] void referase();

  /**
   * pause action.
   *
   * @details Sets the 'opspaused' and 'wdpaused' parameters in one step.
   *
   * @param operations - true to pause signup, swap, stake, unstake, claim and
   * distribute,
   * @param withdrawals - true to pause withdrawals.
   *
   * @pre requires permission of the contract account
   */
  [[eosio::action]] void pause(bool operations, bool withdrawals);

private:
  // helper functions
  void param_set(name virtualtable, name paramname, const std::string &value);
  void validate_parameter(name paramname, const std::string &value);
};
/** @}*/ // end of @defgroup rewardconfig contract

} // namespace rewardeco
