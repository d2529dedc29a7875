// Covers the rewardconfig contract: parameter upsert/erase with value
// validation, the referral percentage table and the pause switches.

#include "rewardbank_tester.hpp"

BOOST_AUTO_TEST_SUITE(rewardconfig_tests)

BOOST_FIXTURE_TEST_CASE( paramupsert_requires_contract_authority, rewardbank_tester ) try {
   auto r = push_config_action( "alice"_n, "paramupsert"_n, mvo()
      ("virtualtable", "rates")
      ("paramname", "dailyrate")
      ("value", "50")
   );
   BOOST_REQUIRE( r != success() );
   require_substr( r, "missing authority of rewardconfig" );

   BOOST_REQUIRE_EQUAL( std::to_string(DAILY_RATE), get_parameter( "dailyrate"_n )["value"].as<std::string>() );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( paramupsert_inserts_and_updates, rewardbank_tester ) try {
   BOOST_REQUIRE( get_parameter( "newparam"_n ).is_null() );

   BOOST_REQUIRE_EQUAL( success(), paramupsert( "misc"_n, "newparam"_n, "first" ) );
   auto row = get_parameter( "newparam"_n );
   BOOST_REQUIRE_EQUAL( "misc"_n, row["virtualtable"].as<name>() );
   BOOST_REQUIRE_EQUAL( "first", row["value"].as<std::string>() );

   BOOST_REQUIRE_EQUAL( success(), paramupsert( "other"_n, "newparam"_n, "second" ) );
   row = get_parameter( "newparam"_n );
   BOOST_REQUIRE_EQUAL( "other"_n, row["virtualtable"].as<name>() );
   BOOST_REQUIRE_EQUAL( "second", row["value"].as<std::string>() );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( paramupsert_validates_known_parameters, rewardbank_tester ) try {
   BOOST_REQUIRE_EQUAL( wasm_assert_msg( "parameter must be a non-negative integer" ),
                        paramupsert( "rates"_n, "dailyrate"_n, "abc" ) );
   BOOST_REQUIRE_EQUAL( wasm_assert_msg( "parameter must be a non-negative integer" ),
                        paramupsert( "rates"_n, "swaprate"_n, "-5" ) );
   BOOST_REQUIRE_EQUAL( wasm_assert_msg( "parameter must be a non-negative integer" ),
                        paramupsert( "rates"_n, "signupbonus"_n, "" ) );
   BOOST_REQUIRE_EQUAL( wasm_assert_msg( "parameter must be a non-negative integer" ),
                        paramupsert( "rates"_n, "signupbonus"_n, "1234567890123456789" ) );
   BOOST_REQUIRE_EQUAL( wasm_assert_msg( "switch parameter must be 0 or 1" ),
                        paramupsert( "switches"_n, "opspaused"_n, "yes" ) );
   BOOST_REQUIRE_EQUAL( wasm_assert_msg( "operator account does not exist" ),
                        paramupsert( "accounts"_n, "operator"_n, "nosuchacct" ) );

   BOOST_REQUIRE_EQUAL( std::to_string(SWAP_RATE), get_parameter( "swaprate"_n )["value"].as<std::string>() );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( rate_parameters_are_bounded, rewardbank_tester ) try {
   BOOST_REQUIRE_EQUAL( wasm_assert_msg( "daily rate must not exceed 100" ),
                        paramupsert( "rates"_n, "dailyrate"_n, "101" ) );
   BOOST_REQUIRE_EQUAL( wasm_assert_msg( "daily rate must not exceed 100" ),
                        paramupsert( "rates"_n, "dailyrate"_n, "999999999999999999" ) );
   BOOST_REQUIRE_EQUAL( success(), paramupsert( "rates"_n, "dailyrate"_n, "100" ) );

   BOOST_REQUIRE_EQUAL( wasm_assert_msg( "swap rate must be between 1 and 1000000000000" ),
                        paramupsert( "rates"_n, "swaprate"_n, "0" ) );
   BOOST_REQUIRE_EQUAL( wasm_assert_msg( "swap rate must be between 1 and 1000000000000" ),
                        paramupsert( "rates"_n, "swaprate"_n, "1000000000001" ) );
   BOOST_REQUIRE_EQUAL( success(), paramupsert( "rates"_n, "swaprate"_n, "1000000000000" ) );

   BOOST_REQUIRE_EQUAL( "100", get_parameter( "dailyrate"_n )["value"].as<std::string>() );
   BOOST_REQUIRE_EQUAL( "1000000000000", get_parameter( "swaprate"_n )["value"].as<std::string>() );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( paramerase_removes_parameter, rewardbank_tester ) try {
   BOOST_REQUIRE_EQUAL( success(), paramerase( "dailyrate"_n ) );
   BOOST_REQUIRE( get_parameter( "dailyrate"_n ).is_null() );

   BOOST_REQUIRE_EQUAL( wasm_assert_msg( "config parameter does not exist" ),
                        paramerase( "dailyrate"_n ) );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( absent_daily_rate_accrues_nothing, rewardbank_tester ) try {
   BOOST_REQUIRE_EQUAL( success(), paramerase( "dailyrate"_n ) );
   BOOST_REQUIRE_EQUAL( success(), signup( "alice"_n, name() ) );
   BOOST_REQUIRE_EQUAL( success(), stake( "alice"_n, asset::from_string("100.0000 RWD") ) );
   produce_block();
   produce_block( fc::seconds(86400) );

   BOOST_REQUIRE_EQUAL( success(), claim( "alice"_n, "alice"_n ) );
   BOOST_REQUIRE_EQUAL( 0, claimable_of( "alice"_n ) );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( operator_parameter_redirects_fees, rewardbank_tester ) try {
   BOOST_REQUIRE_EQUAL( success(), paramupsert( "accounts"_n, "operator"_n, "erin" ) );
   BOOST_REQUIRE_EQUAL( success(), signup( "alice"_n, name() ) );
   BOOST_REQUIRE_EQUAL( "erin"_n, get_user( "alice"_n )["referrer"].as<name>() );

   BOOST_REQUIRE_EQUAL( success(), swap( "alice"_n, asset::from_string("20.0000 USDT") ) );
   BOOST_REQUIRE_EQUAL( asset::from_string("1001.0000 USDT"), usdt_balance( "erin"_n ) );
   BOOST_REQUIRE_EQUAL( asset::from_string("0.0000 USDT"), usdt_balance( OPERATOR ) );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( refupsert_requires_five_levels, rewardbank_tester ) try {
   BOOST_REQUIRE_EQUAL( wasm_assert_msg( "referral table must have exactly 5 levels" ),
                        refupsert( { 100, 50, 30, 20 } ) );
   BOOST_REQUIRE_EQUAL( wasm_assert_msg( "referral table must have exactly 5 levels" ),
                        refupsert( { 100, 50, 30, 20, 10, 5 } ) );
   BOOST_REQUIRE_EQUAL( wasm_assert_msg( "referral percentage must not exceed 1000" ),
                        refupsert( { 100, 50, 30, 20, 1001 } ) );

   BOOST_REQUIRE( get_referrals()["percents"].as<vector<uint16_t>>() == REFERRAL_PERCENTS );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( refupsert_replaces_table, rewardbank_tester ) try {
   const vector<uint16_t> flat = { 10, 10, 10, 10, 1000 };
   BOOST_REQUIRE_EQUAL( success(), refupsert( flat ) );
   BOOST_REQUIRE( get_referrals()["percents"].as<vector<uint16_t>>() == flat );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( referase_removes_table, rewardbank_tester ) try {
   BOOST_REQUIRE_EQUAL( success(), referase() );
   BOOST_REQUIRE( get_referrals().is_null() );

   BOOST_REQUIRE_EQUAL( wasm_assert_msg( "referral record does not exist" ), referase() );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( pause_sets_both_switches, rewardbank_tester ) try {
   BOOST_REQUIRE_EQUAL( success(), pause( true, false ) );

   auto ops = get_parameter( "opspaused"_n );
   BOOST_REQUIRE_EQUAL( "switches"_n, ops["virtualtable"].as<name>() );
   BOOST_REQUIRE_EQUAL( "1", ops["value"].as<std::string>() );
   BOOST_REQUIRE_EQUAL( "0", get_parameter( "wdpaused"_n )["value"].as<std::string>() );

   BOOST_REQUIRE_EQUAL( success(), pause( false, true ) );
   BOOST_REQUIRE_EQUAL( "0", get_parameter( "opspaused"_n )["value"].as<std::string>() );
   BOOST_REQUIRE_EQUAL( "1", get_parameter( "wdpaused"_n )["value"].as<std::string>() );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( config_version_reports_configured_accounts, rewardbank_tester ) try {
   auto r = push_config_action( CONFIG, "version"_n, mvo() );
   require_substr( r, "rewardbank/rewardconfig/rewardtokens/stabletokens version = " );
} FC_LOG_AND_RETHROW()

BOOST_AUTO_TEST_SUITE_END()
