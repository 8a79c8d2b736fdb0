/*
 * Copyright (c) 2015 Cryptonomex, Inc., and contributors.
 *
 * The MIT License
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */
#include <boost/test/unit_test.hpp>

#include <apogee/chain/database.hpp>
#include <apogee/chain/exceptions.hpp>
#include <apogee/chain/vesting_grant_object.hpp>

#include "../common/database_fixture.hpp"

using namespace apogee::chain;

BOOST_AUTO_TEST_SUITE( vesting_policy_tests )

BOOST_AUTO_TEST_CASE( linear_vesting_math )
{
   linear_vesting_policy policy;
   policy.begin_height = 1000;
   const share_type total = 7776;

   BOOST_CHECK( !policy.has_started( 999 ) );
   BOOST_CHECK( policy.has_started( 1000 ) );
   BOOST_CHECK( !policy.is_past_cliff( 1719 ) );
   BOOST_CHECK( policy.is_past_cliff( 1720 ) );

   BOOST_CHECK_EQUAL( policy.get_vested( total, 0 ).value, 0u );
   BOOST_CHECK_EQUAL( policy.get_vested( total, 1000 ).value, 0u );
   BOOST_CHECK_EQUAL( policy.get_vested( total, 1720 ).value, 0u );
   BOOST_CHECK_EQUAL( policy.get_vested( total, 1721 ).value, 1u );
   BOOST_CHECK_EQUAL( policy.get_vested( total, 1720 + 3888 ).value, 3888u );
   BOOST_CHECK_EQUAL( policy.get_vested( total, 1720 + 7775 ).value, 7775u );
   BOOST_CHECK_EQUAL( policy.get_vested( total, 1720 + 7776 ).value, 7776u );
   BOOST_CHECK_EQUAL( policy.get_vested( total, std::numeric_limits<uint32_t>::max() ).value, 7776u );

   // floor division
   BOOST_CHECK_EQUAL( policy.get_vested( 1000, 1720 + 1 ).value, 0u );
   BOOST_CHECK_EQUAL( policy.get_vested( 1000, 1720 + 8 ).value, 1u );
}

BOOST_AUTO_TEST_CASE( large_grants_do_not_overflow )
{
   linear_vesting_policy policy;
   const share_type total = std::numeric_limits<uint64_t>::max();
   const uint32_t half = policy.vesting_cliff_blocks + policy.vesting_duration_blocks / 2;
   BOOST_CHECK_EQUAL( policy.get_vested( total, half ).value, total.value / 2 );
   BOOST_CHECK_EQUAL( policy.get_vested( total, half * 2 ).value, total.value );
}

BOOST_AUTO_TEST_CASE( allowed_claim_subtracts_claimed )
{
   linear_vesting_policy policy;
   vesting_grant_object grant;
   grant.total_granted = 1000;
   grant.total_claimed = 500;

   const uint32_t end = policy.vesting_cliff_blocks + policy.vesting_duration_blocks;
   BOOST_CHECK_EQUAL( grant.get_allowed_claim( policy, end ).value, 500u );
   // less vested than already claimed
   BOOST_CHECK_EQUAL( grant.get_allowed_claim( policy, policy.vesting_cliff_blocks + 100 ).value, 0u );
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE( vesting_tests, database_fixture )

BOOST_AUTO_TEST_CASE( schedule_vesting_escrows_funds )
{ try {
   ACTOR( beneficiary );

   BOOST_CHECK_EQUAL( schedule_vesting( authority, beneficiary, 1000 ).value, 1000u );
   BOOST_CHECK_EQUAL( schedule_vesting( authority, beneficiary, 500 ).value, 1500u );

   BOOST_CHECK_EQUAL( get_balance( escrow ), 1500u );
   BOOST_CHECK_EQUAL( db->get_escrow_balance().value, 1500u );
   BOOST_CHECK_EQUAL( get_balance( authority ), initial_supply - 1500 );
   BOOST_CHECK_EQUAL( get_balance( beneficiary ), 0u );

   const vesting_grant_object* grant = db->find_vesting_grant( beneficiary );
   BOOST_REQUIRE( grant != nullptr );
   BOOST_CHECK_EQUAL( grant->total_granted.value, 1500u );
   BOOST_CHECK_EQUAL( grant->total_claimed.value, 0u );

   auto scheduled = events_of<vesting_scheduled_event>();
   BOOST_REQUIRE_EQUAL( scheduled.size(), 2u );
   BOOST_CHECK( scheduled[1].beneficiary == beneficiary );
   BOOST_CHECK_EQUAL( scheduled[1].amount.value, 500u );
   BOOST_CHECK_EQUAL( scheduled[1].total_granted.value, 1500u );

   auto transfers = events_of<transfer_event>();
   BOOST_CHECK( transfers.back().from == authority );
   BOOST_CHECK( transfers.back().to == escrow );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( schedule_vesting_failures )
{ try {
   ACTORS( (alice)(beneficiary) );
   transfer( authority, alice, 100 );

   APOGEE_REQUIRE_THROW( schedule_vesting( alice, beneficiary, 10 ), unauthorized );
   APOGEE_REQUIRE_THROW( schedule_vesting( authority, address(), 10 ), invalid_recipient );
   APOGEE_REQUIRE_THROW( schedule_vesting( authority, beneficiary, 0 ), zero_amount );
   APOGEE_REQUIRE_THROW( schedule_vesting( authority, beneficiary, initial_supply ), insufficient_balance );
   BOOST_CHECK( db->find_vesting_grant( beneficiary ) == nullptr );
   BOOST_CHECK_EQUAL( get_balance( escrow ), 0u );

   commit_trajectory( authority );
   APOGEE_REQUIRE_THROW( schedule_vesting( authority, beneficiary, 10 ), trajectory_already_committed );
   // the phase check comes before the argument checks
   APOGEE_REQUIRE_THROW( schedule_vesting( authority, address(), 0 ), trajectory_already_committed );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( claim_timing_failures )
{ try {
   ACTORS( (beneficiary)(stranger) );
   schedule_vesting( authority, beneficiary, 1000 );

   APOGEE_REQUIRE_THROW( claim_vested( beneficiary, 0 ), vesting_not_started );
   APOGEE_REQUIRE_THROW( claim_vested( beneficiary, vesting_start - 1 ), vesting_not_started );
   APOGEE_REQUIRE_THROW( claim_vested( beneficiary, vesting_start ), cliff_not_reached );
   APOGEE_REQUIRE_THROW( claim_vested( beneficiary, vesting_start + 719 ), cliff_not_reached );
   // the cliff has passed but nothing has vested yet
   APOGEE_REQUIRE_THROW( claim_vested( beneficiary, vesting_start + 720 ), nothing_to_claim );
   APOGEE_REQUIRE_THROW( claim_vested( stranger, vesting_start + 5000 ), nothing_to_claim );

   BOOST_CHECK_EQUAL( get_balance( escrow ), 1000u );
   BOOST_CHECK_EQUAL( db->find_vesting_grant( beneficiary )->total_claimed.value, 0u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( claim_vested_releases_linearly )
{ try {
   ACTOR( beneficiary );
   schedule_vesting( authority, beneficiary, 7776 );
   const uint32_t cliff = vesting_start + 720;

   BOOST_CHECK_EQUAL( claim_vested( beneficiary, cliff + 1 ).value, 1u );
   BOOST_CHECK_EQUAL( claim_vested( beneficiary, cliff + 100 ).value, 99u );
   BOOST_CHECK_EQUAL( get_balance( beneficiary ), 100u );
   BOOST_CHECK_EQUAL( get_balance( escrow ), 7676u );

   BOOST_CHECK_EQUAL( claim_vested( beneficiary, cliff + 100000 ).value, 7676u );
   BOOST_CHECK_EQUAL( get_balance( beneficiary ), 7776u );
   BOOST_CHECK_EQUAL( get_balance( escrow ), 0u );

   // fully claimed
   APOGEE_REQUIRE_THROW( claim_vested( beneficiary, cliff + 200000 ), nothing_to_claim );

   auto claims = events_of<vesting_claimed_event>();
   BOOST_REQUIRE_EQUAL( claims.size(), 3u );
   BOOST_CHECK( claims[2].beneficiary == beneficiary );
   BOOST_CHECK_EQUAL( claims[2].amount.value, 7676u );
   BOOST_CHECK_EQUAL( claims[2].total_claimed.value, 7776u );

   auto transfers = events_of<transfer_event>();
   BOOST_CHECK( transfers.back().from == escrow );
   BOOST_CHECK( transfers.back().to == beneficiary );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( claim_twice_at_same_height )
{ try {
   ACTOR( beneficiary );
   schedule_vesting( authority, beneficiary, 1000 );
   const uint32_t h = vesting_start + 720 + 3888;

   BOOST_CHECK_EQUAL( claim_vested( beneficiary, h ).value, 500u );
   BOOST_CHECK_EQUAL( get_claimable( beneficiary, h ), 0u );
   const size_t events_before = events.size();

   APOGEE_REQUIRE_THROW( claim_vested( beneficiary, h ), nothing_to_claim );
   BOOST_CHECK_EQUAL( get_balance( beneficiary ), 500u );
   BOOST_CHECK_EQUAL( db->find_vesting_grant( beneficiary )->total_claimed.value, 500u );
   BOOST_CHECK_EQUAL( events.size(), events_before );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( claimable_is_monotonic )
{ try {
   ACTOR( beneficiary );
   schedule_vesting( authority, beneficiary, 987654321 );

   uint64_t previous = 0;
   for( uint32_t h = 0; h <= vesting_start + 720 + 7776 + 500; h += 37 )
   {
      const uint64_t claimable = get_claimable( beneficiary, h );
      BOOST_CHECK_GE( claimable, previous );
      BOOST_CHECK_LE( claimable, 987654321u );
      previous = claimable;
   }
   BOOST_CHECK_EQUAL( previous, 987654321u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( vesting_then_commit_scenario )
{ try {
   ACTOR( b );
   const uint32_t s = vesting_start;
   const uint32_t c = APOGEE_VESTING_CLIFF_BLOCKS;
   const uint32_t d = APOGEE_VESTING_DURATION_BLOCKS;

   schedule_vesting( authority, b, 1000 );
   allocation_result allocation = commit_trajectory( authority, s );

   // the base excludes the escrowed 1000
   const uint64_t base = initial_supply - 1000;
   BOOST_CHECK_EQUAL( allocation.to_reserve.value, base * 892 / 10000 );
   BOOST_CHECK_EQUAL( allocation.to_treasury.value, base * 108 / 10000 );
   BOOST_CHECK_EQUAL( get_balance( authority ), 899999101u );

   BOOST_CHECK_EQUAL( get_claimable( b, s + c ), 0u );
   BOOST_CHECK_EQUAL( get_claimable( b, s + c + 3888 ), 500u );
   BOOST_CHECK_EQUAL( get_claimable( b, s + c + d ), 1000u );

   BOOST_CHECK_EQUAL( claim_vested( b, s + c + d ).value, 1000u );
   BOOST_CHECK_EQUAL( get_balance( b ), 1000u );
   BOOST_CHECK_EQUAL( get_balance( escrow ), 0u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( escrow_cannot_spend_grants )
{ try {
   ACTORS( (beneficiary)(thief) );
   schedule_vesting( authority, beneficiary, 1000 );
   const uint32_t end = vesting_start + 720 + 7776;

   APOGEE_REQUIRE_THROW( transfer( escrow, thief, 1000, end ), unauthorized );
   APOGEE_REQUIRE_THROW( approve( escrow, thief, APOGEE_UNLIMITED_ALLOWANCE ), unauthorized );
   APOGEE_REQUIRE_THROW( transfer_from( thief, escrow, thief, 1000 ), unauthorized );
   APOGEE_REQUIRE_THROW( claim_vested( escrow, end ), unauthorized );
   APOGEE_REQUIRE_THROW( log_mission( escrow, 1 ), unauthorized );

   BOOST_CHECK_EQUAL( get_allowance( escrow, thief ), 0u );
   BOOST_CHECK_EQUAL( get_balance( thief ), 0u );
   BOOST_CHECK_EQUAL( get_balance( escrow ), 1000u );

   BOOST_CHECK_EQUAL( claim_vested( beneficiary, end ).value, 1000u );
   BOOST_CHECK_EQUAL( get_balance( beneficiary ), 1000u );
   BOOST_CHECK_EQUAL( get_balance( escrow ), 0u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( vesting_start_defaults_to_unlock_height )
{ try {
   genesis_state_type genesis = genesis_state;
   genesis.vesting_start_height.reset();
   database other;
   other.init_genesis( genesis );
   BOOST_CHECK_EQUAL( other.get_ledger_properties().vesting_policy.begin_height, unlock_height );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
