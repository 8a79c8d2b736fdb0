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

#include "../common/database_fixture.hpp"

#include <random>

using namespace apogee::chain;

BOOST_FIXTURE_TEST_SUITE( invariant_tests, database_fixture )

/**
 * Applies a long pseudo random mix of every operation, many of them invalid,
 * and checks after each call that no funds were created or destroyed and
 * that a failed call left no trace.
 */
BOOST_AUTO_TEST_CASE( random_operations_preserve_supply )
{ try {
   ACTORS( (alice)(bob)(carol)(dave) );
   const vector<address> actors = { authority, alice, bob, carol, dave, escrow, treasury, address() };

   std::mt19937 rng( 1992 );
   auto pick = [&]( size_t n ) { return size_t( rng() % n ); };
   auto any_actor = [&]() { return actors[ pick( actors.size() ) ]; };
   auto any_amount = [&]() -> uint64_t {
      switch( pick( 4 ) )
      {
         case 0: return 0;
         case 1: return pick( 1000 );
         case 2: return pick( 10000000 );
         default: return APOGEE_UNLIMITED_ALLOWANCE;
      }
   };

   uint32_t height = 0;
   uint32_t failures = 0;
   uint64_t previous_claimed = 0;
   for( int i = 0; i < 3000; ++i )
   {
      height += uint32_t( pick( 8 ) );
      operation op;
      switch( pick( 8 ) )
      {
         case 0: { transfer_operation o; o.to = any_actor(); o.amount = any_amount(); op = o; break; }
         case 1: { approve_operation o; o.spender = any_actor(); o.amount = any_amount(); op = o; break; }
         case 2: { transfer_from_operation o; o.from = any_actor(); o.to = any_actor(); o.amount = any_amount(); op = o; break; }
         case 3: { if( pick( 20 ) == 0 ) op = commit_trajectory_operation(); else op = claim_vested_operation(); break; }
         case 4: { ignition_burn_operation o; o.amount = any_amount(); op = o; break; }
         case 5: { schedule_vesting_operation o; o.beneficiary = any_actor(); o.amount = any_amount(); op = o; break; }
         case 6: { op = claim_vested_operation(); break; }
         default: { log_mission_operation o; o.value = rng(); op = o; break; }
      }
      // the authority is favoured so that privileged paths get exercised
      const address caller = pick( 3 ) == 0 ? authority : any_actor();

      const ledger_snapshot before = db->get_snapshot();
      const size_t events_before = events.size();
      try
      {
         apply( caller, op, height );
      }
      catch( const ledger_exception& )
      {
         ++failures;
         const ledger_snapshot after = db->get_snapshot();
         BOOST_REQUIRE_EQUAL( fc::json::to_string( before ), fc::json::to_string( after ) );
         BOOST_REQUIRE_EQUAL( events.size(), events_before );
      }

      BOOST_REQUIRE_EQUAL( sum_of_balances( *db ).value, initial_supply );

      uint64_t claimed = 0;
      for( const vesting_grant_object& g : db->get_snapshot().vesting_grants )
      {
         BOOST_REQUIRE( g.total_claimed <= g.total_granted );
         claimed += g.total_claimed.value;
      }
      BOOST_REQUIRE_GE( claimed, previous_claimed );
      previous_claimed = claimed;

      // what is still owed is always covered by the escrow
      uint64_t owed = 0;
      for( const vesting_grant_object& g : db->get_snapshot().vesting_grants )
         owed += ( g.total_granted - g.total_claimed ).value;
      BOOST_REQUIRE_LE( owed, get_balance( escrow ) );
   }

   BOOST_TEST_MESSAGE( "random sequence rejected " << failures << " operations" );
   BOOST_CHECK_GT( failures, 0u );
   BOOST_CHECK_LE( db->get_mission_log_length(), uint32_t( APOGEE_MISSION_LOG_CAPACITY ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( phase_never_moves_backwards )
{ try {
   ACTOR( alice );
   BOOST_CHECK_EQUAL( db->get_phase(), pre_ignition );
   commit_trajectory( authority, 10 );
   BOOST_CHECK_EQUAL( db->get_phase(), fuel_allocated );

   transfer( authority, alice, 10, 20 );
   ignition_burn( authority, 10 );
   log_mission( authority, 1, 30 );
   APOGEE_REQUIRE_THROW( commit_trajectory( authority, 40 ), trajectory_already_committed );

   BOOST_CHECK_EQUAL( db->get_phase(), fuel_allocated );
   BOOST_CHECK( db->is_trajectory_committed() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
