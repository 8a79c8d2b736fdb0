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
#include <apogee/chain/ledger_state.hpp>

#include <stdexcept>

#include "../common/database_fixture.hpp"

using namespace apogee::chain;

BOOST_FIXTURE_TEST_SUITE( database_tests, database_fixture )

BOOST_AUTO_TEST_CASE( undo_session_restores_state )
{ try {
   ACTOR( alice );
   ledger_state state;
   account_balance_object b;
   b.owner = alice;
   b.balance = 10;
   state.balances.insert( b );

   {
      undo_session session( state );
      state.balances.modify( state.balances.begin(), []( account_balance_object& o ) { o.balance = 99; } );
      state.dynamic_properties.trajectory_committed = true;
      state.mission_log.push_back( mission_log_entry() );
   }
   BOOST_CHECK_EQUAL( state.balances.begin()->balance.value, 10u );
   BOOST_CHECK( !state.dynamic_properties.trajectory_committed );
   BOOST_CHECK( state.mission_log.empty() );

   {
      undo_session session( state );
      state.mission_log.push_back( mission_log_entry() );
      session.commit();
   }
   BOOST_CHECK_EQUAL( state.mission_log.size(), 1u );

   {
      undo_session session( state );
      state.mission_log.clear();
      undo_session moved( std::move( session ) );
      moved.undo();
      BOOST_CHECK_EQUAL( state.mission_log.size(), 1u );
   }
   BOOST_CHECK_EQUAL( state.mission_log.size(), 1u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( failed_operation_publishes_nothing )
{ try {
   ACTORS( (alice)(bob) );
   transfer( authority, alice, 100 );
   const size_t events_before = events.size();
   BOOST_CHECK_EQUAL( db->get_applied_events().size(), 1u );

   APOGEE_REQUIRE_THROW( transfer( alice, bob, 1000 ), insufficient_balance );
   BOOST_CHECK_EQUAL( events.size(), events_before );

   // still the events of the last successful call
   const vector<ledger_event>& last = db->get_applied_events();
   BOOST_REQUIRE_EQUAL( last.size(), 1u );
   BOOST_REQUIRE( last[0].which() == ledger_event::tag<transfer_event>::value );
   BOOST_CHECK( last[0].get<transfer_event>().to == alice );
   BOOST_CHECK_EQUAL( last[0].get<transfer_event>().amount.value, 100u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( observer_failure_does_not_undo )
{ try {
   ACTOR( alice );
   int calls = 0;
   db->applied_event.connect( [&calls]( const ledger_event& e ) {
      ++calls;
      FC_THROW( "observer is broken" );
   } );

   transfer( authority, alice, 100 );
   BOOST_CHECK_EQUAL( calls, 1 );
   BOOST_CHECK_EQUAL( get_balance( alice ), 100u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( std_exception_in_observer_is_contained )
{ try {
   ACTOR( alice );
   int calls = 0;
   db->applied_event.connect( [&calls]( const ledger_event& e ) {
      ++calls;
      throw std::runtime_error( "observer is broken" );
   } );

   // the commit emits four events; every one of them reaches the observer
   BOOST_CHECK_NO_THROW( commit_trajectory( authority ) );
   BOOST_CHECK_EQUAL( calls, 4 );
   BOOST_CHECK( db->is_trajectory_committed() );
   BOOST_CHECK_EQUAL( events_of<trajectory_committed_event>().size(), 1u );

   transfer( authority, alice, 100 );
   BOOST_CHECK_EQUAL( calls, 5 );
   BOOST_CHECK_EQUAL( get_balance( alice ), 100u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( observer_may_apply_operations )
{ try {
   ACTORS( (alice)(bob) );
   bool forwarded = false;
   db->applied_event.connect( [&]( const ledger_event& e ) {
      if( forwarded || e.which() != ledger_event::tag<transfer_event>::value )
         return;
      if( e.get<transfer_event>().to != alice )
         return;
      forwarded = true;
      transfer( alice, bob, 40 );
   } );

   const size_t events_before = events.size();
   transfer( authority, alice, 100 );

   BOOST_CHECK( forwarded );
   BOOST_CHECK_EQUAL( get_balance( alice ), 60u );
   BOOST_CHECK_EQUAL( get_balance( bob ), 40u );
   BOOST_CHECK_EQUAL( events.size(), events_before + 2 );
   // the nested call is now the last successful one
   BOOST_REQUIRE_EQUAL( db->get_applied_events().size(), 1u );
   BOOST_CHECK( db->get_applied_events()[0].get<transfer_event>().to == bob );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( apply_returns_operation_result )
{ try {
   ACTOR( alice );
   operation_result r = apply( alice, approve_operation() );
   BOOST_CHECK( r.which() == operation_result::tag<void_result>::value );

   ignition_burn_operation burn;
   burn.amount = 3;
   r = apply( authority, burn );
   BOOST_REQUIRE( r.which() == operation_result::tag<share_type>::value );
   BOOST_CHECK_EQUAL( r.get<share_type>().value, 3u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( genesis_validation )
{ try {
   ACTOR( other_address );
   {
      genesis_state_type g = genesis_state;
      g.initial_supply = 0;
      APOGEE_REQUIRE_THROW( database().init_genesis( g ), genesis_exception );
   }
   {
      genesis_state_type g = genesis_state;
      g.authority = address();
      APOGEE_REQUIRE_THROW( database().init_genesis( g ), genesis_exception );
   }
   {
      genesis_state_type g = genesis_state;
      g.escrow = address();
      APOGEE_REQUIRE_THROW( database().init_genesis( g ), genesis_exception );
   }
   {
      genesis_state_type g = genesis_state;
      g.escrow = g.authority;
      APOGEE_REQUIRE_THROW( database().init_genesis( g ), genesis_exception );
      g.escrow = g.treasury;
      APOGEE_REQUIRE_THROW( database().init_genesis( g ), genesis_exception );
      g.escrow = g.liquidity_reserve;
      APOGEE_REQUIRE_THROW( database().init_genesis( g ), genesis_exception );
   }
   {
      genesis_state_type g = genesis_state;
      g.burn_target = g.escrow;
      APOGEE_REQUIRE_THROW( database().init_genesis( g ), genesis_exception );
      g.burn_target = address();
      APOGEE_REQUIRE_THROW( database().init_genesis( g ), genesis_exception );
      g.burn_target = g.authority;
      APOGEE_REQUIRE_THROW( database().init_genesis( g ), genesis_exception );
      g.burn_target = other_address;
      g.validate();
   }
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( genesis_applies_once )
{ try {
   BOOST_CHECK( db->is_initialized() );
   BOOST_CHECK_THROW( db->init_genesis( genesis_state ), fc::exception );
   BOOST_CHECK_EQUAL( get_balance( authority ), initial_supply );

   database fresh;
   BOOST_CHECK( !fresh.is_initialized() );
   BOOST_CHECK_THROW( fresh.apply_operation( call_context( authority, 0 ), transfer_operation() ), fc::exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( snapshot_lists_state )
{ try {
   ACTORS( (alice)(bob) );
   transfer( authority, alice, 10 );
   approve( alice, bob, 5 );
   schedule_vesting( authority, bob, 7 );
   log_mission( authority, 1 );

   ledger_snapshot snap = db->get_snapshot();
   BOOST_CHECK_EQUAL( snap.balances.size(), 3u );  // authority, alice, escrow
   BOOST_CHECK_EQUAL( snap.allowances.size(), 1u );
   BOOST_CHECK_EQUAL( snap.vesting_grants.size(), 1u );
   BOOST_CHECK_EQUAL( snap.mission_log.size(), 1u );
   BOOST_CHECK( snap.properties.authority == authority );
   BOOST_CHECK_EQUAL( snap.dynamic_properties.total_transfers, 1u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
