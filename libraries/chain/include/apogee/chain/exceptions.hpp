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
#pragma once

#include <fc/exception/exception.hpp>
#include <fc/log/logger.hpp>
#include <apogee/chain/protocol/types.hpp>

#include <exception>

#define APOGEE_ASSERT( expr, exc_type, FORMAT, ... )                  \
   FC_MULTILINE_MACRO_BEGIN                                           \
   if( !(expr) )                                                      \
      FC_THROW_EXCEPTION( exc_type, FORMAT, __VA_ARGS__ );            \
   FC_MULTILINE_MACRO_END

#define APOGEE_TRY_NOTIFY( signal, ... )                                      \
   try                                                                        \
   {                                                                          \
      signal( __VA_ARGS__ );                                                  \
   }                                                                          \
   catch( const fc::exception& e )                                            \
   {                                                                          \
      elog( "Caught exception in event observer: ${e}",                       \
            ("e", e.to_detail_string()) );                                    \
   }                                                                          \
   catch( const std::exception& e )                                           \
   {                                                                          \
      elog( "Caught exception in event observer: ${e}", ("e", e.what()) );    \
   }                                                                          \
   catch( ... )                                                               \
   {                                                                          \
      elog( "Caught unexpected exception in event observer" );                \
   }

namespace apogee { namespace chain {

   FC_DECLARE_EXCEPTION( ledger_exception, 4000000, "ledger exception" )

   FC_DECLARE_DERIVED_EXCEPTION( authorization_exception,      apogee::chain::ledger_exception, 4010000, "authorization exception" )
   FC_DECLARE_DERIVED_EXCEPTION( phase_exception,              apogee::chain::ledger_exception, 4020000, "phase or timing exception" )
   FC_DECLARE_DERIVED_EXCEPTION( value_exception,              apogee::chain::ledger_exception, 4030000, "value exception" )
   FC_DECLARE_DERIVED_EXCEPTION( addressing_exception,         apogee::chain::ledger_exception, 4040000, "addressing exception" )
   FC_DECLARE_DERIVED_EXCEPTION( capacity_exception,           apogee::chain::ledger_exception, 4050000, "capacity exception" )
   FC_DECLARE_DERIVED_EXCEPTION( lookup_exception,             apogee::chain::ledger_exception, 4060000, "lookup exception" )
   FC_DECLARE_DERIVED_EXCEPTION( nothing_to_do_exception,      apogee::chain::ledger_exception, 4070000, "nothing to do" )
   FC_DECLARE_DERIVED_EXCEPTION( genesis_exception,            apogee::chain::ledger_exception, 4080000, "invalid genesis state" )

   FC_DECLARE_DERIVED_EXCEPTION( unauthorized,                 apogee::chain::authorization_exception, 4010001, "caller is not the authority" )

   FC_DECLARE_DERIVED_EXCEPTION( trajectory_already_committed, apogee::chain::phase_exception, 4020001, "trajectory already committed" )
   FC_DECLARE_DERIVED_EXCEPTION( vesting_not_started,          apogee::chain::phase_exception, 4020002, "vesting not started" )
   FC_DECLARE_DERIVED_EXCEPTION( cliff_not_reached,            apogee::chain::phase_exception, 4020003, "vesting cliff not reached" )

   FC_DECLARE_DERIVED_EXCEPTION( zero_amount,                  apogee::chain::value_exception, 4030001, "zero amount" )
   FC_DECLARE_DERIVED_EXCEPTION( insufficient_balance,         apogee::chain::value_exception, 4030002, "insufficient balance" )
   FC_DECLARE_DERIVED_EXCEPTION( insufficient_allowance,       apogee::chain::value_exception, 4030003, "insufficient allowance" )
   FC_DECLARE_DERIVED_EXCEPTION( invalid_allocation,           apogee::chain::value_exception, 4030004, "allocation exceeds its base" )

   FC_DECLARE_DERIVED_EXCEPTION( invalid_recipient,            apogee::chain::addressing_exception, 4040001, "invalid recipient" )

   FC_DECLARE_DERIVED_EXCEPTION( mission_log_full,             apogee::chain::capacity_exception, 4050001, "mission log full" )

   FC_DECLARE_DERIVED_EXCEPTION( index_out_of_bounds,          apogee::chain::lookup_exception, 4060001, "index out of bounds" )

   FC_DECLARE_DERIVED_EXCEPTION( nothing_to_claim,             apogee::chain::nothing_to_do_exception, 4070001, "nothing to claim" )

} } // apogee::chain
