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
#include <apogee/chain/launch_evaluator.hpp>
#include <apogee/chain/database.hpp>
#include <apogee/chain/exceptions.hpp>

#include <fc/uint128.hpp>

namespace apogee { namespace chain {

namespace {

share_type basis_points_of( const share_type& base, uint32_t bps )
{
   return ( fc::uint128_t( base.value ) * bps / APOGEE_100_PERCENT ).to_uint64();
}

}

void_result commit_trajectory_evaluator::do_evaluate( const commit_trajectory_operation& op )
{ try {
   const database& d = db();
   const auto& props = d.get_ledger_properties();

   APOGEE_ASSERT( !d.get_dynamic_properties().trajectory_committed, trajectory_already_committed,
                  "the trajectory can only be committed once", ("height", height()) );

   const share_type base = d.get_balance( props.authority );
   APOGEE_ASSERT( base > share_type(0), zero_amount,
                  "authority ${a} holds nothing to allocate", ("a", props.authority) );

   allocation.to_reserve = basis_points_of( base, APOGEE_LIQUIDITY_RESERVE_BPS );
   allocation.to_treasury = basis_points_of( base, APOGEE_TREASURY_BPS );
   APOGEE_ASSERT( fc::uint128_t( allocation.to_reserve.value ) + allocation.to_treasury.value <= base.value,
                  invalid_allocation, "allocation of ${r} + ${t} exceeds ${b}",
                  ("r", allocation.to_reserve)("t", allocation.to_treasury)("b", base) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

allocation_result commit_trajectory_evaluator::do_apply( const commit_trajectory_operation& op )
{ try {
   database& d = db();
   const auto& props = d.get_ledger_properties();
   const auto& dyn = d.get_dynamic_properties();

   // the flag goes up before any funds move
   d.modify( dyn, []( dynamic_launch_property_object& p )
   {
      p.trajectory_committed = true;
   } );

   if( !props.liquidity_reserve.is_null() && allocation.to_reserve > share_type(0) )
   {
      d.transfer_balance( props.authority, props.liquidity_reserve, allocation.to_reserve );

      fuel_allocated_event fuel;
      fuel.reserve = props.liquidity_reserve;
      fuel.amount = allocation.to_reserve;
      d.push_event( fuel );
   }
   if( !props.treasury.is_null() && allocation.to_treasury > share_type(0) )
      d.transfer_balance( props.authority, props.treasury, allocation.to_treasury );

   d.modify( dyn, []( dynamic_launch_property_object& p )
   {
      p.phase = fuel_allocated;
   } );

   trajectory_committed_event committed;
   committed.height = height();
   committed.reserve_amount = allocation.to_reserve;
   committed.treasury_amount = allocation.to_treasury;
   d.push_event( committed );

   ilog( "Trajectory committed at height ${h}: ${r} to liquidity reserve, ${t} to treasury",
         ("h", height())("r", allocation.to_reserve)("t", allocation.to_treasury) );

   return allocation;
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result ignition_burn_evaluator::do_evaluate( const ignition_burn_operation& op )
{ try {
   const database& d = db();
   const share_type balance = d.get_balance( caller() );
   APOGEE_ASSERT( balance >= op.amount, insufficient_balance,
                  "Insufficient Balance: ${balance}, unable to burn ${amount}",
                  ("balance", balance)("amount", op.amount) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

share_type ignition_burn_evaluator::do_apply( const ignition_burn_operation& op )
{ try {
   database& d = db();
   const address& target = d.get_ledger_properties().burn_target;

   d.transfer_balance( caller(), target, op.amount );
   d.modify( d.get_dynamic_properties(), [&op]( dynamic_launch_property_object& p )
   {
      p.total_burned += op.amount;
   } );

   ignition_burn_event burn;
   burn.burner = caller();
   burn.target = target;
   burn.amount = op.amount;
   burn.total_burned = d.get_total_burned();
   d.push_event( burn );

   ilog( "Ignition burn of ${a} at height ${h}, ${t} burned in total",
         ("a", op.amount)("h", height())("t", burn.total_burned) );

   return burn.total_burned;
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // apogee::chain
