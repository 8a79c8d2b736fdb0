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
#include <apogee/chain/database.hpp>
#include <apogee/chain/vesting_evaluator.hpp>
#include <apogee/chain/vesting_grant_object.hpp>
#include <fc/log/logger.hpp>

namespace apogee { namespace chain {

void_result schedule_vesting_evaluator::do_evaluate( const schedule_vesting_operation& op )
{ try {
   const database& d = db();

   // all grants are carved out before launch funds move
   APOGEE_ASSERT( !d.get_dynamic_properties().trajectory_committed, trajectory_already_committed,
                  "vesting can only be scheduled before the trajectory commit", ("beneficiary", op.beneficiary) );
   APOGEE_ASSERT( !op.beneficiary.is_null(), invalid_recipient,
                  "vesting beneficiary must not be the null address", ("beneficiary", op.beneficiary) );
   APOGEE_ASSERT( op.amount > share_type(0), zero_amount,
                  "vesting amount must be positive", ("amount", op.amount) );

   const share_type balance = d.get_balance( caller() );
   APOGEE_ASSERT( balance >= op.amount, insufficient_balance,
                  "Insufficient Balance: ${balance}, unable to escrow ${amount}",
                  ("balance", balance)("amount", op.amount) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

share_type schedule_vesting_evaluator::do_apply( const schedule_vesting_operation& op )
{ try {
   database& d = db();

   d.transfer_balance( caller(), d.get_ledger_properties().escrow, op.amount );

   const vesting_grant_object* existing = d.find_vesting_grant( op.beneficiary );
   if( existing == nullptr )
   {
      d.create_vesting_grant( [&op]( vesting_grant_object& g )
      {
         g.beneficiary = op.beneficiary;
         g.total_granted = op.amount;
      } );
   }
   else
   {
      d.modify( *existing, [&op]( vesting_grant_object& g )
      {
         g.total_granted += op.amount;
      } );
   }

   vesting_scheduled_event scheduled;
   scheduled.beneficiary = op.beneficiary;
   scheduled.amount = op.amount;
   scheduled.total_granted = d.find_vesting_grant( op.beneficiary )->total_granted;
   d.push_event( scheduled );

   return scheduled.total_granted;
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result claim_vested_evaluator::do_evaluate( const claim_vested_operation& op )
{ try {
   const database& d = db();
   const linear_vesting_policy& policy = d.get_ledger_properties().vesting_policy;

   APOGEE_ASSERT( policy.has_started( height() ), vesting_not_started,
                  "vesting starts at height ${s}", ("s", policy.begin_height)("height", height()) );
   APOGEE_ASSERT( policy.is_past_cliff( height() ), cliff_not_reached,
                  "vesting cliff ends at height ${c}",
                  ("c", uint64_t( policy.begin_height ) + policy.vesting_cliff_blocks)("height", height()) );

   grant = d.find_vesting_grant( caller() );
   APOGEE_ASSERT( grant != nullptr && grant->total_granted > grant->total_claimed, nothing_to_claim,
                  "${b} has no unclaimed vesting grant", ("b", caller()) );

   claimable = grant->get_allowed_claim( policy, height() );
   APOGEE_ASSERT( claimable > share_type(0), nothing_to_claim,
                  "nothing has vested for ${b} since the last claim", ("b", caller())("height", height()) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

share_type claim_vested_evaluator::do_apply( const claim_vested_operation& op )
{ try {
   database& d = db();

   d.modify( *grant, [this]( vesting_grant_object& g )
   {
      g.total_claimed += claimable;
   } );

   d.transfer_balance( d.get_ledger_properties().escrow, caller(), claimable );

   vesting_claimed_event claimed;
   claimed.beneficiary = caller();
   claimed.amount = claimable;
   claimed.total_claimed = d.find_vesting_grant( caller() )->total_claimed;
   d.push_event( claimed );

   return claimable;
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // apogee::chain
