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
#include <apogee/chain/protocol/types.hpp>

namespace apogee { namespace chain {

   /**
    * @defgroup events Events
    *
    * Notification records emitted by operations. Observers receive them in
    * emission order after the emitting operation has been applied; the ledger
    * never reads them back.
    *
    * @{
    */

   /** every movement of funds, including mints from and burns to special addresses */
   struct transfer_event
   {
      address     from;
      address     to;
      share_type  amount;
   };

   struct approval_event
   {
      address     owner;
      address     spender;
      share_type  amount;
   };

   struct fuel_allocated_event
   {
      address     reserve;
      share_type  amount;
   };

   struct trajectory_committed_event
   {
      uint32_t    height = 0;
      share_type  reserve_amount;
      share_type  treasury_amount;
   };

   struct ignition_burn_event
   {
      address     burner;
      address     target;
      share_type  amount;
      share_type  total_burned;
   };

   struct vesting_scheduled_event
   {
      address     beneficiary;
      share_type  amount;
      share_type  total_granted;
   };

   struct vesting_claimed_event
   {
      address     beneficiary;
      share_type  amount;
      share_type  total_claimed;
   };

   struct mission_logged_event
   {
      uint32_t          index = 0;
      uint32_t          height = 0;
      uint64_t          value = 0;
      mission_tag_type  tag;
   };

   typedef fc::static_variant<
            transfer_event,
            approval_event,
            fuel_allocated_event,
            trajectory_committed_event,
            ignition_burn_event,
            vesting_scheduled_event,
            vesting_claimed_event,
            mission_logged_event
         > ledger_event;

   /// @}

} } // apogee::chain

FC_REFLECT( apogee::chain::transfer_event, (from)(to)(amount) )
FC_REFLECT( apogee::chain::approval_event, (owner)(spender)(amount) )
FC_REFLECT( apogee::chain::fuel_allocated_event, (reserve)(amount) )
FC_REFLECT( apogee::chain::trajectory_committed_event, (height)(reserve_amount)(treasury_amount) )
FC_REFLECT( apogee::chain::ignition_burn_event, (burner)(target)(amount)(total_burned) )
FC_REFLECT( apogee::chain::vesting_scheduled_event, (beneficiary)(amount)(total_granted) )
FC_REFLECT( apogee::chain::vesting_claimed_event, (beneficiary)(amount)(total_claimed) )
FC_REFLECT( apogee::chain::mission_logged_event, (index)(height)(value)(tag) )
FC_REFLECT_TYPENAME( apogee::chain::ledger_event )
