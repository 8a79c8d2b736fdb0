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
#include <apogee/chain/vesting_grant_object.hpp>

namespace apogee { namespace chain {

   /**
    * @class ledger_property_object
    * @brief Parameters fixed when the ledger is created
    * @ingroup object
    * @ingroup implementation
    *
    * Filled in from the genesis state and never modified afterwards.
    */
   class ledger_property_object
   {
      public:
         share_type        total_supply;

         address           authority;
         address           liquidity_reserve;  ///< receives the fuel allocation on commit
         address           treasury;
         address           burn_target;        ///< dead address unless configured
         address           escrow;             ///< custody of unclaimed vesting grants

         uint32_t          launch_unlock_height = 0;
         linear_vesting_policy vesting_policy;
   };

   /**
    * @class dynamic_launch_property_object
    * @brief Launch state machine and running counters
    * @ingroup object
    * @ingroup implementation
    *
    * The values here are calculated during normal ledger operations.
    */
   class dynamic_launch_property_object
   {
      public:
         launch_phase      phase = pre_ignition;
         /** set once by commit_trajectory, never cleared */
         bool              trajectory_committed = false;

         share_type        total_burned;
         /** number of successful transfer and transfer_from operations */
         uint64_t          total_transfers = 0;
   };

}}

FC_REFLECT( apogee::chain::ledger_property_object,
            (total_supply)
            (authority)
            (liquidity_reserve)
            (treasury)
            (burn_target)
            (escrow)
            (launch_unlock_height)
            (vesting_policy)
          )

FC_REFLECT( apogee::chain::dynamic_launch_property_object,
            (phase)
            (trajectory_committed)
            (total_burned)
            (total_transfers)
          )
