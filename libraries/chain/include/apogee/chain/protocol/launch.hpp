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
#include <apogee/chain/protocol/base.hpp>

namespace apogee { namespace chain {

   /**
    * @ingroup operations
    *
    * @brief Splits the authority balance into the liquidity reserve and treasury allocations.
    *
    * The base is the authority's entire balance at the time of the call:
    * APOGEE_LIQUIDITY_RESERVE_BPS of it go to the liquidity reserve and
    * APOGEE_TREASURY_BPS to the treasury, both rounded down. This can happen
    * once; there is no operation that reverts it.
    */
   struct commit_trajectory_operation : public base_operation
   {
      bool requires_authority()const { return true; }
   };

   /**
    * @ingroup operations
    *
    * @brief Sends authority funds to the burn target. May be repeated.
    */
   struct ignition_burn_operation : public base_operation
   {
      share_type amount;

      bool requires_authority()const { return true; }
      void validate()const;
   };

}} // apogee::chain

FC_REFLECT( apogee::chain::commit_trajectory_operation, )
FC_REFLECT( apogee::chain::ignition_burn_operation, (amount) )
