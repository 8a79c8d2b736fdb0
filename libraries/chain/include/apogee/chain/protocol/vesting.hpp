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
    * @brief Escrows authority funds for a beneficiary under the linear vesting schedule.
    *
    * Only allowed before the trajectory commit. Grants to the same beneficiary
    * accumulate into a single grant.
    */
   struct schedule_vesting_operation : public base_operation
   {
      address     beneficiary;
      share_type  amount;

      bool requires_authority()const { return true; }
   };

   /**
    * @ingroup operations
    *
    * @brief Withdraws everything that has vested for the caller and not been claimed yet.
    */
   struct claim_vested_operation : public base_operation
   {
   };

}} // apogee::chain

FC_REFLECT( apogee::chain::schedule_vesting_operation, (beneficiary)(amount) )
FC_REFLECT( apogee::chain::claim_vested_operation, )
