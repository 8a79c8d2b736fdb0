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
    * @brief Transfers an amount from the caller to another address.
    *
    * A zero amount is accepted and still produces a transfer event.
    */
   struct transfer_operation : public base_operation
   {
      /// Account to transfer asset to
      address     to;
      share_type  amount;

      void        validate()const;
   };

   /**
    * @ingroup operations
    *
    * @brief Sets the amount @ref spender may move out of the caller's balance.
    *
    * The previous allowance is overwritten, not adjusted. An amount of
    * APOGEE_UNLIMITED_ALLOWANCE is never consumed by transfer_from.
    */
   struct approve_operation : public base_operation
   {
      address     spender;
      share_type  amount;
   };

   /**
    * @ingroup operations
    *
    * @brief Moves funds out of @ref from on the strength of an allowance granted to the caller.
    */
   struct transfer_from_operation : public base_operation
   {
      address     from;
      address     to;
      share_type  amount;
   };

}} // apogee::chain

FC_REFLECT( apogee::chain::transfer_operation, (to)(amount) )
FC_REFLECT( apogee::chain::approve_operation, (spender)(amount) )
FC_REFLECT( apogee::chain::transfer_from_operation, (from)(to)(amount) )
