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

#include <boost/multi_index_container.hpp>
#include <boost/multi_index/ordered_index.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/composite_key.hpp>

namespace apogee { namespace chain {
   using namespace boost::multi_index;

   /**
    * @brief Tracks the balance of a single address
    * @ingroup object
    *
    * Created the first time an address is credited. Never removed, even once
    * the balance drops back to zero.
    */
   class account_balance_object
   {
      public:
         address     owner;
         share_type  balance;
         /// number of successful transfers sent from this address
         uint64_t    transfer_count = 0;
   };

   /**
    * @brief Amount @ref spender may still move out of @ref owner's balance
    * @ingroup object
    */
   class allowance_object
   {
      public:
         address     owner;
         address     spender;
         share_type  amount;

         bool is_unlimited()const { return amount.value == APOGEE_UNLIMITED_ALLOWANCE; }
   };

   struct by_owner;
   struct by_owner_spender;

   /**
    * @ingroup object_index
    */
   typedef multi_index_container<
      account_balance_object,
      indexed_by<
         ordered_unique< tag<by_owner>,
            member<account_balance_object, address, &account_balance_object::owner>
         >
      >
   > account_balance_index;

   /**
    * @ingroup object_index
    */
   typedef multi_index_container<
      allowance_object,
      indexed_by<
         ordered_unique< tag<by_owner_spender>,
            composite_key< allowance_object,
               member<allowance_object, address, &allowance_object::owner>,
               member<allowance_object, address, &allowance_object::spender>
            >
         >
      >
   > allowance_index;

}}

FC_REFLECT( apogee::chain::account_balance_object, (owner)(balance)(transfer_count) )
FC_REFLECT( apogee::chain::allowance_object, (owner)(spender)(amount) )
