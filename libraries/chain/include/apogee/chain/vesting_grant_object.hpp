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

namespace apogee { namespace chain {
   using namespace boost::multi_index;

   /**
    * @brief Linear vesting with cliff, measured in block heights
    *
    * Nothing vests before begin_height + vesting_cliff_blocks. From there the
    * vested share grows linearly and reaches the whole grant once
    * vesting_duration_blocks more heights have passed.
    *
    * Note that the linear window starts at the cliff, not at begin_height.
    */
   struct linear_vesting_policy
   {
      /// This is the height at which the schedule starts.
      uint32_t begin_height = 0;
      /// No amount may be claimed before this many blocks past begin_height.
      uint32_t vesting_cliff_blocks = APOGEE_VESTING_CLIFF_BLOCKS;
      /// Length of the linear release window that follows the cliff. Must be greater than 0.
      uint32_t vesting_duration_blocks = APOGEE_VESTING_DURATION_BLOCKS;

      bool has_started( uint32_t height )const { return height >= begin_height; }
      bool is_past_cliff( uint32_t height )const;

      /**
       * Total amount of @p total_granted vested at @p height, claimed or not.
       * Non-decreasing in height.
       */
      share_type get_vested( const share_type& total_granted, uint32_t height )const;
   };

   /**
    * @brief Escrowed funds granted to a beneficiary
    * @ingroup object
    *
    * The funds themselves sit on the escrow address; this object only records
    * how much was granted and how much of it was already withdrawn.
    */
   class vesting_grant_object
   {
      public:
         /// Account which may claim from this grant
         address     beneficiary;
         /// Sum of all schedule_vesting amounts for the beneficiary
         share_type  total_granted;
         /// Amount already moved out of escrow to the beneficiary
         share_type  total_claimed;

         /**
          * Amount that has vested at @p height and not been claimed yet.
          */
         share_type get_allowed_claim( const linear_vesting_policy& policy, uint32_t height )const;
   };

   struct by_beneficiary;

   /**
    * @ingroup object_index
    */
   typedef multi_index_container<
      vesting_grant_object,
      indexed_by<
         ordered_unique< tag<by_beneficiary>,
            member<vesting_grant_object, address, &vesting_grant_object::beneficiary>
         >
      >
   > vesting_grant_index;

} } // apogee::chain

FC_REFLECT(apogee::chain::linear_vesting_policy,
           (begin_height)
           (vesting_cliff_blocks)
           (vesting_duration_blocks)
          )

FC_REFLECT(apogee::chain::vesting_grant_object,
           (beneficiary)
           (total_granted)
           (total_claimed)
          )
