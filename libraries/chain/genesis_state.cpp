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
#include <apogee/chain/genesis_state.hpp>
#include <apogee/chain/exceptions.hpp>

namespace apogee { namespace chain {

void genesis_state_type::validate()const
{ try {
   APOGEE_ASSERT( initial_supply > share_type(0), genesis_exception,
                  "initial supply must be positive", ("initial_supply", initial_supply) );
   APOGEE_ASSERT( !authority.is_null(), genesis_exception,
                  "authority must not be the null address", ("authority", authority) );
   APOGEE_ASSERT( !escrow.is_null(), genesis_exception,
                  "escrow must not be the null address", ("escrow", escrow) );
   APOGEE_ASSERT( escrow != authority && escrow != liquidity_reserve && escrow != treasury,
                  genesis_exception, "escrow must not share an address with another role",
                  ("escrow", escrow) );
   APOGEE_ASSERT( get_burn_target() != escrow, genesis_exception,
                  "burn target must not be the escrow", ("burn_target", get_burn_target()) );
   APOGEE_ASSERT( get_burn_target() != authority, genesis_exception,
                  "burn target must not be the authority", ("burn_target", get_burn_target()) );
   if( burn_target.valid() )
      APOGEE_ASSERT( !burn_target->is_null(), genesis_exception,
                     "burn target must not be the null address", ("burn_target", *burn_target) );
} FC_CAPTURE_AND_RETHROW( (*this) ) }

address genesis_state_type::get_burn_target()const
{
   if( burn_target.valid() )
      return *burn_target;
   return address( APOGEE_DEAD_ADDRESS );
}

uint32_t genesis_state_type::get_vesting_start_height()const
{
   if( vesting_start_height.valid() )
      return *vesting_start_height;
   return launch_unlock_height;
}

} } // namespace apogee::chain
