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
#include <apogee/chain/vesting_grant_object.hpp>

namespace apogee { namespace chain {

bool linear_vesting_policy::is_past_cliff( uint32_t height )const
{
   return has_started( height )
       && uint64_t( height ) >= uint64_t( begin_height ) + vesting_cliff_blocks;
}

share_type linear_vesting_policy::get_vested( const share_type& total_granted, uint32_t height )const
{
   share_type total_vested = 0;

   if( is_past_cliff( height ) )
   {
      const uint64_t elapsed_blocks = uint64_t( height ) - begin_height - vesting_cliff_blocks;
      if( elapsed_blocks < vesting_duration_blocks )
      {
         total_vested = ( fc::uint128_t( total_granted.value ) * elapsed_blocks / vesting_duration_blocks ).to_uint64();
      }
      else
      {
         total_vested = total_granted;
      }
   }

   return total_vested;
}

share_type vesting_grant_object::get_allowed_claim( const linear_vesting_policy& policy, uint32_t height )const
{
   const share_type total_vested = policy.get_vested( total_granted, height );
   if( total_claimed >= total_vested )
      return share_type( 0 );
   return total_vested - total_claimed;
}

} } // apogee::chain
