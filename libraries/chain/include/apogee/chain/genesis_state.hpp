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

#include <string>

namespace apogee { namespace chain {
using std::string;

/**
 * Everything the ledger needs to know at construction. The whole supply is
 * credited to @ref authority; all other parameters are immutable afterwards.
 */
struct genesis_state_type {
   share_type initial_supply;

   address authority;
   /// commit_trajectory skips the reserve transfer when this is null
   address liquidity_reserve;
   /// commit_trajectory skips the treasury transfer when this is null
   address treasury;
   /// defaults to APOGEE_DEAD_ADDRESS
   optional<address> burn_target;
   /// custody of scheduled vesting grants; must differ from every other role
   address escrow;

   uint32_t launch_unlock_height = 0;
   /// defaults to launch_unlock_height
   optional<uint32_t> vesting_start_height;

   void validate()const;

   address get_burn_target()const;
   uint32_t get_vesting_start_height()const;
};

} } // namespace apogee::chain

FC_REFLECT(apogee::chain::genesis_state_type,
           (initial_supply)
           (authority)(liquidity_reserve)(treasury)(burn_target)(escrow)
           (launch_unlock_height)(vesting_start_height))
