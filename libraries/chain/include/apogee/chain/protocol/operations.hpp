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
#include <apogee/chain/protocol/transfer.hpp>
#include <apogee/chain/protocol/launch.hpp>
#include <apogee/chain/protocol/vesting.hpp>
#include <apogee/chain/protocol/mission.hpp>

namespace apogee { namespace chain {

   /**
    * @ingroup operations
    *
    * Defines the set of valid operations as a discriminated union type.
    * The position of each type is part of the external interface: append only.
    */
   typedef fc::static_variant<
            transfer_operation,
            approve_operation,
            transfer_from_operation,
            commit_trajectory_operation,
            ignition_burn_operation,
            schedule_vesting_operation,
            claim_vested_operation,
            log_mission_operation
         > operation;

   /**
    *  Performs all state independent checks of an operation.
    */
   void operation_validate( const operation& op );

   /**
    *  True when only the ledger authority may submit @p op.
    */
   bool operation_requires_authority( const operation& op );

} } // apogee::chain

FC_REFLECT_TYPENAME( apogee::chain::operation )
