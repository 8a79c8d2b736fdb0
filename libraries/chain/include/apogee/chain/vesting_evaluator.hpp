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
#include <apogee/chain/evaluator.hpp>
#include <apogee/chain/vesting_grant_object.hpp>

namespace apogee { namespace chain {

class schedule_vesting_evaluator : public evaluator<schedule_vesting_evaluator>
{
   public:
      typedef schedule_vesting_operation operation_type;

      void_result do_evaluate( const schedule_vesting_operation& op );
      share_type do_apply( const schedule_vesting_operation& op );
};

class claim_vested_evaluator : public evaluator<claim_vested_evaluator>
{
   public:
      typedef claim_vested_operation operation_type;

      void_result do_evaluate( const claim_vested_operation& op );
      share_type do_apply( const claim_vested_operation& op );

      const vesting_grant_object* grant = nullptr;
      share_type claimable;
};

} } // apogee::chain
