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

namespace apogee { namespace chain {

   class commit_trajectory_evaluator : public evaluator<commit_trajectory_evaluator>
   {
      public:
         typedef commit_trajectory_operation operation_type;

         void_result do_evaluate( const commit_trajectory_operation& o );
         allocation_result do_apply( const commit_trajectory_operation& o );

         /** computed by do_evaluate from the authority balance */
         allocation_result allocation;
   };

   class ignition_burn_evaluator : public evaluator<ignition_burn_evaluator>
   {
      public:
         typedef ignition_burn_operation operation_type;

         void_result do_evaluate( const ignition_burn_operation& o );
         share_type do_apply( const ignition_burn_operation& o );
   };

} } // apogee::chain
