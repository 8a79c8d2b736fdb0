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

namespace apogee
{
namespace chain
{

/**
    *  @defgroup operations Operations
    *  @brief A set of valid commands for mutating the ledger state.
    *
    *  An operation can be thought of like a function that will modify the shared
    *  state of the ledger. The members of each struct are like function arguments
    *  and each operation can potentially generate a return value.
    *
    *  The caller and the current height are not part of an operation: they are
    *  supplied by the host with every call as a @ref call_context.
    *
    *  Each operation is a fully defined state transition. It either applies
    *  completely or not at all.
    *
    *  @{
    */
struct void_result
{
};

/** amounts moved by a trajectory commit */
struct allocation_result
{
  share_type to_reserve;
  share_type to_treasury;
};

typedef fc::static_variant<void_result, share_type, uint32_t, allocation_result> operation_result;

struct base_operation
{
  /**
   * Checks that do not depend on ledger state. They are run before the
   * evaluator sees the operation.
   */
  void validate() const {}

  /** privileged operations override this; the ledger authority must then be the caller */
  bool requires_authority() const { return false; }
};

///@}

} // namespace chain
} // namespace apogee

FC_REFLECT(apogee::chain::void_result, )
FC_REFLECT(apogee::chain::allocation_result, (to_reserve)(to_treasury))
FC_REFLECT_TYPENAME(apogee::chain::operation_result)
