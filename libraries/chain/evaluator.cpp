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
#include <apogee/chain/database.hpp>
#include <apogee/chain/evaluator.hpp>
#include <apogee/chain/exceptions.hpp>

namespace apogee
{
namespace chain
{
database &generic_evaluator::db() const
{
  return *_db;
}

operation_result generic_evaluator::start_evaluate(database &d, const call_context &ctx, const operation &op)
{
  try
  {
    _db = &d;
    _ctx = &ctx;

    if (operation_requires_authority(op))
    {
      const address &authority = d.get_ledger_properties().authority;
      APOGEE_ASSERT(ctx.caller == authority, unauthorized,
                    "${caller} is not the ledger authority",
                    ("caller", ctx.caller)("authority", authority));
    }
    // escrowed funds only leave through claim_vested
    const address &escrow = d.get_ledger_properties().escrow;
    APOGEE_ASSERT(ctx.caller != escrow, unauthorized,
                  "the vesting escrow ${escrow} cannot submit operations", ("escrow", escrow));
    operation_validate(op);

    operation_result result = evaluate(op);
    result = apply(op);
    return result;
  }
  FC_CAPTURE_AND_RETHROW((ctx))
}

} // namespace chain
} // namespace apogee
