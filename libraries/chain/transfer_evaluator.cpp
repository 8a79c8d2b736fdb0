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
#include <apogee/chain/transfer_evaluator.hpp>
#include <apogee/chain/database.hpp>
#include <apogee/chain/exceptions.hpp>

namespace apogee
{
namespace chain
{
void_result transfer_evaluator::do_evaluate(const transfer_operation &op)
{
  try
  {
    const database &d = db();

    APOGEE_ASSERT(!caller().is_null(), invalid_recipient,
                  "cannot transfer from the null address", ("to", op.to));

    const share_type balance = d.get_balance(caller());
    APOGEE_ASSERT(balance >= op.amount, insufficient_balance,
                  "Insufficient Balance: ${balance}, unable to transfer '${total_transfer}' from '${a}' to '${t}'",
                  ("a", caller())("t", op.to)("total_transfer", op.amount)("balance", balance));

    return void_result();
  }
  FC_CAPTURE_AND_RETHROW((op))
}

void_result transfer_evaluator::do_apply(const transfer_operation &o)
{
  try
  {
    database &d = db();
    d.transfer_balance(caller(), o.to, o.amount);
    d.count_transfer(caller());
    return void_result();
  }
  FC_CAPTURE_AND_RETHROW((o))
}

void_result approve_evaluator::do_evaluate(const approve_operation &op)
{
  return void_result();
}

void_result approve_evaluator::do_apply(const approve_operation &o)
{
  try
  {
    database &d = db();
    d.set_allowance(caller(), o.spender, o.amount);

    approval_event e;
    e.owner = caller();
    e.spender = o.spender;
    e.amount = o.amount;
    d.push_event(e);
    return void_result();
  }
  FC_CAPTURE_AND_RETHROW((o))
}

void_result transfer_from_evaluator::do_evaluate(const transfer_from_operation &op)
{
  try
  {
    const database &d = db();

    APOGEE_ASSERT(op.from != d.get_ledger_properties().escrow, unauthorized,
                  "funds held in the vesting escrow cannot be spent", ("from", op.from));

    const share_type allowance = d.get_allowance(op.from, caller());
    unlimited_allowance = allowance.value == APOGEE_UNLIMITED_ALLOWANCE;
    if (!unlimited_allowance)
    {
      APOGEE_ASSERT(allowance >= op.amount, insufficient_allowance,
                    "${spender} may move ${allowance} from ${from}, requested ${amount}",
                    ("spender", caller())("from", op.from)("allowance", allowance)("amount", op.amount));
      remaining_allowance = allowance - op.amount;
    }

    APOGEE_ASSERT(!op.from.is_null() && !op.to.is_null(), invalid_recipient,
                  "cannot transfer between ${from} and ${to}", ("from", op.from)("to", op.to));

    const share_type balance = d.get_balance(op.from);
    APOGEE_ASSERT(balance >= op.amount, insufficient_balance,
                  "Insufficient Balance: ${balance}, unable to transfer '${total_transfer}' from '${a}' to '${t}'",
                  ("a", op.from)("t", op.to)("total_transfer", op.amount)("balance", balance));

    return void_result();
  }
  FC_CAPTURE_AND_RETHROW((op))
}

void_result transfer_from_evaluator::do_apply(const transfer_from_operation &o)
{
  try
  {
    database &d = db();
    if (!unlimited_allowance)
      d.set_allowance(o.from, caller(), remaining_allowance);

    d.transfer_balance(o.from, o.to, o.amount);
    d.count_transfer(o.from);
    return void_result();
  }
  FC_CAPTURE_AND_RETHROW((o))
}

} // namespace chain
} // namespace apogee
