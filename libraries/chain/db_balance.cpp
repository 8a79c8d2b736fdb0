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
#include <apogee/chain/exceptions.hpp>

#include <boost/tuple/tuple.hpp>

namespace apogee
{
namespace chain
{

share_type database::get_balance(const address &owner) const
{
    const auto &index = _state.balances.get<by_owner>();
    auto itr = index.find(owner);
    if (itr == index.end())
        return share_type(0);
    return itr->balance;
}

share_type database::get_allowance(const address &owner, const address &spender) const
{
    const auto &index = _state.allowances.get<by_owner_spender>();
    auto itr = index.find(boost::make_tuple(owner, spender));
    if (itr == index.end())
        return share_type(0);
    return itr->amount;
}

void database::debit_balance(const address &account, const share_type &amount)
{
    try
    {
        auto &index = _state.balances.get<by_owner>();
        auto itr = index.find(account);
        const share_type available = itr == index.end() ? share_type(0) : itr->balance;
        APOGEE_ASSERT(available >= amount, insufficient_balance,
                      "Insufficient Balance: ${a}'s balance of ${b} is less than required ${r}",
                      ("a", account)("b", available)("r", amount));
        if (amount == share_type(0))
            return;
        const share_type new_balance = available - amount;
        index.modify(itr, [&new_balance](account_balance_object &b) {
            b.balance = new_balance;
        });
    }
    FC_CAPTURE_AND_RETHROW((account)(amount))
}

void database::credit_balance(const address &account, const share_type &amount)
{
    try
    {
        auto &index = _state.balances.get<by_owner>();
        auto itr = index.find(account);
        if (itr == index.end())
        {
            account_balance_object b;
            b.owner = account;
            b.balance = amount;
            index.insert(b);
            return;
        }
        const share_type new_balance = itr->balance + amount;
        index.modify(itr, [&new_balance](account_balance_object &b) {
            b.balance = new_balance;
        });
    }
    FC_CAPTURE_AND_RETHROW((account)(amount))
}

void database::transfer_balance(const address &from, const address &to, const share_type &amount)
{
    debit_balance(from, amount);
    credit_balance(to, amount);

    transfer_event e;
    e.from = from;
    e.to = to;
    e.amount = amount;
    push_event(e);
}

void database::set_allowance(const address &owner, const address &spender, const share_type &amount)
{
    auto &index = _state.allowances.get<by_owner_spender>();
    auto itr = index.find(boost::make_tuple(owner, spender));
    if (itr == index.end())
    {
        allowance_object a;
        a.owner = owner;
        a.spender = spender;
        a.amount = amount;
        index.insert(a);
    }
    else
    {
        index.modify(itr, [&amount](allowance_object &a) {
            a.amount = amount;
        });
    }
}

} // namespace chain
} // namespace apogee
