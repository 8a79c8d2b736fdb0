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

namespace apogee
{
namespace chain
{

void database::count_transfer(const address &from)
{
    _state.dynamic_properties.total_transfers++;

    auto &index = _state.balances.get<by_owner>();
    auto itr = index.find(from);
    if (itr == index.end())
    {
        // a zero amount transfer from an address that never held funds
        account_balance_object b;
        b.owner = from;
        b.transfer_count = 1;
        index.insert(b);
        return;
    }
    index.modify(itr, [](account_balance_object &b) {
        b.transfer_count++;
    });
}

uint32_t database::append_mission_log_entry(const mission_log_entry &entry)
{
    APOGEE_ASSERT(_state.mission_log.size() < APOGEE_MISSION_LOG_CAPACITY, mission_log_full,
                  "mission log holds ${n} entries", ("n", get_mission_log_length()));
    _state.mission_log.push_back(entry);
    return uint32_t(_state.mission_log.size() - 1);
}

} // namespace chain
} // namespace apogee
