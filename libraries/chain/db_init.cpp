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

#include <apogee/chain/launch_evaluator.hpp>
#include <apogee/chain/mission_evaluator.hpp>
#include <apogee/chain/transfer_evaluator.hpp>
#include <apogee/chain/vesting_evaluator.hpp>

namespace apogee
{
namespace chain
{

void database::initialize_evaluators()
{
    _operation_evaluators.resize(operation::count());
    register_evaluator<transfer_evaluator>();
    register_evaluator<approve_evaluator>();
    register_evaluator<transfer_from_evaluator>();
    register_evaluator<commit_trajectory_evaluator>();
    register_evaluator<ignition_burn_evaluator>();
    register_evaluator<schedule_vesting_evaluator>();
    register_evaluator<claim_vested_evaluator>();
    register_evaluator<log_mission_evaluator>();
}

void database::init_genesis(const genesis_state_type &genesis)
{
    try
    {
        FC_ASSERT(!_initialized, "genesis state was already applied");
        genesis.validate();

        ledger_property_object &p = _state.properties;
        p.total_supply = genesis.initial_supply;
        p.authority = genesis.authority;
        p.liquidity_reserve = genesis.liquidity_reserve;
        p.treasury = genesis.treasury;
        p.burn_target = genesis.get_burn_target();
        p.escrow = genesis.escrow;
        p.launch_unlock_height = genesis.launch_unlock_height;
        p.vesting_policy.begin_height = genesis.get_vesting_start_height();

        _state.dynamic_properties = dynamic_launch_property_object();

        _pending_events.clear();
        credit_balance(genesis.authority, genesis.initial_supply);
        transfer_event mint;
        mint.to = genesis.authority;
        mint.amount = genesis.initial_supply;
        push_event(mint);

        _initialized = true;
        ilog("Ledger created: ${supply} ${symbol} held by ${authority}, vesting starts at ${start}",
             ("supply", genesis.initial_supply)("symbol", APOGEE_SYMBOL)("authority", genesis.authority)
             ("start", p.vesting_policy.begin_height));

        _applied_events = std::move(_pending_events);
        _pending_events.clear();
        notify_applied_events();
    }
    FC_CAPTURE_AND_RETHROW((genesis))
}

} // namespace chain
} // namespace apogee
