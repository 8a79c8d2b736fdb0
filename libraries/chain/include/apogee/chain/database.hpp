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
#include <apogee/chain/call_context.hpp>
#include <apogee/chain/evaluator.hpp>
#include <apogee/chain/genesis_state.hpp>
#include <apogee/chain/ledger_state.hpp>
#include <apogee/chain/protocol/protocol.hpp>

#include <fc/signals.hpp>
#include <fc/log/logger.hpp>

#include <map>

namespace apogee
{
namespace chain
{
/**
    *   @class database
    *   @brief tracks the complete state of one token ledger
    *
    *   Every mutation goes through apply_operation(). Each call either applies
    *   in full, after which its events are published on applied_event, or
    *   throws and leaves the state exactly as it found it.
    *
    *   Calls are expected one at a time; the database does no locking.
    */
class database
{
  public:
    database();
    ~database();

    /**
         * @brief Creates the ledger described by @p genesis
         *
         * Credits the whole supply to the authority. Must be called exactly once,
         * before the first operation.
         */
    void init_genesis(const genesis_state_type &genesis);

    bool is_initialized() const { return _initialized; }

    /**
         * Runs @p op on behalf of @p ctx.caller at height @p ctx.height.
         * Throws the named exception of the first failed check.
         */
    operation_result apply_operation(const call_context &ctx, const operation &op);

    template <typename EvaluatorType>
    void register_evaluator()
    {
        _operation_evaluators[operation::tag<typename EvaluatorType::operation_type>::value].reset(new op_evaluator_impl<EvaluatorType>());
    }

    /**
          *  This signal is emitted once for each event of a successful
          *  operation, in the order the operation produced them. Events of
          *  failed operations are never emitted.
          */
    fc::signal<void(const ledger_event &)> applied_event;

    /** events produced by the most recent successful operation (or by init_genesis) */
    const vector<ledger_event> &get_applied_events() const { return _applied_events; }

    /// @{ @group Queries
    const ledger_property_object &get_ledger_properties() const;
    const dynamic_launch_property_object &get_dynamic_properties() const;

    string get_name() const;
    string get_symbol() const;
    uint8_t get_decimals() const;

    share_type get_total_supply() const;
    share_type get_balance(const address &owner) const;
    share_type get_allowance(const address &owner, const address &spender) const;

    uint32_t get_launch_unlock_height() const;
    bool is_launch_unlocked(uint32_t height) const;
    launch_phase get_phase() const;
    bool is_trajectory_committed() const;
    share_type get_total_burned() const;

    uint64_t get_total_transfers() const;
    uint64_t get_transfer_count(const address &owner) const;

    uint32_t get_mission_log_length() const;
    const mission_log_entry &get_mission_log_entry(uint32_t index) const;

    const vesting_grant_object *find_vesting_grant(const address &beneficiary) const;
    share_type get_claimable_vested(const address &beneficiary, uint32_t height) const;
    share_type get_escrow_balance() const;

    ledger_snapshot get_snapshot() const;
    /// @}

    /// @{ @group Mutators used by evaluators
    /**
         * Moves @p amount from @p from to @p to and records a transfer_event.
         * Throws insufficient_balance when @p from cannot cover it.
         */
    void transfer_balance(const address &from, const address &to, const share_type &amount);
    void set_allowance(const address &owner, const address &spender, const share_type &amount);
    /** bumps the global and the per-sender transfer counters */
    void count_transfer(const address &from);
    uint32_t append_mission_log_entry(const mission_log_entry &entry);

    template <typename Lambda>
    void modify(const dynamic_launch_property_object &obj, const Lambda &m)
    {
        FC_ASSERT(&obj == &_state.dynamic_properties);
        m(_state.dynamic_properties);
    }

    template <typename Lambda>
    void modify(const vesting_grant_object &obj, const Lambda &m)
    {
        auto &idx = _state.vesting_grants.get<by_beneficiary>();
        auto itr = idx.find(obj.beneficiary);
        FC_ASSERT(itr != idx.end(), "unknown vesting grant for ${b}", ("b", obj.beneficiary));
        idx.modify(itr, m);
    }

    template <typename Constructor>
    const vesting_grant_object &create_vesting_grant(const Constructor &constructor)
    {
        vesting_grant_object obj;
        constructor(obj);
        auto result = _state.vesting_grants.insert(obj);
        FC_ASSERT(result.second, "vesting grant for ${b} already exists", ("b", obj.beneficiary));
        return *result.first;
    }

    void push_event(const ledger_event &e);
    /// @}

  private:
    void initialize_evaluators();
    void debit_balance(const address &account, const share_type &amount);
    void credit_balance(const address &account, const share_type &amount);
    void notify_applied_events();

    vector<std::unique_ptr<op_evaluator>> _operation_evaluators;

    ledger_state _state;
    bool _initialized = false;

    /** events of the operation being applied; published only once it succeeds */
    vector<ledger_event> _pending_events;
    /** events of the last successful operation */
    vector<ledger_event> _applied_events;
};

} // namespace chain
} // namespace apogee
