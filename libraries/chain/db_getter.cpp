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

const ledger_property_object &database::get_ledger_properties() const
{
  return _state.properties;
}

const dynamic_launch_property_object &database::get_dynamic_properties() const
{
  return _state.dynamic_properties;
}

string database::get_name() const
{
  return APOGEE_TOKEN_NAME;
}

string database::get_symbol() const
{
  return APOGEE_SYMBOL;
}

uint8_t database::get_decimals() const
{
  return APOGEE_DECIMALS;
}

share_type database::get_total_supply() const
{
  return _state.properties.total_supply;
}

uint32_t database::get_launch_unlock_height() const
{
  return _state.properties.launch_unlock_height;
}

bool database::is_launch_unlocked(uint32_t height) const
{
  return height >= _state.properties.launch_unlock_height;
}

launch_phase database::get_phase() const
{
  return _state.dynamic_properties.phase;
}

bool database::is_trajectory_committed() const
{
  return _state.dynamic_properties.trajectory_committed;
}

share_type database::get_total_burned() const
{
  return _state.dynamic_properties.total_burned;
}

uint64_t database::get_total_transfers() const
{
  return _state.dynamic_properties.total_transfers;
}

uint64_t database::get_transfer_count(const address &owner) const
{
  const auto &index = _state.balances.get<by_owner>();
  auto itr = index.find(owner);
  if (itr == index.end())
    return 0;
  return itr->transfer_count;
}

uint32_t database::get_mission_log_length() const
{
  return uint32_t(_state.mission_log.size());
}

const mission_log_entry &database::get_mission_log_entry(uint32_t index) const
{
  APOGEE_ASSERT(index < _state.mission_log.size(), index_out_of_bounds,
                "mission log index ${i} is out of bounds, length is ${l}",
                ("i", index)("l", get_mission_log_length()));
  return _state.mission_log[index];
}

const vesting_grant_object *database::find_vesting_grant(const address &beneficiary) const
{
  const auto &index = _state.vesting_grants.get<by_beneficiary>();
  auto itr = index.find(beneficiary);
  if (itr == index.end())
    return nullptr;
  return &*itr;
}

share_type database::get_claimable_vested(const address &beneficiary, uint32_t height) const
{
  const vesting_grant_object *grant = find_vesting_grant(beneficiary);
  if (grant == nullptr)
    return share_type(0);
  return grant->get_allowed_claim(_state.properties.vesting_policy, height);
}

share_type database::get_escrow_balance() const
{
  return get_balance(_state.properties.escrow);
}

ledger_snapshot database::get_snapshot() const
{
  ledger_snapshot result;
  result.properties = _state.properties;
  result.dynamic_properties = _state.dynamic_properties;
  result.balances.assign(_state.balances.begin(), _state.balances.end());
  result.allowances.assign(_state.allowances.begin(), _state.allowances.end());
  result.vesting_grants.assign(_state.vesting_grants.begin(), _state.vesting_grants.end());
  result.mission_log = _state.mission_log;
  return result;
}

} // namespace chain
} // namespace apogee
