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
#include <fc/container/flat_fwd.hpp>
#include <fc/crypto/sha256.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/reflect/variant.hpp>
#include <fc/optional.hpp>
#include <fc/safe.hpp>
#include <fc/container/flat.hpp>
#include <fc/string.hpp>
#include <fc/uint128.hpp>
#include <fc/static_variant.hpp>

#include <memory>
#include <vector>
#include <cstdint>

#include <apogee/chain/config.hpp>
#include <apogee/chain/protocol/address.hpp>

namespace apogee
{
namespace chain
{

using std::make_pair;
using std::map;
using std::pair;
using std::set;
using std::shared_ptr;
using std::string;
using std::unique_ptr;
using std::vector;

using fc::flat_map;
using fc::flat_set;
using fc::optional;
using fc::safe;
using fc::static_variant;
using fc::variant;
using fc::variant_object;

/** token amounts; arithmetic throws on overflow and underflow instead of wrapping */
typedef safe<uint64_t> share_type;

/** opaque fixed-size label attached to a mission log entry, usually a content hash */
typedef fc::sha256 mission_tag_type;

/**
 * Launch phases. Only pre_ignition and fuel_allocated are ever entered:
 * commit_trajectory moves pre_ignition straight to fuel_allocated.
 * trajectory_lock and live are kept so that observers decoding the numeric
 * phase value see the full historical set; nothing transitions into them.
 */
enum launch_phase
{
    pre_ignition = 0,
    trajectory_lock = 1, ///< unreachable
    fuel_allocated = 2,
    live = 3             ///< unreachable
};

} // namespace chain
} // namespace apogee

FC_REFLECT_ENUM(apogee::chain::launch_phase,
                (pre_ignition)(trajectory_lock)(fuel_allocated)(live))
FC_REFLECT_TYPENAME(apogee::chain::share_type)
