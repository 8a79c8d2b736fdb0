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

#include <cstdint>
#include <limits>

#define APOGEE_TOKEN_NAME "Apogee"
#define APOGEE_SYMBOL "APG"
#define APOGEE_DECIMALS 18

#define APOGEE_ADDRESS_PREFIX "0x"
#define APOGEE_ADDRESS_SIZE 20
/** conventional unspendable sink used when no burn target is configured */
#define APOGEE_DEAD_ADDRESS "0x000000000000000000000000000000000000dEaD"

/** percentage fields are fixed point with a denominator of 10,000 */
#define APOGEE_100_PERCENT 10000
#define APOGEE_1_PERCENT (APOGEE_100_PERCENT / 100)

/** trajectory commit split of the authority balance, in basis points */
#define APOGEE_LIQUIDITY_RESERVE_BPS 892 ///< 8.92%
#define APOGEE_TREASURY_BPS 108          ///< 1.08%

#define APOGEE_VESTING_CLIFF_BLOCKS 720      ///< nothing is claimable before start + cliff
#define APOGEE_VESTING_DURATION_BLOCKS 7776  ///< linear release window after the cliff

#define APOGEE_MISSION_LOG_CAPACITY 1992

/** an allowance equal to this value is never decremented by transfer_from */
#define APOGEE_UNLIMITED_ALLOWANCE (std::numeric_limits<uint64_t>::max())

#define APOGEE_MAX_SHARE_SUPPLY (std::numeric_limits<uint64_t>::max())
