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
#include <apogee/chain/mission_evaluator.hpp>
#include <apogee/chain/database.hpp>
#include <apogee/chain/exceptions.hpp>

namespace apogee { namespace chain {

void_result log_mission_evaluator::do_evaluate( const log_mission_operation& op )
{ try {
   const database& d = db();
   APOGEE_ASSERT( d.get_mission_log_length() < APOGEE_MISSION_LOG_CAPACITY, mission_log_full,
                  "mission log is full at ${n} entries", ("n", d.get_mission_log_length()) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

uint32_t log_mission_evaluator::do_apply( const log_mission_operation& op )
{ try {
   database& d = db();

   mission_log_entry entry;
   entry.height = height();
   entry.value = op.value;
   entry.tag = op.tag;
   const uint32_t index = d.append_mission_log_entry( entry );

   mission_logged_event logged;
   logged.index = index;
   logged.height = entry.height;
   logged.value = entry.value;
   logged.tag = entry.tag;
   d.push_event( logged );

   return index;
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // apogee::chain
