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

#include <apogee/chain/account_object.hpp>
#include <apogee/chain/global_property_object.hpp>
#include <apogee/chain/mission_log_object.hpp>
#include <apogee/chain/vesting_grant_object.hpp>

namespace apogee { namespace chain {

   /**
    * @brief The complete mutable state of one ledger
    * @ingroup implementation
    *
    * Owned by exactly one @ref database. Copyable, which is what the undo
    * session relies on.
    */
   struct ledger_state
   {
      ledger_property_object         properties;
      dynamic_launch_property_object dynamic_properties;
      account_balance_index          balances;
      allowance_index                allowances;
      vesting_grant_index            vesting_grants;
      vector<mission_log_entry>      mission_log;
   };

   /**
    * Flattened copy of a @ref ledger_state, suitable for JSON export.
    */
   struct ledger_snapshot
   {
      ledger_property_object           properties;
      dynamic_launch_property_object   dynamic_properties;
      vector<account_balance_object>   balances;
      vector<allowance_object>         allowances;
      vector<vesting_grant_object>     vesting_grants;
      vector<mission_log_entry>        mission_log;
   };

   /**
    * @brief Restores a @ref ledger_state unless committed
    *
    * Takes a full copy of the state when started. If the session is destroyed
    * without commit() the copy is put back, so a failed operation leaves no
    * trace.
    */
   class undo_session
   {
      public:
         explicit undo_session( ledger_state& state );
         undo_session( undo_session&& mv );
         ~undo_session();

         /** keep the changes made since the session started */
         void commit() { _apply_undo = false; }
         /** put the state back as it was when the session started */
         void undo();

      private:
         undo_session( const undo_session& ) = delete;
         undo_session& operator=( const undo_session& ) = delete;

         ledger_state& _state;
         ledger_state  _backup;
         bool          _apply_undo = true;
   };

} } // apogee::chain

FC_REFLECT( apogee::chain::ledger_snapshot,
            (properties)
            (dynamic_properties)
            (balances)
            (allowances)
            (vesting_grants)
            (mission_log)
          )
