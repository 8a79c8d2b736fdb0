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

#include <apogee/chain/protocol/types.hpp>

namespace apogee { namespace chain {

   /**
    * @brief One record of the mission log
    * @ingroup object
    *
    * Entries live in an append only sequence of at most
    * APOGEE_MISSION_LOG_CAPACITY elements. The position of an entry is its
    * index and never changes.
    *
    * @note this object is READ ONLY it can never be modified
    */
   class mission_log_entry
   {
      public:
         /** the height of the call that wrote this entry */
         uint32_t          height = 0;
         uint64_t          value = 0;
         mission_tag_type  tag;
   };

} } // apogee::chain

FC_REFLECT( apogee::chain::mission_log_entry, (height)(value)(tag) )
