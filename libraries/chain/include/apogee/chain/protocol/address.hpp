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

#include <apogee/chain/config.hpp>

#include <fc/crypto/ripemd160.hpp>

#include <string>

namespace apogee { namespace chain {

   /**
    *  @brief a 160 bit account identifier
    *
    *  The textual form is APOGEE_ADDRESS_PREFIX followed by 40 hex digits. Parsing
    *  accepts either case; formatting always emits lower case.
    *
    *  A default constructed address is the null address (all zero bytes). The null
    *  address never holds a balance and is rejected as a recipient.
    */
   class address
   {
      public:
       address(); ///< constructs empty / null address
       explicit address( const std::string& hexstr ); ///< parses "0x" + 40 hex digits
       explicit address( const fc::ripemd160& a ) : addr( a ) {}

       static bool is_valid( const std::string& hexstr );

       bool is_null()const { return addr == fc::ripemd160(); }

       explicit operator std::string()const;

       fc::ripemd160 addr;
   };
   inline bool operator == ( const address& a, const address& b ) { return a.addr == b.addr; }
   inline bool operator != ( const address& a, const address& b ) { return a.addr != b.addr; }
   inline bool operator <  ( const address& a, const address& b ) { return a.addr <  b.addr; }

} } // namespace apogee::chain

namespace fc
{
   void to_variant( const apogee::chain::address& var,  fc::variant& vo );
   void from_variant( const fc::variant& var,  apogee::chain::address& vo );
}

namespace std
{
   template<>
   struct hash<apogee::chain::address>
   {
       public:
         size_t operator()(const apogee::chain::address &a) const
         {
            return (uint64_t(a.addr._hash[0])<<32) | uint64_t( a.addr._hash[1] );
         }
   };
}

#include <fc/reflect/reflect.hpp>
FC_REFLECT( apogee::chain::address, (addr) )
