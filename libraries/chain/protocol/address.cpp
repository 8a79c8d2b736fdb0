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
#include <apogee/chain/protocol/address.hpp>

#include <fc/exception/exception.hpp>

#include <algorithm>
#include <cctype>

namespace apogee { namespace chain {

   address::address(){}

   address::address( const std::string& hexstr )
   {
      FC_ASSERT( is_valid( hexstr ), "invalid address: ${a}", ("a", hexstr) );
      addr = fc::ripemd160( hexstr.substr( sizeof( APOGEE_ADDRESS_PREFIX ) - 1 ) );
   }

   bool address::is_valid( const std::string& hexstr )
   {
      std::string prefix( APOGEE_ADDRESS_PREFIX );
      if( hexstr.size() != prefix.size() + 2 * APOGEE_ADDRESS_SIZE )
         return false;
      if( hexstr.compare( 0, prefix.size(), prefix ) != 0 )
         return false;
      return std::all_of( hexstr.begin() + prefix.size(), hexstr.end(),
                          []( char c ) { return std::isxdigit( static_cast<unsigned char>( c ) ) != 0; } );
   }

   address::operator std::string()const
   {
      return APOGEE_ADDRESS_PREFIX + addr.str();
   }

} } // namespace apogee::chain

namespace fc
{
    void to_variant( const apogee::chain::address& var,  variant& vo )
    {
        vo = std::string(var);
    }
    void from_variant( const variant& var,  apogee::chain::address& vo )
    {
        vo = apogee::chain::address( var.as_string() );
    }
}
