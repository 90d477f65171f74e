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
#include <levy/protocol/types.hpp>

#include <fc/exception/exception.hpp>

#include <limits>

namespace levy { namespace protocol {

share_type scaled_precision( uint8_t decimals )
{
   FC_ASSERT( decimals <= LEVY_MAX_DECIMALS, "Too many decimals", ("decimals",decimals) );
   share_type result = 1;
   for( uint8_t i = 0; i < decimals; ++i )
      result *= 10;
   return result;
}

share_type max_share_amount()
{
   return std::numeric_limits<share_type>::max();
}

} } // levy::protocol

namespace fc {

void to_variant( const levy::protocol::share_type& var, fc::variant& vo, uint32_t max_depth )
{
   vo = var.str();
}

void from_variant( const fc::variant& var, levy::protocol::share_type& vo, uint32_t max_depth )
{ try {
   if( var.is_string() )
   {
      const auto& s = var.get_string();
      FC_ASSERT( !s.empty() && s.find_first_not_of( "0123456789" ) == std::string::npos,
                 "Amount must be a non-negative decimal integer" );
      vo = levy::protocol::share_type( s );
   }
   else if( var.is_uint64() )
      vo = var.as_uint64();
   else
   {
      FC_ASSERT( var.is_int64() && var.as_int64() >= 0, "Amount must be a non-negative integer" );
      vo = static_cast<uint64_t>( var.as_int64() );
   }
} FC_CAPTURE_AND_RETHROW( (var) ) }

} // fc
