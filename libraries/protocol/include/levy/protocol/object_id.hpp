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
#include <fc/exception/exception.hpp>
#include <fc/variant.hpp>
#include <fc/string.hpp>

#include <cstdint>
#include <functional>
#include <string>

namespace levy { namespace db {

   /**
    * @brief a typed reference to an object living in the database
    *
    * Identities are written as "space.type.instance", e.g. 1.2.7 for the 8th account.
    */
   template<uint8_t SpaceID, uint8_t TypeID>
   struct object_id
   {
      static constexpr uint8_t  space_id = SpaceID;
      static constexpr uint8_t  type_id  = TypeID;

      object_id() = default;
      explicit object_id( uint64_t i ):instance(i)
      {
         FC_ASSERT( (instance >> 48) == 0, "instance overflow", ("instance",instance) );
      }

      friend bool  operator == ( const object_id& a, const object_id& b ) { return a.instance == b.instance; }
      friend bool  operator != ( const object_id& a, const object_id& b ) { return a.instance != b.instance; }
      friend bool  operator <  ( const object_id& a, const object_id& b ) { return a.instance < b.instance; }
      friend bool  operator >  ( const object_id& a, const object_id& b ) { return a.instance > b.instance; }

      friend size_t hash_value( const object_id& v ) { return std::hash<uint64_t>()(v.instance); }

      explicit operator std::string() const
      {
         return fc::to_string(space_id) + "." + fc::to_string(type_id) + "." + fc::to_string(instance);
      }

      uint64_t instance = 0;
   };

} } // levy::db

namespace fc {

 template<uint8_t SpaceID, uint8_t TypeID>
 void to_variant( const levy::db::object_id<SpaceID,TypeID>& var,  fc::variant& vo, uint32_t max_depth = 1 )
 {
    vo = std::string( var );
 }

 template<uint8_t SpaceID, uint8_t TypeID>
 void from_variant( const fc::variant& var,  levy::db::object_id<SpaceID,TypeID>& vo, uint32_t max_depth = 1 )
 { try {
    const auto& s = var.get_string();
    auto first_dot = s.find('.');
    FC_ASSERT( first_dot != std::string::npos && first_dot != 0, "Missing the space part" );
    auto second_dot = s.find('.',first_dot+1);
    FC_ASSERT( second_dot != std::string::npos && second_dot != first_dot+1, "Missing the type part" );
    FC_ASSERT( fc::to_uint64( s.substr( 0, first_dot ) ) == SpaceID &&
               fc::to_uint64( s.substr( first_dot+1, (second_dot-first_dot)-1 ) ) == TypeID,
               "Space.Type.0 (${SpaceID}.${TypeID}.0) doesn't match expected value ${var}",
               ("TypeID",TypeID)("SpaceID",SpaceID)("var",var) );
    vo = levy::db::object_id<SpaceID,TypeID>( fc::to_uint64( s.substr( second_dot+1 ) ) );
 } FC_CAPTURE_AND_RETHROW( (var) ) }

} // namespace fc

namespace std {
   template<uint8_t SpaceID, uint8_t TypeID>
   struct hash< levy::db::object_id<SpaceID,TypeID> >
   {
      size_t operator()( const levy::db::object_id<SpaceID,TypeID>& x ) const
      {
         return std::hash<uint64_t>()(x.instance);
      }
   };
}
