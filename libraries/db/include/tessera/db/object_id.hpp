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
#include <fc/reflect/reflect.hpp>
#include <fc/string.hpp>
#include <fc/variant.hpp>

#include <string>

namespace tessera { namespace db {

   /**
    *  An object id packs the space, the type and the instance number of an object
    *  into a single 64 bit number.  The space and type select the index the object
    *  lives in, the instance is assigned sequentially by that index.
    */
   struct object_id_type
   {
      static constexpr uint8_t instance_bits = 48;
      static constexpr uint8_t type_and_instance_bits = 56;
      static constexpr uint64_t one_byte_mask = 0x00ff;
      static constexpr uint64_t max_instance = 0x0000ffffffffffff;

      object_id_type() = default;
      object_id_type( uint8_t s, uint8_t t, uint64_t i ){ reset( s, t, i ); }

      void reset( uint8_t s, uint8_t t, uint64_t i )
      {
         FC_ASSERT( i >> instance_bits == 0, "instance overflow", ("instance",i) );
         number = ( (uint64_t(s) << type_and_instance_bits) | (uint64_t(t) << instance_bits) ) | i;
      }

      uint8_t  space()const      { return number >> type_and_instance_bits; }
      uint8_t  type()const       { return (number >> instance_bits) & one_byte_mask; }
      uint64_t instance()const   { return number & max_instance; }
      bool     is_null()const    { return 0 == number; }

      friend bool  operator == ( const object_id_type& a, const object_id_type& b ) { return a.number == b.number; }
      friend bool  operator != ( const object_id_type& a, const object_id_type& b ) { return a.number != b.number; }
      friend bool  operator <  ( const object_id_type& a, const object_id_type& b ) { return a.number < b.number; }
      friend bool  operator >  ( const object_id_type& a, const object_id_type& b ) { return a.number > b.number; }

      object_id_type& operator++() { ++number; return *this; }

      friend size_t hash_value( const object_id_type& v ) { return std::hash<uint64_t>()(v.number); }

      explicit operator std::string() const
      {
         return fc::to_string(space()) + "." + fc::to_string(type()) + "." + fc::to_string(instance());
      }

      uint64_t number = 0;
   };

} } // tessera::db

FC_REFLECT( tessera::db::object_id_type, (number) )

namespace fc {

   inline void to_variant( const tessera::db::object_id_type& var, fc::variant& vo, uint32_t max_depth = 1 )
   {
      vo = std::string( var );
   }

   inline void from_variant( const fc::variant& var, tessera::db::object_id_type& vo, uint32_t max_depth = 1 )
   { try {
      const auto& s = var.get_string();
      auto first_dot = s.find('.');
      FC_ASSERT( first_dot != std::string::npos && first_dot != 0, "Missing the space part" );
      auto second_dot = s.find('.',first_dot+1);
      FC_ASSERT( second_dot != std::string::npos && second_dot != first_dot+1, "Missing the type part" );
      auto space_id = fc::to_uint64( s.substr( 0, first_dot ) );
      FC_ASSERT( space_id <= tessera::db::object_id_type::one_byte_mask, "space overflow" );
      auto type_id = fc::to_uint64( s.substr( first_dot+1, (second_dot-first_dot)-1 ) );
      FC_ASSERT( type_id <= tessera::db::object_id_type::one_byte_mask, "type overflow" );
      vo.reset( static_cast<uint8_t>(space_id), static_cast<uint8_t>(type_id), fc::to_uint64( s.substr( second_dot+1 ) ) );
   } FC_CAPTURE_AND_RETHROW( (var) ) }

} // namespace fc

namespace std {
   template <> struct hash<tessera::db::object_id_type>
   {
      size_t operator()( const tessera::db::object_id_type& x ) const
      {
         return std::hash<uint64_t>()(x.number);
      }
   };
}
