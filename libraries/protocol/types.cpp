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
#include <tessera/protocol/types.hpp>
#include <tessera/protocol/exceptions.hpp>

#include <boost/lexical_cast.hpp>

#include <algorithm>
#include <limits>

namespace tessera { namespace protocol {

   void principal_type::validate()const
   {
      TESSERA_ASSERT( !name.empty(), invalid_principal, "Principal must not be empty", ("principal",name) );
      TESSERA_ASSERT( name.size() <= TESSERA_MAX_PRINCIPAL_LENGTH, invalid_principal,
                      "Principal ${p} is too long", ("p",name) );
   }

   void token_metadata::validate()const
   {
      TESSERA_ASSERT( !name.empty() && name.size() <= TESSERA_MAX_NAME_LENGTH, invalid_metadata,
                      "Asset name must contain between 1 and ${max} characters", ("max",TESSERA_MAX_NAME_LENGTH) );
      TESSERA_ASSERT( description.size() <= TESSERA_MAX_DESCRIPTION_LENGTH, invalid_metadata,
                      "Asset description is too long", ("length",description.size()) );
      TESSERA_ASSERT( category < ASSET_CATEGORY_COUNT, invalid_metadata,
                      "Unknown asset category", ("category",category) );
      TESSERA_ASSERT( geographic_restrictions.size() <= TESSERA_MAX_GEOGRAPHIC_REGIONS, invalid_metadata,
                      "Too many geographic restrictions", ("count",geographic_restrictions.size()) );
      for( const auto& region : geographic_restrictions )
         TESSERA_ASSERT( !region.empty(), invalid_metadata, "Region codes must not be empty", ("region",region) );
   }

   /**
    * Valid symbols contain between TESSERA_SYMBOL_MIN_LENGTH and TESSERA_SYMBOL_MAX_LENGTH
    * characters, start with a capital letter and contain only capital letters and digits.
    */
   bool is_valid_symbol( const string& symbol )
   {
      if( symbol.size() < TESSERA_SYMBOL_MIN_LENGTH || symbol.size() > TESSERA_SYMBOL_MAX_LENGTH )
         return false;
      if( symbol.front() < 'A' || symbol.front() > 'Z' )
         return false;
      return std::all_of( symbol.begin(), symbol.end(), []( char c ) {
         return ( c >= 'A' && c <= 'Z' ) || ( c >= '0' && c <= '9' );
      } );
   }

   string share_to_string( const share_type& s )
   {
      return boost::lexical_cast<string>( s.value );
   }

   share_type share_from_string( const string& s )
   {
      try
      {
         return share_type( boost::lexical_cast<fc::int128_t>( s ) );
      }
      catch( const boost::bad_lexical_cast& )
      {
         FC_THROW_EXCEPTION( fc::parse_error_exception, "Invalid amount ${s}", ("s",s) );
      }
   }

} } // tessera::protocol

namespace fc {

   void to_variant( const tessera::protocol::share_type& var, fc::variant& vo, uint32_t max_depth )
   {
      if( var.value >= std::numeric_limits<int64_t>::min() && var.value <= std::numeric_limits<int64_t>::max() )
         vo = static_cast<int64_t>( var.value );
      else
         vo = tessera::protocol::share_to_string( var );
   }

   void from_variant( const fc::variant& var, tessera::protocol::share_type& vo, uint32_t max_depth )
   {
      FC_ASSERT( var.is_integer() || var.is_string(), "Amounts must be integers or decimal strings", ("amount",var) );
      if( var.is_string() )
         vo = tessera::protocol::share_from_string( var.get_string() );
      else if( var.is_uint64() )
         vo = fc::int128_t( var.as_uint64() );
      else
         vo = fc::int128_t( var.as_int64() );
   }

   void to_variant( const tessera::protocol::principal_type& var, fc::variant& vo, uint32_t max_depth )
   {
      vo = var.name;
   }

   void from_variant( const fc::variant& var, tessera::protocol::principal_type& vo, uint32_t max_depth )
   {
      vo.name = var.as_string();
   }

} // fc
