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
#include <fc/container/flat_fwd.hpp>
#include <fc/container/flat.hpp>
#include <fc/optional.hpp>
#include <fc/safe.hpp>
#include <fc/static_variant.hpp>
#include <fc/time.hpp>
#include <fc/uint128.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/reflect/variant.hpp>
#include <fc/variant.hpp>

#include <tessera/protocol/config.hpp>
#include <tessera/db/object_id.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace tessera { namespace protocol {

   using std::map;
   using std::vector;
   using std::string;
   using std::unique_ptr;
   using std::shared_ptr;

   using fc::variant;
   using fc::variant_object;
   using fc::mutable_variant_object;
   using fc::flat_set;
   using fc::flat_map;
   using fc::optional;
   using fc::safe;
   using fc::static_variant;
   using fc::time_point_sec;

   using tessera::db::object_id_type;

   /** token amounts, supplies, valuations and dividends; every operation on it is checked */
   typedef fc::safe<fc::int128_t>  share_type;

   /** identifies a physical or digital asset, assigned by the external asset registry */
   typedef uint64_t                asset_id_type;
   typedef uint64_t                proposal_id_type;

   /**
    *  @brief an opaque party able to authorize ledger operations
    *
    *  The ledger never interprets the identifier, it only compares principals and
    *  asks the host's authority_verifier whether the current request may act as one.
    */
   struct principal_type
   {
      principal_type() = default;
      explicit principal_type( const string& n ):name(n){}
      explicit principal_type( const char* n ):name(n){}

      bool is_null()const { return name.empty(); }
      void validate()const;

      friend bool operator == ( const principal_type& a, const principal_type& b ) { return a.name == b.name; }
      friend bool operator != ( const principal_type& a, const principal_type& b ) { return a.name != b.name; }
      friend bool operator <  ( const principal_type& a, const principal_type& b ) { return a.name <  b.name; }
      friend bool operator >  ( const principal_type& a, const principal_type& b ) { return a.name >  b.name; }

      string name;
   };

   /// Kind of the underlying asset.
   enum asset_category
   {
      physical = 0,
      digital  = 1,
      ASSET_CATEGORY_COUNT = 2
   };

   /**
    *  Descriptive data recorded with a tokenized asset.  Only the name is required,
    *  the hashes point at documents kept outside of the ledger.
    */
   struct token_metadata
   {
      string                  name;
      string                  description;
      asset_category          category = physical;
      optional<string>        ipfs_uri;
      optional<string>        legal_docs_hash;
      optional<string>        valuation_report_hash;
      bool                    accredited_investor_required = false;
      flat_set<string>        geographic_restrictions;

      void validate()const;
   };

   /** @return the decimal text form of a 128 bit amount */
   string      share_to_string( const share_type& s );
   /** parses the decimal text form, throws parse_error_exception on bad input */
   share_type  share_from_string( const string& s );

   bool is_valid_symbol( const string& symbol );

} }  // tessera::protocol

namespace fc {
   void to_variant( const tessera::protocol::share_type& var, fc::variant& vo, uint32_t max_depth = 1 );
   void from_variant( const fc::variant& var, tessera::protocol::share_type& vo, uint32_t max_depth = 1 );

   void to_variant( const tessera::protocol::principal_type& var, fc::variant& vo, uint32_t max_depth = 1 );
   void from_variant( const fc::variant& var, tessera::protocol::principal_type& vo, uint32_t max_depth = 1 );
}

FC_REFLECT_ENUM( tessera::protocol::asset_category, (physical)(digital)(ASSET_CATEGORY_COUNT) )

FC_REFLECT_TYPENAME( tessera::protocol::principal_type )
FC_REFLECT( tessera::protocol::token_metadata,
            (name)(description)(category)(ipfs_uri)(legal_docs_hash)(valuation_report_hash)
            (accredited_investor_required)(geographic_restrictions) )
