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

#include <fc/io/json.hpp>

#include <boost/preprocessor/seq/for_each.hpp>
#include <boost/preprocessor/stringize.hpp>
#include <boost/signals2/connection.hpp>
#include <boost/test/unit_test.hpp>

#include <tessera/chain/database.hpp>
#include <tessera/chain/dividend_object.hpp>
#include <tessera/chain/restriction_object.hpp>
#include <tessera/chain/vote_object.hpp>
#include <tessera/chain/detokenization_object.hpp>

#include <iostream>

using namespace tessera::db;

extern uint32_t TESSERA_TESTING_GENESIS_TIMESTAMP;

#define TESSERA_REQUIRE_THROW( expr, exc_type )           \
{                                                         \
   std::string req_throw_info = fc::json::to_string(      \
      fc::mutable_variant_object()                        \
      ("source_file", __FILE__)                           \
      ("source_lineno", __LINE__)                         \
      ("expr", #expr)                                     \
      ("exc_type", #exc_type)                             \
      );                                                  \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "TESSERA_REQUIRE_THROW begin "         \
         << req_throw_info << std::endl;                  \
   BOOST_REQUIRE_THROW( expr, exc_type );                 \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "TESSERA_REQUIRE_THROW end "           \
         << req_throw_info << std::endl;                  \
}

#define TESSERA_CHECK_THROW( expr, exc_type )             \
{                                                         \
   std::string req_throw_info = fc::json::to_string(      \
      fc::mutable_variant_object()                        \
      ("source_file", __FILE__)                           \
      ("source_lineno", __LINE__)                         \
      ("expr", #expr)                                     \
      ("exc_type", #exc_type)                             \
      );                                                  \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "TESSERA_CHECK_THROW begin "           \
         << req_throw_info << std::endl;                  \
   BOOST_CHECK_THROW( expr, exc_type );                   \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "TESSERA_CHECK_THROW end "             \
         << req_throw_info << std::endl;                  \
}

#define REQUIRE_OP_VALIDATION_FAILURE( op, field, value, exc_type ) \
{ \
   const auto temp = op.field; \
   op.field = value; \
   TESSERA_REQUIRE_THROW( op.validate(), exc_type ); \
   op.field = temp; \
}

/// Declares a principal named after the variable
#define ACTOR(name) \
   const principal_type name( BOOST_PP_STRINGIZE(name) );

#define ACTORS_IMPL(r, data, elem) ACTOR(elem)
#define ACTORS(names) BOOST_PP_SEQ_FOR_EACH(ACTORS_IMPL, ~, names)

namespace tessera { namespace chain {

struct database_fixture {
   database db;
   genesis_state_type genesis_state;
   vector<ledger_event> events;
   boost::signals2::scoped_connection event_connection;

   database_fixture();
   ~database_fixture();

   static tokenize_asset_operation make_tokenize_op( asset_id_type asset_id, const string& symbol,
                                                     share_type supply, const principal_type& tokenizer,
                                                     share_type min_voting_threshold = 0, uint32_t decimals = 2 );

   /// Pushes op as if its required authorities had signed it
   operation_result push( const operation& op );
   /// Pushes op authorized by signer alone
   operation_result push_as( const operation& op, const principal_type& signer );

   void set_time( time_point_sec t );
   void advance_time( uint32_t seconds );
   time_point_sec now()const { return db.ledger_time(); }

   const tokenized_asset_object& tokenize( asset_id_type asset_id, const string& symbol, share_type supply,
                                           const principal_type& tokenizer, share_type min_voting_threshold = 0,
                                           uint32_t decimals = 2 );
   void mint( asset_id_type asset_id, share_type amount, const principal_type& minter );
   void burn( asset_id_type asset_id, share_type amount, const principal_type& burner );
   void transfer( asset_id_type asset_id, const principal_type& from, const principal_type& to, share_type amount );
   void update_valuation( asset_id_type asset_id, share_type valuation, const principal_type& updater );
   void lock( asset_id_type asset_id, const principal_type& holder, time_point_sec until, const principal_type& caller );
   void unlock( asset_id_type asset_id, const principal_type& holder );

   void set_restriction( asset_id_type asset_id, bool require_accredited, const principal_type& issuer,
                         const flat_set<string>& geographic_allowed = flat_set<string>() );
   void clear_restriction( asset_id_type asset_id, const principal_type& issuer );
   void whitelist_add( asset_id_type asset_id, const principal_type& account, const principal_type& issuer );
   void whitelist_remove( asset_id_type asset_id, const principal_type& account, const principal_type& issuer );

   void set_revenue_sharing( asset_id_type asset_id, bool enabled, const principal_type& issuer );
   void distribute( asset_id_type asset_id, share_type amount, const principal_type& distributor );
   share_type claim( asset_id_type asset_id, const principal_type& holder );

   void vote( asset_id_type asset_id, proposal_id_type proposal_id, const principal_type& voter );
   proposal_id_type propose_detokenization( asset_id_type asset_id, const principal_type& proposer );
   void execute_detokenization( asset_id_type asset_id, proposal_id_type proposal_id );

   /// Checks that the balances of the asset add up to its supply and that only positive balances are stored
   void verify_supply_invariant( asset_id_type asset_id )const;
   /// @return how many events with the given topic and name the last successful push emitted
   size_t count_events( const string& topic, const string& name )const;
};

} }
