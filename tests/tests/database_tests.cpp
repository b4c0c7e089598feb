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
#include <boost/test/unit_test.hpp>

#include <tessera/chain/database.hpp>
#include <tessera/chain/exceptions.hpp>
#include <tessera/chain/tokenized_asset_object.hpp>

#include "../common/database_fixture.hpp"

using namespace tessera::chain;

BOOST_FIXTURE_TEST_SUITE( database_tests, database_fixture )

BOOST_AUTO_TEST_CASE( undo_test )
{
   try {
      ACTOR(alice);
      object_id_type id1;
      {
         auto ses = db._undo_db.start_undo_session();
         const auto& asset = db.create<tokenized_asset_object>( [&]( tokenized_asset_object& a ) {
            a.asset_id = 7;
            a.tokenizer = alice;
         });
         id1 = asset.id;
         // abandon changes
         ses.undo();
      }
      BOOST_CHECK( db.find_tokenized_asset( 7 ) == nullptr );

      auto ses = db._undo_db.start_undo_session();
      const auto& asset = db.create<tokenized_asset_object>( [&]( tokenized_asset_object& a ) {
         a.asset_id = 7;
         a.tokenizer = alice;
      });
      BOOST_CHECK( asset.id == id1 );
   } catch ( const fc::exception& e )
   {
      edump( (e.to_detail_string()) );
      throw;
   }
}

/**
 * Check that a modifier which throws leaves the object in its index
 */
BOOST_AUTO_TEST_CASE( failed_modify_test )
{ try {
   ACTORS((alice)(bob));
   const auto& asset = tokenize( 1, "GOLD", 100, alice );
   object_id_type asset_id = asset.id;

   db.modify( asset, [&bob]( tokenized_asset_object& a ) {
      a.tokenizer = bob;
   });
   BOOST_CHECK( db.get_tokenized_asset( 1 ).tokenizer == bob );

   BOOST_CHECK_THROW( db.modify( asset, []( tokenized_asset_object& a ) {
      throw 5;
   }), int );
   BOOST_CHECK( db.find_object( asset_id ) != nullptr );
   BOOST_CHECK( db.find_tokenized_asset( 1 ) != nullptr );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( commit_keeps_changes )
{ try {
   ACTOR(alice);
   {
      auto ses = db._undo_db.start_undo_session();
      db.create<tokenized_asset_object>( [&]( tokenized_asset_object& a ) {
         a.asset_id = 3;
         a.tokenizer = alice;
         a.total_supply = 10;
      });
      BOOST_CHECK( db._undo_db.session_active() );
      ses.commit();
   }
   BOOST_CHECK( !db._undo_db.session_active() );
   BOOST_REQUIRE( db.find_tokenized_asset( 3 ) != nullptr );

   // the committed object is the starting point of the next session
   {
      auto ses = db._undo_db.start_undo_session();
      db.modify( db.get_tokenized_asset( 3 ), []( tokenized_asset_object& a ) {
         a.total_supply = 20;
      });
   }
   BOOST_CHECK( db.get_tokenized_asset( 3 ).total_supply == 10 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( undo_sessions_do_not_nest )
{ try {
   ACTOR(alice);
   auto ses = db._undo_db.start_undo_session();
   BOOST_CHECK_THROW( db._undo_db.start_undo_session(), fc::exception );

   db.create<tokenized_asset_object>( [&]( tokenized_asset_object& a ) {
      a.asset_id = 4;
      a.tokenizer = alice;
   });
   ses.undo();
   BOOST_CHECK( db.find_tokenized_asset( 4 ) == nullptr );
   BOOST_CHECK( !db._undo_db.session_active() );
} FC_LOG_AND_RETHROW() }

/**
 * An object modified and then removed in the same session comes back with the
 * value it had before the session
 */
BOOST_AUTO_TEST_CASE( undo_restores_modified_then_removed_object )
{ try {
   ACTORS((alice)(bob));
   const auto& asset = tokenize( 1, "GOLD", 100, alice );
   const object_id_type asset_id = asset.id;
   {
      auto ses = db._undo_db.start_undo_session();
      db.modify( asset, [&bob]( tokenized_asset_object& a ) {
         a.tokenizer = bob;
      });
      db.remove( db.get_tokenized_asset( 1 ) );
      BOOST_CHECK( db.find_object( asset_id ) == nullptr );
   }
   BOOST_REQUIRE( db.find_tokenized_asset( 1 ) != nullptr );
   BOOST_CHECK( db.get_tokenized_asset( 1 ).tokenizer == alice );
   BOOST_CHECK( db.get_tokenized_asset( 1 ).id == asset_id );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( failed_operation_leaves_no_trace )
{ try {
   ACTORS((alice)(bob));
   tokenize( 1, "GOLD", 1000, alice );
   const auto applied = db.get_dynamic_global_properties().applied_operations;

   transfer( 1, alice, bob, 400 );
   BOOST_CHECK_EQUAL( events.size(), 1u );

   // alice has 600 left
   TESSERA_REQUIRE_THROW( transfer( 1, alice, bob, 601 ), insufficient_balance );
   BOOST_CHECK( events.empty() );
   BOOST_CHECK( db.get_token_balance( 1, alice ) == 600 );
   BOOST_CHECK( db.get_token_balance( 1, bob ) == 400 );
   BOOST_CHECK_EQUAL( db.get_dynamic_global_properties().applied_operations, applied + 1 );
   BOOST_CHECK( !db._undo_db.session_active() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( overflow_is_reported_as_math_overflow )
{ try {
   ACTOR(alice);
   const share_type max_supply = share_from_string( "170141183460469231731687303715884105727" );
   tokenize( 1, "BIG", max_supply, alice );

   TESSERA_REQUIRE_THROW( mint( 1, 1, alice ), math_overflow );
   TESSERA_REQUIRE_THROW( mint( 1, 1, alice ), arithmetic_fault_exception );
   BOOST_CHECK( db.get_tokenized_asset( 1 ).total_supply == max_supply );
   BOOST_CHECK( db.get_token_balance( 1, alice ) == max_supply );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( genesis_is_applied_once )
{ try {
   BOOST_CHECK( db.is_initialized() );
   TESSERA_REQUIRE_THROW( db.init_genesis( genesis_state ), genesis_already_applied );

   database fresh;
   BOOST_CHECK( !fresh.is_initialized() );
   ACTOR(alice);
   TESSERA_REQUIRE_THROW( fresh.push_operation( make_tokenize_op( 1, "GOLD", 10, alice ), permissive_verifier() ),
                          genesis_not_applied );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( genesis_creates_initial_assets )
{ try {
   ACTORS((alice)(bob)(carol));
   genesis_state_type genesis;
   genesis.initial_timestamp = time_point_sec( TESSERA_TESTING_GENESIS_TIMESTAMP );
   genesis.initial_parameters.detokenization_voting_period = 3600;

   genesis_state_type::initial_tokenized_asset_type initial;
   initial.tokenize = make_tokenize_op( 5, "HOUSE", 1000, alice, 500 );
   initial.revenue_sharing_enabled = true;
   initial.whitelist = { bob, carol };
   genesis.initial_assets.push_back( initial );

   database ledger;
   ledger.init_genesis( genesis );

   const auto& asset = ledger.get_tokenized_asset( 5 );
   BOOST_CHECK_EQUAL( asset.symbol, "HOUSE" );
   BOOST_CHECK( asset.total_supply == 1000 );
   BOOST_CHECK( ledger.get_token_balance( 5, alice ) == 1000 );
   BOOST_CHECK( ledger.is_revenue_sharing_enabled( 5 ) );
   BOOST_REQUIRE_EQUAL( ledger.get_whitelist( 5 ).size(), 2u );
   BOOST_CHECK( ledger.get_whitelist( 5 )[0] == bob );
   BOOST_CHECK_EQUAL( ledger.get_chain_parameters().detokenization_voting_period, 3600u );
   BOOST_CHECK( ledger.ledger_time() == genesis.initial_timestamp );

   // genesis leaves no open session behind and turns recording on for what follows
   BOOST_CHECK( !ledger._undo_db.session_active() );
   BOOST_CHECK( ledger._undo_db.enabled() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( invalid_genesis_is_rejected )
{ try {
   ACTOR(alice);
   genesis_state_type genesis;
   genesis.initial_timestamp = time_point_sec( TESSERA_TESTING_GENESIS_TIMESTAMP );

   genesis_state_type::initial_tokenized_asset_type initial;
   initial.tokenize = make_tokenize_op( 5, "HOUSE", 1000, alice );
   genesis.initial_assets.push_back( initial );
   genesis.initial_assets.push_back( initial );

   database ledger;
   TESSERA_REQUIRE_THROW( ledger.init_genesis( genesis ), asset_already_tokenized );
   BOOST_CHECK( !ledger.is_initialized() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( ledger_time_is_monotonic )
{ try {
   const auto start = now();
   advance_time( 60 );
   BOOST_CHECK( now() == start + 60 );
   set_time( now() );
   BOOST_CHECK( now() == start + 60 );
   TESSERA_REQUIRE_THROW( set_time( start ), ledger_time_regression );
   BOOST_CHECK( now() == start + 60 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( missing_authority_is_rejected )
{ try {
   ACTORS((alice)(mallory));
   TESSERA_REQUIRE_THROW( push_as( make_tokenize_op( 1, "GOLD", 100, alice ), mallory ), missing_authority );
   TESSERA_REQUIRE_THROW( push_as( make_tokenize_op( 1, "GOLD", 100, alice ), mallory ), unauthorized_exception );
   BOOST_CHECK( db.find_tokenized_asset( 1 ) == nullptr );

   push_as( make_tokenize_op( 1, "GOLD", 100, alice ), alice );
   BOOST_CHECK( db.find_tokenized_asset( 1 ) != nullptr );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( observers_may_push_operations )
{ try {
   ACTORS((alice)(bob));
   tokenize( 1, "GOLD", 100, alice );

   // Observers run after the operation committed, a nested push is an ordinary operation
   bool pushed = false;
   boost::signals2::scoped_connection c = db.applied_operation.connect(
      [&]( const operation& op, const operation_result& ) {
         if( op.which() == operation::tag<token_transfer_operation>::value && !pushed )
         {
            pushed = true;
            token_transfer_operation back;
            back.asset_id = 1;
            back.from = bob;
            back.to = alice;
            back.amount = 10;
            db.push_operation( back, permissive_verifier() );
         }
      });

   transfer( 1, alice, bob, 30 );
   BOOST_CHECK( pushed );
   BOOST_CHECK( db.get_token_balance( 1, bob ) == 20 );
   BOOST_CHECK( db.get_token_balance( 1, alice ) == 80 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( events_are_emitted_after_commit )
{ try {
   ACTORS((alice)(bob));
   tokenize( 1, "GOLD", 100, alice );
   BOOST_REQUIRE_EQUAL( events.size(), 1u );
   BOOST_CHECK_EQUAL( events[0].topic, "token" );
   BOOST_CHECK_EQUAL( events[0].name, "tokenized" );
   BOOST_CHECK_EQUAL( events[0].payload["symbol"].as_string(), "GOLD" );

   transfer( 1, alice, bob, 25 );
   BOOST_REQUIRE_EQUAL( count_events( "token", "transferred" ), 1u );
   BOOST_CHECK_EQUAL( events[0].payload["amount"].as_int64(), 25 );
   BOOST_CHECK_EQUAL( events[0].payload["to"].as_string(), "bob" );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( index_is_registered_once )
{ try {
   const auto& idx = db.get_index_type< primary_index<tokenized_asset_index> >();
   BOOST_CHECK_EQUAL( idx.object_type_id(), uint8_t(tokenized_asset_object_type) );
   BOOST_CHECK_THROW( db.add_index< primary_index<tokenized_asset_index> >(), fc::exception );
   BOOST_CHECK( &db.get_index_type< primary_index<tokenized_asset_index> >() == &idx );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
