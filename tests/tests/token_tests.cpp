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

#include <algorithm>

#include <tessera/chain/database.hpp>
#include <tessera/chain/exceptions.hpp>
#include <tessera/chain/tokenized_asset_object.hpp>

#include "../common/database_fixture.hpp"

using namespace tessera::chain;

BOOST_FIXTURE_TEST_SUITE( token_tests, database_fixture )

BOOST_AUTO_TEST_CASE( tokenize_credits_supply_to_tokenizer )
{ try {
   ACTOR(alice);
   const auto& asset = tokenize( 42, "ACME", 1000, alice, 500, 2 );

   BOOST_CHECK_EQUAL( asset.symbol, "ACME" );
   BOOST_CHECK( asset.total_supply == 1000 );
   BOOST_CHECK_EQUAL( asset.decimals, 2u );
   BOOST_CHECK( asset.tokenizer == alice );
   BOOST_CHECK( asset.min_voting_threshold == 500 );
   BOOST_CHECK( asset.valuation == 0 );
   BOOST_CHECK( !asset.detokenized );
   BOOST_CHECK( asset.tokenized_at == now() );

   BOOST_CHECK( db.get_token_balance( 42, alice ) == 1000 );
   auto holders = db.get_token_holders( 42 );
   BOOST_REQUIRE_EQUAL( holders.size(), 1u );
   BOOST_CHECK( holders[0] == alice );
   BOOST_CHECK_EQUAL( count_events( "token", "tokenized" ), 1u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( tokenize_rejects_duplicates_and_bad_parameters )
{ try {
   ACTORS((alice)(bob));
   tokenize( 42, "ACME", 1000, alice );

   TESSERA_REQUIRE_THROW( tokenize( 42, "OTHER", 10, bob ), asset_already_tokenized );
   TESSERA_REQUIRE_THROW( tokenize( 42, "OTHER", 10, bob ), already_exists_exception );
   TESSERA_REQUIRE_THROW( tokenize( 43, "ZERO", 0, alice ), invalid_token_supply );
   TESSERA_REQUIRE_THROW( tokenize( 43, "NEG", -5, alice ), invalid_token_supply );
   TESSERA_REQUIRE_THROW( tokenize( 43, "DEC", 10, alice, 0, 19 ), invalid_token_decimals );
   TESSERA_REQUIRE_THROW( tokenize( 43, "DEC", 10, alice, 0, 19 ), invalid_input_exception );
   BOOST_CHECK( db.find_tokenized_asset( 43 ) == nullptr );

   tokenize( 43, "DEC", 10, alice, 0, 18 );
   BOOST_CHECK_EQUAL( db.get_tokenized_asset( 43 ).decimals, 18u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( decimal_limit_follows_chain_parameters )
{ try {
   ACTOR(alice);
   genesis_state_type genesis;
   genesis.initial_timestamp = time_point_sec( TESSERA_TESTING_GENESIS_TIMESTAMP );
   genesis.initial_parameters.max_token_decimals = 6;

   database ledger;
   ledger.init_genesis( genesis );
   permissive_verifier auth;
   TESSERA_REQUIRE_THROW( ledger.push_operation( make_tokenize_op( 1, "SIX", 100, alice, 0, 7 ), auth ),
                          invalid_token_decimals );
   ledger.push_operation( make_tokenize_op( 1, "SIX", 100, alice, 0, 6 ), auth );
   BOOST_CHECK( ledger.find_tokenized_asset( 1 ) != nullptr );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( unknown_asset_is_not_tokenized )
{ try {
   ACTORS((alice)(bob));
   BOOST_CHECK( db.find_tokenized_asset( 9 ) == nullptr );
   TESSERA_REQUIRE_THROW( db.get_tokenized_asset( 9 ), asset_not_tokenized );
   TESSERA_REQUIRE_THROW( mint( 9, 10, alice ), asset_not_tokenized );
   TESSERA_REQUIRE_THROW( burn( 9, 10, alice ), asset_not_tokenized );
   TESSERA_REQUIRE_THROW( transfer( 9, alice, bob, 10 ), not_found_exception );
   TESSERA_REQUIRE_THROW( update_valuation( 9, 10, alice ), asset_not_tokenized );
   TESSERA_REQUIRE_THROW( db.get_ownership_percentage( 9, alice ), asset_not_tokenized );
   BOOST_CHECK( db.get_token_balance( 9, alice ) == 0 );
   BOOST_CHECK( db.get_token_holders( 9 ).empty() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( mint_and_burn_adjust_supply )
{ try {
   ACTORS((alice)(bob));
   tokenize( 42, "ACME", 1000, alice );

   mint( 42, 250, alice );
   BOOST_CHECK( db.get_tokenized_asset( 42 ).total_supply == 1250 );
   BOOST_CHECK( db.get_token_balance( 42, alice ) == 1250 );
   BOOST_CHECK_EQUAL( count_events( "token", "minted" ), 1u );

   burn( 42, 50, alice );
   BOOST_CHECK( db.get_tokenized_asset( 42 ).total_supply == 1200 );
   BOOST_CHECK( db.get_token_balance( 42, alice ) == 1200 );
   BOOST_CHECK_EQUAL( count_events( "token", "burned" ), 1u );

   TESSERA_REQUIRE_THROW( mint( 42, 10, bob ), unauthorized_caller );
   TESSERA_REQUIRE_THROW( burn( 42, 10, bob ), unauthorized_caller );
   TESSERA_REQUIRE_THROW( mint( 42, 0, alice ), invalid_amount );
   TESSERA_REQUIRE_THROW( burn( 42, -1, alice ), invalid_amount );
   TESSERA_REQUIRE_THROW( burn( 42, 1201, alice ), insufficient_balance );
   BOOST_CHECK( db.get_tokenized_asset( 42 ).total_supply == 1200 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( burning_everything_empties_holder_set )
{ try {
   ACTOR(alice);
   tokenize( 42, "ACME", 100, alice );
   burn( 42, 100, alice );

   BOOST_CHECK( db.get_tokenized_asset( 42 ).total_supply == 0 );
   BOOST_CHECK( db.get_token_holders( 42 ).empty() );
   TESSERA_REQUIRE_THROW( db.get_ownership_percentage( 42, alice ), asset_not_tokenized );

   mint( 42, 10, alice );
   BOOST_CHECK_EQUAL( db.get_token_holders( 42 ).size(), 1u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( ownership_percentage_in_basis_points )
{ try {
   ACTORS((tokenizer)(holder)(nobody));
   tokenize( 42, "ACME", 1000, tokenizer, 0, 2 );
   BOOST_CHECK( db.get_ownership_percentage( 42, tokenizer ) == TESSERA_100_PERCENT );

   transfer( 42, tokenizer, holder, 250 );
   BOOST_CHECK( db.get_ownership_percentage( 42, holder ) == 2500 );
   BOOST_CHECK( db.get_ownership_percentage( 42, tokenizer ) == 7500 );
   BOOST_CHECK( db.get_ownership_percentage( 42, nobody ) == 0 );

   // rounded down
   transfer( 42, tokenizer, nobody, 1 );
   BOOST_CHECK( db.get_ownership_percentage( 42, nobody ) == 10 );
   tokenize( 43, "ODD", 3, tokenizer );
   transfer( 43, tokenizer, holder, 1 );
   BOOST_CHECK( db.get_ownership_percentage( 43, holder ) == 3333 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( transfer_moves_balance_and_holder_set )
{ try {
   ACTORS((alice)(bob)(carol));
   tokenize( 42, "ACME", 1000, alice );

   transfer( 42, alice, bob, 400 );
   BOOST_CHECK( db.get_token_balance( 42, alice ) == 600 );
   BOOST_CHECK( db.get_token_balance( 42, bob ) == 400 );
   BOOST_CHECK_EQUAL( db.get_token_holders( 42 ).size(), 2u );

   // the full balance may be moved, the sender leaves the holder set
   transfer( 42, bob, carol, 400 );
   BOOST_CHECK( db.get_token_balance( 42, bob ) == 0 );
   auto holders = db.get_token_holders( 42 );
   BOOST_REQUIRE_EQUAL( holders.size(), 2u );
   BOOST_CHECK( std::find( holders.begin(), holders.end(), bob ) == holders.end() );

   // one more than the balance fails
   TESSERA_REQUIRE_THROW( transfer( 42, carol, bob, 401 ), insufficient_balance );
   TESSERA_REQUIRE_THROW( transfer( 42, carol, bob, 401 ), state_conflict_exception );
   TESSERA_REQUIRE_THROW( transfer( 42, carol, bob, 0 ), invalid_amount );
   TESSERA_REQUIRE_THROW( transfer( 42, bob, carol, 1 ), insufficient_balance );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( self_transfer_keeps_balance )
{ try {
   ACTOR(alice);
   tokenize( 42, "ACME", 1000, alice );
   transfer( 42, alice, alice, 1000 );
   BOOST_CHECK( db.get_token_balance( 42, alice ) == 1000 );
   BOOST_CHECK_EQUAL( db.get_token_holders( 42 ).size(), 1u );
   TESSERA_REQUIRE_THROW( transfer( 42, alice, alice, 1001 ), insufficient_balance );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( transfer_requires_sender_authority )
{ try {
   ACTORS((alice)(bob));
   tokenize( 42, "ACME", 1000, alice );

   token_transfer_operation op;
   op.asset_id = 42;
   op.from = alice;
   op.to = bob;
   op.amount = 10;
   TESSERA_REQUIRE_THROW( push_as( op, bob ), missing_authority );
   BOOST_CHECK( db.get_token_balance( 42, bob ) == 0 );
   push_as( op, alice );
   BOOST_CHECK( db.get_token_balance( 42, bob ) == 10 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( valuation_update )
{ try {
   ACTORS((alice)(bob));
   tokenize( 42, "ACME", 1000, alice );
   advance_time( 3600 );

   update_valuation( 42, 5000000, alice );
   const auto& asset = db.get_tokenized_asset( 42 );
   BOOST_CHECK( asset.valuation == 5000000 );
   BOOST_CHECK( asset.last_valuation_update == now() );
   BOOST_REQUIRE_EQUAL( count_events( "token", "valuation_updated" ), 1u );
   BOOST_CHECK_EQUAL( events[0].payload["old_valuation"].as_int64(), 0 );

   TESSERA_REQUIRE_THROW( update_valuation( 42, 0, alice ), invalid_valuation );
   TESSERA_REQUIRE_THROW( update_valuation( 42, -1, alice ), invalid_valuation );
   TESSERA_REQUIRE_THROW( update_valuation( 42, 10, bob ), unauthorized_caller );
   BOOST_CHECK( db.get_tokenized_asset( 42 ).valuation == 5000000 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( supply_beyond_64_bits )
{ try {
   ACTORS((alice)(bob));
   const share_type big = share_from_string( "100000000000000000000000" );
   tokenize( 42, "WIDE", big, alice, 0, 18 );
   transfer( 42, alice, bob, share_from_string( "25000000000000000000000" ) );
   BOOST_CHECK( db.get_ownership_percentage( 42, bob ) == 2500 );
   BOOST_CHECK_EQUAL( share_to_string( db.get_token_balance( 42, alice ) ), "75000000000000000000000" );

   fc::variant v( db.get_token_balance( 42, alice ), TESSERA_MAX_NESTED_OBJECTS );
   BOOST_CHECK( v.is_string() );
   share_type back;
   fc::from_variant( v, back, TESSERA_MAX_NESTED_OBJECTS );
   BOOST_CHECK( back == db.get_token_balance( 42, alice ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
