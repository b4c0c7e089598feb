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
#include <tessera/chain/detokenization_object.hpp>

#include "../common/database_fixture.hpp"

using namespace tessera::chain;

BOOST_FIXTURE_TEST_SUITE( detokenization_tests, database_fixture )

BOOST_AUTO_TEST_CASE( execute_requires_passed_vote )
{ try {
   ACTORS((alice)(bob));
   tokenize( 42, "ACME", 1000, alice, 500 );
   transfer( 42, alice, bob, 400 );
   BOOST_CHECK( db.get_detokenization_status( 42 ) == detokenization_none );
   BOOST_CHECK( !db.is_detokenization_active( 42 ) );

   proposal_id_type p = propose_detokenization( 42, bob );
   BOOST_CHECK_EQUAL( p, proposal_id_type(TESSERA_FIRST_PROPOSAL_ID) );
   BOOST_CHECK_EQUAL( count_events( "detokenize", "proposed" ), 1u );
   BOOST_CHECK( db.get_detokenization_status( 42 ) == detokenization_proposed );
   BOOST_CHECK( db.is_detokenization_active( 42 ) );
   const auto& proposal = db.get_detokenization_proposal( 42 );
   BOOST_CHECK( proposal.proposer == bob );
   BOOST_CHECK( proposal.voting_deadline == now() + db.get_chain_parameters().detokenization_voting_period );

   TESSERA_REQUIRE_THROW( execute_detokenization( 42, p ), detokenization_not_approved );
   vote( 42, p, bob );
   TESSERA_REQUIRE_THROW( execute_detokenization( 42, p ), detokenization_not_approved );
   BOOST_CHECK( !db.get_tokenized_asset( 42 ).detokenized );

   vote( 42, p, alice );
   BOOST_CHECK( db.get_detokenization_status( 42 ) == detokenization_passed );
   execute_detokenization( 42, p );
   BOOST_CHECK_EQUAL( count_events( "detokenize", "executed" ), 1u );
   BOOST_CHECK( db.get_tokenized_asset( 42 ).detokenized );
   BOOST_CHECK( db.get_detokenization_status( 42 ) == detokenization_executed );
   BOOST_CHECK( !db.is_detokenization_active( 42 ) );
   BOOST_CHECK( db.get_detokenization_proposal( 42 ).executed_at == now() );

   TESSERA_REQUIRE_THROW( execute_detokenization( 42, p ), detokenization_not_approved );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( execute_checks_the_proposal )
{ try {
   ACTORS((alice));
   tokenize( 42, "ACME", 1000, alice );
   TESSERA_REQUIRE_THROW( execute_detokenization( 42, 1 ), proposal_not_found );
   proposal_id_type p = propose_detokenization( 42, alice );
   TESSERA_REQUIRE_THROW( execute_detokenization( 42, p + 1 ), proposal_not_found );
   TESSERA_REQUIRE_THROW( execute_detokenization( 99, p ), asset_not_tokenized );
   TESSERA_REQUIRE_THROW( execute_detokenization( 42, 0 ), invalid_proposal );
   TESSERA_REQUIRE_THROW( db.get_detokenization_proposal( 7 ), proposal_not_found );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( one_open_proposal_per_asset )
{ try {
   ACTORS((alice)(bob));
   tokenize( 42, "ACME", 1000, alice, 500 );
   tokenize( 43, "BOLT", 1000, bob );
   proposal_id_type p = propose_detokenization( 42, alice );
   TESSERA_REQUIRE_THROW( propose_detokenization( 42, bob ), detokenization_already_proposed );

   // ids are unique across assets
   proposal_id_type q = propose_detokenization( 43, bob );
   BOOST_CHECK( q != p );

   vote( 42, p, alice );
   BOOST_CHECK( db.get_detokenization_status( 42 ) == detokenization_passed );
   TESSERA_REQUIRE_THROW( propose_detokenization( 42, alice ), detokenization_already_proposed );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( expired_proposal_is_rejected_and_replaceable )
{ try {
   ACTORS((alice)(bob));
   tokenize( 42, "ACME", 1000, alice, 800 );
   transfer( 42, alice, bob, 300 );
   proposal_id_type p = propose_detokenization( 42, alice );
   vote( 42, p, bob );

   advance_time( db.get_chain_parameters().detokenization_voting_period - 1 );
   BOOST_CHECK( db.get_detokenization_status( 42 ) == detokenization_proposed );
   advance_time( 1 );
   BOOST_CHECK( db.get_detokenization_status( 42 ) == detokenization_rejected );
   BOOST_CHECK( !db.is_detokenization_active( 42 ) );

   TESSERA_REQUIRE_THROW( vote( 42, p, alice ), voting_period_ended );
   TESSERA_REQUIRE_THROW( execute_detokenization( 42, p ), detokenization_not_approved );

   proposal_id_type p2 = propose_detokenization( 42, bob );
   BOOST_CHECK( p2 > p );
   BOOST_CHECK( db.get_detokenization_status( 42 ) == detokenization_proposed );
   TESSERA_REQUIRE_THROW( execute_detokenization( 42, p ), proposal_not_found );

   // bob may vote again on the new proposal
   vote( 42, p2, bob );
   vote( 42, p2, alice );
   execute_detokenization( 42, p2 );
   BOOST_CHECK( db.get_tokenized_asset( 42 ).detokenized );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( passed_proposal_can_be_executed_after_deadline )
{ try {
   ACTORS((alice));
   tokenize( 42, "ACME", 1000, alice, 500 );
   proposal_id_type p = propose_detokenization( 42, alice );
   vote( 42, p, alice );
   advance_time( db.get_chain_parameters().detokenization_voting_period + 60 );
   BOOST_CHECK( db.get_detokenization_status( 42 ) == detokenization_passed );
   execute_detokenization( 42, p );
   BOOST_CHECK( db.get_detokenization_status( 42 ) == detokenization_executed );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( detokenized_asset_is_frozen )
{ try {
   ACTORS((alice)(bob));
   tokenize( 42, "ACME", 1000, alice, 500 );
   transfer( 42, alice, bob, 100 );
   set_revenue_sharing( 42, true, alice );
   distribute( 42, 1000, alice );
   proposal_id_type p = propose_detokenization( 42, alice );
   vote( 42, p, alice );
   execute_detokenization( 42, p );

   TESSERA_REQUIRE_THROW( mint( 42, 10, alice ), asset_not_tokenized );
   TESSERA_REQUIRE_THROW( burn( 42, 10, alice ), asset_not_tokenized );
   TESSERA_REQUIRE_THROW( transfer( 42, alice, bob, 10 ), asset_not_tokenized );
   TESSERA_REQUIRE_THROW( lock( 42, bob, now() + 60, alice ), asset_not_tokenized );
   TESSERA_REQUIRE_THROW( distribute( 42, 100, alice ), asset_not_tokenized );
   TESSERA_REQUIRE_THROW( propose_detokenization( 42, alice ), asset_not_tokenized );
   TESSERA_REQUIRE_THROW( vote( 42, p, bob ), voting_period_ended );
   TESSERA_REQUIRE_THROW( tokenize( 42, "ACME", 1000, alice ), asset_already_tokenized );

   // the record and accrued dividends stay readable
   BOOST_CHECK( db.get_token_balance( 42, bob ) == 100 );
   BOOST_CHECK( db.get_ownership_percentage( 42, bob ) == 1000 );
   BOOST_CHECK( claim( 42, bob ) == 100 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
