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

BOOST_FIXTURE_TEST_SUITE( lock_tests, database_fixture )

/**
 * Asset 42 with supply 1000, its tokenizer locks its own balance.  Burning is refused
 * until ledger time passes the lock, afterwards the same burn succeeds.
 */
BOOST_AUTO_TEST_CASE( locked_tokens_cannot_be_burned_until_expiry )
{ try {
   ACTOR(alice);
   tokenize( 42, "ACME", 1000, alice );
   const time_point_sec until = now() + 3600;

   lock( 42, alice, until, alice );
   BOOST_CHECK( db.is_tokens_locked( 42, alice ) );
   BOOST_REQUIRE( db.get_token_lock( 42, alice ).valid() );
   BOOST_CHECK( *db.get_token_lock( 42, alice ) == until );
   BOOST_CHECK_EQUAL( count_events( "token", "locked" ), 1u );

   TESSERA_REQUIRE_THROW( burn( 42, 100, alice ), tokens_are_locked );
   BOOST_CHECK( db.get_tokenized_asset( 42 ).total_supply == 1000 );

   advance_time( 3599 );
   TESSERA_REQUIRE_THROW( burn( 42, 100, alice ), tokens_are_locked );

   // expires once ledger time reaches the lock
   advance_time( 1 );
   BOOST_CHECK( !db.is_tokens_locked( 42, alice ) );
   burn( 42, 100, alice );
   BOOST_CHECK( db.get_tokenized_asset( 42 ).total_supply == 900 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( locked_tokens_cannot_be_transferred )
{ try {
   ACTORS((alice)(bob)(carol));
   tokenize( 42, "ACME", 1000, alice );
   transfer( 42, alice, bob, 500 );

   lock( 42, bob, now() + 100, alice );
   TESSERA_REQUIRE_THROW( transfer( 42, bob, carol, 1 ), tokens_are_locked );

   // the lock gates the sender only
   transfer( 42, alice, bob, 100 );
   BOOST_CHECK( db.get_token_balance( 42, bob ) == 600 );

   // a lock is checked before the balance
   TESSERA_REQUIRE_THROW( transfer( 42, bob, carol, 601 ), tokens_are_locked );

   advance_time( 100 );
   transfer( 42, bob, carol, 600 );
   BOOST_CHECK( db.get_token_balance( 42, carol ) == 600 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( locks_keep_voting_and_dividend_weight )
{ try {
   ACTORS((alice)(bob));
   tokenize( 42, "ACME", 1000, alice, 100 );
   transfer( 42, alice, bob, 400 );
   lock( 42, bob, now() + 1000, alice );

   BOOST_CHECK( db.get_token_balance( 42, bob ) == 400 );
   BOOST_CHECK( db.get_ownership_percentage( 42, bob ) == 4000 );

   vote( 42, 7, bob );
   BOOST_CHECK( db.get_vote_tally( 42, 7 ) == 400 );

   set_revenue_sharing( 42, true, alice );
   distribute( 42, 100, alice );
   BOOST_CHECK( db.get_unclaimed_dividends( 42, bob ) == 40 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( only_tokenizer_or_holder_may_lock )
{ try {
   ACTORS((alice)(bob)(mallory));
   tokenize( 42, "ACME", 1000, alice );
   transfer( 42, alice, bob, 10 );

   TESSERA_REQUIRE_THROW( lock( 42, bob, now() + 10, mallory ), unauthorized_caller );
   BOOST_CHECK( !db.is_tokens_locked( 42, bob ) );

   // a holder may lock its own tokens
   lock( 42, bob, now() + 10, bob );
   BOOST_CHECK( db.is_tokens_locked( 42, bob ) );

   // the caller must authorize the lock
   token_lock_operation op;
   op.asset_id = 42;
   op.holder = bob;
   op.until = now() + 20;
   op.caller = alice;
   TESSERA_REQUIRE_THROW( push_as( op, bob ), missing_authority );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( lock_replaces_previous_lock )
{ try {
   ACTOR(alice);
   tokenize( 42, "ACME", 1000, alice );
   lock( 42, alice, now() + 1000, alice );
   lock( 42, alice, now() + 10, alice );
   BOOST_CHECK( *db.get_token_lock( 42, alice ) == now() + 10 );

   // a lock in the past is stored but not active
   lock( 42, alice, now() - 1, alice );
   BOOST_CHECK( db.get_token_lock( 42, alice ).valid() );
   BOOST_CHECK( !db.is_tokens_locked( 42, alice ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( unlock_is_permissionless )
{ try {
   ACTORS((alice)(bob)(anyone));
   tokenize( 42, "ACME", 1000, alice );
   transfer( 42, alice, bob, 10 );
   lock( 42, bob, now() + 1000, alice );

   token_unlock_operation op;
   op.asset_id = 42;
   op.holder = bob;
   push_as( op, anyone );
   BOOST_CHECK( !db.is_tokens_locked( 42, bob ) );
   BOOST_CHECK( !db.get_token_lock( 42, bob ).valid() );
   BOOST_CHECK_EQUAL( count_events( "token", "unlocked" ), 1u );

   // removing an absent lock is a no-op without an event
   unlock( 42, bob );
   BOOST_CHECK( events.empty() );

   TESSERA_REQUIRE_THROW( unlock( 99, bob ), asset_not_tokenized );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
