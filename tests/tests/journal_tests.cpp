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
#include <tessera/chain/journal.hpp>

#include <fc/io/json.hpp>

#include "../common/database_fixture.hpp"

#include <sstream>

using namespace tessera::chain;

namespace {

   // the fixture genesis is at 2020-09-13T12:26:40
   const char* const mixed_journal = R"([
      {"signers": ["alice"], "op": [3, {"asset_id": 7, "from": "alice", "to": "bob", "amount": 400}]},
      {"signers": ["alice"], "op": [3, {"asset_id": 7, "from": "bob", "to": "alice", "amount": 100}]},
      {"signers": ["bob"], "time": "2020-09-14T00:00:00",
       "op": [3, {"asset_id": 7, "from": "bob", "to": "carol", "amount": 150}]},
      {"signers": ["carol"], "op": [3, {"asset_id": 7, "from": "carol", "to": "alice", "amount": 50}]}
   ])";

   vector<journal_entry> parse_journal( const char* text )
   {
      return fc::json::from_string( text ).as<vector<journal_entry>>( TESSERA_MAX_NESTED_OBJECTS );
   }

   bool contains( const std::string& text, const std::string& part )
   {
      return text.find( part ) != std::string::npos;
   }

}

BOOST_FIXTURE_TEST_SUITE( journal_tests, database_fixture )

BOOST_AUTO_TEST_CASE( replay_continues_after_rejected_entry )
{ try {
   ACTORS((alice)(bob)(carol));
   tokenize( 7, "TOWER", 1000, alice );

   std::ostringstream out;
   const auto summary = replay_journal( db, parse_journal( mixed_journal ), journal_replay_options(), out );

   BOOST_CHECK_EQUAL( summary.processed, 4u );
   BOOST_CHECK_EQUAL( summary.applied, 3u );
   BOOST_CHECK_EQUAL( summary.rejected, 1u );

   // entry 1 moves bob's tokens with only alice's signature
   const std::string report = out.str();
   BOOST_CHECK( contains( report, "#0 ok " ) );
   BOOST_CHECK( contains( report, "#1 rejected " ) );
   BOOST_CHECK( contains( report, "(4030001)" ) );
   BOOST_CHECK( contains( report, "#2 ok " ) );
   BOOST_CHECK( contains( report, "#3 ok " ) );

   BOOST_CHECK( db.get_token_balance( 7, alice ) == 650 );
   BOOST_CHECK( db.get_token_balance( 7, bob ) == 250 );
   BOOST_CHECK( db.get_token_balance( 7, carol ) == 100 );
   BOOST_CHECK( db.ledger_time() == time_point_sec::from_iso_string( "2020-09-14T00:00:00" ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( replay_stops_at_first_rejection_when_asked )
{ try {
   ACTORS((alice)(bob)(carol));
   tokenize( 7, "TOWER", 1000, alice );
   const auto start = now();

   journal_replay_options options;
   options.stop_on_error = true;
   std::ostringstream out;
   const auto summary = replay_journal( db, parse_journal( mixed_journal ), options, out );

   BOOST_CHECK_EQUAL( summary.processed, 2u );
   BOOST_CHECK_EQUAL( summary.applied, 1u );
   BOOST_CHECK_EQUAL( summary.rejected, 1u );
   BOOST_CHECK( !contains( out.str(), "#2" ) );

   // the entry carrying a time was never reached
   BOOST_CHECK( db.ledger_time() == start );
   BOOST_CHECK( db.get_token_balance( 7, alice ) == 600 );
   BOOST_CHECK( db.get_token_balance( 7, bob ) == 400 );
   BOOST_CHECK( db.get_token_balance( 7, carol ) == 0 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( replay_rejects_clock_moving_backwards )
{ try {
   ACTORS((alice)(bob));
   tokenize( 7, "TOWER", 1000, alice );
   const auto start = now();

   const char* const journal = R"([
      {"signers": ["alice"], "time": "2020-01-01T00:00:00",
       "op": [3, {"asset_id": 7, "from": "alice", "to": "bob", "amount": 10}]}
   ])";
   std::ostringstream out;
   const auto summary = replay_journal( db, parse_journal( journal ), journal_replay_options(), out );

   BOOST_CHECK_EQUAL( summary.rejected, 1u );
   BOOST_CHECK( contains( out.str(), "(4070002)" ) );
   BOOST_CHECK( db.ledger_time() == start );
   BOOST_CHECK( db.get_token_balance( 7, bob ) == 0 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( replay_prints_events_of_applied_entries )
{ try {
   ACTORS((alice)(bob));
   tokenize( 7, "TOWER", 1000, alice );

   const char* const journal = R"([
      {"signers": ["alice"], "op": [3, {"asset_id": 7, "from": "alice", "to": "bob", "amount": 10}]}
   ])";
   journal_replay_options options;
   options.print_events = true;
   std::ostringstream out;
   const auto summary = replay_journal( db, parse_journal( journal ), options, out );

   BOOST_CHECK_EQUAL( summary.applied, 1u );
   BOOST_CHECK( contains( out.str(), "\"transferred\"" ) );

   std::ostringstream quiet;
   replay_journal( db, parse_journal( journal ), journal_replay_options(), quiet );
   BOOST_CHECK( !contains( quiet.str(), "\"transferred\"" ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
