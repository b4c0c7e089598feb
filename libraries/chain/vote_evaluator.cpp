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
#include <tessera/chain/vote_evaluator.hpp>

#include <tessera/chain/database.hpp>
#include <tessera/chain/exceptions.hpp>
#include <tessera/chain/detokenization_object.hpp>
#include <tessera/chain/vote_object.hpp>

namespace tessera { namespace chain {

void_result vote_cast_evaluator::do_evaluate( const vote_cast_operation& op )
{ try {
   const database& d = db();

   d.get_tokenized_asset( op.asset_id );

   TESSERA_ASSERT( !d.has_voted( op.asset_id, op.proposal_id, op.voter ), already_voted,
                   "${v} has already voted on proposal ${p} of asset ${a}",
                   ("v",op.voter)("p",op.proposal_id)("a",op.asset_id) );

   const auto* proposal = d.find_detokenization_proposal( op.asset_id );
   if( proposal != nullptr && proposal->proposal_id == op.proposal_id )
      TESSERA_ASSERT( !proposal->executed && proposal->voting_open( d.ledger_time() ), voting_period_ended,
                      "Voting on proposal ${p} of asset ${a} ended at ${t}",
                      ("p",op.proposal_id)("a",op.asset_id)("t",proposal->voting_deadline) );

   weight = d.get_token_balance( op.asset_id, op.voter );
   TESSERA_ASSERT( weight > 0, insufficient_voting_power,
                   "${v} holds no tokens of asset ${a}", ("v",op.voter)("a",op.asset_id) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result vote_cast_evaluator::do_apply( const vote_cast_operation& op )
{ try {
   database& d = db();
   const auto now = d.ledger_time();

   const auto& idx = d.get_index_type<vote_tally_index>().indices().get<by_proposal>();
   auto itr = idx.find( boost::make_tuple( op.asset_id, op.proposal_id ) );
   if( itr == idx.end() )
   {
      d.create<vote_tally_object>( [&op,this]( vote_tally_object& t ) {
         t.asset_id = op.asset_id;
         t.proposal_id = op.proposal_id;
         t.total_weight = weight;
         t.voter_count = 1;
      });
   }
   else
   {
      d.modify( *itr, [this]( vote_tally_object& t ) {
         t.total_weight += weight;
         ++t.voter_count;
      });
   }

   d.create<vote_record_object>( [&op,this,now]( vote_record_object& r ) {
      r.asset_id = op.asset_id;
      r.proposal_id = op.proposal_id;
      r.voter = op.voter;
      r.weight = weight;
      r.cast_at = now;
   });

   d.publish_event( "vote", "cast", fc::mutable_variant_object()
                    ("asset_id", op.asset_id)
                    ("proposal_id", op.proposal_id)
                    ("voter", op.voter, TESSERA_MAX_NESTED_OBJECTS)
                    ("weight", weight, TESSERA_MAX_NESTED_OBJECTS)
                    ("total_weight", d.get_vote_tally( op.asset_id, op.proposal_id ), TESSERA_MAX_NESTED_OBJECTS) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // tessera::chain
