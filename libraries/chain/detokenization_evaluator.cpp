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
#include <tessera/chain/detokenization_evaluator.hpp>
#include <tessera/chain/asset_checks.hpp>

#include <tessera/chain/database.hpp>
#include <tessera/chain/exceptions.hpp>
#include <tessera/chain/detokenization_object.hpp>
#include <tessera/chain/tokenized_asset_object.hpp>

namespace tessera { namespace chain {

void_result detokenization_propose_evaluator::do_evaluate( const detokenization_propose_operation& op )
{ try {
   const database& d = db();

   get_live_asset( d, op.asset_id );

   prior_proposal = d.find_detokenization_proposal( op.asset_id );
   if( prior_proposal != nullptr )
   {
      auto status = d.get_detokenization_status( *prior_proposal );
      TESSERA_ASSERT( status != detokenization_proposed && status != detokenization_passed,
                      detokenization_already_proposed,
                      "Asset ${a} already has detokenization proposal ${p} in progress",
                      ("a",op.asset_id)("p",prior_proposal->proposal_id) );
   }

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

proposal_id_type detokenization_propose_evaluator::do_apply( const detokenization_propose_operation& op )
{ try {
   database& d = db();
   const auto& dgp = d.get_dynamic_global_properties();
   const auto now = d.ledger_time();
   const proposal_id_type proposal_id = dgp.next_proposal_id;
   const time_point_sec deadline = now + d.get_chain_parameters().detokenization_voting_period;

   if( prior_proposal != nullptr )
      d.remove( *prior_proposal );

   d.modify( dgp, []( dynamic_global_property_object& p ) {
      ++p.next_proposal_id;
   });

   d.create<detokenization_proposal_object>( [&op,proposal_id,now,deadline]( detokenization_proposal_object& p ) {
      p.asset_id = op.asset_id;
      p.proposal_id = proposal_id;
      p.proposer = op.proposer;
      p.created = now;
      p.voting_deadline = deadline;
   });

   d.publish_event( "detokenize", "proposed", fc::mutable_variant_object()
                    ("asset_id", op.asset_id)
                    ("proposal_id", proposal_id)
                    ("proposer", op.proposer, TESSERA_MAX_NESTED_OBJECTS)
                    ("voting_deadline", deadline, TESSERA_MAX_NESTED_OBJECTS) );
   return proposal_id;
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result detokenization_execute_evaluator::do_evaluate( const detokenization_execute_operation& op )
{ try {
   const database& d = db();

   asset = &d.get_tokenized_asset( op.asset_id );
   proposal = d.find_detokenization_proposal( op.asset_id );
   TESSERA_ASSERT( proposal != nullptr && proposal->proposal_id == op.proposal_id, proposal_not_found,
                   "Asset ${a} has no detokenization proposal ${p}", ("a",op.asset_id)("p",op.proposal_id) );
   TESSERA_ASSERT( !proposal->executed, detokenization_not_approved,
                   "Detokenization proposal ${p} of asset ${a} was already executed",
                   ("p",op.proposal_id)("a",op.asset_id) );
   TESSERA_ASSERT( d.proposal_passed( op.asset_id, op.proposal_id ), detokenization_not_approved,
                   "Detokenization proposal ${p} of asset ${a} has not reached the voting threshold",
                   ("p",op.proposal_id)("a",op.asset_id) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result detokenization_execute_evaluator::do_apply( const detokenization_execute_operation& op )
{ try {
   database& d = db();
   const auto now = d.ledger_time();

   d.modify( *asset, []( tokenized_asset_object& a ) {
      a.detokenized = true;
   });
   d.modify( *proposal, [now]( detokenization_proposal_object& p ) {
      p.executed = true;
      p.executed_at = now;
   });

   ilog( "Asset ${a} detokenized by proposal ${p}", ("a",op.asset_id)("p",op.proposal_id) );

   d.publish_event( "detokenize", "executed", fc::mutable_variant_object()
                    ("asset_id", op.asset_id)
                    ("proposal_id", op.proposal_id)
                    ("executed_at", now, TESSERA_MAX_NESTED_OBJECTS) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // tessera::chain
