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
#include <tessera/chain/dividend_evaluator.hpp>
#include <tessera/chain/asset_checks.hpp>

#include <tessera/chain/database.hpp>
#include <tessera/chain/exceptions.hpp>
#include <tessera/chain/dividend_object.hpp>
#include <tessera/chain/tokenized_asset_object.hpp>

namespace tessera { namespace chain {

void_result revenue_sharing_update_evaluator::do_evaluate( const revenue_sharing_update_operation& op )
{ try {
   asset = &db().get_tokenized_asset( op.asset_id );
   require_tokenizer( *asset, op.issuer );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result revenue_sharing_update_evaluator::do_apply( const revenue_sharing_update_operation& op )
{ try {
   database& d = db();

   d.modify( *asset, [&op]( tokenized_asset_object& a ) {
      a.revenue_sharing_enabled = op.enabled;
   });

   d.publish_event( "dividend", "revenue_sharing_updated", fc::mutable_variant_object()
                    ("asset_id", op.asset_id)
                    ("enabled", op.enabled) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result dividend_distribute_evaluator::do_evaluate( const dividend_distribute_operation& op )
{ try {
   const database& d = db();

   asset = &get_live_asset( d, op.asset_id );
   require_tokenizer( *asset, op.distributor );
   TESSERA_ASSERT( asset->revenue_sharing_enabled, revenue_sharing_disabled,
                   "Revenue sharing is disabled for asset ${a}", ("a",op.asset_id) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result dividend_distribute_evaluator::do_apply( const dividend_distribute_operation& op )
{ try {
   database& d = db();

   share_type distributed = 0;
   uint64_t recipients = 0;
   const auto& idx = d.get_index_type<token_balance_index>().indices().get<by_asset_owner>();
   auto range = idx.equal_range( boost::make_tuple( op.asset_id ) );
   for( auto itr = range.first; itr != range.second; ++itr )
   {
      share_type share = op.total_amount * itr->amount / asset->total_supply;
      if( share == 0 )
         continue;
      d.credit_dividend( op.asset_id, itr->owner, share );
      distributed += share;
      ++recipients;
   }

   d.publish_event( "dividend", "distributed", fc::mutable_variant_object()
                    ("asset_id", op.asset_id)
                    ("total_amount", op.total_amount, TESSERA_MAX_NESTED_OBJECTS)
                    ("distributed", distributed, TESSERA_MAX_NESTED_OBJECTS)
                    ("remainder", op.total_amount - distributed, TESSERA_MAX_NESTED_OBJECTS)
                    ("recipients", recipients) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result dividend_claim_evaluator::do_evaluate( const dividend_claim_operation& op )
{ try {
   const database& d = db();

   d.get_tokenized_asset( op.asset_id );
   TESSERA_ASSERT( d.get_unclaimed_dividends( op.asset_id, op.holder ) > 0, no_dividends_to_claim,
                   "${h} has no dividends to claim for asset ${a}", ("h",op.holder)("a",op.asset_id) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

share_type dividend_claim_evaluator::do_apply( const dividend_claim_operation& op )
{ try {
   database& d = db();

   share_type amount = d.take_unclaimed_dividend( op.asset_id, op.holder );

   d.publish_event( "dividend", "claimed", fc::mutable_variant_object()
                    ("asset_id", op.asset_id)
                    ("holder", op.holder, TESSERA_MAX_NESTED_OBJECTS)
                    ("amount", amount, TESSERA_MAX_NESTED_OBJECTS) );
   return amount;
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // tessera::chain
