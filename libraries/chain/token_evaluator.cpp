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
#include <tessera/chain/token_evaluator.hpp>
#include <tessera/chain/asset_checks.hpp>

#include <tessera/chain/database.hpp>
#include <tessera/chain/exceptions.hpp>
#include <tessera/chain/tokenized_asset_object.hpp>

namespace tessera { namespace chain {

void_result tokenize_asset_evaluator::do_evaluate( const tokenize_asset_operation& op )
{ try {
   const database& d = db();

   TESSERA_ASSERT( d.find_tokenized_asset( op.asset_id ) == nullptr, asset_already_tokenized,
                   "Asset ${a} is already tokenized", ("a",op.asset_id) );
   TESSERA_ASSERT( op.decimals <= d.get_chain_parameters().max_token_decimals, invalid_token_decimals,
                   "Token decimals ${d} exceed the maximum of ${m}",
                   ("d",op.decimals)("m",d.get_chain_parameters().max_token_decimals) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result tokenize_asset_evaluator::do_apply( const tokenize_asset_operation& op )
{ try {
   database& d = db();
   const auto now = d.ledger_time();

   const auto& asset = d.create<tokenized_asset_object>( [&op,now]( tokenized_asset_object& a ) {
      a.asset_id = op.asset_id;
      a.symbol = op.symbol;
      a.total_supply = op.total_supply;
      a.decimals = op.decimals;
      a.tokenizer = op.tokenizer;
      a.min_voting_threshold = op.min_voting_threshold;
      a.valuation = 0;
      a.metadata = op.metadata;
      a.tokenized_at = now;
      a.last_valuation_update = now;
   });
   d.adjust_token_balance( asset, op.tokenizer, op.total_supply );

   d.publish_event( "token", "tokenized", fc::mutable_variant_object()
                    ("asset_id", op.asset_id)
                    ("symbol", op.symbol)
                    ("total_supply", op.total_supply, TESSERA_MAX_NESTED_OBJECTS)
                    ("tokenizer", op.tokenizer, TESSERA_MAX_NESTED_OBJECTS) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result token_mint_evaluator::do_evaluate( const token_mint_operation& op )
{ try {
   const database& d = db();

   asset = &get_live_asset( d, op.asset_id );
   require_tokenizer( *asset, op.minter );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result token_mint_evaluator::do_apply( const token_mint_operation& op )
{ try {
   database& d = db();

   d.modify( *asset, [&op]( tokenized_asset_object& a ) {
      a.total_supply += op.amount;
   });
   d.adjust_token_balance( *asset, op.minter, op.amount );

   d.publish_event( "token", "minted", fc::mutable_variant_object()
                    ("asset_id", op.asset_id)
                    ("amount", op.amount, TESSERA_MAX_NESTED_OBJECTS)
                    ("minter", op.minter, TESSERA_MAX_NESTED_OBJECTS)
                    ("total_supply", asset->total_supply, TESSERA_MAX_NESTED_OBJECTS) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result token_burn_evaluator::do_evaluate( const token_burn_operation& op )
{ try {
   const database& d = db();

   asset = &get_live_asset( d, op.asset_id );
   require_tokenizer( *asset, op.burner );
   require_unlocked( d, *asset, op.burner );

   share_type balance = d.get_token_balance( op.asset_id, op.burner );
   TESSERA_ASSERT( balance >= op.amount, insufficient_balance,
                   "Insufficient balance: ${b}, unable to burn ${x} tokens of asset ${a}",
                   ("b",balance)("x",op.amount)("a",op.asset_id) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result token_burn_evaluator::do_apply( const token_burn_operation& op )
{ try {
   database& d = db();

   d.adjust_token_balance( *asset, op.burner, -op.amount );
   d.modify( *asset, [&op]( tokenized_asset_object& a ) {
      a.total_supply -= op.amount;
   });

   d.publish_event( "token", "burned", fc::mutable_variant_object()
                    ("asset_id", op.asset_id)
                    ("amount", op.amount, TESSERA_MAX_NESTED_OBJECTS)
                    ("burner", op.burner, TESSERA_MAX_NESTED_OBJECTS)
                    ("total_supply", asset->total_supply, TESSERA_MAX_NESTED_OBJECTS) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result token_transfer_evaluator::do_evaluate( const token_transfer_operation& op )
{ try {
   const database& d = db();

   asset = &get_live_asset( d, op.asset_id );
   d.validate_transfer( op.asset_id, op.from, op.to );
   require_unlocked( d, *asset, op.from );

   share_type balance = d.get_token_balance( op.asset_id, op.from );
   TESSERA_ASSERT( balance >= op.amount, insufficient_balance,
                   "Insufficient balance: ${b}, unable to transfer ${x} tokens of asset ${a} from ${f} to ${t}",
                   ("b",balance)("x",op.amount)("a",op.asset_id)("f",op.from)("t",op.to) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result token_transfer_evaluator::do_apply( const token_transfer_operation& op )
{ try {
   database& d = db();

   d.adjust_token_balance( *asset, op.from, -op.amount );
   d.adjust_token_balance( *asset, op.to, op.amount );

   d.publish_event( "token", "transferred", fc::mutable_variant_object()
                    ("asset_id", op.asset_id)
                    ("from", op.from, TESSERA_MAX_NESTED_OBJECTS)
                    ("to", op.to, TESSERA_MAX_NESTED_OBJECTS)
                    ("amount", op.amount, TESSERA_MAX_NESTED_OBJECTS) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result asset_valuation_update_evaluator::do_evaluate( const asset_valuation_update_operation& op )
{ try {
   const database& d = db();

   asset = &d.get_tokenized_asset( op.asset_id );
   require_tokenizer( *asset, op.updater );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result asset_valuation_update_evaluator::do_apply( const asset_valuation_update_operation& op )
{ try {
   database& d = db();
   const auto now = d.ledger_time();
   const share_type old_valuation = asset->valuation;

   d.modify( *asset, [&op,now]( tokenized_asset_object& a ) {
      a.valuation = op.new_valuation;
      a.last_valuation_update = now;
   });

   d.publish_event( "token", "valuation_updated", fc::mutable_variant_object()
                    ("asset_id", op.asset_id)
                    ("old_valuation", old_valuation, TESSERA_MAX_NESTED_OBJECTS)
                    ("new_valuation", op.new_valuation, TESSERA_MAX_NESTED_OBJECTS) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result token_lock_evaluator::do_evaluate( const token_lock_operation& op )
{ try {
   const database& d = db();

   const auto& asset = get_live_asset( d, op.asset_id );
   TESSERA_ASSERT( asset.is_tokenizer( op.caller ) || op.caller == op.holder, unauthorized_caller,
                   "${c} may not lock the tokens of ${h} in asset ${a}",
                   ("c",op.caller)("h",op.holder)("a",op.asset_id) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result token_lock_evaluator::do_apply( const token_lock_operation& op )
{ try {
   database& d = db();

   const auto& idx = d.get_index_type<token_lock_index>().indices().get<by_asset_holder>();
   auto itr = idx.find( boost::make_tuple( op.asset_id, op.holder ) );
   if( itr == idx.end() )
   {
      d.create<token_lock_object>( [&op]( token_lock_object& l ) {
         l.asset_id = op.asset_id;
         l.holder = op.holder;
         l.until = op.until;
      });
   }
   else
   {
      d.modify( *itr, [&op]( token_lock_object& l ) {
         l.until = op.until;
      });
   }

   d.publish_event( "token", "locked", fc::mutable_variant_object()
                    ("asset_id", op.asset_id)
                    ("holder", op.holder, TESSERA_MAX_NESTED_OBJECTS)
                    ("until", op.until, TESSERA_MAX_NESTED_OBJECTS) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result token_unlock_evaluator::do_evaluate( const token_unlock_operation& op )
{ try {
   db().get_tokenized_asset( op.asset_id );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result token_unlock_evaluator::do_apply( const token_unlock_operation& op )
{ try {
   database& d = db();

   const auto& idx = d.get_index_type<token_lock_index>().indices().get<by_asset_holder>();
   auto itr = idx.find( boost::make_tuple( op.asset_id, op.holder ) );
   if( itr == idx.end() )
      return void_result();

   d.remove( *itr );
   d.publish_event( "token", "unlocked", fc::mutable_variant_object()
                    ("asset_id", op.asset_id)
                    ("holder", op.holder, TESSERA_MAX_NESTED_OBJECTS) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // tessera::chain
