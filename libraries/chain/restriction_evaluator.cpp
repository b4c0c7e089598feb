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
#include <tessera/chain/restriction_evaluator.hpp>
#include <tessera/chain/asset_checks.hpp>

#include <tessera/chain/database.hpp>
#include <tessera/chain/exceptions.hpp>
#include <tessera/chain/restriction_object.hpp>
#include <tessera/chain/tokenized_asset_object.hpp>

namespace tessera { namespace chain {

void_result transfer_restriction_set_evaluator::do_evaluate( const transfer_restriction_set_operation& op )
{ try {
   require_tokenizer( db().get_tokenized_asset( op.asset_id ), op.issuer );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result transfer_restriction_set_evaluator::do_apply( const transfer_restriction_set_operation& op )
{ try {
   database& d = db();

   const auto& idx = d.get_index_type<transfer_restriction_index>().indices().get<by_asset>();
   auto itr = idx.find( op.asset_id );
   if( itr == idx.end() )
   {
      d.create<transfer_restriction_object>( [&op]( transfer_restriction_object& r ) {
         r.asset_id = op.asset_id;
         r.restriction = op.restriction;
      });
   }
   else
   {
      d.modify( *itr, [&op]( transfer_restriction_object& r ) {
         r.restriction = op.restriction;
      });
   }

   d.publish_event( "transfer", "restriction_set", fc::mutable_variant_object()
                    ("asset_id", op.asset_id)
                    ("require_accredited", op.restriction.require_accredited)
                    ("geographic_allowed", op.restriction.geographic_allowed, TESSERA_MAX_NESTED_OBJECTS) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result transfer_restriction_clear_evaluator::do_evaluate( const transfer_restriction_clear_operation& op )
{ try {
   require_tokenizer( db().get_tokenized_asset( op.asset_id ), op.issuer );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result transfer_restriction_clear_evaluator::do_apply( const transfer_restriction_clear_operation& op )
{ try {
   database& d = db();

   const auto& idx = d.get_index_type<transfer_restriction_index>().indices().get<by_asset>();
   auto itr = idx.find( op.asset_id );
   if( itr == idx.end() )
      return void_result();

   d.remove( *itr );
   d.publish_event( "transfer", "restriction_cleared", fc::mutable_variant_object()
                    ("asset_id", op.asset_id) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result whitelist_add_evaluator::do_evaluate( const whitelist_add_operation& op )
{ try {
   const database& d = db();

   require_tokenizer( d.get_tokenized_asset( op.asset_id ), op.issuer );

   already_listed = d.is_whitelisted( op.asset_id, op.account );
   if( !already_listed )
   {
      const auto max_size = d.get_chain_parameters().max_whitelist_size;
      TESSERA_ASSERT( d.get_whitelist_size( op.asset_id ) < max_size, whitelist_full,
                      "The whitelist of asset ${a} already holds the maximum of ${m} accounts",
                      ("a",op.asset_id)("m",max_size) );
   }

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result whitelist_add_evaluator::do_apply( const whitelist_add_operation& op )
{ try {
   if( already_listed )
      return void_result();

   database& d = db();
   d.create<whitelist_entry_object>( [&op]( whitelist_entry_object& w ) {
      w.asset_id = op.asset_id;
      w.account = op.account;
   });

   d.publish_event( "transfer", "whitelist_added", fc::mutable_variant_object()
                    ("asset_id", op.asset_id)
                    ("account", op.account, TESSERA_MAX_NESTED_OBJECTS) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result whitelist_remove_evaluator::do_evaluate( const whitelist_remove_operation& op )
{ try {
   require_tokenizer( db().get_tokenized_asset( op.asset_id ), op.issuer );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result whitelist_remove_evaluator::do_apply( const whitelist_remove_operation& op )
{ try {
   database& d = db();

   const auto& idx = d.get_index_type<whitelist_entry_index>().indices().get<by_asset_account>();
   auto itr = idx.find( boost::make_tuple( op.asset_id, op.account ) );
   if( itr == idx.end() )
      return void_result();

   d.remove( *itr );
   d.publish_event( "transfer", "whitelist_removed", fc::mutable_variant_object()
                    ("asset_id", op.asset_id)
                    ("account", op.account, TESSERA_MAX_NESTED_OBJECTS) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // tessera::chain
