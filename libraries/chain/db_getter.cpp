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
#include <tessera/chain/database.hpp>
#include <tessera/chain/dividend_object.hpp>

namespace tessera { namespace chain {

const global_property_object& database::get_global_properties()const
{
   return get<global_property_object>( object_id_type( implementation_ids, impl_global_property_object_type, 0 ) );
}

const dynamic_global_property_object& database::get_dynamic_global_properties()const
{
   return get<dynamic_global_property_object>(
            object_id_type( implementation_ids, impl_dynamic_global_property_object_type, 0 ) );
}

const chain_parameters& database::get_chain_parameters()const
{
   return get_global_properties().parameters;
}

time_point_sec database::ledger_time()const
{
   return get_dynamic_global_properties().time;
}

const tokenized_asset_object* database::find_tokenized_asset( asset_id_type asset_id )const
{
   const auto& idx = get_index_type<tokenized_asset_index>().indices().get<by_asset>();
   auto itr = idx.find( asset_id );
   if( itr == idx.end() )
      return nullptr;
   return &*itr;
}

const tokenized_asset_object& database::get_tokenized_asset( asset_id_type asset_id )const
{
   const auto* asset = find_tokenized_asset( asset_id );
   TESSERA_ASSERT( asset != nullptr, asset_not_tokenized, "Asset ${a} is not tokenized", ("a",asset_id) );
   return *asset;
}

share_type database::get_token_balance( asset_id_type asset_id, const principal_type& holder )const
{
   const auto& idx = get_index_type<token_balance_index>().indices().get<by_asset_owner>();
   auto itr = idx.find( boost::make_tuple( asset_id, holder ) );
   if( itr == idx.end() )
      return 0;
   return itr->amount;
}

vector<principal_type> database::get_token_holders( asset_id_type asset_id )const
{
   vector<principal_type> result;
   const auto& idx = get_index_type<token_balance_index>().indices().get<by_asset_owner>();
   auto range = idx.equal_range( boost::make_tuple( asset_id ) );
   for( auto itr = range.first; itr != range.second; ++itr )
      result.push_back( itr->owner );
   return result;
}

share_type database::get_ownership_percentage( asset_id_type asset_id, const principal_type& holder )const
{ try {
   const auto& asset = get_tokenized_asset( asset_id );
   TESSERA_ASSERT( asset.total_supply > 0, asset_not_tokenized,
                   "Asset ${a} has no tokens in circulation", ("a",asset_id) );
   try {
      return asset.ownership_percentage( get_token_balance( asset_id, holder ) );
   }
   TESSERA_RECODE_EXC( fc::overflow_exception, math_overflow )
} FC_CAPTURE_AND_RETHROW( (asset_id)(holder) ) }

optional<time_point_sec> database::get_token_lock( asset_id_type asset_id, const principal_type& holder )const
{
   const auto& idx = get_index_type<token_lock_index>().indices().get<by_asset_holder>();
   auto itr = idx.find( boost::make_tuple( asset_id, holder ) );
   if( itr == idx.end() )
      return optional<time_point_sec>();
   return itr->until;
}

bool database::is_tokens_locked( asset_id_type asset_id, const principal_type& holder )const
{
   auto until = get_token_lock( asset_id, holder );
   return until.valid() && *until > ledger_time();
}

share_type database::get_unclaimed_dividends( asset_id_type asset_id, const principal_type& holder )const
{
   const auto& idx = get_index_type<unclaimed_dividend_index>().indices().get<by_asset_holder>();
   auto itr = idx.find( boost::make_tuple( asset_id, holder ) );
   if( itr == idx.end() )
      return 0;
   return itr->amount;
}

bool database::is_revenue_sharing_enabled( asset_id_type asset_id )const
{
   const auto* asset = find_tokenized_asset( asset_id );
   return asset != nullptr && asset->revenue_sharing_enabled;
}

} }
