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
#include <tessera/chain/restriction_object.hpp>

namespace tessera { namespace chain {

bool database::validate_transfer( asset_id_type asset_id, const principal_type& from, const principal_type& to )const
{ try {
   get_tokenized_asset( asset_id );

   // A whitelist admits only the accounts on it, the sender is not checked
   if( get_whitelist_size( asset_id ) > 0 )
      TESSERA_ASSERT( is_whitelisted( asset_id, to ), transfer_restriction_failed,
                      "${to} is not on the whitelist of asset ${a}", ("to",to)("a",asset_id) );

   const auto& idx = get_index_type<transfer_restriction_index>().indices().get<by_asset>();
   auto itr = idx.find( asset_id );
   if( itr != idx.end() && itr->restriction.require_accredited )
      TESSERA_ASSERT( is_whitelisted( asset_id, to ), accredited_investor_required,
                      "Asset ${a} may only be transferred to accredited investors, ${to} is not one",
                      ("a",asset_id)("to",to) );
   return true;
} FC_CAPTURE_AND_RETHROW( (asset_id)(from)(to) ) }

bool database::is_whitelisted( asset_id_type asset_id, const principal_type& account )const
{
   const auto& idx = get_index_type<whitelist_entry_index>().indices().get<by_asset_account>();
   return idx.find( boost::make_tuple( asset_id, account ) ) != idx.end();
}

vector<principal_type> database::get_whitelist( asset_id_type asset_id )const
{
   vector<principal_type> result;
   const auto& idx = get_index_type<whitelist_entry_index>().indices().get<by_asset>();
   auto range = idx.equal_range( boost::make_tuple( asset_id ) );
   for( auto itr = range.first; itr != range.second; ++itr )
      result.push_back( itr->account );
   return result;
}

size_t database::get_whitelist_size( asset_id_type asset_id )const
{
   const auto& idx = get_index_type<whitelist_entry_index>().indices().get<by_asset>();
   auto range = idx.equal_range( boost::make_tuple( asset_id ) );
   return size_t( std::distance( range.first, range.second ) );
}

bool database::has_transfer_restrictions( asset_id_type asset_id )const
{
   const auto& idx = get_index_type<transfer_restriction_index>().indices().get<by_asset>();
   return idx.find( asset_id ) != idx.end() || get_whitelist_size( asset_id ) > 0;
}

const transfer_restriction& database::get_transfer_restriction( asset_id_type asset_id )const
{
   const auto& idx = get_index_type<transfer_restriction_index>().indices().get<by_asset>();
   auto itr = idx.find( asset_id );
   TESSERA_ASSERT( itr != idx.end(), asset_not_tokenized,
                   "Asset ${a} has no transfer restriction", ("a",asset_id) );
   return itr->restriction;
}

} }
