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
#include <tessera/chain/vote_object.hpp>
#include <tessera/chain/detokenization_object.hpp>

namespace tessera { namespace chain {

share_type database::get_vote_tally( asset_id_type asset_id, proposal_id_type proposal_id )const
{
   const auto& idx = get_index_type<vote_tally_index>().indices().get<by_proposal>();
   auto itr = idx.find( boost::make_tuple( asset_id, proposal_id ) );
   TESSERA_ASSERT( itr != idx.end(), proposal_not_found,
                   "Nobody has voted on proposal ${p} of asset ${a}", ("p",proposal_id)("a",asset_id) );
   return itr->total_weight;
}

bool database::has_voted( asset_id_type asset_id, proposal_id_type proposal_id, const principal_type& voter )const
{
   const auto& idx = get_index_type<vote_record_index>().indices().get<by_proposal_voter>();
   return idx.find( boost::make_tuple( asset_id, proposal_id, voter ) ) != idx.end();
}

bool database::proposal_passed( asset_id_type asset_id, proposal_id_type proposal_id )const
{
   const auto& asset = get_tokenized_asset( asset_id );
   const auto& idx = get_index_type<vote_tally_index>().indices().get<by_proposal>();
   auto itr = idx.find( boost::make_tuple( asset_id, proposal_id ) );
   if( itr == idx.end() )
      return false;
   return itr->total_weight >= asset.min_voting_threshold;
}

const detokenization_proposal_object* database::find_detokenization_proposal( asset_id_type asset_id )const
{
   const auto& idx = get_index_type<detokenization_proposal_index>().indices().get<by_asset>();
   auto itr = idx.find( asset_id );
   if( itr == idx.end() )
      return nullptr;
   return &*itr;
}

const detokenization_proposal_object& database::get_detokenization_proposal( asset_id_type asset_id )const
{
   const auto* proposal = find_detokenization_proposal( asset_id );
   TESSERA_ASSERT( proposal != nullptr, proposal_not_found,
                   "Asset ${a} has no detokenization proposal", ("a",asset_id) );
   return *proposal;
}

detokenization_status database::get_detokenization_status( const detokenization_proposal_object& p )const
{
   if( p.executed )
      return detokenization_executed;
   if( proposal_passed( p.asset_id, p.proposal_id ) )
      return detokenization_passed;
   if( !p.voting_open( ledger_time() ) )
      return detokenization_rejected;
   return detokenization_proposed;
}

detokenization_status database::get_detokenization_status( asset_id_type asset_id )const
{
   const auto* proposal = find_detokenization_proposal( asset_id );
   if( proposal == nullptr )
      return detokenization_none;
   return get_detokenization_status( *proposal );
}

bool database::is_detokenization_active( asset_id_type asset_id )const
{
   auto status = get_detokenization_status( asset_id );
   return status == detokenization_proposed || status == detokenization_passed;
}

} }
