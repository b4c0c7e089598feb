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

void database::adjust_token_balance( const tokenized_asset_object& asset, const principal_type& holder, share_type delta )
{ try {
   if( delta == 0 )
      return;

   const auto& index = get_index_type<token_balance_index>().indices().get<by_asset_owner>();
   auto itr = index.find( boost::make_tuple( asset.asset_id, holder ) );
   if( itr == index.end() )
   {
      TESSERA_ASSERT( delta > 0, insufficient_balance,
                      "Insufficient balance: ${h} holds no tokens of asset ${a}, unable to deduct ${d}",
                      ("h",holder)("a",asset.asset_id)("d",-delta) );
      create<token_balance_object>( [&asset,&holder,&delta]( token_balance_object& b ) {
         b.asset_id = asset.asset_id;
         b.owner = holder;
         b.amount = delta;
      });
      return;
   }

   TESSERA_ASSERT( itr->amount + delta >= 0, insufficient_balance,
                   "Insufficient balance: ${h} holds ${b} tokens of asset ${a}, unable to deduct ${d}",
                   ("h",holder)("b",itr->amount)("a",asset.asset_id)("d",-delta) );
   if( itr->amount + delta == 0 )
      remove( *itr );
   else
      modify( *itr, [&delta]( token_balance_object& b ) {
         b.amount += delta;
      });
} FC_CAPTURE_AND_RETHROW( (asset.asset_id)(holder)(delta) ) }

void database::credit_dividend( asset_id_type asset_id, const principal_type& holder, share_type amount )
{
   FC_ASSERT( amount > 0, "Only positive dividends can be credited", ("amount",amount) );
   const auto& index = get_index_type<unclaimed_dividend_index>().indices().get<by_asset_holder>();
   auto itr = index.find( boost::make_tuple( asset_id, holder ) );
   if( itr == index.end() )
   {
      create<unclaimed_dividend_object>( [asset_id,&holder,&amount]( unclaimed_dividend_object& d ) {
         d.asset_id = asset_id;
         d.holder = holder;
         d.amount = amount;
      });
   }
   else
   {
      modify( *itr, [&amount]( unclaimed_dividend_object& d ) {
         d.amount += amount;
      });
   }
}

share_type database::take_unclaimed_dividend( asset_id_type asset_id, const principal_type& holder )
{
   const auto& index = get_index_type<unclaimed_dividend_index>().indices().get<by_asset_holder>();
   auto itr = index.find( boost::make_tuple( asset_id, holder ) );
   TESSERA_ASSERT( itr != index.end() && itr->amount > 0, no_dividends_to_claim,
                   "${h} has no dividends to claim for asset ${a}", ("h",holder)("a",asset_id) );
   share_type amount = itr->amount;
   remove( *itr );
   return amount;
}

} }
