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
#include <tessera/chain/genesis_state.hpp>
#include <tessera/protocol/exceptions.hpp>

namespace tessera { namespace chain {

void genesis_state_type::validate()const
{ try {
   initial_parameters.validate();
   flat_set<asset_id_type> seen;
   for( const auto& a : initial_assets )
   {
      a.tokenize.validate();
      TESSERA_ASSERT( seen.insert( a.tokenize.asset_id ).second, asset_already_tokenized,
                      "Asset ${id} appears twice in the genesis state", ("id",a.tokenize.asset_id) );
      TESSERA_ASSERT( a.tokenize.decimals <= initial_parameters.max_token_decimals, invalid_token_decimals,
                      "Asset ${id} has more decimals than the ledger allows", ("id",a.tokenize.asset_id) );
      TESSERA_ASSERT( a.whitelist.size() <= initial_parameters.max_whitelist_size, whitelist_full,
                      "Whitelist of asset ${id} is too long", ("id",a.tokenize.asset_id) );
      for( const auto& p : a.whitelist )
         p.validate();
   }
} FC_CAPTURE_AND_RETHROW() }

} } // tessera::chain
