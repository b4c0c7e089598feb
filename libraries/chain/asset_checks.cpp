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
#include <tessera/chain/asset_checks.hpp>

#include <tessera/chain/database.hpp>
#include <tessera/chain/tokenized_asset_object.hpp>

namespace tessera { namespace chain {

const tokenized_asset_object& get_live_asset( const database& d, asset_id_type asset_id )
{
   const auto& asset = d.get_tokenized_asset( asset_id );
   TESSERA_ASSERT( !asset.detokenized, asset_not_tokenized,
                   "Asset ${a} has been detokenized", ("a",asset_id) );
   return asset;
}

void require_tokenizer( const tokenized_asset_object& asset, const principal_type& who )
{
   TESSERA_ASSERT( asset.is_tokenizer( who ), unauthorized_caller,
                   "Only the tokenizer ${t} of asset ${a} may do this, not ${w}",
                   ("t",asset.tokenizer)("a",asset.asset_id)("w",who) );
}

void require_unlocked( const database& d, const tokenized_asset_object& asset, const principal_type& holder )
{
   TESSERA_ASSERT( !d.is_tokens_locked( asset.asset_id, holder ), tokens_are_locked,
                   "Tokens of ${h} in asset ${a} are locked until ${t}",
                   ("h",holder)("a",asset.asset_id)("t",*d.get_token_lock( asset.asset_id, holder )) );
}

} } // tessera::chain
