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
#pragma once

#include <tessera/chain/types.hpp>

namespace tessera { namespace chain {

   class database;
   class tokenized_asset_object;

   /**
    * @return the asset if it is tokenized and not detokenized, a detokenized
    * asset is frozen and rejected with asset_not_tokenized
    */
   const tokenized_asset_object& get_live_asset( const database& d, asset_id_type asset_id );

   /// Throws unauthorized_caller unless who is the tokenizer of asset
   void require_tokenizer( const tokenized_asset_object& asset, const principal_type& who );

   /// Throws tokens_are_locked while holder has an active lock on asset
   void require_unlocked( const database& d, const tokenized_asset_object& asset, const principal_type& holder );

} } // tessera::chain
