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
#include <tessera/protocol/token.hpp>

#include <string>
#include <vector>

namespace tessera { namespace chain {
using std::string;
using std::vector;

struct genesis_state_type {
   struct initial_tokenized_asset_type {
      /// tokenized as if the tokenizer had submitted it
      tokenize_asset_operation   tokenize;
      bool                       revenue_sharing_enabled = false;
      vector<principal_type>     whitelist;
   };

   time_point_sec                           initial_timestamp;
   chain_parameters                         initial_parameters;
   vector<initial_tokenized_asset_type>     initial_assets;

   /** checks the parameters and every initial asset without touching a database */
   void validate()const;
};

} } // namespace tessera::chain

FC_REFLECT( tessera::chain::genesis_state_type::initial_tokenized_asset_type,
            (tokenize)(revenue_sharing_enabled)(whitelist) )

FC_REFLECT( tessera::chain::genesis_state_type,
            (initial_timestamp)(initial_parameters)(initial_assets) )
