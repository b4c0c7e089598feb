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
#include <tessera/protocol/types.hpp>

namespace tessera { namespace protocol {

   /**
    *  Parameters of the ledger which the host configures through the genesis state.
    */
   struct chain_parameters
   {
      uint8_t                 max_token_decimals           = TESSERA_DEFAULT_MAX_TOKEN_DECIMALS;
      uint32_t                detokenization_voting_period = TESSERA_DEFAULT_DETOKENIZATION_VOTING_PERIOD; ///< seconds
      uint32_t                max_whitelist_size           = TESSERA_DEFAULT_MAX_WHITELIST_SIZE;

      /** defined in chain_parameters.cpp */
      void validate()const;
   };

} }  // tessera::protocol

FC_REFLECT( tessera::protocol::chain_parameters,
            (max_token_decimals)
            (detokenization_voting_period)
            (max_whitelist_size)
          )
