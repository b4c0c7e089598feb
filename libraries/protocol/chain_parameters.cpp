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
#include <tessera/protocol/chain_parameters.hpp>
#include <tessera/protocol/exceptions.hpp>

namespace tessera { namespace protocol {

   void chain_parameters::validate()const
   {
      TESSERA_ASSERT( max_token_decimals <= TESSERA_MAX_TOKEN_DECIMALS, invalid_parameter,
                      "Decimal limit can not exceed ${max}", ("max",TESSERA_MAX_TOKEN_DECIMALS) );
      TESSERA_ASSERT( detokenization_voting_period > 0, invalid_parameter,
                      "Detokenization voting period must be positive", ("period",detokenization_voting_period) );
      TESSERA_ASSERT( detokenization_voting_period <= TESSERA_MAX_DETOKENIZATION_VOTING_PERIOD, invalid_parameter,
                      "Detokenization voting period is too long",
                      ("period",detokenization_voting_period)("max",TESSERA_MAX_DETOKENIZATION_VOTING_PERIOD) );
      TESSERA_ASSERT( max_whitelist_size > 0, invalid_parameter, "Whitelist size limit must be positive", ("max_whitelist_size",max_whitelist_size) );
   }

} } // tessera::protocol
