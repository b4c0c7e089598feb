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
#include <tessera/protocol/token.hpp>

namespace tessera { namespace protocol {

void tokenize_asset_operation::validate()const
{
   tokenizer.validate();
   TESSERA_ASSERT( is_valid_symbol( symbol ), invalid_symbol, "Invalid token symbol ${s}", ("s",symbol) );
   TESSERA_ASSERT( total_supply > 0, invalid_token_supply,
                   "Total supply must be positive", ("total_supply",total_supply) );
   TESSERA_ASSERT( decimals <= TESSERA_MAX_TOKEN_DECIMALS, invalid_token_decimals,
                   "A token can not have more than ${max} decimals", ("max",TESSERA_MAX_TOKEN_DECIMALS)("decimals",decimals) );
   TESSERA_ASSERT( min_voting_threshold >= 0, invalid_parameter,
                   "Voting threshold must not be negative", ("min_voting_threshold",min_voting_threshold) );
   metadata.validate();
}

void token_mint_operation::validate()const
{
   minter.validate();
   TESSERA_ASSERT( amount > 0, invalid_amount, "Must mint a positive amount", ("amount",amount) );
}

void token_burn_operation::validate()const
{
   burner.validate();
   TESSERA_ASSERT( amount > 0, invalid_amount, "Must burn a positive amount", ("amount",amount) );
}

void token_transfer_operation::validate()const
{
   from.validate();
   to.validate();
   TESSERA_ASSERT( amount > 0, invalid_amount, "Must transfer a positive amount", ("amount",amount) );
}

void asset_valuation_update_operation::validate()const
{
   updater.validate();
   TESSERA_ASSERT( new_valuation > 0, invalid_valuation,
                   "Valuation must be positive", ("new_valuation",new_valuation) );
}

void token_lock_operation::validate()const
{
   holder.validate();
   caller.validate();
}

void token_unlock_operation::validate()const
{
   holder.validate();
}

} } // tessera::protocol
