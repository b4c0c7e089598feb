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

#include <tessera/chain/global_property_object.hpp>
#include <tessera/chain/tokenized_asset_object.hpp>
#include <tessera/chain/restriction_object.hpp>
#include <tessera/chain/dividend_object.hpp>
#include <tessera/chain/vote_object.hpp>
#include <tessera/chain/detokenization_object.hpp>

#include <tessera/chain/token_evaluator.hpp>
#include <tessera/chain/restriction_evaluator.hpp>
#include <tessera/chain/dividend_evaluator.hpp>
#include <tessera/chain/vote_evaluator.hpp>
#include <tessera/chain/detokenization_evaluator.hpp>

namespace tessera { namespace chain {

void database::initialize_evaluators()
{
   _operation_evaluators.resize(255);
   register_evaluator<tokenize_asset_evaluator>();
   register_evaluator<token_mint_evaluator>();
   register_evaluator<token_burn_evaluator>();
   register_evaluator<token_transfer_evaluator>();
   register_evaluator<asset_valuation_update_evaluator>();
   register_evaluator<token_lock_evaluator>();
   register_evaluator<token_unlock_evaluator>();
   register_evaluator<transfer_restriction_set_evaluator>();
   register_evaluator<transfer_restriction_clear_evaluator>();
   register_evaluator<whitelist_add_evaluator>();
   register_evaluator<whitelist_remove_evaluator>();
   register_evaluator<revenue_sharing_update_evaluator>();
   register_evaluator<dividend_distribute_evaluator>();
   register_evaluator<dividend_claim_evaluator>();
   register_evaluator<vote_cast_evaluator>();
   register_evaluator<detokenization_propose_evaluator>();
   register_evaluator<detokenization_execute_evaluator>();
}

void database::initialize_indexes()
{
   reset_indexes();

   //Protocol object indexes
   add_index< primary_index<tokenized_asset_index> >();
   add_index< primary_index<token_balance_index> >();
   add_index< primary_index<token_lock_index> >();
   add_index< primary_index<transfer_restriction_index> >();
   add_index< primary_index<whitelist_entry_index> >();
   add_index< primary_index<unclaimed_dividend_index> >();
   add_index< primary_index<vote_tally_index> >();
   add_index< primary_index<vote_record_index> >();
   add_index< primary_index<detokenization_proposal_index> >();

   //Implementation object indexes
   add_index< primary_index<global_property_index> >();
   add_index< primary_index<dynamic_global_property_index> >();
}

} }
