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
#include <tessera/protocol/chain_parameters.hpp>

namespace tessera { namespace chain {

   using namespace tessera::protocol;

   enum object_space
   {
      ledger_ids          = 1,
      implementation_ids  = 2
   };

   /**
    *  Types of the objects which hold the state of tokenized assets.
    */
   enum ledger_object_type
   {
      tokenized_asset_object_type = 1,
      token_balance_object_type,
      token_lock_object_type,
      transfer_restriction_object_type,
      whitelist_entry_object_type,
      unclaimed_dividend_object_type,
      vote_tally_object_type,
      vote_record_object_type,
      detokenization_proposal_object_type,
      LEDGER_OBJECT_TYPE_COUNT ///< Sentry value which contains the number of different object types
   };

   enum impl_object_type
   {
      impl_global_property_object_type,
      impl_dynamic_global_property_object_type
   };

} } // tessera::chain

FC_REFLECT_ENUM( tessera::chain::object_space, (ledger_ids)(implementation_ids) )
FC_REFLECT_ENUM( tessera::chain::ledger_object_type,
                 (tokenized_asset_object_type)
                 (token_balance_object_type)
                 (token_lock_object_type)
                 (transfer_restriction_object_type)
                 (whitelist_entry_object_type)
                 (unclaimed_dividend_object_type)
                 (vote_tally_object_type)
                 (vote_record_object_type)
                 (detokenization_proposal_object_type)
                 (LEDGER_OBJECT_TYPE_COUNT)
               )
FC_REFLECT_ENUM( tessera::chain::impl_object_type,
                 (impl_global_property_object_type)
                 (impl_dynamic_global_property_object_type)
               )
