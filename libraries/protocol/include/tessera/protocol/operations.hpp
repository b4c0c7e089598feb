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
#include <tessera/protocol/base.hpp>
#include <tessera/protocol/token.hpp>
#include <tessera/protocol/restriction.hpp>
#include <tessera/protocol/dividend.hpp>
#include <tessera/protocol/governance.hpp>

namespace tessera { namespace protocol {

   /**
    * @ingroup operations
    *
    * Defines the set of valid operations as a discriminated union type.  New
    * operations are only ever appended so that journals keep their meaning.
    */
   typedef fc::static_variant<
            /*  0 */ tokenize_asset_operation,
            /*  1 */ token_mint_operation,
            /*  2 */ token_burn_operation,
            /*  3 */ token_transfer_operation,
            /*  4 */ asset_valuation_update_operation,
            /*  5 */ token_lock_operation,
            /*  6 */ token_unlock_operation,
            /*  7 */ transfer_restriction_set_operation,
            /*  8 */ transfer_restriction_clear_operation,
            /*  9 */ whitelist_add_operation,
            /* 10 */ whitelist_remove_operation,
            /* 11 */ revenue_sharing_update_operation,
            /* 12 */ dividend_distribute_operation,
            /* 13 */ dividend_claim_operation,
            /* 14 */ vote_cast_operation,
            /* 15 */ detokenization_propose_operation,
            /* 16 */ detokenization_execute_operation
         > operation;

   /// @} // operations group

   /**
    *  Appends the principals which must authorize op to result.
    */
   void operation_get_required_authorities( const operation& op, flat_set<principal_type>& result );

   void operation_validate( const operation& op );

} } // tessera::protocol

FC_REFLECT_TYPENAME( tessera::protocol::operation )
