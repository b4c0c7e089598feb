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

namespace tessera { namespace protocol {

   /**
    * @brief Enables or disables dividend distribution for an asset
    * @ingroup operations
    *
    * Disabling keeps every dividend already credited claimable.
    */
   struct revenue_sharing_update_operation : public base_operation
   {
      asset_id_type     asset_id = 0;
      bool              enabled = false;
      principal_type    issuer;

      void get_required_authorities( flat_set<principal_type>& a )const { a.insert( issuer ); }
      void validate()const;
   };

   /**
    * @brief Credits an amount to the current holders in proportion to their balances
    * @ingroup operations
    *
    * Each holder receives total_amount * balance / total_supply, rounded down.
    */
   struct dividend_distribute_operation : public base_operation
   {
      asset_id_type     asset_id = 0;
      share_type        total_amount;
      principal_type    distributor;

      void get_required_authorities( flat_set<principal_type>& a )const { a.insert( distributor ); }
      void validate()const;
   };

   /**
    * @brief Pays out and resets the unclaimed dividend of a holder
    * @ingroup operations
    *
    * The claimed amount is returned as the operation result.
    */
   struct dividend_claim_operation : public base_operation
   {
      asset_id_type     asset_id = 0;
      principal_type    holder;

      void get_required_authorities( flat_set<principal_type>& a )const { a.insert( holder ); }
      void validate()const;
   };

} } // tessera::protocol

FC_REFLECT( tessera::protocol::revenue_sharing_update_operation, (asset_id)(enabled)(issuer) )
FC_REFLECT( tessera::protocol::dividend_distribute_operation, (asset_id)(total_amount)(distributor) )
FC_REFLECT( tessera::protocol::dividend_claim_operation, (asset_id)(holder) )
