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
    * @brief Registers an asset with the ledger and issues its whole supply to the tokenizer
    * @ingroup operations
    *
    * The tokenizer becomes the controlling principal of the asset: only it may mint,
    * burn, lock other holders and administer restrictions, valuation and dividends.
    */
   struct tokenize_asset_operation : public base_operation
   {
      asset_id_type     asset_id = 0;
      string            symbol;
      share_type        total_supply;
      uint32_t          decimals = 0;
      /// minimum affirmative vote weight for a proposal on this asset to pass
      share_type        min_voting_threshold;
      principal_type    tokenizer;
      token_metadata    metadata;

      void get_required_authorities( flat_set<principal_type>& a )const { a.insert( tokenizer ); }
      void validate()const;
   };

   /**
    * @brief Issues new tokens to the tokenizer
    * @ingroup operations
    */
   struct token_mint_operation : public base_operation
   {
      asset_id_type     asset_id = 0;
      share_type        amount;
      principal_type    minter;

      void get_required_authorities( flat_set<principal_type>& a )const { a.insert( minter ); }
      void validate()const;
   };

   /**
    * @brief Destroys tokens held by the tokenizer
    * @ingroup operations
    */
   struct token_burn_operation : public base_operation
   {
      asset_id_type     asset_id = 0;
      share_type        amount;
      principal_type    burner;

      void get_required_authorities( flat_set<principal_type>& a )const { a.insert( burner ); }
      void validate()const;
   };

   /**
    * @brief Moves tokens between two holders
    * @ingroup operations
    *
    * The transfer restrictions of the asset are checked against the receiver
    * before any balance changes.
    */
   struct token_transfer_operation : public base_operation
   {
      asset_id_type     asset_id = 0;
      principal_type    from;
      principal_type    to;
      share_type        amount;

      void get_required_authorities( flat_set<principal_type>& a )const { a.insert( from ); }
      void validate()const;
   };

   /**
    * @ingroup operations
    */
   struct asset_valuation_update_operation : public base_operation
   {
      asset_id_type     asset_id = 0;
      share_type        new_valuation;
      principal_type    updater;

      void get_required_authorities( flat_set<principal_type>& a )const { a.insert( updater ); }
      void validate()const;
   };

   /**
    * @brief Makes the whole balance of a holder non-transferable and non-burnable until a point in time
    * @ingroup operations
    *
    * The tokenizer may lock any holder, a holder may lock its own balance.  A new
    * lock replaces the previous one.
    */
   struct token_lock_operation : public base_operation
   {
      asset_id_type     asset_id = 0;
      principal_type    holder;
      time_point_sec    until;
      principal_type    caller;

      void get_required_authorities( flat_set<principal_type>& a )const { a.insert( caller ); }
      void validate()const;
   };

   /**
    * @brief Removes the lock of a holder
    * @ingroup operations
    *
    * Anyone may submit this operation, it names no authority.
    */
   struct token_unlock_operation : public base_operation
   {
      asset_id_type     asset_id = 0;
      principal_type    holder;

      void validate()const;
   };

} } // tessera::protocol

FC_REFLECT( tessera::protocol::tokenize_asset_operation,
            (asset_id)(symbol)(total_supply)(decimals)(min_voting_threshold)(tokenizer)(metadata) )
FC_REFLECT( tessera::protocol::token_mint_operation, (asset_id)(amount)(minter) )
FC_REFLECT( tessera::protocol::token_burn_operation, (asset_id)(amount)(burner) )
FC_REFLECT( tessera::protocol::token_transfer_operation, (asset_id)(from)(to)(amount) )
FC_REFLECT( tessera::protocol::asset_valuation_update_operation, (asset_id)(new_valuation)(updater) )
FC_REFLECT( tessera::protocol::token_lock_operation, (asset_id)(holder)(until)(caller) )
FC_REFLECT( tessera::protocol::token_unlock_operation, (asset_id)(holder) )
