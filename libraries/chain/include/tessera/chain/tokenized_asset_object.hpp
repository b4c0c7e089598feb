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
#include <tessera/db/generic_index.hpp>

#include <boost/multi_index/composite_key.hpp>

namespace tessera { namespace chain {

using namespace tessera::db;

/**
 *  @brief an asset whose ownership is represented by fungible tokens
 *  @ingroup object
 *
 *  The sum of all token_balance_object amounts of the asset always equals
 *  total_supply.
 */
class tokenized_asset_object : public abstract_object<tokenized_asset_object>
{
   public:
      static constexpr uint8_t space_id = ledger_ids;
      static constexpr uint8_t type_id  = tokenized_asset_object_type;

      asset_id_type     asset_id = 0;
      string            symbol;
      share_type        total_supply;
      uint32_t          decimals = 0;
      principal_type    tokenizer;
      share_type        min_voting_threshold;
      share_type        valuation;
      token_metadata    metadata;

      /// set once the asset has been detokenized, the tokens are frozen from then on
      bool              detokenized = false;
      bool              revenue_sharing_enabled = false;

      time_point_sec    tokenized_at;
      time_point_sec    last_valuation_update;

      bool is_tokenizer( const principal_type& p )const { return p == tokenizer; }

      /// @return the share of the supply held by balance, in basis points
      share_type ownership_percentage( const share_type& balance )const;
};

/**
 *  @brief the tokens one principal holds of one asset
 *  @ingroup object
 *
 *  Only positive balances are stored, the object is removed when its amount
 *  reaches zero.  The balance objects of an asset therefore form its holder set.
 */
class token_balance_object : public abstract_object<token_balance_object>
{
   public:
      static constexpr uint8_t space_id = ledger_ids;
      static constexpr uint8_t type_id  = token_balance_object_type;

      asset_id_type     asset_id = 0;
      principal_type    owner;
      share_type        amount;
};

/**
 *  @brief keeps the whole balance of a holder in place until a point in time
 *  @ingroup object
 *
 *  A lock does not change the balance counted for votes and dividends.
 */
class token_lock_object : public abstract_object<token_lock_object>
{
   public:
      static constexpr uint8_t space_id = ledger_ids;
      static constexpr uint8_t type_id  = token_lock_object_type;

      asset_id_type     asset_id = 0;
      principal_type    holder;
      time_point_sec    until;

      bool is_active( time_point_sec now )const { return until > now; }
};

struct by_asset;
struct by_asset_owner;
struct by_asset_holder;

/**
* @ingroup object_index
*/
typedef multi_index_container<
   tokenized_asset_object,
   indexed_by<
      ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
      ordered_unique< tag<by_asset>,
         member< tokenized_asset_object, asset_id_type, &tokenized_asset_object::asset_id >
      >
   >
> tokenized_asset_multi_index_type;

/**
* @ingroup object_index
*/
typedef generic_index<tokenized_asset_object, tokenized_asset_multi_index_type> tokenized_asset_index;

/**
* @ingroup object_index
*/
typedef multi_index_container<
   token_balance_object,
   indexed_by<
      ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
      ordered_unique< tag<by_asset_owner>,
         composite_key< token_balance_object,
            member< token_balance_object, asset_id_type, &token_balance_object::asset_id >,
            member< token_balance_object, principal_type, &token_balance_object::owner >
         >
      >
   >
> token_balance_multi_index_type;

/**
* @ingroup object_index
*/
typedef generic_index<token_balance_object, token_balance_multi_index_type> token_balance_index;

/**
* @ingroup object_index
*/
typedef multi_index_container<
   token_lock_object,
   indexed_by<
      ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
      ordered_unique< tag<by_asset_holder>,
         composite_key< token_lock_object,
            member< token_lock_object, asset_id_type, &token_lock_object::asset_id >,
            member< token_lock_object, principal_type, &token_lock_object::holder >
         >
      >
   >
> token_lock_multi_index_type;

/**
* @ingroup object_index
*/
typedef generic_index<token_lock_object, token_lock_multi_index_type> token_lock_index;

} } // tessera::chain

FC_REFLECT_DERIVED( tessera::chain::tokenized_asset_object, (tessera::db::object),
                    (asset_id)(symbol)(total_supply)(decimals)(tokenizer)(min_voting_threshold)
                    (valuation)(metadata)(detokenized)(revenue_sharing_enabled)
                    (tokenized_at)(last_valuation_update) )

FC_REFLECT_DERIVED( tessera::chain::token_balance_object, (tessera::db::object),
                    (asset_id)(owner)(amount) )

FC_REFLECT_DERIVED( tessera::chain::token_lock_object, (tessera::db::object),
                    (asset_id)(holder)(until) )
