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
#include <tessera/protocol/restriction.hpp>

#include <boost/multi_index/composite_key.hpp>

namespace tessera { namespace chain {

using namespace tessera::db;

/**
 *  @brief the transfer policy of an asset
 *  @ingroup object
 *
 *  When no policy object exists for an asset the accreditation check is skipped.
 */
class transfer_restriction_object : public abstract_object<transfer_restriction_object>
{
   public:
      static constexpr uint8_t space_id = ledger_ids;
      static constexpr uint8_t type_id  = transfer_restriction_object_type;

      asset_id_type           asset_id = 0;
      transfer_restriction    restriction;
};

/**
 *  @brief one principal on the whitelist of an asset
 *  @ingroup object
 *
 *  The whitelist is both the transfer allow-list and the accredited investor
 *  registry.  Entries are listed in the order they were added.
 */
class whitelist_entry_object : public abstract_object<whitelist_entry_object>
{
   public:
      static constexpr uint8_t space_id = ledger_ids;
      static constexpr uint8_t type_id  = whitelist_entry_object_type;

      asset_id_type           asset_id = 0;
      principal_type          account;
};

struct by_asset;
struct by_asset_account;

/**
* @ingroup object_index
*/
typedef multi_index_container<
   transfer_restriction_object,
   indexed_by<
      ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
      ordered_unique< tag<by_asset>,
         member< transfer_restriction_object, asset_id_type, &transfer_restriction_object::asset_id >
      >
   >
> transfer_restriction_multi_index_type;

typedef generic_index<transfer_restriction_object, transfer_restriction_multi_index_type> transfer_restriction_index;

/**
* @ingroup object_index
*/
typedef multi_index_container<
   whitelist_entry_object,
   indexed_by<
      ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
      ordered_unique< tag<by_asset>,
         composite_key< whitelist_entry_object,
            member< whitelist_entry_object, asset_id_type, &whitelist_entry_object::asset_id >,
            member< object, object_id_type, &object::id >
         >
      >,
      ordered_unique< tag<by_asset_account>,
         composite_key< whitelist_entry_object,
            member< whitelist_entry_object, asset_id_type, &whitelist_entry_object::asset_id >,
            member< whitelist_entry_object, principal_type, &whitelist_entry_object::account >
         >
      >
   >
> whitelist_entry_multi_index_type;

typedef generic_index<whitelist_entry_object, whitelist_entry_multi_index_type> whitelist_entry_index;

} } // tessera::chain

FC_REFLECT_DERIVED( tessera::chain::transfer_restriction_object, (tessera::db::object),
                    (asset_id)(restriction) )

FC_REFLECT_DERIVED( tessera::chain::whitelist_entry_object, (tessera::db::object),
                    (asset_id)(account) )
