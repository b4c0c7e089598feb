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
 *  @brief dividends credited to a holder and not claimed yet
 *  @ingroup object
 *
 *  The object is removed when the holder claims.
 */
class unclaimed_dividend_object : public abstract_object<unclaimed_dividend_object>
{
   public:
      static constexpr uint8_t space_id = ledger_ids;
      static constexpr uint8_t type_id  = unclaimed_dividend_object_type;

      asset_id_type     asset_id = 0;
      principal_type    holder;
      share_type        amount;
};

struct by_asset_holder;

/**
* @ingroup object_index
*/
typedef multi_index_container<
   unclaimed_dividend_object,
   indexed_by<
      ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
      ordered_unique< tag<by_asset_holder>,
         composite_key< unclaimed_dividend_object,
            member< unclaimed_dividend_object, asset_id_type, &unclaimed_dividend_object::asset_id >,
            member< unclaimed_dividend_object, principal_type, &unclaimed_dividend_object::holder >
         >
      >
   >
> unclaimed_dividend_multi_index_type;

typedef generic_index<unclaimed_dividend_object, unclaimed_dividend_multi_index_type> unclaimed_dividend_index;

} } // tessera::chain

FC_REFLECT_DERIVED( tessera::chain::unclaimed_dividend_object, (tessera::db::object),
                    (asset_id)(holder)(amount) )
