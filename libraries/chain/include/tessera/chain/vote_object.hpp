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
 *  @brief accumulated affirmative weight of one proposal on one asset
 *  @ingroup object
 *
 *  Created by the first vote, a proposal nobody voted on has no tally.
 */
class vote_tally_object : public abstract_object<vote_tally_object>
{
   public:
      static constexpr uint8_t space_id = ledger_ids;
      static constexpr uint8_t type_id  = vote_tally_object_type;

      asset_id_type     asset_id = 0;
      proposal_id_type  proposal_id = 0;
      share_type        total_weight;
      uint32_t          voter_count = 0;
};

/**
 *  @brief records that a principal voted on a proposal, and with which weight
 *  @ingroup object
 */
class vote_record_object : public abstract_object<vote_record_object>
{
   public:
      static constexpr uint8_t space_id = ledger_ids;
      static constexpr uint8_t type_id  = vote_record_object_type;

      asset_id_type     asset_id = 0;
      proposal_id_type  proposal_id = 0;
      principal_type    voter;
      share_type        weight;
      time_point_sec    cast_at;
};

struct by_proposal;
struct by_proposal_voter;

/**
* @ingroup object_index
*/
typedef multi_index_container<
   vote_tally_object,
   indexed_by<
      ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
      ordered_unique< tag<by_proposal>,
         composite_key< vote_tally_object,
            member< vote_tally_object, asset_id_type, &vote_tally_object::asset_id >,
            member< vote_tally_object, proposal_id_type, &vote_tally_object::proposal_id >
         >
      >
   >
> vote_tally_multi_index_type;

typedef generic_index<vote_tally_object, vote_tally_multi_index_type> vote_tally_index;

/**
* @ingroup object_index
*/
typedef multi_index_container<
   vote_record_object,
   indexed_by<
      ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
      ordered_unique< tag<by_proposal_voter>,
         composite_key< vote_record_object,
            member< vote_record_object, asset_id_type, &vote_record_object::asset_id >,
            member< vote_record_object, proposal_id_type, &vote_record_object::proposal_id >,
            member< vote_record_object, principal_type, &vote_record_object::voter >
         >
      >
   >
> vote_record_multi_index_type;

typedef generic_index<vote_record_object, vote_record_multi_index_type> vote_record_index;

} } // tessera::chain

FC_REFLECT_DERIVED( tessera::chain::vote_tally_object, (tessera::db::object),
                    (asset_id)(proposal_id)(total_weight)(voter_count) )

FC_REFLECT_DERIVED( tessera::chain::vote_record_object, (tessera::db::object),
                    (asset_id)(proposal_id)(voter)(weight)(cast_at) )
