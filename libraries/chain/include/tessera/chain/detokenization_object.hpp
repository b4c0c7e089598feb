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

namespace tessera { namespace chain {

using namespace tessera::db;

/// Stage of a detokenization proposal
enum detokenization_status
{
   detokenization_none,
   detokenization_proposed,
   detokenization_passed,
   detokenization_rejected,
   detokenization_executed,
   DETOKENIZATION_STATUS_COUNT
};

/**
 *  @brief the vote on ending the tokenized state of an asset
 *  @ingroup object
 *
 *  An asset has at most one proposal object.  A proposal which is executed or
 *  rejected is terminal and is replaced by the next proposal for the asset.
 */
class detokenization_proposal_object : public abstract_object<detokenization_proposal_object>
{
   public:
      static constexpr uint8_t space_id = ledger_ids;
      static constexpr uint8_t type_id  = detokenization_proposal_object_type;

      asset_id_type     asset_id = 0;
      proposal_id_type  proposal_id = 0;
      principal_type    proposer;
      time_point_sec    created;
      time_point_sec    voting_deadline;
      bool              executed = false;
      time_point_sec    executed_at;

      bool voting_open( time_point_sec now )const { return now < voting_deadline; }
};

struct by_asset;
struct by_proposal_id;

/**
* @ingroup object_index
*/
typedef multi_index_container<
   detokenization_proposal_object,
   indexed_by<
      ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
      ordered_unique< tag<by_asset>,
         member< detokenization_proposal_object, asset_id_type, &detokenization_proposal_object::asset_id >
      >,
      ordered_unique< tag<by_proposal_id>,
         member< detokenization_proposal_object, proposal_id_type, &detokenization_proposal_object::proposal_id >
      >
   >
> detokenization_proposal_multi_index_type;

typedef generic_index<detokenization_proposal_object, detokenization_proposal_multi_index_type> detokenization_proposal_index;

} } // tessera::chain

FC_REFLECT_ENUM( tessera::chain::detokenization_status,
                 (detokenization_none)(detokenization_proposed)(detokenization_passed)
                 (detokenization_rejected)(detokenization_executed)(DETOKENIZATION_STATUS_COUNT) )

FC_REFLECT_DERIVED( tessera::chain::detokenization_proposal_object, (tessera::db::object),
                    (asset_id)(proposal_id)(proposer)(created)(voting_deadline)(executed)(executed_at) )
