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
    * @brief Casts a vote for a proposal on an asset
    * @ingroup operations
    *
    * The vote weighs the voter's balance at the time the vote is cast.  Each
    * principal votes at most once per proposal.
    */
   struct vote_cast_operation : public base_operation
   {
      asset_id_type     asset_id = 0;
      proposal_id_type  proposal_id = 0;
      principal_type    voter;

      void get_required_authorities( flat_set<principal_type>& a )const { a.insert( voter ); }
      void validate()const;
   };

   /**
    * @brief Opens a vote on ending the tokenized state of an asset
    * @ingroup operations
    *
    * The new proposal id is returned as the operation result.
    */
   struct detokenization_propose_operation : public base_operation
   {
      asset_id_type     asset_id = 0;
      principal_type    proposer;

      void get_required_authorities( flat_set<principal_type>& a )const { a.insert( proposer ); }
      void validate()const;
   };

   /**
    * @brief Ends the tokenized state of an asset once its proposal passed
    * @ingroup operations
    *
    * Anyone may submit this operation, the vote is the authorization.
    */
   struct detokenization_execute_operation : public base_operation
   {
      asset_id_type     asset_id = 0;
      proposal_id_type  proposal_id = 0;

      void validate()const;
   };

} } // tessera::protocol

FC_REFLECT( tessera::protocol::vote_cast_operation, (asset_id)(proposal_id)(voter) )
FC_REFLECT( tessera::protocol::detokenization_propose_operation, (asset_id)(proposer) )
FC_REFLECT( tessera::protocol::detokenization_execute_operation, (asset_id)(proposal_id) )
