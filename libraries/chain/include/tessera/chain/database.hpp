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

#include <tessera/chain/global_property_object.hpp>
#include <tessera/chain/tokenized_asset_object.hpp>
#include <tessera/chain/restriction_object.hpp>
#include <tessera/chain/detokenization_object.hpp>
#include <tessera/chain/genesis_state.hpp>
#include <tessera/chain/evaluator.hpp>
#include <tessera/chain/ledger_event.hpp>
#include <tessera/chain/authority_verifier.hpp>

#include <tessera/db/object_database.hpp>
#include <tessera/db/object.hpp>

#include <fc/signals.hpp>
#include <fc/log/logger.hpp>

#include <map>

namespace tessera { namespace chain {
   using tessera::db::abstract_object;
   using tessera::db::object;
   class op_evaluator;

   /**
    *   @class database
    *   @brief tracks the ownership and governance state of tokenized assets
    *
    *   Every change goes through push_operation(), which applies one operation
    *   inside an undo session.  When any check fails the session is undone and
    *   the ledger is left as it was before the call.
    */
   class database : public db::object_database
   {
         //////////////////// db_management.cpp ////////////////////
      public:
         database();
         ~database() override;

         /**
          * @brief Installs the parameters, clock and initial assets of a fresh ledger
          *
          * Must be called exactly once before any operation is pushed.
          */
         void init_genesis( const genesis_state_type& genesis_state );

         bool is_initialized()const { return _initialized; }

         //////////////////// db_apply.cpp ////////////////////

         /**
          *  Validates op, asks auth for every principal op names and applies it.
          *  Either all effects of op are kept or the call throws with the ledger
          *  unchanged.
          *
          *  @return the result of the evaluator
          */
         operation_result push_operation( const operation& op, const authority_verifier& auth );

         /**
          *  Advances the ledger clock.  The clock is supplied by the host and never
          *  moves backwards.
          */
         void set_ledger_time( time_point_sec now );

         /**
          *  This method is used to track applied operations, it is emitted after
          *  the operation was committed, together with its result.
          */
         fc::signal<void(const operation&, const operation_result&)> applied_operation;

         /**
          *  Emitted for every event of a committed operation, in the order the
          *  evaluator published them.
          */
         fc::signal<void(const ledger_event&)>                      applied_event;

         //////////////////// db_notify.cpp ////////////////////

         /** Queues an event of the operation being applied, dropped if the operation fails */
         void publish_event( const string& topic, const string& name, const variant_object& payload );

         //////////////////// db_getter.cpp ////////////////////

         const global_property_object&          get_global_properties()const;
         const dynamic_global_property_object&  get_dynamic_global_properties()const;
         const chain_parameters&                get_chain_parameters()const;
         time_point_sec                         ledger_time()const;

         const tokenized_asset_object&          get_tokenized_asset( asset_id_type asset_id )const;
         const tokenized_asset_object*          find_tokenized_asset( asset_id_type asset_id )const;

         /// @return the balance of holder, 0 if holder has none
         share_type                             get_token_balance( asset_id_type asset_id, const principal_type& holder )const;
         /// @return every principal with a positive balance of the asset
         vector<principal_type>                 get_token_holders( asset_id_type asset_id )const;
         /// @return the share of the supply held by holder in basis points
         share_type                             get_ownership_percentage( asset_id_type asset_id, const principal_type& holder )const;

         bool                                   is_tokens_locked( asset_id_type asset_id, const principal_type& holder )const;
         optional<time_point_sec>               get_token_lock( asset_id_type asset_id, const principal_type& holder )const;

         share_type                             get_unclaimed_dividends( asset_id_type asset_id, const principal_type& holder )const;
         bool                                   is_revenue_sharing_enabled( asset_id_type asset_id )const;

         //////////////////// db_restriction.cpp ////////////////////

         /**
          *  Checks a transfer of the asset to `to` against the whitelist and the
          *  accreditation requirement.  Throws the violated restriction.
          *
          *  @return true if the transfer is allowed
          */
         bool                                   validate_transfer( asset_id_type asset_id, const principal_type& from,
                                                                   const principal_type& to )const;
         bool                                   is_whitelisted( asset_id_type asset_id, const principal_type& account )const;
         /// @return the whitelist in the order its entries were added
         vector<principal_type>                 get_whitelist( asset_id_type asset_id )const;
         size_t                                 get_whitelist_size( asset_id_type asset_id )const;
         bool                                   has_transfer_restrictions( asset_id_type asset_id )const;
         const transfer_restriction&            get_transfer_restriction( asset_id_type asset_id )const;

         //////////////////// db_governance.cpp ////////////////////

         share_type                             get_vote_tally( asset_id_type asset_id, proposal_id_type proposal_id )const;
         bool                                   has_voted( asset_id_type asset_id, proposal_id_type proposal_id,
                                                           const principal_type& voter )const;
         /// @return true if the tally reached the voting threshold of the asset
         bool                                   proposal_passed( asset_id_type asset_id, proposal_id_type proposal_id )const;

         const detokenization_proposal_object&  get_detokenization_proposal( asset_id_type asset_id )const;
         const detokenization_proposal_object*  find_detokenization_proposal( asset_id_type asset_id )const;
         detokenization_status                  get_detokenization_status( asset_id_type asset_id )const;
         detokenization_status                  get_detokenization_status( const detokenization_proposal_object& p )const;
         /// @return true while the asset has a proposal which is proposed or passed
         bool                                   is_detokenization_active( asset_id_type asset_id )const;

         //////////////////// db_balance.cpp ////////////////////

         /**
          * @brief Adjust a holder's balance of a tokenized asset by delta
          *
          * Keeps the holder set in step: a balance object is created on the first
          * credit and removed when the balance reaches zero.  The total supply is
          * not touched.
          */
         void adjust_token_balance( const tokenized_asset_object& asset, const principal_type& holder, share_type delta );

         /// Adds amount to the unclaimed dividend of holder
         void credit_dividend( asset_id_type asset_id, const principal_type& holder, share_type amount );

         /// Removes the unclaimed dividend of holder and returns it
         share_type take_unclaimed_dividend( asset_id_type asset_id, const principal_type& holder );

         //////////////////// db_init.cpp ////////////////////

         /// Reset the object graph in-memory
         void initialize_indexes();
         void initialize_evaluators();

         template<typename EvaluatorType>
         void register_evaluator()
         {
            _operation_evaluators[
               operation::tag<typename EvaluatorType::operation_type>::value].reset( new op_evaluator_impl<EvaluatorType>() );
         }

      private:
         //////////////////// db_apply.cpp ////////////////////
         operation_result apply_operation( const operation& op );

         vector< std::unique_ptr<op_evaluator> > _operation_evaluators;

         vector<ledger_event>                    _pending_events;
         bool                                    _applying = false;
         bool                                    _initialized = false;
   };

} }
