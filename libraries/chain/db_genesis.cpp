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
#include <tessera/chain/database.hpp>
#include <tessera/chain/exceptions.hpp>

namespace tessera { namespace chain {

void database::init_genesis( const genesis_state_type& genesis_state )
{ try {
   TESSERA_ASSERT( !_initialized, genesis_already_applied, "Genesis state can only be applied once", ("time",ledger_time()) );
   FC_ASSERT( genesis_state.initial_timestamp != time_point_sec(), "Must initialize genesis timestamp." );
   genesis_state.validate();

   _undo_db.disable();

   create<global_property_object>( [&genesis_state]( global_property_object& p ) {
      p.parameters = genesis_state.initial_parameters;
   });
   create<dynamic_global_property_object>( [&genesis_state]( dynamic_global_property_object& p ) {
      p.time = genesis_state.initial_timestamp;
      p.next_proposal_id = TESSERA_FIRST_PROPOSAL_ID;
   });
   _initialized = true;

   for( const auto& initial : genesis_state.initial_assets )
   {
      const auto& tokenize = initial.tokenize;
      apply_operation( tokenize );
      if( initial.revenue_sharing_enabled )
      {
         revenue_sharing_update_operation op;
         op.asset_id = tokenize.asset_id;
         op.enabled = true;
         op.issuer = tokenize.tokenizer;
         apply_operation( op );
      }
      for( const auto& account : initial.whitelist )
      {
         whitelist_add_operation op;
         op.asset_id = tokenize.asset_id;
         op.account = account;
         op.issuer = tokenize.tokenizer;
         apply_operation( op );
      }
   }
   _pending_events.clear();

   _undo_db.enable();

   ilog( "Ledger initialized at ${t} with ${n} tokenized assets",
         ("t",genesis_state.initial_timestamp)("n",genesis_state.initial_assets.size()) );
} FC_CAPTURE_AND_RETHROW() }

} }
