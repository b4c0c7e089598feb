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
#include <tessera/chain/evaluator.hpp>
#include <tessera/chain/exceptions.hpp>

namespace tessera { namespace chain {

operation_result database::push_operation( const operation& op, const authority_verifier& auth )
{ try {
   TESSERA_ASSERT( !_applying, reentrant_operation,
                   "An operation cannot be pushed while another one is being applied", ("op",op) );
   TESSERA_ASSERT( _initialized, genesis_not_applied,
                   "The ledger must be initialized before operations are pushed", ("op",op) );

   operation_validate( op );

   flat_set<principal_type> required;
   operation_get_required_authorities( op, required );
   for( const auto& who : required )
      auth.require_auth( who );

   _pending_events.clear();
   _applying = true;

   operation_result result;
   try {
      auto session = _undo_db.start_undo_session();
      try {
         result = apply_operation( op );
      }
      TESSERA_RECODE_EXC( fc::overflow_exception, math_overflow )
      TESSERA_RECODE_EXC( fc::underflow_exception, math_underflow )

      modify( get_dynamic_global_properties(), []( dynamic_global_property_object& dgp ) {
         ++dgp.applied_operations;
      });
      session.commit();
   } catch( const fc::exception& e ) {
      _applying = false;
      _pending_events.clear();
      dlog( "Operation rejected: ${e}", ("e",e.to_string()) );
      throw;
   }

   vector<ledger_event> events;
   events.swap( _pending_events );
   _applying = false;

   TESSERA_TRY_NOTIFY( applied_operation, op, result )
   for( const auto& e : events )
   {
      TESSERA_TRY_NOTIFY( applied_event, e )
   }
   return result;
} FC_CAPTURE_AND_RETHROW( (op) ) }

operation_result database::apply_operation( const operation& op )
{
   int i_which = op.which();
   uint64_t u_which = uint64_t( i_which );
   FC_ASSERT( i_which >= 0, "Negative operation tag in operation ${op}", ("op",op) );
   FC_ASSERT( u_which < _operation_evaluators.size(), "No registered evaluator for operation ${op}", ("op",op) );
   unique_ptr<op_evaluator>& eval = _operation_evaluators[ u_which ];
   FC_ASSERT( eval, "No registered evaluator for operation ${op}", ("op",op) );
   return eval->evaluate( *this, op, true );
}

void database::set_ledger_time( time_point_sec now )
{
   TESSERA_ASSERT( _initialized, genesis_not_applied,
                   "The ledger must be initialized before its clock is set", ("now",now) );
   const auto& dgp = get_dynamic_global_properties();
   if( now < dgp.time )
   {
      wlog( "Refusing to move the ledger clock back from ${old} to ${new}", ("old",dgp.time)("new",now) );
      FC_THROW_EXCEPTION( ledger_time_regression, "Ledger time cannot move backwards from ${old} to ${new}",
                          ("old",dgp.time)("new",now) );
   }
   modify( dgp, [now]( dynamic_global_property_object& p ) {
      p.time = now;
   });
}

} }
