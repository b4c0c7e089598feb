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
#include <tessera/chain/journal.hpp>
#include <tessera/chain/database.hpp>
#include <tessera/chain/authority_verifier.hpp>

#include <fc/io/json.hpp>
#include <fc/log/logger.hpp>

#include <boost/signals2/connection.hpp>

#include <ostream>

namespace tessera { namespace chain {

namespace {

   std::string to_json( const operation& op )
   {
      fc::variant v;
      fc::to_variant( op, v, TESSERA_MAX_NESTED_OBJECTS );
      return fc::json::to_string( v );
   }

}

journal_replay_summary replay_journal( database& ledger, const vector<journal_entry>& journal,
                                       const journal_replay_options& options, std::ostream& out )
{
   vector<ledger_event> events;
   boost::signals2::scoped_connection event_connection = ledger.applied_event.connect(
      [&events]( const ledger_event& e ) { events.push_back( e ); } );

   journal_replay_summary summary;
   for( size_t i = 0; i < journal.size(); ++i )
   {
      const auto& entry = journal[i];
      ++summary.processed;
      events.clear();
      try
      {
         if( entry.time.valid() )
            ledger.set_ledger_time( *entry.time );

         const approved_principals_verifier auth( entry.signers );
         const auto result = ledger.push_operation( entry.op, auth );
         ++summary.applied;

         fc::variant result_var;
         fc::to_variant( result, result_var, TESSERA_MAX_NESTED_OBJECTS );
         out << "#" << i << " ok " << fc::json::to_string( result_var ) << "\n";
         if( options.print_events )
         {
            for( const auto& e : events )
            {
               fc::variant ev;
               fc::to_variant( e, ev, TESSERA_MAX_NESTED_OBJECTS );
               out << "   " << fc::json::to_string( ev ) << "\n";
            }
         }
      }
      catch( const fc::exception& e )
      {
         ++summary.rejected;
         out << "#" << i << " rejected " << e.name() << " (" << e.code() << "): " << e.top_message() << "\n";
         dlog( "Rejected ${op}: ${e}", ("op",to_json( entry.op ))("e",e.to_detail_string()) );
         if( options.stop_on_error )
            break;
      }
   }

   ilog( "Replayed ${p} of ${n} entries, ${a} applied, ${r} rejected",
         ("p",summary.processed)("n",journal.size())("a",summary.applied)("r",summary.rejected) );
   return summary;
}

} } // tessera::chain
