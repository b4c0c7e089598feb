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
#include <tessera/protocol/operations.hpp>

#include <iosfwd>

namespace tessera { namespace chain {

   class database;

   /**
    *  One request of a journal: the operation, the principals whose authority
    *  the recording host verified, and the ledger time to set before applying it.
    */
   struct journal_entry
   {
      flat_set<principal_type>   signers;
      optional<time_point_sec>   time;
      operation                  op;
   };

   struct journal_replay_options
   {
      bool print_events  = false;
      bool stop_on_error = false;
   };

   struct journal_replay_summary
   {
      uint32_t processed = 0; ///< entries attempted, less than the journal size after a stop on error
      uint32_t applied   = 0;
      uint32_t rejected  = 0;
   };

   /**
    *  Applies the entries in order, each one authorized only by its signers.  One
    *  line per entry goes to out: "#i ok <result>" or "#i rejected <name> (<code>): <message>".
    *  A rejected entry leaves the ledger unchanged and the replay moves on to the
    *  next one unless options.stop_on_error is set.
    */
   journal_replay_summary replay_journal( database& ledger, const vector<journal_entry>& journal,
                                          const journal_replay_options& options, std::ostream& out );

} } // tessera::chain

FC_REFLECT( tessera::chain::journal_entry, (signers)(time)(op) )
FC_REFLECT( tessera::chain::journal_replay_summary, (processed)(applied)(rejected) )
