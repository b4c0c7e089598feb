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

#include <fc/exception/exception.hpp>
#include <tessera/protocol/exceptions.hpp>

#define TESSERA_TRY_NOTIFY( signal, ... )                                     \
   try                                                                        \
   {                                                                          \
      signal( __VA_ARGS__ );                                                  \
   }                                                                          \
   catch( const fc::exception& e )                                            \
   {                                                                          \
      elog( "Caught exception in ledger observer: ${e}", ("e", e.to_detail_string() ) ); \
   }

/**
 *  Rethrows an exception raised below the ledger as the ledger error which
 *  describes it, keeping the log of the original.
 */
#define TESSERA_RECODE_EXC( cause_type, effect_type ) \
   catch( const cause_type& e ) \
   { throw( effect_type( e.what(), e.get_log() ) ); }

namespace tessera { namespace chain {

   FC_DECLARE_EXCEPTION( chain_exception, 3000000 )

   FC_DECLARE_DERIVED_EXCEPTION( database_query_exception,     tessera::chain::chain_exception, 3010000 )
   FC_DECLARE_DERIVED_EXCEPTION( undo_database_exception,      tessera::chain::chain_exception, 3070000 )

   FC_DECLARE_DERIVED_EXCEPTION( genesis_already_applied,      tessera::chain::database_query_exception, 3010001 )
   FC_DECLARE_DERIVED_EXCEPTION( genesis_not_applied,          tessera::chain::database_query_exception, 3010002 )
   FC_DECLARE_DERIVED_EXCEPTION( reentrant_operation,          tessera::chain::undo_database_exception, 3070001 )

} } // tessera::chain
