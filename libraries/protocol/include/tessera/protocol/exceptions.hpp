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

#define TESSERA_ASSERT( expr, exc_type, FORMAT, ... )                 \
   FC_MULTILINE_MACRO_BEGIN                                           \
   if( !(expr) )                                                      \
      FC_THROW_EXCEPTION( exc_type, FORMAT, __VA_ARGS__ );            \
   FC_MULTILINE_MACRO_END

namespace tessera { namespace protocol {

   /**
    *  Every failure of a ledger operation derives from ledger_exception through
    *  exactly one of the seven kind classes below, so callers can react to the
    *  kind without knowing every specific error.
    */
   FC_DECLARE_EXCEPTION( ledger_exception, 4000000 )

   FC_DECLARE_DERIVED_EXCEPTION( not_found_exception,             tessera::protocol::ledger_exception, 4010000 )
   FC_DECLARE_DERIVED_EXCEPTION( already_exists_exception,        tessera::protocol::ledger_exception, 4020000 )
   FC_DECLARE_DERIVED_EXCEPTION( unauthorized_exception,          tessera::protocol::ledger_exception, 4030000 )
   FC_DECLARE_DERIVED_EXCEPTION( invalid_input_exception,         tessera::protocol::ledger_exception, 4040000 )
   FC_DECLARE_DERIVED_EXCEPTION( arithmetic_fault_exception,      tessera::protocol::ledger_exception, 4050000 )
   FC_DECLARE_DERIVED_EXCEPTION( restriction_violation_exception, tessera::protocol::ledger_exception, 4060000 )
   FC_DECLARE_DERIVED_EXCEPTION( state_conflict_exception,        tessera::protocol::ledger_exception, 4070000 )

   FC_DECLARE_DERIVED_EXCEPTION( asset_not_tokenized,             tessera::protocol::not_found_exception, 4010011 )
   FC_DECLARE_DERIVED_EXCEPTION( proposal_not_found,              tessera::protocol::not_found_exception, 4010023 )

   FC_DECLARE_DERIVED_EXCEPTION( asset_already_tokenized,         tessera::protocol::already_exists_exception, 4020010 )
   FC_DECLARE_DERIVED_EXCEPTION( already_voted,                   tessera::protocol::already_exists_exception, 4020022 )
   FC_DECLARE_DERIVED_EXCEPTION( detokenization_already_proposed, tessera::protocol::already_exists_exception, 4020029 )

   FC_DECLARE_DERIVED_EXCEPTION( missing_authority,               tessera::protocol::unauthorized_exception, 4030001 )
   FC_DECLARE_DERIVED_EXCEPTION( unauthorized_caller,             tessera::protocol::unauthorized_exception, 4030008 )

   FC_DECLARE_DERIVED_EXCEPTION( invalid_amount,                  tessera::protocol::invalid_input_exception, 4040001 )
   FC_DECLARE_DERIVED_EXCEPTION( invalid_principal,               tessera::protocol::invalid_input_exception, 4040002 )
   FC_DECLARE_DERIVED_EXCEPTION( invalid_symbol,                  tessera::protocol::invalid_input_exception, 4040003 )
   FC_DECLARE_DERIVED_EXCEPTION( invalid_metadata,                tessera::protocol::invalid_input_exception, 4040004 )
   FC_DECLARE_DERIVED_EXCEPTION( invalid_parameter,               tessera::protocol::invalid_input_exception, 4040005 )
   FC_DECLARE_DERIVED_EXCEPTION( invalid_token_supply,            tessera::protocol::invalid_input_exception, 4040012 )
   FC_DECLARE_DERIVED_EXCEPTION( invalid_token_decimals,          tessera::protocol::invalid_input_exception, 4040013 )
   FC_DECLARE_DERIVED_EXCEPTION( invalid_proposal,                tessera::protocol::invalid_input_exception, 4040024 )
   FC_DECLARE_DERIVED_EXCEPTION( invalid_dividend_amount,         tessera::protocol::invalid_input_exception, 4040027 )
   FC_DECLARE_DERIVED_EXCEPTION( invalid_valuation,               tessera::protocol::invalid_input_exception, 4040030 )

   FC_DECLARE_DERIVED_EXCEPTION( math_overflow,                   tessera::protocol::arithmetic_fault_exception, 4050032 )
   FC_DECLARE_DERIVED_EXCEPTION( math_underflow,                  tessera::protocol::arithmetic_fault_exception, 4050033 )

   FC_DECLARE_DERIVED_EXCEPTION( transfer_restriction_failed,     tessera::protocol::restriction_violation_exception, 4060017 )
   FC_DECLARE_DERIVED_EXCEPTION( accredited_investor_required,    tessera::protocol::restriction_violation_exception, 4060019 )

   FC_DECLARE_DERIVED_EXCEPTION( revenue_sharing_disabled,        tessera::protocol::state_conflict_exception, 4070001 )
   FC_DECLARE_DERIVED_EXCEPTION( ledger_time_regression,          tessera::protocol::state_conflict_exception, 4070002 )
   FC_DECLARE_DERIVED_EXCEPTION( whitelist_full,                  tessera::protocol::state_conflict_exception, 4070003 )
   FC_DECLARE_DERIVED_EXCEPTION( insufficient_balance,            tessera::protocol::state_conflict_exception, 4070014 )
   FC_DECLARE_DERIVED_EXCEPTION( tokens_are_locked,               tessera::protocol::state_conflict_exception, 4070016 )
   FC_DECLARE_DERIVED_EXCEPTION( insufficient_voting_power,       tessera::protocol::state_conflict_exception, 4070021 )
   FC_DECLARE_DERIVED_EXCEPTION( voting_period_ended,             tessera::protocol::state_conflict_exception, 4070025 )
   FC_DECLARE_DERIVED_EXCEPTION( no_dividends_to_claim,           tessera::protocol::state_conflict_exception, 4070026 )
   FC_DECLARE_DERIVED_EXCEPTION( detokenization_not_approved,     tessera::protocol::state_conflict_exception, 4070028 )

} } // tessera::protocol
