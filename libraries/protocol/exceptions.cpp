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
#include <tessera/protocol/exceptions.hpp>

namespace tessera { namespace protocol {

   FC_IMPLEMENT_EXCEPTION( ledger_exception, 4000000, "ledger exception" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( not_found_exception,             ledger_exception, 4010000, "not found" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( already_exists_exception,        ledger_exception, 4020000, "already exists" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( unauthorized_exception,          ledger_exception, 4030000, "unauthorized" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_input_exception,         ledger_exception, 4040000, "invalid input" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( arithmetic_fault_exception,      ledger_exception, 4050000, "arithmetic fault" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( restriction_violation_exception, ledger_exception, 4060000, "restriction violation" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( state_conflict_exception,        ledger_exception, 4070000, "state conflict" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( asset_not_tokenized,             not_found_exception, 4010011, "asset is not tokenized" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( proposal_not_found,              not_found_exception, 4010023, "proposal not found" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( asset_already_tokenized,         already_exists_exception, 4020010, "asset is already tokenized" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( already_voted,                   already_exists_exception, 4020022, "already voted on this proposal" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( detokenization_already_proposed, already_exists_exception, 4020029, "detokenization is already proposed" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( missing_authority,               unauthorized_exception, 4030001, "missing required authority" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( unauthorized_caller,             unauthorized_exception, 4030008, "caller is not permitted to perform this action" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_amount,                  invalid_input_exception, 4040001, "amount must be positive" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_principal,               invalid_input_exception, 4040002, "invalid principal" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_symbol,                  invalid_input_exception, 4040003, "invalid token symbol" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_metadata,                invalid_input_exception, 4040004, "invalid token metadata" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_parameter,               invalid_input_exception, 4040005, "invalid ledger parameter" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_token_supply,            invalid_input_exception, 4040012, "invalid token supply" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_token_decimals,          invalid_input_exception, 4040013, "invalid token decimals" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_proposal,                invalid_input_exception, 4040024, "invalid proposal" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_dividend_amount,         invalid_input_exception, 4040027, "invalid dividend amount" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_valuation,               invalid_input_exception, 4040030, "invalid valuation" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( math_overflow,                   arithmetic_fault_exception, 4050032, "arithmetic overflow" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( math_underflow,                  arithmetic_fault_exception, 4050033, "arithmetic underflow" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( transfer_restriction_failed,     restriction_violation_exception, 4060017, "transfer restriction failed" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( accredited_investor_required,    restriction_violation_exception, 4060019, "accredited investor required" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( revenue_sharing_disabled,        state_conflict_exception, 4070001, "revenue sharing is disabled" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( ledger_time_regression,          state_conflict_exception, 4070002, "ledger time can not move backwards" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( whitelist_full,                  state_conflict_exception, 4070003, "whitelist is full" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( insufficient_balance,            state_conflict_exception, 4070014, "insufficient balance" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( tokens_are_locked,               state_conflict_exception, 4070016, "tokens are locked" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( insufficient_voting_power,       state_conflict_exception, 4070021, "insufficient voting power" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( voting_period_ended,             state_conflict_exception, 4070025, "voting period ended" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( no_dividends_to_claim,           state_conflict_exception, 4070026, "no dividends to claim" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( detokenization_not_approved,     state_conflict_exception, 4070028, "detokenization is not approved" )

} } // tessera::protocol
