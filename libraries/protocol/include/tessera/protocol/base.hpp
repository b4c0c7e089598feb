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

#include <tessera/protocol/types.hpp>
#include <tessera/protocol/exceptions.hpp>

namespace tessera { namespace protocol {

   /**
    *  @defgroup operations Operations
    *  @brief The commands which mutate the ledger.
    *
    *  An operation can be thought of like a function call on the ledger: the members
    *  of each struct are the arguments and applying it may produce a result.  Every
    *  operation is applied on its own and either all of its effects are kept or none.
    *
    *  @subsection defined_authority Explicit Authority
    *
    *    Each operation contains enough information to know which principals must
    *    authorize it, the host proves those before the ledger looks at its state.
    *
    *  @{
    */

   struct void_result{};
   typedef fc::static_variant<void_result,share_type,proposal_id_type> operation_result;

   struct base_operation
   {
      void get_required_authorities( flat_set<principal_type>& )const{}
      void validate()const{}
   };

   ///@}

} } // tessera::protocol

FC_REFLECT_TYPENAME( tessera::protocol::operation_result )
FC_REFLECT( tessera::protocol::void_result, )
