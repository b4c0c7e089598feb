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
#include <tessera/chain/evaluator.hpp>

#include <tessera/protocol/governance.hpp>

namespace tessera { namespace chain {

   class tokenized_asset_object;
   class detokenization_proposal_object;

   class detokenization_propose_evaluator : public evaluator<detokenization_propose_evaluator>
   {
      public:
         typedef detokenization_propose_operation operation_type;

         void_result do_evaluate( const detokenization_propose_operation& op );
         proposal_id_type do_apply( const detokenization_propose_operation& op );

         const detokenization_proposal_object* prior_proposal = nullptr;
   };

   class detokenization_execute_evaluator : public evaluator<detokenization_execute_evaluator>
   {
      public:
         typedef detokenization_execute_operation operation_type;

         void_result do_evaluate( const detokenization_execute_operation& op );
         void_result do_apply( const detokenization_execute_operation& op );

         const tokenized_asset_object*          asset = nullptr;
         const detokenization_proposal_object*  proposal = nullptr;
   };

} } // tessera::chain
