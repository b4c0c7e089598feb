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

#include <tessera/protocol/dividend.hpp>

namespace tessera { namespace chain {

   class tokenized_asset_object;

   class revenue_sharing_update_evaluator : public evaluator<revenue_sharing_update_evaluator>
   {
      public:
         typedef revenue_sharing_update_operation operation_type;

         void_result do_evaluate( const revenue_sharing_update_operation& op );
         void_result do_apply( const revenue_sharing_update_operation& op );

         const tokenized_asset_object* asset = nullptr;
   };

   /**
    *  Credits every current holder its pro-rata share of the distributed amount.
    *  Shares are rounded down, the remainder stays with the distributor.
    */
   class dividend_distribute_evaluator : public evaluator<dividend_distribute_evaluator>
   {
      public:
         typedef dividend_distribute_operation operation_type;

         void_result do_evaluate( const dividend_distribute_operation& op );
         void_result do_apply( const dividend_distribute_operation& op );

         const tokenized_asset_object* asset = nullptr;
   };

   class dividend_claim_evaluator : public evaluator<dividend_claim_evaluator>
   {
      public:
         typedef dividend_claim_operation operation_type;

         void_result do_evaluate( const dividend_claim_operation& op );
         share_type do_apply( const dividend_claim_operation& op );
   };

} } // tessera::chain
