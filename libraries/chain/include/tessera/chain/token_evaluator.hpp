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

#include <tessera/protocol/token.hpp>

namespace tessera { namespace chain {

   class tokenized_asset_object;

   class tokenize_asset_evaluator : public evaluator<tokenize_asset_evaluator>
   {
      public:
         typedef tokenize_asset_operation operation_type;

         void_result do_evaluate( const tokenize_asset_operation& op );
         void_result do_apply( const tokenize_asset_operation& op );
   };

   class token_mint_evaluator : public evaluator<token_mint_evaluator>
   {
      public:
         typedef token_mint_operation operation_type;

         void_result do_evaluate( const token_mint_operation& op );
         void_result do_apply( const token_mint_operation& op );

         const tokenized_asset_object* asset = nullptr;
   };

   class token_burn_evaluator : public evaluator<token_burn_evaluator>
   {
      public:
         typedef token_burn_operation operation_type;

         void_result do_evaluate( const token_burn_operation& op );
         void_result do_apply( const token_burn_operation& op );

         const tokenized_asset_object* asset = nullptr;
   };

   class token_transfer_evaluator : public evaluator<token_transfer_evaluator>
   {
      public:
         typedef token_transfer_operation operation_type;

         void_result do_evaluate( const token_transfer_operation& op );
         void_result do_apply( const token_transfer_operation& op );

         const tokenized_asset_object* asset = nullptr;
   };

   class asset_valuation_update_evaluator : public evaluator<asset_valuation_update_evaluator>
   {
      public:
         typedef asset_valuation_update_operation operation_type;

         void_result do_evaluate( const asset_valuation_update_operation& op );
         void_result do_apply( const asset_valuation_update_operation& op );

         const tokenized_asset_object* asset = nullptr;
   };

   class token_lock_evaluator : public evaluator<token_lock_evaluator>
   {
      public:
         typedef token_lock_operation operation_type;

         void_result do_evaluate( const token_lock_operation& op );
         void_result do_apply( const token_lock_operation& op );
   };

   class token_unlock_evaluator : public evaluator<token_unlock_evaluator>
   {
      public:
         typedef token_unlock_operation operation_type;

         void_result do_evaluate( const token_unlock_operation& op );
         void_result do_apply( const token_unlock_operation& op );
   };

} } // tessera::chain
