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

#include <tessera/protocol/restriction.hpp>

namespace tessera { namespace chain {

   class tokenized_asset_object;

   class transfer_restriction_set_evaluator : public evaluator<transfer_restriction_set_evaluator>
   {
      public:
         typedef transfer_restriction_set_operation operation_type;

         void_result do_evaluate( const transfer_restriction_set_operation& op );
         void_result do_apply( const transfer_restriction_set_operation& op );
   };

   class transfer_restriction_clear_evaluator : public evaluator<transfer_restriction_clear_evaluator>
   {
      public:
         typedef transfer_restriction_clear_operation operation_type;

         void_result do_evaluate( const transfer_restriction_clear_operation& op );
         void_result do_apply( const transfer_restriction_clear_operation& op );
   };

   class whitelist_add_evaluator : public evaluator<whitelist_add_evaluator>
   {
      public:
         typedef whitelist_add_operation operation_type;

         void_result do_evaluate( const whitelist_add_operation& op );
         void_result do_apply( const whitelist_add_operation& op );

         bool already_listed = false;
   };

   class whitelist_remove_evaluator : public evaluator<whitelist_remove_evaluator>
   {
      public:
         typedef whitelist_remove_operation operation_type;

         void_result do_evaluate( const whitelist_remove_operation& op );
         void_result do_apply( const whitelist_remove_operation& op );
   };

} } // tessera::chain
