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

namespace tessera { namespace chain {

   /**
    *  @brief answers whether the current request may act as a principal
    *
    *  The ledger asks the verifier for every principal an operation names before
    *  it looks at any state.  A failed check throws missing_authority.
    */
   class authority_verifier
   {
      public:
         virtual ~authority_verifier(){}

         virtual void require_auth( const principal_type& who )const = 0;
   };

   /**
    *  Authorizes a fixed set of principals, typically those whose signatures the
    *  host checked for the request.
    */
   class approved_principals_verifier : public authority_verifier
   {
      public:
         approved_principals_verifier() = default;
         explicit approved_principals_verifier( const flat_set<principal_type>& approved );

         void approve( const principal_type& who ) { _approved.insert( who ); }
         const flat_set<principal_type>& approved()const { return _approved; }

         virtual void require_auth( const principal_type& who )const override;

      private:
         flat_set<principal_type> _approved;
   };

   /**
    *  Accepts every principal.  For tests and for replaying journals whose
    *  authorization was checked when they were recorded.
    */
   class permissive_verifier : public authority_verifier
   {
      public:
         virtual void require_auth( const principal_type& who )const override {}
   };

} } // tessera::chain
