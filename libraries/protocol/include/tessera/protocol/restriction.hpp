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
#include <tessera/protocol/base.hpp>

namespace tessera { namespace protocol {

   /**
    *  Transfer policy of an asset.  When require_accredited is set the receiver of
    *  a transfer must be on the asset's whitelist.  Region codes are recorded for
    *  the host, principals carry no region the ledger could check them against.
    */
   struct transfer_restriction
   {
      bool              require_accredited = false;
      flat_set<string>  geographic_allowed;

      void validate()const;
   };

   /**
    * @brief Replaces the transfer policy of an asset
    * @ingroup operations
    */
   struct transfer_restriction_set_operation : public base_operation
   {
      asset_id_type          asset_id = 0;
      transfer_restriction   restriction;
      principal_type         issuer;

      void get_required_authorities( flat_set<principal_type>& a )const { a.insert( issuer ); }
      void validate()const;
   };

   /**
    * @brief Removes the transfer policy of an asset, the whitelist is kept
    * @ingroup operations
    */
   struct transfer_restriction_clear_operation : public base_operation
   {
      asset_id_type          asset_id = 0;
      principal_type         issuer;

      void get_required_authorities( flat_set<principal_type>& a )const { a.insert( issuer ); }
      void validate()const;
   };

   /**
    * @ingroup operations
    */
   struct whitelist_add_operation : public base_operation
   {
      asset_id_type          asset_id = 0;
      principal_type         account;
      principal_type         issuer;

      void get_required_authorities( flat_set<principal_type>& a )const { a.insert( issuer ); }
      void validate()const;
   };

   /**
    * @ingroup operations
    */
   struct whitelist_remove_operation : public base_operation
   {
      asset_id_type          asset_id = 0;
      principal_type         account;
      principal_type         issuer;

      void get_required_authorities( flat_set<principal_type>& a )const { a.insert( issuer ); }
      void validate()const;
   };

} } // tessera::protocol

FC_REFLECT( tessera::protocol::transfer_restriction, (require_accredited)(geographic_allowed) )
FC_REFLECT( tessera::protocol::transfer_restriction_set_operation, (asset_id)(restriction)(issuer) )
FC_REFLECT( tessera::protocol::transfer_restriction_clear_operation, (asset_id)(issuer) )
FC_REFLECT( tessera::protocol::whitelist_add_operation, (asset_id)(account)(issuer) )
FC_REFLECT( tessera::protocol::whitelist_remove_operation, (asset_id)(account)(issuer) )
