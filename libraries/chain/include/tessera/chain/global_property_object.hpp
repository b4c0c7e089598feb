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
#include <tessera/db/generic_index.hpp>

namespace tessera { namespace chain {

   /**
    * @class global_property_object
    * @brief Maintains the parameters the ledger was configured with
    * @ingroup object
    * @ingroup implementation
    */
   class global_property_object : public tessera::db::abstract_object<global_property_object>
   {
      public:
         static const uint8_t space_id = implementation_ids;
         static const uint8_t type_id  = impl_global_property_object_type;

         chain_parameters           parameters;
   };

   /**
    * @class dynamic_global_property_object
    * @brief Maintains global state which changes with every call
    * @ingroup object
    * @ingroup implementation
    */
   class dynamic_global_property_object : public tessera::db::abstract_object<dynamic_global_property_object>
   {
      public:
         static const uint8_t space_id = implementation_ids;
         static const uint8_t type_id  = impl_dynamic_global_property_object_type;

         /// ledger time supplied by the host, never moves backwards
         time_point_sec    time;
         /// next id handed out to a detokenization proposal
         proposal_id_type  next_proposal_id = TESSERA_FIRST_PROPOSAL_ID;
         /// number of operations applied successfully
         uint64_t          applied_operations = 0;
   };

   typedef tessera::db::sparse_index<global_property_object>          global_property_index;
   typedef tessera::db::sparse_index<dynamic_global_property_object>  dynamic_global_property_index;

}}

FC_REFLECT_DERIVED( tessera::chain::dynamic_global_property_object, (tessera::db::object),
                    (time)
                    (next_proposal_id)
                    (applied_operations)
                  )

FC_REFLECT_DERIVED( tessera::chain::global_property_object, (tessera::db::object),
                    (parameters)
                  )
