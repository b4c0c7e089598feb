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
#include <tessera/protocol/restriction.hpp>

namespace tessera { namespace protocol {

void transfer_restriction::validate()const
{
   TESSERA_ASSERT( geographic_allowed.size() <= TESSERA_MAX_GEOGRAPHIC_REGIONS, invalid_parameter,
                   "Too many allowed regions", ("count",geographic_allowed.size()) );
   for( const auto& region : geographic_allowed )
      TESSERA_ASSERT( !region.empty(), invalid_parameter, "Region codes must not be empty", ("region",region) );
}

void transfer_restriction_set_operation::validate()const
{
   issuer.validate();
   restriction.validate();
}

void transfer_restriction_clear_operation::validate()const
{
   issuer.validate();
}

void whitelist_add_operation::validate()const
{
   issuer.validate();
   account.validate();
}

void whitelist_remove_operation::validate()const
{
   issuer.validate();
   account.validate();
}

} } // tessera::protocol
