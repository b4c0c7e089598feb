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

#define TESSERA_SYMBOL_MIN_LENGTH                      1
#define TESSERA_SYMBOL_MAX_LENGTH                      16
#define TESSERA_MAX_NAME_LENGTH                        128
#define TESSERA_MAX_DESCRIPTION_LENGTH                 4096
#define TESSERA_MAX_PRINCIPAL_LENGTH                   128

/** ownership shares are expressed in basis points, 10000 is 100.00% */
#define TESSERA_100_PERCENT                            10000

#define TESSERA_MAX_TOKEN_DECIMALS                     18
#define TESSERA_DEFAULT_MAX_TOKEN_DECIMALS             TESSERA_MAX_TOKEN_DECIMALS
#define TESSERA_DEFAULT_DETOKENIZATION_VOTING_PERIOD   (60*60*24*7) ///< seconds, one week
#define TESSERA_MAX_DETOKENIZATION_VOTING_PERIOD       (60*60*24*365)
#define TESSERA_DEFAULT_MAX_WHITELIST_SIZE             1000
#define TESSERA_MAX_GEOGRAPHIC_REGIONS                 256

#define TESSERA_MAX_NESTED_OBJECTS                     (200)

/** proposal ids handed out by the ledger start here, 0 is never a valid id */
#define TESSERA_FIRST_PROPOSAL_ID                      1

#define TESSERA_CURRENT_DB_VERSION                     "TESSERA1"
