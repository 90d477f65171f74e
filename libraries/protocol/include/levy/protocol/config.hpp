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

#define LEVY_SYMBOL "LEVY"
#define LEVY_CORE_SYMBOL "CORE"

/** the levy token is denominated like an ERC-20 style asset */
#define LEVY_DEFAULT_DECIMALS                  18
#define LEVY_MAX_DECIMALS                      36
#define LEVY_DEFAULT_INITIAL_SUPPLY            1000000 ///< whole units, scaled by 10^decimals at construction

#define LEVY_MIN_ASSET_SYMBOL_LENGTH 3
#define LEVY_MAX_ASSET_SYMBOL_LENGTH 16

#define LEVY_MIN_ACCOUNT_NAME_LENGTH 1
#define LEVY_MAX_ACCOUNT_NAME_LENGTH 63

/** the levy is expressed in whole percent */
#define LEVY_100_PERCENT                       100
#define LEVY_DEFAULT_TAX_PERCENT               5
#define LEVY_DEFAULT_TAX_WINDOW_SECONDS        (60*60) ///< 1 hour

/** pool fees are expressed in basis points */
#define LEVY_POOL_FEE_DENOM                    10000
#define LEVY_DEFAULT_POOL_TAKER_FEE            30 ///< 0.3%

#define LEVY_DEFAULT_BLOCK_INTERVAL            5 /* seconds */
#define LEVY_MIN_BLOCK_INTERVAL                1 /* seconds */
#define LEVY_MAX_BLOCK_INTERVAL                30 /* seconds */

#define LEVY_MAX_NESTED_OBJECTS                (200)

#define LEVY_CUSTODY_ACCOUNT_SUFFIX            "-custody"
#define LEVY_PAIR_ACCOUNT_PREFIX               "pair-"
#define LEVY_SHARE_ASSET_PREFIX                "LP"
/** letters kept from each asset symbol when naming the share asset of a pool */
#define LEVY_SHARE_SYMBOL_PART_LENGTH          6
