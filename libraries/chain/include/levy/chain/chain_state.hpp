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

#include <levy/chain/account_object.hpp>
#include <levy/chain/asset_object.hpp>
#include <levy/chain/liquidity_pool_object.hpp>
#include <levy/chain/operation_history_object.hpp>

namespace levy { namespace chain {

   /**
    * @brief The mutable ledger state
    *
    * Every change to it is reported to the undo database, the counters handing out ids included, so
    * that an undone transaction also gives back the ids it allocated.
    */
   struct chain_state
   {
      account_index                       accounts;
      asset_index                         assets;
      account_balance_index               balances;
      allowance_index                     allowances;
      liquidity_pool_index                liquidity_pools;
      vector<operation_history_object>    history;

      uint64_t                            next_account_instance = 0;
      uint64_t                            next_asset_instance = 0;
      uint64_t                            next_pool_instance = 0;
   };

} } // levy::chain
