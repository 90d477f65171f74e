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
#include <levy/protocol/base.hpp>

namespace levy { namespace protocol {

   /**
    * @brief Exchange with the pool of a pair through the registered exchange gateway
    * @ingroup operations
    *
    * The account must have approved the gateway account for @ref amount_to_sell beforehand.
    */
   struct exchange_swap_operation : public base_operation
   {
      account_id_type          account;            ///< The account who sells and receives
      asset                    amount_to_sell;     ///< The amount of one asset type to sell
      asset                    min_to_receive;     ///< The minimum amount of the other asset type to receive
      time_point_sec           deadline;           ///< The swap fails after this time

      account_id_type caller()const { return account; }
      void            validate()const;
   };

   /**
    * @brief Deposit into the pool of a pair through the registered exchange gateway
    * @ingroup operations
    */
   struct exchange_add_liquidity_operation : public base_operation
   {
      account_id_type          account;            ///< The account who deposits and receives the share asset
      asset                    amount_a;           ///< Desired amount of the first asset
      asset                    amount_b;           ///< Desired amount of the second asset
      share_type               min_a = 0;          ///< Minimum amount of the first asset to deposit
      share_type               min_b = 0;          ///< Minimum amount of the second asset to deposit
      time_point_sec           deadline;

      account_id_type caller()const { return account; }
      void            validate()const;
   };

} } // levy::protocol

FC_REFLECT( levy::protocol::exchange_swap_operation,
            (account)(amount_to_sell)(min_to_receive)(deadline) )
FC_REFLECT( levy::protocol::exchange_add_liquidity_operation,
            (account)(amount_a)(amount_b)(min_a)(min_b)(deadline) )
