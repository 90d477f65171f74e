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

#include <levy/chain/types.hpp>

namespace levy { namespace chain {

   /**
    * @brief Creates and finds the pool of a pair of assets
    */
   class pair_factory
   {
      public:
         virtual ~pair_factory(){}

         /// Fails with @ref exchange_pair_exists if the pair already has a pool
         virtual liquidity_pool_id_type create_pair( asset_id_type token_a, asset_id_type token_b ) = 0;
         virtual optional<liquidity_pool_id_type> get_pair( asset_id_type token_a, asset_id_type token_b )const = 0;
   };

   /**
    * @brief What a liquidity deposit actually consumed and minted
    */
   struct add_liquidity_result
   {
      share_type amount_a;
      share_type amount_b;
      /// Share asset minted to the recipient
      asset      liquidity;
   };

   /**
    * @brief Swaps and liquidity deposits against the pools of a @ref pair_factory
    *
    * Amounts leave the caller through @ref database::transfer_from with @ref gateway_account as the
    * spender, so the caller has to approve the gateway account first.
    */
   class exchange_gateway
   {
      public:
         virtual ~exchange_gateway(){}

         virtual pair_factory&   factory() = 0;
         /// The asset every levy conversion is paired with
         virtual asset_id_type   paired_asset()const = 0;
         /// The identity the gateway spends allowances as
         virtual account_id_type gateway_account()const = 0;

         /**
          * Sells exactly @p amount_in of path[0] for path[1].
          *
          * The output is computed from what the pool actually received, so assets that withhold part
          * of a transfer can be sold.
          *
          * @return the amount of path[1] sent to @p recipient
          */
         virtual share_type swap_exact_input_supporting_fee_on_transfer( account_id_type caller,
                                                                         share_type amount_in,
                                                                         share_type min_out,
                                                                         const vector<asset_id_type>& path,
                                                                         account_id_type recipient,
                                                                         time_point_sec deadline ) = 0;

         /**
          * Deposits up to @p desired_a of @p token_a and @p desired_b of @p token_b at the pool's current
          * ratio and mints the share asset to @p recipient.
          */
         virtual add_liquidity_result add_liquidity( account_id_type caller,
                                                     asset_id_type token_a,
                                                     asset_id_type token_b,
                                                     share_type desired_a,
                                                     share_type desired_b,
                                                     share_type min_a,
                                                     share_type min_b,
                                                     account_id_type recipient,
                                                     time_point_sec deadline ) = 0;
   };

} } // levy::chain

FC_REFLECT( levy::chain::add_liquidity_result, (amount_a)(amount_b)(liquidity) )
