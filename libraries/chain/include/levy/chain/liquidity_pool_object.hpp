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
    *  @brief A liquidity pool of a pair of assets
    *  @ingroup object
    *
    *  The reserves are held by @ref pair_account like any other balance. @ref balance_a and
    *  @ref balance_b are the reserves as of the last completed swap or deposit.
    */
   class liquidity_pool_object
   {
      public:
         static const uint8_t space_id = protocol_ids;
         static const uint8_t type_id  = liquidity_pool_object_type;

         liquidity_pool_id_type id;
         asset_id_type   asset_a;                ///< Type of the first asset in the pool
         asset_id_type   asset_b;                ///< Type of the second asset in the pool
         share_type      balance_a;              ///< The reserve of the first asset
         share_type      balance_b;              ///< The reserve of the second asset
         asset_id_type   share_asset;            ///< Type of the share asset aka the LP token
         account_id_type pair_account;           ///< Holder of the reserves
         uint16_t        taker_fee_percent = 0;  ///< Taker fee in basis points

         bool is_empty()const { return balance_a == 0 || balance_b == 0; }
   };

   struct by_asset_ab;

   /**
    * @ingroup object_index
    */
   typedef multi_index_container<
      liquidity_pool_object,
      indexed_by<
         ordered_unique< tag<by_id>,
            member< liquidity_pool_object, liquidity_pool_id_type, &liquidity_pool_object::id > >,
         ordered_unique< tag<by_asset_ab>,
            composite_key< liquidity_pool_object,
               member< liquidity_pool_object, asset_id_type, &liquidity_pool_object::asset_a >,
               member< liquidity_pool_object, asset_id_type, &liquidity_pool_object::asset_b >
            >
         >
      >
   > liquidity_pool_index;

} } // levy::chain

FC_REFLECT( levy::chain::liquidity_pool_object,
            (id)(asset_a)(asset_b)(balance_a)(balance_b)(share_asset)(pair_account)(taker_fee_percent) )
