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
    *  @brief tracks the parameters of an asset
    *  @ingroup object
    *
    *  All assets have a globally unique symbol name that controls how they are traded and an issuer who
    *  created them. The supply is tracked here rather than summed over balances.
    */
   class asset_object
   {
      public:
         static const uint8_t space_id = protocol_ids;
         static const uint8_t type_id  = asset_object_type;

         asset_id_type     id;
         /// Ticker symbol for this asset, i.e. "LEVY"
         string            symbol;
         /// Maximum number of digits after the decimal point
         uint8_t           precision = 0;
         /// ID of the account which issued this asset
         account_id_type   issuer;
         /// The number of shares currently in existence
         share_type        current_supply;
         /// Set for the share asset of a liquidity pool
         optional<liquidity_pool_id_type> for_liquidity_pool;

         asset amount( share_type a )const { return asset( a, id ); }

         /// 10^precision
         share_type scaled_precision()const { return levy::protocol::scaled_precision( precision ); }

         bool is_liquidity_pool_share_asset()const { return for_liquidity_pool.valid(); }

         static bool is_valid_symbol( const string& symbol );
   };

   /**
    * @ingroup object_index
    */
   typedef multi_index_container<
      asset_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< asset_object, asset_id_type, &asset_object::id > >,
         ordered_unique< tag<by_symbol>, member< asset_object, string, &asset_object::symbol > >
      >
   > asset_index;

} } // levy::chain

FC_REFLECT( levy::chain::asset_object,
            (id)(symbol)(precision)(issuer)(current_supply)(for_liquidity_pool) )
