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

#include <levy/chain/exchange_gateway.hpp>

namespace levy { namespace chain {

   class database;

   /**
    * @brief An exchange gateway backed by constant product pools kept in the database
    *
    * Every pool gets a pair account holding its reserves and a share asset issued to liquidity
    * providers. Input amounts are pulled before the pool is locked; the output transfer and share
    * minting run with the pool locked, so a transfer that re-enters the same pool while its output
    * is being paid out fails with @ref exchange_pool_locked.
    */
   class constant_product_gateway : public exchange_gateway, public pair_factory
   {
      public:
         constant_product_gateway( database& db, asset_id_type paired_asset,
                                   uint16_t taker_fee_percent = LEVY_DEFAULT_POOL_TAKER_FEE,
                                   const string& account_name = "exchange-router" );

         pair_factory&   factory() override { return *this; }
         asset_id_type   paired_asset()const override { return _paired_asset; }
         account_id_type gateway_account()const override { return _account; }

         liquidity_pool_id_type           create_pair( asset_id_type token_a, asset_id_type token_b ) override;
         optional<liquidity_pool_id_type> get_pair( asset_id_type token_a, asset_id_type token_b )const override;

         share_type swap_exact_input_supporting_fee_on_transfer( account_id_type caller,
                                                                 share_type amount_in,
                                                                 share_type min_out,
                                                                 const vector<asset_id_type>& path,
                                                                 account_id_type recipient,
                                                                 time_point_sec deadline ) override;

         add_liquidity_result add_liquidity( account_id_type caller,
                                             asset_id_type token_a,
                                             asset_id_type token_b,
                                             share_type desired_a,
                                             share_type desired_b,
                                             share_type min_a,
                                             share_type min_b,
                                             account_id_type recipient,
                                             time_point_sec deadline ) override;

         /// out = in * (1 - fee) * reserve_out / (reserve_in + in * (1 - fee)), rounded down
         static share_type get_amount_out( share_type amount_in, share_type reserve_in, share_type reserve_out,
                                           uint16_t taker_fee_percent );

         /// The amount of the other asset matching @p amount_a at the ratio of the reserves
         static share_type quote( share_type amount_a, share_type reserve_a, share_type reserve_b );

         bool is_locked( liquidity_pool_id_type pool )const { return _locked_pools.find( pool ) != _locked_pools.end(); }

         uint16_t taker_fee_percent()const { return _taker_fee_percent; }

      private:
         class pool_lock;

         /**
          * "LP" followed by the letters of both symbols, each cut to LEVY_SHARE_SYMBOL_PART_LENGTH and
          * joined with a dot. When that symbol is taken the second part ends with the pool instance
          * written in letters.
          */
         string make_share_symbol( const string& sym_a, const string& sym_b )const;

         share_type reserve_of( liquidity_pool_id_type pool, asset_id_type asset_type )const;

         /// Moves @p amount from @p from to the pair account of @p pool and returns how much arrived
         share_type pull( account_id_type from, liquidity_pool_id_type pool, const asset& amount );

         database&                           _db;
         asset_id_type                       _paired_asset;
         uint16_t                            _taker_fee_percent;
         account_id_type                     _account;
         flat_set<liquidity_pool_id_type>    _locked_pools;
   };

} } // levy::chain
