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

#include <levy/protocol/types.hpp>

#include <string>
#include <vector>

namespace levy { namespace chain {
using std::string;
using std::vector;
using levy::protocol::share_type;
using levy::protocol::time_point_sec;
using levy::protocol::optional;

struct genesis_state_type {
   struct initial_account_type {
      initial_account_type( const string& name = string() )
         : name(name)
      {}
      string name;
   };
   struct initial_asset_type {
      string symbol;
      string issuer_name;
      uint8_t precision = LEVY_DEFAULT_DECIMALS;
   };
   struct initial_balance_type {
      /// Must correspond to one of the initial accounts
      string owner_name;
      /// Must correspond to one of the initial assets
      string asset_symbol;
      /// Base units, not whole units
      share_type amount;
   };
   /**
    * Parameters of the levy token created right after the initial assets.
    */
   struct initial_token_type {
      string symbol = LEVY_SYMBOL;
      uint8_t precision = LEVY_DEFAULT_DECIMALS;
      /// Whole units, scaled by 10^precision when issued
      uint64_t initial_supply = LEVY_DEFAULT_INITIAL_SUPPLY;
      uint16_t tax_percent = LEVY_DEFAULT_TAX_PERCENT;
      uint32_t tax_window_seconds = LEVY_DEFAULT_TAX_WINDOW_SECONDS;
      /// Must correspond to one of the initial accounts
      string admin_name;
      /// Must correspond to one of the initial assets
      string paired_asset_symbol;
   };
   /**
    * Deposited by the administrator into the token/paired pool, before any transfer is made.
    */
   struct initial_liquidity_type {
      share_type token_amount;
      share_type paired_amount;
   };

   time_point_sec                           initial_timestamp;
   uint8_t                                  block_interval = LEVY_DEFAULT_BLOCK_INTERVAL;
   vector<initial_account_type>             initial_accounts;
   vector<initial_asset_type>               initial_assets;
   vector<initial_balance_type>             initial_balances;
   initial_token_type                       token;
   /// Basis points of @ref LEVY_POOL_FEE_DENOM
   uint16_t                                 pool_taker_fee = LEVY_DEFAULT_POOL_TAKER_FEE;
   optional<initial_liquidity_type>         initial_liquidity;
};

/// A small but complete genesis: an administrator, two users, the core asset and its wrapped form
genesis_state_type create_example_genesis();

} } // namespace levy::chain

FC_REFLECT( levy::chain::genesis_state_type::initial_account_type, (name) )

FC_REFLECT( levy::chain::genesis_state_type::initial_asset_type, (symbol)(issuer_name)(precision) )

FC_REFLECT( levy::chain::genesis_state_type::initial_balance_type, (owner_name)(asset_symbol)(amount) )

FC_REFLECT( levy::chain::genesis_state_type::initial_token_type,
            (symbol)(precision)(initial_supply)(tax_percent)(tax_window_seconds)(admin_name)(paired_asset_symbol) )

FC_REFLECT( levy::chain::genesis_state_type::initial_liquidity_type, (token_amount)(paired_amount) )

FC_REFLECT( levy::chain::genesis_state_type,
            (initial_timestamp)(block_interval)(initial_accounts)(initial_assets)(initial_balances)
            (token)(pool_taker_fee)(initial_liquidity) )
