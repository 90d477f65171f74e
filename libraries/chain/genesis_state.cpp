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
#include <levy/chain/genesis_state.hpp>

namespace levy { namespace chain {

genesis_state_type create_example_genesis()
{
   const share_type whole = levy::protocol::scaled_precision( LEVY_DEFAULT_DECIMALS );

   genesis_state_type genesis;
   genesis.initial_timestamp = time_point_sec( 1767225600 ); // 2026-01-01T00:00:00

   genesis.initial_accounts.emplace_back( "admin" );
   genesis.initial_accounts.emplace_back( "alice" );
   genesis.initial_accounts.emplace_back( "bob" );

   genesis_state_type::initial_asset_type core;
   core.symbol = LEVY_CORE_SYMBOL;
   core.issuer_name = "admin";
   genesis.initial_assets.push_back( core );

   genesis_state_type::initial_asset_type wrapped;
   wrapped.symbol = "W" LEVY_CORE_SYMBOL;
   wrapped.issuer_name = "admin";
   genesis.initial_assets.push_back( wrapped );

   genesis_state_type::initial_balance_type balance;
   balance.owner_name = "admin";
   balance.asset_symbol = wrapped.symbol;
   balance.amount = whole * 1000;
   genesis.initial_balances.push_back( balance );

   balance.owner_name = "alice";
   balance.amount = whole * 100;
   genesis.initial_balances.push_back( balance );

   balance.asset_symbol = core.symbol;
   genesis.initial_balances.push_back( balance );

   genesis.token.admin_name = "admin";
   genesis.token.paired_asset_symbol = wrapped.symbol;

   genesis_state_type::initial_liquidity_type liquidity;
   liquidity.token_amount = whole * 100000;
   liquidity.paired_amount = whole * 100;
   genesis.initial_liquidity = liquidity;

   return genesis;
}

} } // levy::chain
