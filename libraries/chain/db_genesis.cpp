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
#include <levy/chain/database.hpp>
#include <levy/chain/exceptions.hpp>

namespace levy { namespace chain {

void database::init_genesis( const genesis_state_type& genesis_state )
{ try {
   FC_ASSERT( genesis_state.initial_timestamp != time_point_sec(), "Must initialize genesis timestamp." );
   FC_ASSERT( genesis_state.block_interval >= LEVY_MIN_BLOCK_INTERVAL
              && genesis_state.block_interval <= LEVY_MAX_BLOCK_INTERVAL,
              "Block interval must be between ${min} and ${max} seconds",
              ("min", LEVY_MIN_BLOCK_INTERVAL)("max", LEVY_MAX_BLOCK_INTERVAL) );
   FC_ASSERT( _state.accounts.empty(), "The database is already initialized" );

   _head_block_time = genesis_state.initial_timestamp;
   _head_block_num  = 0;
   _block_interval  = genesis_state.block_interval;

   for( const auto& account : genesis_state.initial_accounts )
      create_account( account.name );

   for( const auto& a : genesis_state.initial_assets )
   {
      const account_object& issuer = get_account( a.issuer_name );
      create_asset( a.symbol, a.precision, issuer.id );
   }

   for( const auto& b : genesis_state.initial_balances )
   {
      const account_object& owner = get_account( b.owner_name );
      const asset_object& asset_obj = get_asset( b.asset_symbol );
      issue( owner.id, asset_obj.amount( b.amount ) );
   }

   ilog( "Initialized genesis at ${t} with ${a} accounts and ${s} assets",
         ("t", _head_block_time)("a", _state.accounts.size())("s", _state.assets.size()) );
} FC_CAPTURE_AND_RETHROW() }

} } // levy::chain
