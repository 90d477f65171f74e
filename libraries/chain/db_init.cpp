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

const account_object& database::create_account( const string& name )
{ try {
   FC_ASSERT( name.size() >= LEVY_MIN_ACCOUNT_NAME_LENGTH && name.size() <= LEVY_MAX_ACCOUNT_NAME_LENGTH,
              "Invalid account name length" );
   LEVY_ASSERT( find_account( name ) == nullptr, duplicate_name,
                "Account name '${n}' is already in use", ("n", name) );

   account_object a;
   a.id   = account_id_type( _state.next_account_instance );
   a.name = name;
   const account_object& result = *_state.accounts.insert( std::move(a) ).first;
   _undo_db.on_create( _state.accounts, result );
   _undo_db.on_change( [this]() { --_state.next_account_instance; } );
   ++_state.next_account_instance;
   return result;
} FC_CAPTURE_AND_RETHROW( (name) ) }

const asset_object& database::create_asset( const string& symbol, uint8_t precision, account_id_type issuer,
                                            optional<liquidity_pool_id_type> for_pool )
{ try {
   FC_ASSERT( asset_object::is_valid_symbol( symbol ), "Invalid asset symbol" );
   FC_ASSERT( precision <= LEVY_MAX_DECIMALS, "Invalid precision" );
   get_account( issuer );
   LEVY_ASSERT( find_asset( symbol ) == nullptr, duplicate_name,
                "Asset symbol '${s}' is already in use", ("s", symbol) );

   asset_object a;
   a.id                 = asset_id_type( _state.next_asset_instance );
   a.symbol             = symbol;
   a.precision          = precision;
   a.issuer             = issuer;
   a.current_supply     = 0;
   a.for_liquidity_pool = for_pool;
   const asset_object& result = *_state.assets.insert( std::move(a) ).first;
   _undo_db.on_create( _state.assets, result );
   _undo_db.on_change( [this]() { --_state.next_asset_instance; } );
   ++_state.next_asset_instance;
   return result;
} FC_CAPTURE_AND_RETHROW( (symbol)(precision)(issuer) ) }

const liquidity_pool_object& database::create_liquidity_pool( asset_id_type asset_a, asset_id_type asset_b,
                                                              asset_id_type share_asset, account_id_type pair_account,
                                                              uint16_t taker_fee_percent )
{ try {
   FC_ASSERT( asset_a < asset_b, "Pool assets must be ordered and distinct" );
   FC_ASSERT( taker_fee_percent < LEVY_POOL_FEE_DENOM, "Taker fee must be lower than 100%" );

   liquidity_pool_object p;
   p.id                = liquidity_pool_id_type( _state.next_pool_instance );
   p.asset_a           = asset_a;
   p.asset_b           = asset_b;
   p.balance_a         = 0;
   p.balance_b         = 0;
   p.share_asset       = share_asset;
   p.pair_account      = pair_account;
   p.taker_fee_percent = taker_fee_percent;
   auto result = _state.liquidity_pools.insert( std::move(p) );
   FC_ASSERT( result.second, "Pool already exists" );
   _undo_db.on_create( _state.liquidity_pools, *result.first );
   _undo_db.on_change( [this]() { --_state.next_pool_instance; } );
   ++_state.next_pool_instance;
   return *result.first;
} FC_CAPTURE_AND_RETHROW( (asset_a)(asset_b)(share_asset)(pair_account)(taker_fee_percent) ) }

} } // levy::chain
