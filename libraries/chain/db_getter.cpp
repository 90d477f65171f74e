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

const account_object& database::get_account( account_id_type id )const
{
   const auto& idx = _state.accounts.get<by_id>();
   auto itr = idx.find( id );
   LEVY_ASSERT( itr != idx.end(), unknown_account, "Unable to find account ${id}", ("id", id) );
   return *itr;
}

const account_object& database::get_account( const string& name )const
{
   const account_object* a = find_account( name );
   LEVY_ASSERT( a != nullptr, unknown_account, "Unable to find account '${name}'", ("name", name) );
   return *a;
}

const account_object* database::find_account( const string& name )const
{
   const auto& idx = _state.accounts.get<by_name>();
   auto itr = idx.find( name );
   if( itr == idx.end() )
      return nullptr;
   return &*itr;
}

const asset_object& database::get_asset( asset_id_type id )const
{
   const auto& idx = _state.assets.get<by_id>();
   auto itr = idx.find( id );
   LEVY_ASSERT( itr != idx.end(), unknown_asset, "Unable to find asset ${id}", ("id", id) );
   return *itr;
}

const asset_object& database::get_asset( const string& symbol )const
{
   const asset_object* a = find_asset( symbol );
   LEVY_ASSERT( a != nullptr, unknown_asset, "Unable to find asset '${sym}'", ("sym", symbol) );
   return *a;
}

const asset_object* database::find_asset( const string& symbol )const
{
   const auto& idx = _state.assets.get<by_symbol>();
   auto itr = idx.find( symbol );
   if( itr == idx.end() )
      return nullptr;
   return &*itr;
}

const liquidity_pool_object& database::get_liquidity_pool( liquidity_pool_id_type id )const
{
   const auto& idx = _state.liquidity_pools.get<by_id>();
   auto itr = idx.find( id );
   LEVY_ASSERT( itr != idx.end(), unknown_pool, "Unable to find liquidity pool ${id}", ("id", id) );
   return *itr;
}

const liquidity_pool_object* database::find_liquidity_pool( asset_id_type a, asset_id_type b )const
{
   if( b < a )
      std::swap( a, b );
   const auto& idx = _state.liquidity_pools.get<by_asset_ab>();
   auto itr = idx.find( boost::make_tuple( a, b ) );
   if( itr == idx.end() )
      return nullptr;
   return &*itr;
}

} } // levy::chain
