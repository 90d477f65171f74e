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
#include <levy/chain/token_contract.hpp>

namespace levy { namespace chain {

asset database::get_balance( account_id_type owner, asset_id_type asset_id )const
{
   const auto& index = _state.balances.get<by_account_asset>();
   auto itr = index.find( boost::make_tuple( owner, asset_id ) );
   if( itr == index.end() )
      return asset( 0, asset_id );
   return itr->get_balance();
}

void database::add_balance( account_id_type account, const asset& delta )
{ try {
   if( delta.amount == 0 )
      return;

   auto& index = _state.balances.get<by_account_asset>();
   auto itr = index.find( boost::make_tuple( account, delta.asset_id ) );
   if( itr == index.end() )
   {
      account_balance_object b;
      b.owner = account;
      b.asset_type = delta.asset_id;
      b.balance = delta.amount;
      _undo_db.on_create( _state.balances, *_state.balances.insert( std::move(b) ).first );
   }
   else
   {
      const share_type new_balance = itr->balance + delta.amount;
      _undo_db.on_modify( _state.balances, *itr );
      index.modify( itr, [&new_balance]( account_balance_object& b ) {
         b.balance = new_balance;
      });
   }
} FC_CAPTURE_AND_RETHROW( (account)(delta) ) }

void database::reduce_balance( account_id_type account, const asset& delta )
{ try {
   if( delta.amount == 0 )
      return;

   auto& index = _state.balances.get<by_account_asset>();
   auto itr = index.find( boost::make_tuple( account, delta.asset_id ) );
   const share_type available = ( itr == index.end() ? share_type(0) : itr->balance );
   LEVY_ASSERT( available >= delta.amount, insufficient_balance,
                "Insufficient Balance: ${a}'s balance of ${b} is less than required ${r}",
                ("a", account)("b", available)("r", delta.amount) );

   if( available == delta.amount )
   {
      _undo_db.on_remove( _state.balances, *itr );
      index.erase( itr );
      return;
   }
   _undo_db.on_modify( _state.balances, *itr );
   index.modify( itr, [&delta]( account_balance_object& b ) {
      b.balance -= delta.amount;
   });
} FC_CAPTURE_AND_RETHROW( (account)(delta) ) }

void database::move_value( account_id_type from, account_id_type to, const asset& what )
{ try {
   reduce_balance( from, what );
   add_balance( to, what );
} FC_CAPTURE_AND_RETHROW( (from)(to)(what) ) }

void database::issue( account_id_type to, const asset& what )
{ try {
   auto& idx = _state.assets.get<by_id>();
   auto itr = idx.find( what.asset_id );
   LEVY_ASSERT( itr != idx.end(), unknown_asset, "Unable to find asset ${id}", ("id", what.asset_id) );
   get_account( to );

   const share_type new_supply = itr->current_supply + what.amount;
   _undo_db.on_modify( _state.assets, *itr );
   idx.modify( itr, [&new_supply]( asset_object& a ) {
      a.current_supply = new_supply;
   });
   add_balance( to, what );
} FC_CAPTURE_AND_RETHROW( (to)(what) ) }

share_type database::total_supply( asset_id_type asset_id )const
{
   return get_asset( asset_id ).current_supply;
}

share_type database::decimals_scale( asset_id_type asset_id )const
{
   return get_asset( asset_id ).scaled_precision();
}

asset database::get_allowance( account_id_type owner, account_id_type spender, asset_id_type asset_id )const
{
   const auto& index = _state.allowances.get<by_owner_spender>();
   auto itr = index.find( boost::make_tuple( owner, spender, asset_id ) );
   if( itr == index.end() )
      return asset( 0, asset_id );
   return asset( itr->amount, asset_id );
}

void database::approve( account_id_type owner, account_id_type spender, const asset& amount )
{ try {
   auto& index = _state.allowances.get<by_owner_spender>();
   auto itr = index.find( boost::make_tuple( owner, spender, amount.asset_id ) );
   if( itr == index.end() )
   {
      if( amount.amount == 0 )
         return;
      allowance_object a;
      a.owner = owner;
      a.spender = spender;
      a.asset_type = amount.asset_id;
      a.amount = amount.amount;
      _undo_db.on_create( _state.allowances, *_state.allowances.insert( std::move(a) ).first );
   }
   else if( amount.amount == 0 )
   {
      _undo_db.on_remove( _state.allowances, *itr );
      index.erase( itr );
   }
   else
   {
      _undo_db.on_modify( _state.allowances, *itr );
      index.modify( itr, [&amount]( allowance_object& a ) {
         a.amount = amount.amount;
      });
   }
} FC_CAPTURE_AND_RETHROW( (owner)(spender)(amount) ) }

void database::spend_allowance( account_id_type owner, account_id_type spender, const asset& amount )
{ try {
   auto& index = _state.allowances.get<by_owner_spender>();
   auto itr = index.find( boost::make_tuple( owner, spender, amount.asset_id ) );
   const share_type available = ( itr == index.end() ? share_type(0) : itr->amount );
   LEVY_ASSERT( available >= amount.amount, insufficient_allowance,
                "Insufficient Allowance: ${s} may spend ${a} of ${o}'s balance, ${r} required",
                ("s", spender)("a", available)("o", owner)("r", amount.amount) );

   if( amount.amount == 0 || itr->is_unlimited() )
      return;
   if( available == amount.amount )
   {
      _undo_db.on_remove( _state.allowances, *itr );
      index.erase( itr );
      return;
   }
   _undo_db.on_modify( _state.allowances, *itr );
   index.modify( itr, [&amount]( allowance_object& a ) {
      a.amount -= amount.amount;
   });
} FC_CAPTURE_AND_RETHROW( (owner)(spender)(amount) ) }

void database::transfer( account_id_type from, account_id_type to, const asset& what )
{ try {
   get_account( from );
   get_account( to );
   token_contract* contract = find_token_contract( what.asset_id );
   if( contract != nullptr )
      contract->apply_transfer( from, to, what.amount );
   else
   {
      get_asset( what.asset_id );
      move_value( from, to, what );
   }
} FC_CAPTURE_AND_RETHROW( (from)(to)(what) ) }

void database::transfer_from( account_id_type spender, account_id_type from, account_id_type to, const asset& what )
{ try {
   spend_allowance( from, spender, what );
   transfer( from, to, what );
} FC_CAPTURE_AND_RETHROW( (spender)(from)(to)(what) ) }

} } // levy::chain
