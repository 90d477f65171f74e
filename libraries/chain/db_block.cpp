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
#include <levy/chain/exchange_gateway.hpp>
#include <levy/chain/token_contract.hpp>

namespace levy { namespace chain {

namespace {

   /// Applies a single operation to the database
   struct operation_applier
   {
      typedef void result_type;

      database& db;

      explicit operation_applier( database& d ):db(d){}

      void operator()( const transfer_operation& op )const
      {
         db.transfer( op.from, op.to, op.amount );
      }

      void operator()( const transfer_from_operation& op )const
      {
         db.transfer_from( op.spender, op.from, op.to, op.amount );
      }

      void operator()( const approve_operation& op )const
      {
         db.get_account( op.owner );
         db.get_account( op.spender );
         db.get_asset( op.amount.asset_id );
         db.approve( op.owner, op.spender, op.amount );
      }

      void operator()( const recover_asset_operation& op )const
      {
         token_contract* contract = db.find_token_contract( op.token );
         LEVY_ASSERT( contract != nullptr, unknown_asset,
                      "Asset ${t} has no token contract to recover from", ("t", op.token) );
         contract->apply_recover_asset( op.caller_account, op.amount );
      }

      void operator()( const exchange_swap_operation& op )const
      {
         exchange_gateway& gateway = get_gateway();
         vector<asset_id_type> path{ op.amount_to_sell.asset_id, op.min_to_receive.asset_id };
         gateway.swap_exact_input_supporting_fee_on_transfer( op.account, op.amount_to_sell.amount,
                                                              op.min_to_receive.amount, path,
                                                              op.account, op.deadline );
      }

      void operator()( const exchange_add_liquidity_operation& op )const
      {
         exchange_gateway& gateway = get_gateway();
         gateway.add_liquidity( op.account, op.amount_a.asset_id, op.amount_b.asset_id,
                                op.amount_a.amount, op.amount_b.amount, op.min_a, op.min_b,
                                op.account, op.deadline );
      }

      void operator()( const tax_collected_operation& op )const
      {
         FC_THROW( "Virtual operations can not be applied" );
      }

      void operator()( const liquidity_added_operation& op )const
      {
         FC_THROW( "Virtual operations can not be applied" );
      }

      exchange_gateway& get_gateway()const
      {
         exchange_gateway* gateway = db.find_exchange_gateway();
         FC_ASSERT( gateway != nullptr, "No exchange gateway is registered" );
         return *gateway;
      }
   };

   /// Keeps track of how deeply push_transaction is nested
   struct scoped_depth
   {
      explicit scoped_depth( uint32_t& d ):depth(d) { ++depth; }
      ~scoped_depth() { --depth; }
      uint32_t& depth;
   };

}

void database::push_transaction( const transaction& trx )
{ try {
   trx.validate();

   const bool outermost = ( _transaction_depth == 0 );
   const size_t first_entry = _state.history.size();
   {
      auto session = _undo_db.start_undo_session();
      scoped_depth depth( _transaction_depth );

      uint16_t op_in_trx = 0;
      for( const auto& op : trx.operations )
      {
         if( outermost )
         {
            _current_op_in_trx = op_in_trx++;
            _current_virtual_op = 0;
         }
         apply_operation( op );
      }
      session.merge();
   }

   if( outermost )
   {
      ++_current_trx_in_block;
      notify_applied_operations( first_entry );
   }
} FC_CAPTURE_AND_RETHROW( (trx) ) }

void database::apply_operation( const operation& op )
{ try {
   push_applied_operation( op );
   op.visit( operation_applier( *this ) );
} FC_CAPTURE_AND_RETHROW( (op) ) }

operation_history_id_type database::push_applied_operation( const operation& op )
{
   operation_history_object oh( op );
   oh.id           = operation_history_id_type( _state.history.size() );
   oh.block_num    = _head_block_num;
   oh.trx_in_block = _current_trx_in_block;
   oh.op_in_trx    = _current_op_in_trx;
   oh.virtual_op   = _current_virtual_op++;
   oh.block_time   = _head_block_time;
   _state.history.push_back( std::move(oh) );
   _undo_db.on_change( [this]() { _state.history.pop_back(); } );

   // outside of a transaction the change is already permanent
   if( _transaction_depth == 0 )
      notify_applied_operations( _state.history.size() - 1 );
   return _state.history.back().id;
}

void database::notify_applied_operations( size_t first_entry )
{
   for( size_t i = first_entry; i < _state.history.size(); ++i )
      applied_operation( _state.history[i] );
}

void database::generate_block()
{
   _head_block_time = _head_block_time + uint32_t( _block_interval );
   ++_head_block_num;
   _current_trx_in_block = 0;
   _current_op_in_trx = 0;
   _current_virtual_op = 0;
}

void database::generate_blocks( uint32_t count )
{
   for( uint32_t i = 0; i < count; ++i )
      generate_block();
}

void database::generate_blocks( time_point_sec target )
{
   while( _head_block_time + uint32_t( _block_interval ) < target )
      generate_block();
   if( _head_block_time < target )
   {
      generate_block();
      _head_block_time = target;
   }
}

} } // levy::chain
