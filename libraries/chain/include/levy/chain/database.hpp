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

#include <levy/chain/chain_state.hpp>
#include <levy/chain/genesis_state.hpp>

#include <levy/db/undo_database.hpp>

#include <fc/signals.hpp>
#include <fc/log/logger.hpp>

#include <map>

namespace levy { namespace chain {

   class token_contract;
   class exchange_gateway;

   /**
    *   @class database
    *   @brief tracks the ledger state: accounts, assets, balances, allowances, pools and history
    *
    *   The database is the ledger primitive every asset shares. Operations are applied through
    *   @ref push_transaction, which runs them inside an undo session so that a failure anywhere leaves
    *   no trace. The lower level helpers below do not open sessions of their own.
    */
   class database
   {
         //////////////////// db_management.cpp ////////////////////
      public:
         database();
         ~database();

         /**
          * @brief Creates the initial accounts, assets and balances, and sets the clock
          *
          * The levy token described by @p genesis is not created here; see @ref levy_token.
          */
         void init_genesis( const genesis_state_type& genesis );

         /**
          * Asset transfers go through @p contract from now on. The contract must outlive the database
          * or be unregistered first.
          */
         void register_token_contract( token_contract& contract );
         void unregister_token_contract( asset_id_type token );
         token_contract* find_token_contract( asset_id_type token )const;

         /// Exchange operations are handed to @p gateway
         void register_exchange_gateway( exchange_gateway& gateway );
         exchange_gateway* find_exchange_gateway()const { return _gateway; }

         levy::db::undo_database::session start_undo_session() { return _undo_db.start_undo_session(); }

         //////////////////// db_block.cpp ////////////////////

         /**
          * Validates @p trx and applies all of its operations, or none of them.
          *
          * @ref applied_operation fires for every history entry of the transaction once it has been
          * applied completely.
          */
         void push_transaction( const transaction& trx );

         /**
          * Records @p op in the operation history at the current position.
          * @return the id of the new history entry
          */
         operation_history_id_type push_applied_operation( const operation& op );

         /**
          *  Emitted for every operation, real or virtual, after the change it describes has become
          *  permanent. Operations of a transaction that was undone are never announced.
          */
         fc::signal<void(const operation_history_object&)> applied_operation;

         /// Starts a new block @ref block_interval seconds after the head block
         void generate_block();
         /// Generates @p count blocks
         void generate_blocks( uint32_t count );
         /// Generates blocks until the head block time is @p target. The last block is stamped with @p target exactly.
         void generate_blocks( time_point_sec target );

         //////////////////// db_getter.cpp ////////////////////

         time_point_sec head_block_time()const { return _head_block_time; }
         uint32_t       head_block_num()const  { return _head_block_num; }
         uint8_t        block_interval()const  { return _block_interval; }

         const account_object& get_account( account_id_type id )const;
         const account_object& get_account( const string& name )const;
         const account_object* find_account( const string& name )const;

         const asset_object& get_asset( asset_id_type id )const;
         const asset_object& get_asset( const string& symbol )const;
         const asset_object* find_asset( const string& symbol )const;

         const liquidity_pool_object& get_liquidity_pool( liquidity_pool_id_type id )const;
         /// Looks the pool up with its assets in either order
         const liquidity_pool_object* find_liquidity_pool( asset_id_type a, asset_id_type b )const;

         const vector<operation_history_object>& get_history()const { return _state.history; }
         const chain_state& get_state()const { return _state; }

         //////////////////// db_init.cpp ////////////////////

         const account_object& create_account( const string& name );
         const asset_object&   create_asset( const string& symbol, uint8_t precision, account_id_type issuer,
                                             optional<liquidity_pool_id_type> for_pool = optional<liquidity_pool_id_type>() );
         const liquidity_pool_object& create_liquidity_pool( asset_id_type asset_a, asset_id_type asset_b,
                                                             asset_id_type share_asset, account_id_type pair_account,
                                                             uint16_t taker_fee_percent );

         template<typename Lambda>
         void modify( const liquidity_pool_object& pool, Lambda&& m )
         {
            auto& idx = _state.liquidity_pools.get<by_id>();
            auto itr = idx.find( pool.id );
            FC_ASSERT( itr != idx.end() );
            _undo_db.on_modify( _state.liquidity_pools, *itr );
            FC_ASSERT( idx.modify( itr, std::forward<Lambda>(m) ) );
         }

         //////////////////// db_balance.cpp ////////////////////

         /**
          * @brief Retrieve a particular account's balance in a given asset
          * @param owner Account whose balance should be retrieved
          * @param asset_id ID of the asset to get balance in
          * @return owner's balance in asset
          */
         asset get_balance( account_id_type owner, asset_id_type asset_id )const;

         /**
          * @brief Adjust a particular account's balance in a given asset by a delta
          * @param account ID of account whose balance should be adjusted
          * @param delta Asset ID and amount to adjust balance by
          */
         void add_balance( account_id_type account, const asset& delta );
         /// Throws @ref insufficient_balance when the account holds less than @p delta
         void reduce_balance( account_id_type account, const asset& delta );

         /// Moves @p what between accounts with no further logic. This is the hook every transfer funnels into.
         void move_value( account_id_type from, account_id_type to, const asset& what );

         /// Creates @p what out of nothing, increasing the supply
         void issue( account_id_type to, const asset& what );

         share_type total_supply( asset_id_type asset_id )const;
         /// 10^precision of @p asset_id
         share_type decimals_scale( asset_id_type asset_id )const;

         asset get_allowance( account_id_type owner, account_id_type spender, asset_id_type asset_id )const;
         /// Replaces the allowance of @p spender over @p owner's balance
         void approve( account_id_type owner, account_id_type spender, const asset& amount );
         /// Lowers the allowance by @p amount, unless it is unlimited
         void spend_allowance( account_id_type owner, account_id_type spender, const asset& amount );

         /**
          * Moves @p what through the token contract of its asset, or directly when it has none.
          */
         void transfer( account_id_type from, account_id_type to, const asset& what );
         /// Spends the allowance of @p spender, then @ref transfer
         void transfer_from( account_id_type spender, account_id_type from, account_id_type to, const asset& what );

      private:
         void apply_operation( const operation& op );
         void notify_applied_operations( size_t first_entry );

         chain_state                               _state;
         levy::db::undo_database                   _undo_db;

         std::map<asset_id_type, token_contract*>  _token_contracts;
         exchange_gateway*                         _gateway = nullptr;

         time_point_sec                            _head_block_time;
         uint32_t                                  _head_block_num = 0;
         uint8_t                                   _block_interval = LEVY_DEFAULT_BLOCK_INTERVAL;

         /// Nesting level of @ref push_transaction
         uint32_t                                  _transaction_depth = 0;
         uint16_t                                  _current_trx_in_block = 0;
         uint16_t                                  _current_op_in_trx = 0;
         uint16_t                                  _current_virtual_op = 0;
   };

} } // levy::chain
