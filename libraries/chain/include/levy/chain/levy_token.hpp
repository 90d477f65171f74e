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
#include <levy/chain/exemption_registry.hpp>
#include <levy/chain/genesis_state.hpp>
#include <levy/chain/levy_engine.hpp>
#include <levy/chain/liquidity_converter.hpp>
#include <levy/chain/token_contract.hpp>
#include <levy/chain/token_ledger.hpp>

#include <levy/db/undo_database.hpp>

namespace levy { namespace chain {

   class database;
   class exchange_gateway;
   struct add_liquidity_result;

   struct levy_token_options
   {
      string            symbol = LEVY_SYMBOL;
      uint8_t           precision = LEVY_DEFAULT_DECIMALS;
      /// Whole units
      uint64_t          initial_supply = LEVY_DEFAULT_INITIAL_SUPPLY;
      uint16_t          tax_percent = LEVY_DEFAULT_TAX_PERCENT;
      uint32_t          tax_window_seconds = LEVY_DEFAULT_TAX_WINDOW_SECONDS;
      /// Receives the initial supply and every liquidity position
      account_id_type   admin;

      /// Resolves the administrator of @p token by name
      static levy_token_options from_genesis( const database& db, const genesis_state_type::initial_token_type& token );
   };

   /**
    * @brief A token whose transfers are charged a levy during a fixed window after creation
    *
    * Creating the token issues the whole supply to the administrator, creates the pool pairing the
    * token with the gateway's paired asset and registers the token with the database, so that every
    * transfer of the token, including the ones made by the gateway, is intercepted by the
    * @ref levy_engine.
    *
    * The write methods each push a transaction and are therefore applied completely or not at all.
    */
   class levy_token : public token_contract
   {
      public:
         levy_token( database& db, exchange_gateway& gateway, const levy_token_options& options );
         ~levy_token();

         levy_token( const levy_token& ) = delete;
         levy_token& operator=( const levy_token& ) = delete;

         /// @name token_contract
         /// @{
         asset_id_type token_id()const override { return _token; }
         void apply_transfer( account_id_type from, account_id_type to, share_type amount ) override;
         void apply_recover_asset( account_id_type caller, const asset& amount ) override;
         /// @}

         void transfer( account_id_type caller, account_id_type to, share_type amount );
         void transfer_from( account_id_type spender, account_id_type from, account_id_type to, share_type amount );
         void approve( account_id_type owner, account_id_type spender, share_type amount );

         /**
          * Sends @p amount from the custody account to @p caller, who must be the administrator.
          * The levy token itself can not be recovered.
          */
         void recover_foreign_asset( account_id_type caller, const asset& amount );

         share_type      balance_of( account_id_type holder )const { return _ledger.balance_of( holder ); }
         share_type      allowance( account_id_type owner, account_id_type spender )const { return _ledger.allowance( owner, spender ); }
         share_type      total_supply()const { return _ledger.total_supply(); }
         share_type      decimals_scale()const { return _ledger.decimals_scale(); }
         uint8_t         decimals()const;
         asset           amount( share_type a )const { return _ledger.amount( a ); }

         bool            is_exempt( account_id_type account )const { return _exemptions.is_exempt( account ); }
         const exemption_registry& exemptions()const { return _exemptions; }

         time_point_sec  tax_end_time()const { return _engine.tax_end_time(); }
         uint16_t        tax_percent()const { return _engine.tax_percent(); }
         /// Seconds until the levy stops applying, zero once @p now reaches the end of the window
         uint32_t        remaining_tax_window( time_point_sec now )const;
         uint32_t        remaining_tax_window()const;

         account_id_type         admin()const { return _admin; }
         account_id_type         custody_account()const { return _custody; }
         asset_id_type           paired_asset()const { return _paired_asset; }
         liquidity_pool_id_type  pair()const { return _pair; }

         const levy_engine& engine()const { return _engine; }

      private:
         typedef levy::db::undo_database::session undo_session;

         levy_token( database& db, exchange_gateway& gateway, const levy_token_options& options,
                     undo_session&& session );

         database&               _db;
         exchange_gateway&       _gateway;
         account_id_type         _admin;
         asset_id_type           _token;
         account_id_type         _custody;
         asset_id_type           _paired_asset;
         liquidity_pool_id_type  _pair;

         token_ledger            _ledger;
         exemption_registry      _exemptions;
         liquidity_converter     _converter;
         levy_engine             _engine;
   };

   /**
    * Deposits @p token_amount of the levy token and @p paired_amount of its paired asset from the
    * administrator into the token's pool.
    */
   add_liquidity_result seed_liquidity( database& db, exchange_gateway& gateway, const levy_token& token,
                                        share_type token_amount, share_type paired_amount );

} } // levy::chain
