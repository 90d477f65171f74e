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

#include <fc/exception/exception.hpp>
#include <levy/protocol/exceptions.hpp>
#include <levy/chain/types.hpp>

namespace levy { namespace chain {

   FC_DECLARE_EXCEPTION( chain_exception, 3000000 )

   FC_DECLARE_DERIVED_EXCEPTION( database_query_exception,     levy::chain::chain_exception, 3010000 )
   FC_DECLARE_DERIVED_EXCEPTION( transaction_process_exception,levy::chain::chain_exception, 3030000 )
   FC_DECLARE_DERIVED_EXCEPTION( operation_evaluate_exception, levy::chain::chain_exception, 3050000 )
   FC_DECLARE_DERIVED_EXCEPTION( undo_database_exception,      levy::chain::chain_exception, 3070000 )
   FC_DECLARE_DERIVED_EXCEPTION( ledger_exception,             levy::chain::chain_exception, 3110000 )
   FC_DECLARE_DERIVED_EXCEPTION( access_exception,             levy::chain::chain_exception, 3120000 )
   FC_DECLARE_DERIVED_EXCEPTION( levy_token_exception,         levy::chain::chain_exception, 3130000 )
   FC_DECLARE_DERIVED_EXCEPTION( exchange_exception,           levy::chain::chain_exception, 3140000 )

   FC_DECLARE_DERIVED_EXCEPTION( unknown_account,              levy::chain::database_query_exception, 3010001 )
   FC_DECLARE_DERIVED_EXCEPTION( unknown_asset,                levy::chain::database_query_exception, 3010002 )
   FC_DECLARE_DERIVED_EXCEPTION( unknown_pool,                 levy::chain::database_query_exception, 3010003 )
   FC_DECLARE_DERIVED_EXCEPTION( duplicate_name,               levy::chain::database_query_exception, 3010004 )

   FC_DECLARE_DERIVED_EXCEPTION( insufficient_balance,         levy::chain::ledger_exception, 3110001 )
   FC_DECLARE_DERIVED_EXCEPTION( insufficient_allowance,       levy::chain::ledger_exception, 3110002 )

   FC_DECLARE_DERIVED_EXCEPTION( unauthorized_caller,          levy::chain::access_exception, 3120001 )

   FC_DECLARE_DERIVED_EXCEPTION( self_recovery_forbidden,      levy::chain::levy_token_exception, 3130001 )
   FC_DECLARE_DERIVED_EXCEPTION( token_contract_exists,        levy::chain::levy_token_exception, 3130002 )

   FC_DECLARE_DERIVED_EXCEPTION( exchange_deadline_expired,    levy::chain::exchange_exception, 3140001 )
   FC_DECLARE_DERIVED_EXCEPTION( exchange_invalid_path,        levy::chain::exchange_exception, 3140002 )
   FC_DECLARE_DERIVED_EXCEPTION( exchange_unknown_pair,        levy::chain::exchange_exception, 3140003 )
   FC_DECLARE_DERIVED_EXCEPTION( exchange_insufficient_liquidity, levy::chain::exchange_exception, 3140004 )
   FC_DECLARE_DERIVED_EXCEPTION( exchange_insufficient_output, levy::chain::exchange_exception, 3140005 )
   FC_DECLARE_DERIVED_EXCEPTION( exchange_insufficient_amount, levy::chain::exchange_exception, 3140006 )
   FC_DECLARE_DERIVED_EXCEPTION( exchange_pool_locked,         levy::chain::exchange_exception, 3140007 )
   FC_DECLARE_DERIVED_EXCEPTION( exchange_pair_exists,         levy::chain::exchange_exception, 3140008 )

} } // levy::chain
