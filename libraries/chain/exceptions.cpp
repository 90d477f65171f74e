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
#include <levy/chain/exceptions.hpp>

namespace levy { namespace chain {

   FC_IMPLEMENT_EXCEPTION( chain_exception, 3000000, "ledger exception" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( database_query_exception,     chain_exception, 3010000, "database query exception" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( transaction_process_exception,chain_exception, 3030000, "transaction processing exception" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( operation_evaluate_exception, chain_exception, 3050000, "operation evaluation exception" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( undo_database_exception,      chain_exception, 3070000, "undo database exception" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( ledger_exception,             chain_exception, 3110000, "ledger exception" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( access_exception,             chain_exception, 3120000, "access control exception" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( levy_token_exception,         chain_exception, 3130000, "levy token exception" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( exchange_exception,           chain_exception, 3140000, "exchange gateway exception" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( unknown_account,              database_query_exception, 3010001, "unknown account" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( unknown_asset,                database_query_exception, 3010002, "unknown asset" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( unknown_pool,                 database_query_exception, 3010003, "unknown liquidity pool" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( duplicate_name,               database_query_exception, 3010004, "name already in use" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( insufficient_balance,         ledger_exception, 3110001, "insufficient balance" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( insufficient_allowance,       ledger_exception, 3110002, "insufficient allowance" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( unauthorized_caller,          access_exception, 3120001, "caller is not the administrator" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( self_recovery_forbidden,      levy_token_exception, 3130001, "can not recover the levy token itself" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( token_contract_exists,        levy_token_exception, 3130002, "asset already has a token contract" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( exchange_deadline_expired,    exchange_exception, 3140001, "deadline expired" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( exchange_invalid_path,        exchange_exception, 3140002, "invalid path" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( exchange_unknown_pair,        exchange_exception, 3140003, "no pool for pair" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( exchange_insufficient_liquidity, exchange_exception, 3140004, "insufficient liquidity" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( exchange_insufficient_output, exchange_exception, 3140005, "insufficient output amount" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( exchange_insufficient_amount, exchange_exception, 3140006, "insufficient deposit amount" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( exchange_pool_locked,         exchange_exception, 3140007, "pool is locked" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( exchange_pair_exists,         exchange_exception, 3140008, "pair already exists" )

} } // levy::chain
