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
#include <levy/chain/levy_token.hpp>
#include <levy/chain/database.hpp>
#include <levy/chain/exceptions.hpp>
#include <levy/chain/exchange_gateway.hpp>

#include <boost/algorithm/string/case_conv.hpp>

namespace levy { namespace chain {

levy_token_options levy_token_options::from_genesis( const database& db,
                                                     const genesis_state_type::initial_token_type& token )
{ try {
   levy_token_options options;
   options.symbol             = token.symbol;
   options.precision          = token.precision;
   options.initial_supply     = token.initial_supply;
   options.tax_percent        = token.tax_percent;
   options.tax_window_seconds = token.tax_window_seconds;
   options.admin              = db.get_account( token.admin_name ).id;
   return options;
} FC_CAPTURE_AND_RETHROW( (token) ) }

levy_token::levy_token( database& db, exchange_gateway& gateway, const levy_token_options& options )
   : levy_token( db, gateway, options, db.start_undo_session() )
{
}

levy_token::levy_token( database& db, exchange_gateway& gateway, const levy_token_options& options,
                        undo_session&& session )
   : _db( db ),
     _gateway( gateway ),
     _admin( db.get_account( options.admin ).id ),
     _token( db.create_asset( options.symbol, options.precision, options.admin ).id ),
     _custody( db.create_account( boost::algorithm::to_lower_copy( options.symbol )
                                  + LEVY_CUSTODY_ACCOUNT_SUFFIX ).id ),
     _paired_asset( gateway.paired_asset() ),
     _pair( gateway.factory().create_pair( _token, _paired_asset ) ),
     _ledger( db, _token ),
     _exemptions( flat_set<account_id_type>{ options.admin, gateway.gateway_account(), _custody } ),
     _converter( db, _ledger, gateway, _custody, options.admin ),
     _engine( db, _ledger, _exemptions, _converter, _custody, options.tax_percent,
              db.head_block_time() + options.tax_window_seconds )
{ try {
   _ledger.mint( _admin, share_type( options.initial_supply ) * _ledger.decimals_scale() );
   _db.register_token_contract( *this );
   session.merge();

   ilog( "Created levy token ${s} (${t}) with supply ${n}, levy of ${p}% until ${e}",
         ("s", options.symbol)("t", _token)("n", total_supply())("p", options.tax_percent)
         ("e", _engine.tax_end_time()) );
} FC_CAPTURE_AND_RETHROW( (options.symbol)(options.admin) ) }

levy_token::~levy_token()
{
   _db.unregister_token_contract( _token );
}

void levy_token::apply_transfer( account_id_type from, account_id_type to, share_type amount )
{
   _engine.intercept( from, to, amount, _db.head_block_time() );
}

void levy_token::apply_recover_asset( account_id_type caller, const asset& amount )
{ try {
   LEVY_ASSERT( caller == _admin, unauthorized_caller,
                "Only the administrator ${a} may recover assets", ("a", _admin)("caller", caller) );
   LEVY_ASSERT( amount.asset_id != _token, self_recovery_forbidden,
                "Can not recover the levy token ${t}", ("t", _token) );
   _db.transfer( _custody, caller, amount );
} FC_CAPTURE_AND_RETHROW( (caller)(amount) ) }

void levy_token::transfer( account_id_type caller, account_id_type to, share_type amount )
{
   transfer_operation op;
   op.from = caller;
   op.to = to;
   op.amount = this->amount( amount );
   _db.push_transaction( transaction().add( op ) );
}

void levy_token::transfer_from( account_id_type spender, account_id_type from, account_id_type to, share_type amount )
{
   transfer_from_operation op;
   op.spender = spender;
   op.from = from;
   op.to = to;
   op.amount = this->amount( amount );
   _db.push_transaction( transaction().add( op ) );
}

void levy_token::approve( account_id_type owner, account_id_type spender, share_type amount )
{
   approve_operation op;
   op.owner = owner;
   op.spender = spender;
   op.amount = this->amount( amount );
   _db.push_transaction( transaction().add( op ) );
}

void levy_token::recover_foreign_asset( account_id_type caller, const asset& amount )
{
   recover_asset_operation op;
   op.caller_account = caller;
   op.token = _token;
   op.amount = amount;
   _db.push_transaction( transaction().add( op ) );
}

uint8_t levy_token::decimals()const
{
   return _db.get_asset( _token ).precision;
}

uint32_t levy_token::remaining_tax_window( time_point_sec now )const
{
   const time_point_sec end = _engine.tax_end_time();
   if( now >= end )
      return 0;
   return end.sec_since_epoch() - now.sec_since_epoch();
}

uint32_t levy_token::remaining_tax_window()const
{
   return remaining_tax_window( _db.head_block_time() );
}

add_liquidity_result seed_liquidity( database& db, exchange_gateway& gateway, const levy_token& token,
                                     share_type token_amount, share_type paired_amount )
{ try {
   auto session = db.start_undo_session();

   const account_id_type admin = token.admin();
   const account_id_type router = gateway.gateway_account();
   db.approve( admin, router, token.amount( token_amount ) );
   db.approve( admin, router, asset( paired_amount, token.paired_asset() ) );
   add_liquidity_result result = gateway.add_liquidity( admin, token.token_id(), token.paired_asset(),
                                                        token_amount, paired_amount, 0, 0, admin,
                                                        db.head_block_time() );
   session.merge();
   return result;
} FC_CAPTURE_AND_RETHROW( (token_amount)(paired_amount) ) }

} } // levy::chain
