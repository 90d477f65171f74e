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
#include <levy/chain/liquidity_converter.hpp>
#include <levy/chain/database.hpp>
#include <levy/chain/exchange_gateway.hpp>
#include <levy/chain/token_ledger.hpp>

namespace levy { namespace chain {

liquidity_converter::liquidity_converter( database& db, token_ledger& token, exchange_gateway& gateway,
                                          account_id_type custody, account_id_type recipient )
   : _db( db ), _token( token ), _gateway( gateway ), _custody( custody ), _recipient( recipient )
{
}

liquidity_added_operation liquidity_converter::convert( share_type tax_amount )
{ try {
   const share_type half = tax_amount / 2;
   const share_type remainder = tax_amount - half;

   const asset_id_type token = _token.token_id();
   const asset_id_type paired = _gateway.paired_asset();
   const account_id_type router = _gateway.gateway_account();
   const time_point_sec now = _db.head_block_time();

   _token.approve( _custody, router, half );
   vector<asset_id_type> path{ token, paired };
   _gateway.swap_exact_input_supporting_fee_on_transfer( _custody, half, 0, path, _custody, now );

   // whatever the custody account holds of the paired asset goes in, not only the swap output
   const share_type paired_balance = _db.get_balance( _custody, paired ).amount;

   _token.approve( _custody, router, remainder );
   _db.approve( _custody, router, asset( paired_balance, paired ) );
   const add_liquidity_result result = _gateway.add_liquidity( _custody, token, paired, remainder, paired_balance,
                                                               0, 0, _recipient, now );

   liquidity_added_operation added;
   added.token_amount  = asset( result.amount_a, token );
   added.paired_amount = asset( result.amount_b, paired );
   added.liquidity     = result.liquidity;
   added.recipient     = _recipient;
   _db.push_applied_operation( added );

   dlog( "Converted levy of ${t} into ${l}", ("t", tax_amount)("l", added.liquidity) );
   return added;
} FC_CAPTURE_AND_RETHROW( (tax_amount) ) }

} } // levy::chain
