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
#include <levy/chain/token_ledger.hpp>
#include <levy/chain/database.hpp>

namespace levy { namespace chain {

token_ledger::token_ledger( database& db, asset_id_type token )
   : _db( db ), _token( token )
{
}

void token_ledger::mint( account_id_type holder, share_type amount )
{
   _db.issue( holder, this->amount( amount ) );
}

void token_ledger::move_value( account_id_type from, account_id_type to, share_type amount )
{
   _db.move_value( from, to, this->amount( amount ) );
}

share_type token_ledger::balance_of( account_id_type holder )const
{
   return _db.get_balance( holder, _token ).amount;
}

share_type token_ledger::total_supply()const
{
   return _db.total_supply( _token );
}

share_type token_ledger::decimals_scale()const
{
   return _db.decimals_scale( _token );
}

void token_ledger::approve( account_id_type owner, account_id_type spender, share_type amount )
{
   _db.approve( owner, spender, this->amount( amount ) );
}

share_type token_ledger::allowance( account_id_type owner, account_id_type spender )const
{
   return _db.get_allowance( owner, spender, _token ).amount;
}

} } // levy::chain
