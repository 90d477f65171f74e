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

#include <levy/chain/types.hpp>

namespace levy { namespace chain {

   class database;

   /**
    * @brief The ledger primitive of a single asset
    *
    * Plain balance and allowance bookkeeping on top of the @ref database. @ref move_value never runs
    * any token logic, it is what custom transfer semantics are built on.
    */
   class token_ledger
   {
      public:
         token_ledger( database& db, asset_id_type token );

         asset_id_type token_id()const { return _token; }
         asset amount( share_type a )const { return asset( a, _token ); }

         /// Creates @p amount for @p holder
         void mint( account_id_type holder, share_type amount );
         void move_value( account_id_type from, account_id_type to, share_type amount );

         share_type balance_of( account_id_type holder )const;
         share_type total_supply()const;
         share_type decimals_scale()const;

         void       approve( account_id_type owner, account_id_type spender, share_type amount );
         share_type allowance( account_id_type owner, account_id_type spender )const;

      private:
         database&      _db;
         asset_id_type  _token;
   };

} } // levy::chain
