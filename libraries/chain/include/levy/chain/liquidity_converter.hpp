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
   class exchange_gateway;
   class token_ledger;

   /**
    * @brief Turns collected levy into a liquidity position for the administrator
    *
    * Half of the levy is sold for the paired asset, then the other half is deposited together with
    * the whole paired balance of the custody account. The swap and the deposit accept any price:
    * both minimums are zero. A failure of either call propagates to the caller.
    */
   class liquidity_converter
   {
      public:
         liquidity_converter( database& db, token_ledger& token, exchange_gateway& gateway,
                              account_id_type custody, account_id_type recipient );

         /**
          * Converts @p tax_amount of the token held by the custody account.
          * @return the observation recorded for the deposit
          */
         liquidity_added_operation convert( share_type tax_amount );

      private:
         database&          _db;
         token_ledger&      _token;
         exchange_gateway&  _gateway;
         account_id_type    _custody;
         account_id_type    _recipient;
   };

} } // levy::chain
