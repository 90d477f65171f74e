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
   class exemption_registry;
   class liquidity_converter;
   class token_ledger;

   /**
    * @brief Decides whether a transfer of the levy token is charged, and routes the levy
    *
    * While the tax window is open, a transfer between two accounts that are not exempt delivers the
    * amount less the levy. The levy goes to the custody account and is converted into liquidity
    * right away. Transfers made while a conversion is running are never charged.
    */
   class levy_engine
   {
      public:
         levy_engine( database& db, token_ledger& ledger, const exemption_registry& exemptions,
                      liquidity_converter& converter, account_id_type custody,
                      uint16_t tax_percent, time_point_sec tax_end_time );

         /**
          * Moves @p amount from @p from to @p to, withholding the levy when it applies at @p now.
          *
          * The net amount is delivered before the levy moves to custody, and the levy is in custody
          * before the conversion starts.
          */
         void intercept( account_id_type from, account_id_type to, share_type amount, time_point_sec now );

         /// floor( amount * tax_percent / 100 )
         share_type compute_tax( share_type amount )const;

         /// The levy applies up to and including this instant
         time_point_sec tax_end_time()const { return _tax_end_time; }
         uint16_t       tax_percent()const { return _tax_percent; }
         /// True while a conversion is in progress
         bool           is_swapping()const { return _swapping; }

      private:
         class swap_guard;

         database&                   _db;
         token_ledger&               _ledger;
         const exemption_registry&   _exemptions;
         liquidity_converter&        _converter;
         account_id_type             _custody;
         uint16_t                    _tax_percent;
         time_point_sec              _tax_end_time;
         bool                        _swapping = false;
   };

} } // levy::chain
