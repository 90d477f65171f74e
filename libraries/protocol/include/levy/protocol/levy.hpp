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
#include <levy/protocol/base.hpp>

namespace levy { namespace protocol {

   /**
    * @ingroup operations
    *
    * @brief Moves an unrelated asset out of the custody account of a levy token
    *
    * Only the administrator of @ref token may do this, and @ref amount may not be denominated in the
    * levy token itself.
    */
   struct recover_asset_operation : public base_operation
   {
      account_id_type  caller_account;
      /// The levy token whose custody account holds @ref amount
      asset_id_type    token;
      asset            amount;

      account_id_type caller()const { return caller_account; }
      void            validate()const;
   };

   /**
    * @ingroup operations
    *
    * VIRTUAL. Emitted when a transfer was charged a levy; @ref amount was moved to the custody account.
    */
   struct tax_collected_operation : public base_operation
   {
      tax_collected_operation(){}
      tax_collected_operation( account_id_type f, const asset& a )
      :from(f),amount(a){}

      account_id_type  from;
      asset            amount;

      account_id_type caller()const { return from; }
      void            validate()const { FC_ASSERT( !"virtual operation" ); }
   };

   /**
    * @ingroup operations
    *
    * VIRTUAL. Emitted when collected levy was converted into a liquidity position.
    */
   struct liquidity_added_operation : public base_operation
   {
      /// Levy token consumed by the deposit
      asset            token_amount;
      /// Paired asset supplied to the deposit
      asset            paired_amount;
      /// Share asset minted for the deposit
      asset            liquidity;
      /// Receiver of @ref liquidity
      account_id_type  recipient;

      account_id_type caller()const { return recipient; }
      void            validate()const { FC_ASSERT( !"virtual operation" ); }
   };

}} // levy::protocol

FC_REFLECT( levy::protocol::recover_asset_operation, (caller_account)(token)(amount) )
FC_REFLECT( levy::protocol::tax_collected_operation, (from)(amount) )
FC_REFLECT( levy::protocol::liquidity_added_operation, (token_amount)(paired_amount)(liquidity)(recipient) )
