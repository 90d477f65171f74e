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
    * @brief Transfers an amount of one asset from one account to another
    *
    *  Transfers of the levy token are intercepted and may be charged a levy while the tax window is
    *  open; see @ref levy::chain::levy_engine.
    *
    *  Zero amounts and transfers where @ref from equals @ref to are both valid.
    *
    *  @post from account's balance will be reduced by amount
    *  @post to account's balance will be increased by amount, less any levy withheld
    */
   struct transfer_operation : public base_operation
   {
      /// Account to transfer asset from
      account_id_type  from;
      /// Account to transfer asset to
      account_id_type  to;
      /// The amount of asset to transfer from @ref from to @ref to
      asset            amount;

      account_id_type caller()const { return from; }
      void            validate()const;
   };

   /**
    * @ingroup operations
    *
    * @brief Transfers on behalf of @ref from, spending an allowance granted to @ref spender
    */
   struct transfer_from_operation : public base_operation
   {
      account_id_type  spender;
      account_id_type  from;
      account_id_type  to;
      asset            amount;

      account_id_type caller()const { return spender; }
      void            validate()const;
   };

   /**
    * @ingroup operations
    *
    * @brief Sets the allowance of @ref spender over the assets of @ref owner
    *
    * The allowance is replaced, not increased. An allowance equal to the largest representable amount
    * is never decremented when spent.
    */
   struct approve_operation : public base_operation
   {
      account_id_type  owner;
      account_id_type  spender;
      asset            amount;

      account_id_type caller()const { return owner; }
      void            validate()const;
   };

}} // levy::protocol

FC_REFLECT( levy::protocol::transfer_operation, (from)(to)(amount) )
FC_REFLECT( levy::protocol::transfer_from_operation, (spender)(from)(to)(amount) )
FC_REFLECT( levy::protocol::approve_operation, (owner)(spender)(amount) )
