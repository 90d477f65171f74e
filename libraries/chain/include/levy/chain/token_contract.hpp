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

   /**
    * @brief Custom transfer semantics attached to a single asset
    *
    * Once registered with @ref database::register_token_contract, every transfer of @ref token_id
    * is handed to @ref apply_transfer instead of moving the value directly.
    */
   class token_contract
   {
      public:
         virtual ~token_contract(){}

         virtual asset_id_type token_id()const = 0;

         /// Moves @p amount out of @p from, crediting @p to with whatever the contract decides
         virtual void apply_transfer( account_id_type from, account_id_type to, share_type amount ) = 0;

         /// Moves an asset other than @ref token_id out of the contract's custody to @p caller
         virtual void apply_recover_asset( account_id_type caller, const asset& amount ) = 0;
   };

} } // levy::chain
