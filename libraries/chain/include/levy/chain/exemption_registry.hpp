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
    * @brief Accounts that are never charged a levy
    *
    * Filled once at construction. There is no way to add or remove an account afterwards.
    */
   class exemption_registry
   {
      public:
         exemption_registry(){}
         explicit exemption_registry( flat_set<account_id_type> exempt )
         :_exempt( std::move(exempt) ){}

         bool is_exempt( account_id_type account )const { return _exempt.find( account ) != _exempt.end(); }

         const flat_set<account_id_type>& exempt_accounts()const { return _exempt; }

      private:
         flat_set<account_id_type> _exempt;
   };

} } // levy::chain
