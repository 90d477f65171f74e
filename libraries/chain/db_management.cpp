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
#include <levy/chain/database.hpp>
#include <levy/chain/exceptions.hpp>
#include <levy/chain/token_contract.hpp>

namespace levy { namespace chain {

database::database()
{
}

database::~database()
{
}

void database::register_token_contract( token_contract& contract )
{ try {
   const asset_id_type token = contract.token_id();
   get_asset( token );
   LEVY_ASSERT( _token_contracts.find( token ) == _token_contracts.end(), token_contract_exists,
                "Asset ${a} already has a token contract", ("a", token) );
   _token_contracts[token] = &contract;
} FC_CAPTURE_AND_RETHROW() }

void database::unregister_token_contract( asset_id_type token )
{
   _token_contracts.erase( token );
}

token_contract* database::find_token_contract( asset_id_type token )const
{
   auto itr = _token_contracts.find( token );
   if( itr == _token_contracts.end() )
      return nullptr;
   return itr->second;
}

void database::register_exchange_gateway( exchange_gateway& gateway )
{
   _gateway = &gateway;
}

} } // levy::chain
