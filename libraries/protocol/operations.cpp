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
#include <levy/protocol/operations.hpp>
#include <levy/protocol/exceptions.hpp>

namespace levy { namespace protocol {

FC_IMPLEMENT_EXCEPTION( protocol_exception, 4000000, "protocol exception" )

FC_IMPLEMENT_DERIVED_EXCEPTION( transaction_exception, protocol_exception, 4010000,
                                "transaction validation exception" )
FC_IMPLEMENT_DERIVED_EXCEPTION( tx_empty, transaction_exception, 4010001,
                                "transaction has no operations" )

struct operation_validator
{
   typedef void result_type;
   template<typename T>
   void operator()( const T& v )const { v.validate(); }
};

struct operation_caller_visitor
{
   typedef account_id_type result_type;
   template<typename T>
   account_id_type operator()( const T& v )const { return v.caller(); }
};

bool is_virtual_operation( const operation& op )
{
   return op.is_type<tax_collected_operation>() || op.is_type<liquidity_added_operation>();
}

void operation_validate( const operation& op )
{
   op.visit( operation_validator() );
}

account_id_type operation_caller( const operation& op )
{
   return op.visit( operation_caller_visitor() );
}

void transaction::validate()const
{
   LEVY_ASSERT( !operations.empty(), tx_empty, "A transaction must have at least one operation",
               ("operations", operations.size()) );
   for( const auto& op : operations )
   {
      FC_ASSERT( !is_virtual_operation( op ), "Virtual operations can not be submitted" );
      operation_validate( op );
   }
}

} } // levy::protocol
