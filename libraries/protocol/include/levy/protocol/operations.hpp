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
#include <levy/protocol/levy.hpp>
#include <levy/protocol/liquidity_pool.hpp>
#include <levy/protocol/transfer.hpp>

namespace levy { namespace protocol {

   /**
    * @ingroup operations
    *
    * Defines the set of valid operations as a discriminated union type.
    */
   typedef fc::static_variant<
            /*  0 */ transfer_operation,
            /*  1 */ transfer_from_operation,
            /*  2 */ approve_operation,
            /*  3 */ recover_asset_operation,
            /*  4 */ exchange_swap_operation,
            /*  5 */ exchange_add_liquidity_operation,
            /*  6 */ tax_collected_operation,          // VIRTUAL
            /*  7 */ liquidity_added_operation         // VIRTUAL
         > operation;

   /// @} // operations group

   bool is_virtual_operation( const operation& op );

   /**
    *  Performs basic validation of an operation that does not depend on ledger state.
    */
   void operation_validate( const operation& op );

   /// The account on whose behalf the operation is performed
   account_id_type operation_caller( const operation& op );

   /**
    * @brief a list of operations applied all together or not at all
    */
   struct transaction
   {
      vector<operation> operations;

      void validate()const;

      template<typename Op>
      transaction& add( Op op )
      {
         operations.emplace_back( std::move(op) );
         return *this;
      }
      void clear() { operations.clear(); }
   };

} } // levy::protocol

FC_REFLECT_TYPENAME( levy::protocol::operation )
FC_REFLECT( levy::protocol::transaction, (operations) )
