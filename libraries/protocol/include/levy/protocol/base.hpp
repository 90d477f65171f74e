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

#include <levy/protocol/types.hpp>
#include <levy/protocol/asset.hpp>

namespace levy { namespace protocol {

   /**
    *  @defgroup operations Operations
    *  @brief A set of valid commands for mutating the shared ledger state.
    *
    *  An operation can be thought of like a function that will modify the ledger. The members of each
    *  struct are like function arguments.
    *
    *  Operations are grouped into transactions (@ref transaction) so that they occur in a particular
    *  order and either all of them apply or none of them do. Operations marked VIRTUAL are never
    *  submitted by a caller; the database records them as side effects of other operations.
    *
    *  @{
    */

   struct base_operation
   {
      void validate()const{}
   };

   ///@}

} } // levy::protocol
