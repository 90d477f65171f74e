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
#include <levy/protocol/liquidity_pool.hpp>

namespace levy { namespace protocol {

void exchange_swap_operation::validate()const
{
   FC_ASSERT( amount_to_sell.amount > 0, "Amount to sell should be positive" );
   FC_ASSERT( amount_to_sell.asset_id != min_to_receive.asset_id,
              "ID of the two assets should not be the same" );
}

void exchange_add_liquidity_operation::validate()const
{
   FC_ASSERT( amount_a.amount > 0 && amount_b.amount > 0, "Both amounts of the assets should be positive" );
   FC_ASSERT( amount_a.asset_id != amount_b.asset_id, "ID of the two assets should not be the same" );
   FC_ASSERT( min_a <= amount_a.amount && min_b <= amount_b.amount,
              "Minimum amounts should not exceed the desired amounts" );
}

} } // levy::protocol
