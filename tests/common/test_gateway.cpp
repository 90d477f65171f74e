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
#include "test_gateway.hpp"

#include <levy/chain/exceptions.hpp>

namespace levy { namespace chain { namespace test {

test_gateway::test_gateway( database& db, asset_id_type paired_asset, uint16_t taker_fee_percent )
   : _inner( db, paired_asset, taker_fee_percent )
{
}

share_type test_gateway::swap_exact_input_supporting_fee_on_transfer( account_id_type caller,
                                                                      share_type amount_in,
                                                                      share_type min_out,
                                                                      const vector<asset_id_type>& path,
                                                                      account_id_type recipient,
                                                                      time_point_sec deadline )
{
   if( on_swap )
      on_swap();
   LEVY_ASSERT( !fail_swap, exchange_insufficient_liquidity, "Swap disabled for testing", ("in", amount_in) );

   swap_call call;
   call.caller = caller;
   call.amount_in = amount_in;
   call.min_out = min_out;
   call.path = path;
   call.recipient = recipient;
   call.deadline = deadline;
   call.amount_out = _inner.swap_exact_input_supporting_fee_on_transfer( caller, amount_in, min_out, path,
                                                                         recipient, deadline );
   swaps.push_back( call );
   return call.amount_out;
}

add_liquidity_result test_gateway::add_liquidity( account_id_type caller,
                                                  asset_id_type token_a,
                                                  asset_id_type token_b,
                                                  share_type desired_a,
                                                  share_type desired_b,
                                                  share_type min_a,
                                                  share_type min_b,
                                                  account_id_type recipient,
                                                  time_point_sec deadline )
{
   LEVY_ASSERT( !fail_add_liquidity, exchange_insufficient_liquidity, "Deposit disabled for testing",
                ("a", desired_a)("b", desired_b) );

   add_liquidity_call call;
   call.caller = caller;
   call.token_a = token_a;
   call.token_b = token_b;
   call.desired_a = desired_a;
   call.desired_b = desired_b;
   call.min_a = min_a;
   call.min_b = min_b;
   call.recipient = recipient;
   call.deadline = deadline;
   call.result = _inner.add_liquidity( caller, token_a, token_b, desired_a, desired_b, min_a, min_b,
                                       recipient, deadline );
   deposits.push_back( call );
   return call.result;
}

} } } // levy::chain::test
