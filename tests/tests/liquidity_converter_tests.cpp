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
#include <boost/test/unit_test.hpp>

#include <levy/chain/database.hpp>
#include <levy/chain/exceptions.hpp>
#include <levy/chain/levy_token.hpp>

#include "../common/database_fixture.hpp"

using namespace levy::chain;
using namespace levy::chain::test;

BOOST_FIXTURE_TEST_SUITE( liquidity_converter_tests, database_fixture )

BOOST_AUTO_TEST_CASE( conversion_accepts_any_price )
{ try {
   ACTORS( (alice)(bob) );
   fund( alice_id, 10000 );
   transfer( alice_id, bob_id, token->amount( units( 1000 ) ) );

   BOOST_REQUIRE_EQUAL( gateway->swaps.size(), 1u );
   const auto& swap = gateway->swaps[0];
   BOOST_CHECK( swap.caller == custody_id() );
   BOOST_CHECK( swap.recipient == custody_id() );
   BOOST_CHECK_EQUAL( swap.min_out, 0 );
   BOOST_CHECK( swap.deadline == db.head_block_time() );
   BOOST_REQUIRE_EQUAL( swap.path.size(), 2u );
   BOOST_CHECK( swap.path[0] == token_id );
   BOOST_CHECK( swap.path[1] == paired_id );
   BOOST_CHECK( swap.amount_out > 0 );

   BOOST_REQUIRE_EQUAL( gateway->deposits.size(), 1u );
   const auto& deposit = gateway->deposits[0];
   BOOST_CHECK( deposit.caller == custody_id() );
   BOOST_CHECK( deposit.recipient == admin_id );
   BOOST_CHECK( deposit.token_a == token_id );
   BOOST_CHECK( deposit.token_b == paired_id );
   BOOST_CHECK_EQUAL( deposit.desired_a, units( 25 ) );
   BOOST_CHECK_EQUAL( deposit.desired_b, swap.amount_out );
   BOOST_CHECK_EQUAL( deposit.min_a, 0 );
   BOOST_CHECK_EQUAL( deposit.min_b, 0 );
   BOOST_CHECK( deposit.deadline == db.head_block_time() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( conversion_starts_after_net_and_levy_moved )
{ try {
   ACTORS( (alice)(bob) );
   fund( alice_id, 10000 );
   const share_type custody_before = token_balance( custody_id() );
   const size_t first = db.get_history().size();

   bool swapped = false;
   gateway->on_swap = [&]() {
      swapped = true;
      BOOST_CHECK_EQUAL( token_balance( alice_id ), units( 9000 ) );
      BOOST_CHECK_EQUAL( token_balance( bob_id ), units( 950 ) );
      BOOST_CHECK_EQUAL( token_balance( custody_id() ), share_type( custody_before + units( 50 ) ) );

      const auto collected = recorded<tax_collected_operation>( first );
      BOOST_REQUIRE_EQUAL( collected.size(), 1u );
      BOOST_CHECK( collected[0].from == alice_id );
      BOOST_CHECK( collected[0].amount == token->amount( units( 50 ) ) );
      BOOST_CHECK( recorded<liquidity_added_operation>( first ).empty() );
   };

   transfer( alice_id, bob_id, token->amount( units( 1000 ) ) );

   BOOST_CHECK( swapped );
   BOOST_CHECK_EQUAL( token_balance( bob_id ), units( 950 ) );
   // at least the swapped half has left custody
   BOOST_CHECK( token_balance( custody_id() ) <= custody_before + units( 25 ) );
   BOOST_CHECK_EQUAL( recorded<liquidity_added_operation>( first ).size(), 1u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( liquidity_goes_to_admin )
{ try {
   ACTORS( (alice)(bob) );
   fund( alice_id, 10000 );

   const asset_id_type share = pool().share_asset;
   const share_type admin_shares = get_balance( admin_id, share );
   const share_type supply_before = db.total_supply( share );

   transfer( alice_id, bob_id, token->amount( units( 1000 ) ) );

   const auto added = recorded<liquidity_added_operation>();
   BOOST_REQUIRE_EQUAL( added.size(), 1u );
   BOOST_CHECK( added[0].liquidity.asset_id == share );
   BOOST_CHECK( added[0].liquidity.amount > 0 );
   BOOST_CHECK_EQUAL( get_balance( admin_id, share ), share_type( admin_shares + added[0].liquidity.amount ) );
   BOOST_CHECK_EQUAL( db.total_supply( share ), share_type( supply_before + added[0].liquidity.amount ) );
   BOOST_CHECK_EQUAL( get_balance( custody_id(), share ), 0 );
   BOOST_CHECK_EQUAL( get_balance( bob_id, share ), 0 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( reserves_follow_pair_balances )
{ try {
   ACTORS( (alice)(bob) );
   fund( alice_id, 10000 );
   transfer( alice_id, bob_id, token->amount( units( 1000 ) ) );
   transfer( bob_id, alice_id, token->amount( units( 100 ) ) );

   const liquidity_pool_object& p = pool();
   BOOST_CHECK( p.asset_a == paired_id );
   BOOST_CHECK( p.asset_b == token_id );
   BOOST_CHECK_EQUAL( p.balance_a, paired_balance( pair_account_id() ) );
   BOOST_CHECK_EQUAL( p.balance_b, token_balance( pair_account_id() ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( paired_asset_held_by_custody_is_swept )
{ try {
   ACTORS( (alice)(bob) );
   fund( alice_id, 10000 );
   fund_paired( alice_id, 10 );
   // a foreign deposit into custody is not recovered first
   transfer( alice_id, custody_id(), asset( units( 1 ), paired_id ) );
   BOOST_CHECK_EQUAL( paired_balance( custody_id() ), units( 1 ) );

   transfer( alice_id, bob_id, token->amount( units( 1000 ) ) );

   BOOST_REQUIRE_EQUAL( gateway->swaps.size(), 1u );
   BOOST_REQUIRE_EQUAL( gateway->deposits.size(), 1u );
   BOOST_CHECK_EQUAL( gateway->deposits[0].desired_b, share_type( gateway->swaps[0].amount_out + units( 1 ) ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( failed_swap_undoes_the_transfer )
{ try {
   ACTORS( (alice)(bob) );
   fund( alice_id, 10000 );

   const size_t first = db.get_history().size();
   size_t notified = 0;
   boost::signals2::scoped_connection connection =
      db.applied_operation.connect( [&notified]( const operation_history_object& ) { ++notified; } );

   gateway->fail_swap = true;
   LEVY_REQUIRE_THROW( transfer( alice_id, bob_id, token->amount( units( 1000 ) ) ), exchange_insufficient_liquidity );

   BOOST_CHECK_EQUAL( token_balance( alice_id ), units( 10000 ) );
   BOOST_CHECK_EQUAL( token_balance( bob_id ), 0 );
   BOOST_CHECK_EQUAL( token_balance( custody_id() ), 0 );
   BOOST_CHECK_EQUAL( db.get_history().size(), first );
   BOOST_CHECK_EQUAL( notified, 0u );
   BOOST_CHECK( !token->engine().is_swapping() );

   // nothing is left locked
   gateway->fail_swap = false;
   transfer( alice_id, bob_id, token->amount( units( 1000 ) ) );
   BOOST_CHECK_EQUAL( token_balance( bob_id ), units( 950 ) );
   BOOST_CHECK( notified > 0 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( failed_deposit_undoes_the_swap )
{ try {
   ACTORS( (alice)(bob) );
   fund( alice_id, 10000 );

   const share_type reserve_a = pool().balance_a;
   const share_type reserve_b = pool().balance_b;

   gateway->fail_add_liquidity = true;
   LEVY_REQUIRE_THROW( transfer( alice_id, bob_id, token->amount( units( 1000 ) ) ), exchange_insufficient_liquidity );

   // the swap itself went through before the deposit failed
   BOOST_CHECK_EQUAL( gateway->swaps.size(), 1u );
   BOOST_CHECK_EQUAL( pool().balance_a, reserve_a );
   BOOST_CHECK_EQUAL( pool().balance_b, reserve_b );
   BOOST_CHECK_EQUAL( paired_balance( custody_id() ), 0 );
   BOOST_CHECK_EQUAL( token_balance( alice_id ), units( 10000 ) );
   BOOST_CHECK( !gateway->inner().is_locked( token->pair() ) );
   BOOST_CHECK( !token->engine().is_swapping() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( transfers_during_conversion_are_not_charged )
{ try {
   ACTORS( (alice)(bob)(carol) );
   fund( alice_id, 10000 );
   fund( carol_id, 100 );

   bool was_swapping = false;
   gateway->on_swap = [&]() {
      was_swapping = token->engine().is_swapping();
      db.transfer( carol_id, bob_id, token->amount( units( 100 ) ) );
   };

   const size_t first = db.get_history().size();
   transfer( alice_id, bob_id, token->amount( units( 1000 ) ) );

   BOOST_CHECK( was_swapping );
   BOOST_CHECK( !token->engine().is_swapping() );
   BOOST_CHECK_EQUAL( token_balance( carol_id ), 0 );
   BOOST_CHECK_EQUAL( token_balance( bob_id ), units( 1050 ) );
   BOOST_CHECK_EQUAL( recorded<tax_collected_operation>( first ).size(), 1u );
   BOOST_CHECK_EQUAL( gateway->swaps.size(), 1u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( nested_transaction_during_conversion_is_not_charged )
{ try {
   ACTORS( (alice)(bob)(carol) );
   fund( alice_id, 10000 );
   fund( carol_id, 100 );

   vector<operation_history_object> notified;
   boost::signals2::scoped_connection connection =
      db.applied_operation.connect( [&notified]( const operation_history_object& oh ) { notified.push_back( oh ); } );

   gateway->on_swap = [&]() {
      token->transfer( carol_id, bob_id, units( 100 ) );
   };

   const size_t first = db.get_history().size();
   transfer( alice_id, bob_id, token->amount( units( 1000 ) ) );

   BOOST_CHECK_EQUAL( token_balance( bob_id ), units( 1050 ) );
   BOOST_CHECK_EQUAL( recorded<tax_collected_operation>( first ).size(), 1u );
   BOOST_CHECK_EQUAL( recorded<transfer_operation>( first ).size(), 2u );

   // notified once the outer transaction is applied, in the order of the history
   BOOST_REQUIRE_EQUAL( notified.size(), db.get_history().size() - first );
   for( size_t i = 0; i < notified.size(); ++i )
      BOOST_CHECK( notified[i].id == db.get_history()[first + i].id );
   BOOST_CHECK( notified.front().op.is_type<transfer_operation>() );
   BOOST_CHECK( notified.back().op.is_type<liquidity_added_operation>() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( failed_transfer_during_conversion_aborts_everything )
{ try {
   ACTORS( (alice)(bob)(carol) );
   fund( alice_id, 10000 );

   gateway->on_swap = [&]() {
      // carol holds nothing
      db.transfer( carol_id, bob_id, token->amount( units( 100 ) ) );
   };

   const size_t first = db.get_history().size();
   LEVY_REQUIRE_THROW( transfer( alice_id, bob_id, token->amount( units( 1000 ) ) ), insufficient_balance );
   BOOST_CHECK_EQUAL( token_balance( alice_id ), units( 10000 ) );
   BOOST_CHECK_EQUAL( token_balance( bob_id ), 0 );
   BOOST_CHECK_EQUAL( db.get_history().size(), first );
   BOOST_CHECK( !token->engine().is_swapping() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( dust_transfer_fails_while_window_is_open )
{ try {
   ACTORS( (alice)(bob) );
   fund( alice_id, 1 );

   // a levy of one base unit can not be split into a swap
   LEVY_REQUIRE_THROW( transfer( alice_id, bob_id, token->amount( 20 ) ), exchange_insufficient_amount );
   BOOST_CHECK_EQUAL( token_balance( alice_id ), units( 1 ) );

   // no levy at all below twenty base units
   transfer( alice_id, bob_id, token->amount( 19 ) );
   BOOST_CHECK_EQUAL( token_balance( bob_id ), 19 );

   close_tax_window();
   transfer( alice_id, bob_id, token->amount( 20 ) );
   BOOST_CHECK_EQUAL( token_balance( bob_id ), 39 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
