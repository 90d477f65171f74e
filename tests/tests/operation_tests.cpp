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
#include <levy/protocol/exceptions.hpp>

#include "../common/database_fixture.hpp"

using namespace levy::chain;
using namespace levy::chain::test;

BOOST_FIXTURE_TEST_SUITE( operation_tests, database_fixture )

BOOST_AUTO_TEST_CASE( transfer_validation )
{ try {
   ACTORS( (alice)(bob) );

   transfer_operation op;
   op.from = alice_id;
   op.to = alice_id;
   op.amount = token->amount( 0 );
   op.validate();

   transfer_from_operation from_op;
   from_op.spender = bob_id;
   from_op.from = alice_id;
   from_op.to = bob_id;
   from_op.amount = token->amount( 1 );
   from_op.validate();
   from_op.spender = alice_id;
   from_op.validate();

   approve_operation approve_op;
   approve_op.owner = alice_id;
   approve_op.spender = bob_id;
   approve_op.amount = token->amount( 0 );
   approve_op.validate();
   approve_op.spender = alice_id;
   approve_op.validate();
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( recover_validation )
{ try {
   recover_asset_operation op;
   op.caller_account = admin_id;
   op.token = token_id;
   op.amount = asset( 1, paired_id );
   op.validate();
   REQUIRE_OP_VALIDATION_FAILURE( op, amount, asset( 0, paired_id ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( exchange_validation )
{ try {
   exchange_swap_operation swap;
   swap.account = admin_id;
   swap.amount_to_sell = asset( 1, paired_id );
   swap.min_to_receive = token->amount( 0 );
   swap.validate();
   REQUIRE_OP_VALIDATION_FAILURE( swap, amount_to_sell, asset( 0, paired_id ) );
   REQUIRE_OP_VALIDATION_FAILURE( swap, min_to_receive, asset( 0, paired_id ) );

   exchange_add_liquidity_operation add;
   add.account = admin_id;
   add.amount_a = token->amount( 10 );
   add.amount_b = asset( 10, paired_id );
   add.min_a = 10;
   add.min_b = 5;
   add.validate();
   REQUIRE_OP_VALIDATION_FAILURE( add, amount_a, token->amount( 0 ) );
   REQUIRE_OP_VALIDATION_FAILURE( add, amount_b, asset( 0, paired_id ) );
   REQUIRE_OP_VALIDATION_FAILURE( add, amount_b, token->amount( 10 ) );
   REQUIRE_OP_VALIDATION_FAILURE( add, min_a, share_type( 11 ) );
   REQUIRE_OP_VALIDATION_FAILURE( add, min_b, share_type( 11 ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( caller_of_each_operation )
{ try {
   ACTORS( (alice)(bob)(carol) );

   transfer_operation t;
   t.from = alice_id;
   t.to = bob_id;
   BOOST_CHECK( operation_caller( t ) == alice_id );

   transfer_from_operation tf;
   tf.spender = carol_id;
   tf.from = alice_id;
   tf.to = bob_id;
   BOOST_CHECK( operation_caller( tf ) == carol_id );

   approve_operation a;
   a.owner = bob_id;
   a.spender = carol_id;
   BOOST_CHECK( operation_caller( a ) == bob_id );

   recover_asset_operation r;
   r.caller_account = admin_id;
   BOOST_CHECK( operation_caller( r ) == admin_id );

   BOOST_CHECK( operation_caller( tax_collected_operation( alice_id, token->amount( 5 ) ) ) == alice_id );

   BOOST_CHECK( !is_virtual_operation( t ) );
   BOOST_CHECK( is_virtual_operation( tax_collected_operation() ) );
   BOOST_CHECK( is_virtual_operation( liquidity_added_operation() ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( empty_transaction_is_rejected )
{ try {
   LEVY_REQUIRE_THROW( db.push_transaction( transaction() ), levy::protocol::tx_empty );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( virtual_operation_can_not_be_pushed )
{ try {
   ACTORS( (alice) );
   trx.clear();
   trx.add( tax_collected_operation( alice_id, token->amount( 5 ) ) );
   LEVY_REQUIRE_THROW( db.push_transaction( trx ), fc::exception );

   trx.clear();
   trx.add( liquidity_added_operation() );
   LEVY_REQUIRE_THROW( db.push_transaction( trx ), fc::exception );
   trx.clear();
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( unknown_references_are_rejected )
{ try {
   ACTORS( (alice) );
   const account_id_type nobody( 1000 );

   LEVY_REQUIRE_THROW( transfer( alice_id, nobody, asset( 0, paired_id ) ), unknown_account );
   LEVY_REQUIRE_THROW( transfer( alice_id, admin_id, asset( 0, asset_id_type( 1000 ) ) ), unknown_asset );

   recover_asset_operation op;
   op.caller_account = admin_id;
   op.token = paired_id;
   op.amount = asset( 1, core_id );
   LEVY_REQUIRE_THROW( push_op( op ), unknown_asset );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( transaction_is_applied_completely_or_not_at_all )
{ try {
   ACTORS( (alice)(bob)(carol) );
   fund( alice_id, 100 );
   close_tax_window();

   transfer_operation first;
   first.from = alice_id;
   first.to = bob_id;
   first.amount = token->amount( units( 50 ) );

   transfer_operation second;
   second.from = carol_id;
   second.to = bob_id;
   second.amount = token->amount( units( 1 ) );

   const size_t history = db.get_history().size();
   trx.clear();
   trx.add( first ).add( second );
   LEVY_REQUIRE_THROW( db.push_transaction( trx ), insufficient_balance );

   BOOST_CHECK_EQUAL( token_balance( alice_id ), units( 100 ) );
   BOOST_CHECK_EQUAL( token_balance( bob_id ), 0 );
   BOOST_CHECK_EQUAL( db.get_history().size(), history );

   trx.clear();
   second.from = alice_id;
   trx.add( first ).add( second );
   db.push_transaction( trx );
   trx.clear();
   BOOST_CHECK_EQUAL( token_balance( alice_id ), units( 49 ) );
   BOOST_CHECK_EQUAL( token_balance( bob_id ), units( 51 ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( history_positions )
{ try {
   ACTORS( (alice)(bob) );
   fund( alice_id, 10000 );
   db.generate_block();

   transfer_operation taxed;
   taxed.from = alice_id;
   taxed.to = bob_id;
   taxed.amount = token->amount( units( 1000 ) );

   approve_operation approval;
   approval.owner = alice_id;
   approval.spender = bob_id;
   approval.amount = token->amount( units( 1 ) );

   const size_t first = db.get_history().size();
   trx.clear();
   trx.add( approval ).add( taxed );
   db.push_transaction( trx );
   trx.clear();
   transfer( bob_id, alice_id, token->amount( units( 1 ) ) );

   const auto& history = db.get_history();
   // approval, transfer, levy, liquidity, then the second transaction with its own levy and liquidity
   BOOST_REQUIRE_EQUAL( history.size() - first, 7u );
   for( size_t i = first; i < history.size(); ++i )
   {
      BOOST_CHECK_EQUAL( history[i].id.instance, i );
      BOOST_CHECK_EQUAL( history[i].block_num, db.head_block_num() );
      BOOST_CHECK( history[i].block_time == db.head_block_time() );
   }

   BOOST_CHECK( history[first].op.is_type<approve_operation>() );
   BOOST_CHECK( history[first + 1].op.is_type<transfer_operation>() );
   BOOST_CHECK( history[first + 2].op.is_type<tax_collected_operation>() );
   BOOST_CHECK( history[first + 3].op.is_type<liquidity_added_operation>() );

   BOOST_CHECK_EQUAL( history[first].trx_in_block, 0 );
   BOOST_CHECK_EQUAL( history[first].op_in_trx, 0 );
   BOOST_CHECK_EQUAL( history[first].virtual_op, 0 );
   for( size_t i = 1; i <= 3; ++i )
   {
      BOOST_CHECK_EQUAL( history[first + i].trx_in_block, 0 );
      BOOST_CHECK_EQUAL( history[first + i].op_in_trx, 1 );
      BOOST_CHECK_EQUAL( history[first + i].virtual_op, i - 1 );
   }
   for( size_t i = 4; i <= 6; ++i )
   {
      BOOST_CHECK_EQUAL( history[first + i].trx_in_block, 1 );
      BOOST_CHECK_EQUAL( history[first + i].op_in_trx, 0 );
   }
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( operations_are_announced_after_the_transaction )
{ try {
   ACTORS( (alice)(bob) );
   fund( alice_id, 10000 );

   vector<operation_history_object> announced;
   size_t history_when_first_announced = 0;
   boost::signals2::scoped_connection connection = db.applied_operation.connect(
      [&]( const operation_history_object& oh ) {
         if( announced.empty() )
            history_when_first_announced = db.get_history().size();
         announced.push_back( oh );
      } );

   const size_t first = db.get_history().size();
   transfer( alice_id, bob_id, token->amount( units( 1000 ) ) );

   BOOST_REQUIRE_EQUAL( announced.size(), 3u );
   BOOST_CHECK_EQUAL( history_when_first_announced, first + 3 );
   BOOST_CHECK( announced[0].op.is_type<transfer_operation>() );
   BOOST_CHECK( announced[1].op.is_type<tax_collected_operation>() );
   BOOST_CHECK( announced[2].op.is_type<liquidity_added_operation>() );

   // a failed transaction announces nothing
   LEVY_REQUIRE_THROW( transfer( bob_id, alice_id, token->amount( units( 1000 ) ) ), insufficient_balance );
   BOOST_CHECK_EQUAL( announced.size(), 3u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
