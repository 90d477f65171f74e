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

#include <fc/io/json.hpp>

#include <boost/test/unit_test.hpp>
#include <boost/preprocessor/seq/for_each.hpp>
#include <boost/preprocessor/stringize.hpp>

#include <levy/chain/database.hpp>
#include <levy/chain/exceptions.hpp>
#include <levy/chain/levy_token.hpp>

#include "test_gateway.hpp"

#include <iostream>
#include <memory>

using namespace levy::db;

#define LEVY_REQUIRE_THROW( expr, exc_type )             \
{                                                         \
   std::string req_throw_info = fc::json::to_string(      \
      fc::mutable_variant_object()                        \
      ("source_file", __FILE__)                           \
      ("source_lineno", __LINE__)                         \
      ("expr", #expr)                                     \
      ("exc_type", #exc_type)                             \
      );                                                  \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "LEVY_REQUIRE_THROW begin "            \
         << req_throw_info << std::endl;                  \
   BOOST_REQUIRE_THROW( expr, exc_type );                 \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "LEVY_REQUIRE_THROW end "              \
         << req_throw_info << std::endl;                  \
}

#define LEVY_CHECK_THROW( expr, exc_type )               \
{                                                         \
   std::string req_throw_info = fc::json::to_string(      \
      fc::mutable_variant_object()                        \
      ("source_file", __FILE__)                           \
      ("source_lineno", __LINE__)                         \
      ("expr", #expr)                                     \
      ("exc_type", #exc_type)                             \
      );                                                  \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "LEVY_CHECK_THROW begin "              \
         << req_throw_info << std::endl;                  \
   BOOST_CHECK_THROW( expr, exc_type );                   \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "LEVY_CHECK_THROW end "                \
         << req_throw_info << std::endl;                  \
}

#define REQUIRE_OP_VALIDATION_FAILURE( op, field, value ) \
{ \
   const auto temp = op.field; \
   op.field = value; \
   LEVY_REQUIRE_THROW( op.validate(), fc::exception ); \
   op.field = temp; \
}

/// Only ids are kept: a failed transaction restores the state and with it every object
#define ACTOR(name) \
   const levy::chain::account_id_type name ## _id = create_account( BOOST_PP_STRINGIZE(name) ).id; \
   (void)name ## _id;

#define GET_ACTOR(name) \
   const levy::chain::account_id_type name ## _id = get_account_id( BOOST_PP_STRINGIZE(name) ); \
   (void)name ## _id

#define ACTORS_IMPL(r, data, elem) ACTOR(elem)
#define ACTORS(names) BOOST_PP_SEQ_FOR_EACH(ACTORS_IMPL, ~, names)

namespace levy { namespace chain {

extern uint32_t LEVY_TESTING_GENESIS_TIMESTAMP;

/**
 * A database with the core asset, its wrapped form paired with a levy token, and a seeded pool.
 *
 * The administrator holds the whole token supply less what was deposited into the pool, and most
 * of the wrapped core asset.
 */
struct database_fixture {
   genesis_state_type               genesis_state;
   database                         db;
   transaction                      trx;
   std::unique_ptr<test::test_gateway> gateway;
   std::unique_ptr<levy_token>      token;

   account_id_type                  admin_id;
   asset_id_type                    core_id;
   asset_id_type                    paired_id;
   asset_id_type                    token_id;
   /// One whole unit in base units of every asset the fixture creates
   share_type                       whole;

   /// @p n whole units in base units
   share_type units( uint64_t n )const { return whole * n; }

   /// Deposited by the administrator when the fixture is set up
   share_type                       seeded_token;
   share_type                       seeded_paired;

   database_fixture();
   ~database_fixture();

   /// The genesis state the fixture starts from
   static genesis_state_type make_genesis();

   const account_object& create_account( const string& name );
   account_id_type get_account_id( const string& name )const;

   share_type get_balance( account_id_type account, asset_id_type asset_type )const;
   share_type token_balance( account_id_type account )const;
   share_type paired_balance( account_id_type account )const;
   /// Sum of the token balances of all holders
   share_type token_balance_sum()const;

   account_id_type custody_id()const { return token->custody_account(); }
   account_id_type pair_account_id()const;
   account_id_type router_id()const { return gateway->gateway_account(); }
   const liquidity_pool_object& pool()const { return db.get_liquidity_pool( token->pair() ); }

   /// Pushes a transaction holding only @p op
   void push_op( const operation& op );
   void transfer( account_id_type from, account_id_type to, const asset& amount );
   /// Sends whole units of the token from the administrator, who is exempt
   void fund( account_id_type to, uint64_t whole_units );
   void fund_paired( account_id_type to, uint64_t whole_units );
   void approve( account_id_type owner, account_id_type spender, const asset& amount );

   /// Generates blocks up to @p timestamp
   void generate_blocks( fc::time_point_sec timestamp );
   /// Moves the clock one second past the end of the tax window
   void close_tax_window();

   /// The operations of type @p Op recorded in the history since entry @p first
   template<typename Op>
   vector<Op> recorded( size_t first = 0 )const
   {
      vector<Op> result;
      const auto& history = db.get_history();
      for( size_t i = first; i < history.size(); ++i )
         if( history[i].op.is_type<Op>() )
            result.push_back( history[i].op.get<Op>() );
      return result;
   }
};

} }
