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

#include "database_fixture.hpp"

#include <levy/chain/account_object.hpp>
#include <levy/chain/asset_object.hpp>

using namespace levy::chain::test;

namespace levy { namespace chain {

uint32_t LEVY_TESTING_GENESIS_TIMESTAMP = 1767225600;

namespace buf = boost::unit_test::framework;

database_fixture::database_fixture()
   : genesis_state( make_genesis() )
{ try {
   int argc = buf::master_test_suite().argc;
   char** argv = buf::master_test_suite().argv;
   for( int i=1; i<argc; i++ )
   {
      const std::string arg = argv[i];
      if( arg == "--record-assert-trip" )
         fc::enable_record_assert_trip = true;
      if( arg == "--show-test-names" )
         std::cout << "running test " << buf::current_test_case().p_name << std::endl;
   }

   db.init_genesis( genesis_state );

   admin_id  = db.get_account( "admin" ).id;
   core_id   = db.get_asset( LEVY_CORE_SYMBOL ).id;
   paired_id = db.get_asset( "W" LEVY_CORE_SYMBOL ).id;
   whole     = levy::protocol::scaled_precision( LEVY_DEFAULT_DECIMALS );

   gateway = std::make_unique<test_gateway>( db, paired_id, genesis_state.pool_taker_fee );
   db.register_exchange_gateway( *gateway );

   token = std::make_unique<levy_token>( db, *gateway, levy_token_options::from_genesis( db, genesis_state.token ) );
   token_id = token->token_id();

   seeded_token  = whole * 100000;
   seeded_paired = whole * 100;
   seed_liquidity( db, *gateway, *token, seeded_token, seeded_paired );
   gateway->deposits.clear();
} catch ( const fc::exception& e ) {
   edump( (e.to_detail_string()) );
   throw;
} }

database_fixture::~database_fixture()
{
   token.reset();
   gateway.reset();
}

genesis_state_type database_fixture::make_genesis()
{
   genesis_state_type genesis;
   genesis.initial_timestamp = fc::time_point_sec( LEVY_TESTING_GENESIS_TIMESTAMP );
   genesis.initial_accounts.emplace_back( "admin" );

   genesis_state_type::initial_asset_type core;
   core.symbol = LEVY_CORE_SYMBOL;
   core.issuer_name = "admin";
   genesis.initial_assets.push_back( core );

   genesis_state_type::initial_asset_type wrapped;
   wrapped.symbol = "W" LEVY_CORE_SYMBOL;
   wrapped.issuer_name = "admin";
   genesis.initial_assets.push_back( wrapped );

   genesis_state_type::initial_balance_type balance;
   balance.owner_name = "admin";
   balance.asset_symbol = wrapped.symbol;
   balance.amount = levy::protocol::scaled_precision( LEVY_DEFAULT_DECIMALS ) * 1000000;
   genesis.initial_balances.push_back( balance );

   genesis.token.admin_name = "admin";
   genesis.token.paired_asset_symbol = wrapped.symbol;
   return genesis;
}

const account_object& database_fixture::create_account( const string& name )
{
   return db.create_account( name );
}

account_id_type database_fixture::get_account_id( const string& name )const
{
   return db.get_account( name ).id;
}

share_type database_fixture::get_balance( account_id_type account, asset_id_type asset_type )const
{
   return db.get_balance( account, asset_type ).amount;
}

share_type database_fixture::token_balance( account_id_type account )const
{
   return get_balance( account, token_id );
}

share_type database_fixture::paired_balance( account_id_type account )const
{
   return get_balance( account, paired_id );
}

share_type database_fixture::token_balance_sum()const
{
   share_type sum = 0;
   const auto& idx = db.get_state().balances.get<by_asset_balance>();
   auto range = idx.equal_range( boost::make_tuple( token_id ) );
   for( auto itr = range.first; itr != range.second; ++itr )
      sum += itr->balance;
   return sum;
}

account_id_type database_fixture::pair_account_id()const
{
   return pool().pair_account;
}

void database_fixture::push_op( const operation& op )
{
   trx.clear();
   trx.operations.push_back( op );
   db.push_transaction( trx );
   trx.clear();
}

void database_fixture::transfer( account_id_type from, account_id_type to, const asset& amount )
{ try {
   transfer_operation op;
   op.from = from;
   op.to = to;
   op.amount = amount;
   push_op( op );
} FC_CAPTURE_AND_RETHROW( (from)(to)(amount) ) }

void database_fixture::fund( account_id_type to, uint64_t whole_units )
{
   transfer( admin_id, to, asset( whole * whole_units, token_id ) );
}

void database_fixture::fund_paired( account_id_type to, uint64_t whole_units )
{
   transfer( admin_id, to, asset( whole * whole_units, paired_id ) );
}

void database_fixture::approve( account_id_type owner, account_id_type spender, const asset& amount )
{ try {
   approve_operation op;
   op.owner = owner;
   op.spender = spender;
   op.amount = amount;
   push_op( op );
} FC_CAPTURE_AND_RETHROW( (owner)(spender)(amount) ) }

void database_fixture::generate_blocks( fc::time_point_sec timestamp )
{
   db.generate_blocks( timestamp );
}

void database_fixture::close_tax_window()
{
   db.generate_blocks( token->tax_end_time() + 1 );
}

} } // levy::chain
