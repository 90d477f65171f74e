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
#include <levy/chain/constant_product_gateway.hpp>
#include <levy/chain/database.hpp>
#include <levy/chain/exceptions.hpp>
#include <levy/chain/levy_token.hpp>

#include <fc/io/json.hpp>
#include <fc/log/logger.hpp>
#include <fc/log/logger_config.hpp>
#include <fc/filesystem.hpp>

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>

#include <iostream>

namespace bpo = boost::program_options;

using namespace levy::chain;

namespace levy { namespace cli {

/**
 * One entry of an operations script: the clock is advanced by @ref delay_seconds, then @ref op is
 * pushed in a transaction of its own.
 */
struct scripted_operation
{
   uint32_t   delay_seconds = 0;
   operation  op;
};

} } // levy::cli

FC_REFLECT( levy::cli::scripted_operation, (delay_seconds)(op) )

/// Disable default logging
void disable_default_logging()
{
   fc::configure_logging( fc::logging_config() );
}

fc::variant_object summarize( const database& db, const levy_token& token )
{
   fc::mutable_variant_object balances;
   for( const auto& account : db.get_state().accounts.get<by_id>() )
   {
      fc::mutable_variant_object held;
      const auto& by_account = db.get_state().balances.get<by_account_asset>();
      auto range = by_account.equal_range( boost::make_tuple( account.id ) );
      for( auto itr = range.first; itr != range.second; ++itr )
         held( db.get_asset( itr->asset_type ).symbol, fc::variant( itr->balance, 1 ) );
      balances( account.name, held );
   }

   fc::mutable_variant_object summary;
   summary( "head_block_num", db.head_block_num() )
          ( "head_block_time", db.head_block_time() )
          ( "token", token.token_id() )
          ( "total_supply", fc::variant( token.total_supply(), 1 ) )
          ( "tax_end_time", token.tax_end_time() )
          ( "remaining_tax_window", token.remaining_tax_window() )
          ( "pool", fc::variant( db.get_liquidity_pool( token.pair() ), LEVY_MAX_NESTED_OBJECTS ) )
          ( "balances", balances );
   return summary;
}

int main( int argc, char** argv )
{
   try {
      bpo::options_description app_options( "Levy token ledger" );
      app_options.add_options()
            ( "help,h", "Print this help message and exit." )
            ( "genesis-json", bpo::value<boost::filesystem::path>(),
              "File to read Genesis State from. The example Genesis State is used when omitted." )
            ( "create-genesis-json", bpo::value<boost::filesystem::path>(),
              "Path to write the example Genesis State to, then exit." )
            ( "operations", bpo::value<boost::filesystem::path>(),
              "JSON file with a list of {delay_seconds, op} entries to apply in order." )
            ( "history", "Print the operation history after the summary." );

      bpo::variables_map options;
      try
      {
         bpo::store( bpo::parse_command_line( argc, argv, app_options ), options );
         bpo::notify( options );
      }
      catch( const boost::program_options::error& e )
      {
         std::cerr << "Error parsing command line: " << e.what() << "\n";
         return 1;
      }

      if( options.count( "help" ) )
      {
         disable_default_logging();
         std::cout << app_options << "\n";
         return 0;
      }

      if( options.count( "create-genesis-json" ) )
      {
         fc::path genesis_out = options.at( "create-genesis-json" ).as<boost::filesystem::path>();
         std::cerr << "Creating example genesis state in file " << genesis_out.generic_string() << "\n";
         fc::json::save_to_file( create_example_genesis(), genesis_out );
         return 0;
      }

      genesis_state_type genesis = create_example_genesis();
      if( options.count( "genesis-json" ) )
      {
         fc::path genesis_in = options.at( "genesis-json" ).as<boost::filesystem::path>();
         genesis = fc::json::from_file( genesis_in ).as<genesis_state_type>( LEVY_MAX_NESTED_OBJECTS );
      }

      database db;
      db.init_genesis( genesis );

      constant_product_gateway gateway( db, db.get_asset( genesis.token.paired_asset_symbol ).id,
                                        genesis.pool_taker_fee );
      db.register_exchange_gateway( gateway );

      levy_token token( db, gateway, levy_token_options::from_genesis( db, genesis.token ) );
      if( genesis.initial_liquidity.valid() )
         seed_liquidity( db, gateway, token, genesis.initial_liquidity->token_amount,
                         genesis.initial_liquidity->paired_amount );

      db.applied_operation.connect( []( const operation_history_object& oh ) {
         ilog( "${id} ${op}", ("id", oh.id)("op", fc::json::to_string( fc::variant( oh.op, LEVY_MAX_NESTED_OBJECTS ) )) );
      });

      uint32_t failed = 0;
      if( options.count( "operations" ) )
      {
         fc::path script_in = options.at( "operations" ).as<boost::filesystem::path>();
         const auto script = fc::json::from_file( script_in )
                                .as< vector<levy::cli::scripted_operation> >( LEVY_MAX_NESTED_OBJECTS );
         for( const auto& entry : script )
         {
            db.generate_blocks( db.head_block_time() + entry.delay_seconds );
            try
            {
               db.push_transaction( transaction().add( entry.op ) );
            }
            catch( const fc::exception& e )
            {
               ++failed;
               elog( "Operation failed: ${e}", ("e", e.to_detail_string()) );
            }
         }
      }

      std::cout << fc::json::to_pretty_string( summarize( db, token ) ) << "\n";
      if( options.count( "history" ) )
         std::cout << fc::json::to_pretty_string( fc::variant( db.get_history(), LEVY_MAX_NESTED_OBJECTS ) ) << "\n";

      return failed == 0 ? 0 : 2;
   }
   catch( const fc::exception& e )
   {
      elog( "Exiting with error:\n${e}", ("e", e.to_detail_string()) );
      return 1;
   }
}
