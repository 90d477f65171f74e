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

#include <boost/algorithm/string/case_conv.hpp>

#include <algorithm>

namespace levy { namespace chain {

/**
 * Marks a pool as busy for the lifetime of the lock
 */
class constant_product_gateway::pool_lock
{
   public:
      pool_lock( flat_set<liquidity_pool_id_type>& locked, liquidity_pool_id_type pool )
      :_locked(locked),_pool(pool)
      {
         LEVY_ASSERT( _locked.insert( pool ).second, exchange_pool_locked,
                      "Pool ${p} is locked", ("p", pool) );
      }
      ~pool_lock() { _locked.erase( _pool ); }

      pool_lock( const pool_lock& ) = delete;
      pool_lock& operator=( const pool_lock& ) = delete;

   private:
      flat_set<liquidity_pool_id_type>& _locked;
      liquidity_pool_id_type            _pool;
};

constant_product_gateway::constant_product_gateway( database& db, asset_id_type paired_asset,
                                                    uint16_t taker_fee_percent, const string& account_name )
   : _db( db ), _paired_asset( paired_asset ), _taker_fee_percent( taker_fee_percent )
{ try {
   FC_ASSERT( taker_fee_percent < LEVY_POOL_FEE_DENOM, "Taker fee must be lower than 100%" );
   _db.get_asset( paired_asset );
   const account_object* existing = _db.find_account( account_name );
   _account = ( existing != nullptr ? existing->id : _db.create_account( account_name ).id );
} FC_CAPTURE_AND_RETHROW( (paired_asset)(taker_fee_percent)(account_name) ) }

liquidity_pool_id_type constant_product_gateway::create_pair( asset_id_type token_a, asset_id_type token_b )
{ try {
   FC_ASSERT( token_a != token_b, "Can not pair an asset with itself" );
   LEVY_ASSERT( _db.find_liquidity_pool( token_a, token_b ) == nullptr, exchange_pair_exists,
                "Pair ${a}/${b} already exists", ("a", token_a)("b", token_b) );
   if( token_b < token_a )
      std::swap( token_a, token_b );

   const string sym_a = _db.get_asset( token_a ).symbol;
   const string sym_b = _db.get_asset( token_b ).symbol;

   const account_object& pair_account = _db.create_account( LEVY_PAIR_ACCOUNT_PREFIX
                                                            + boost::algorithm::to_lower_copy( sym_a ) + "-"
                                                            + boost::algorithm::to_lower_copy( sym_b ) );
   const account_id_type pair_id = pair_account.id;
   const asset_object& share = _db.create_asset( make_share_symbol( sym_a, sym_b ),
                                                 LEVY_DEFAULT_DECIMALS, pair_id,
                                                 liquidity_pool_id_type( _db.get_state().next_pool_instance ) );
   const liquidity_pool_object& pool = _db.create_liquidity_pool( token_a, token_b, share.id, pair_id,
                                                                  _taker_fee_percent );
   dlog( "Created pool ${p} for ${a}/${b}", ("p", pool.id)("a", sym_a)("b", sym_b) );
   return pool.id;
} FC_CAPTURE_AND_RETHROW( (token_a)(token_b) ) }

string constant_product_gateway::make_share_symbol( const string& sym_a, const string& sym_b )const
{
   auto letters = []( const string& symbol ) {
      string result;
      for( const char c : symbol )
         if( c != '.' && result.size() < LEVY_SHARE_SYMBOL_PART_LENGTH )
            result += c;
      return result;
   };
   const string part_a = letters( sym_a );
   string part_b = letters( sym_b );

   string symbol = LEVY_SHARE_ASSET_PREFIX + part_a + "." + part_b;
   if( _db.find_asset( symbol ) == nullptr )
      return symbol;

   string suffix;
   uint64_t n = _db.get_state().next_pool_instance;
   do {
      suffix.insert( suffix.begin(), char( 'A' + n % 26 ) );
      n /= 26;
   } while( n > 0 );
   FC_ASSERT( suffix.size() < LEVY_SHARE_SYMBOL_PART_LENGTH, "Too many pools to name a share asset" );

   part_b.resize( std::min<size_t>( part_b.size(), LEVY_SHARE_SYMBOL_PART_LENGTH - suffix.size() ) );
   symbol = LEVY_SHARE_ASSET_PREFIX + part_a + "." + part_b + suffix;
   LEVY_ASSERT( _db.find_asset( symbol ) == nullptr, duplicate_name,
                "Asset symbol '${s}' is already in use", ("s", symbol) );
   return symbol;
}

optional<liquidity_pool_id_type> constant_product_gateway::get_pair( asset_id_type token_a, asset_id_type token_b )const
{
   const liquidity_pool_object* pool = _db.find_liquidity_pool( token_a, token_b );
   if( pool == nullptr )
      return optional<liquidity_pool_id_type>();
   return pool->id;
}

share_type constant_product_gateway::get_amount_out( share_type amount_in, share_type reserve_in, share_type reserve_out,
                                                     uint16_t taker_fee_percent )
{
   LEVY_ASSERT( amount_in > 0, exchange_insufficient_amount, "Input amount must be positive", ("in", amount_in) );
   LEVY_ASSERT( reserve_in > 0 && reserve_out > 0, exchange_insufficient_liquidity,
                "The pool has no liquidity", ("in", reserve_in)("out", reserve_out) );
   const share_type in_with_fee = amount_in * ( LEVY_POOL_FEE_DENOM - taker_fee_percent );
   const share_type numerator   = in_with_fee * reserve_out;
   const share_type denominator = reserve_in * LEVY_POOL_FEE_DENOM + in_with_fee;
   return numerator / denominator;
}

share_type constant_product_gateway::quote( share_type amount_a, share_type reserve_a, share_type reserve_b )
{
   FC_ASSERT( reserve_a > 0 && reserve_b > 0, "The pool has no liquidity" );
   const share_type result = amount_a * reserve_b / reserve_a;
   return result;
}

share_type constant_product_gateway::reserve_of( liquidity_pool_id_type pool_id, asset_id_type asset_type )const
{
   const liquidity_pool_object& pool = _db.get_liquidity_pool( pool_id );
   return asset_type == pool.asset_a ? pool.balance_a : pool.balance_b;
}

share_type constant_product_gateway::pull( account_id_type from, liquidity_pool_id_type pool_id, const asset& amount )
{
   const account_id_type pair_account = _db.get_liquidity_pool( pool_id ).pair_account;
   const share_type balance_before = _db.get_balance( pair_account, amount.asset_id ).amount;
   const share_type reserve_before = reserve_of( pool_id, amount.asset_id );

   _db.transfer_from( _account, from, pair_account, amount );

   // a transfer of a levy token may run a conversion through this very pool, whose deposits are
   // already accounted for in the reserves
   const share_type balance_after = _db.get_balance( pair_account, amount.asset_id ).amount;
   const share_type reserve_after = reserve_of( pool_id, amount.asset_id );
   FC_ASSERT( balance_after + reserve_before >= balance_before + reserve_after, "Internal error" );
   const share_type received = ( balance_after + reserve_before ) - ( balance_before + reserve_after );
   return received;
}

share_type constant_product_gateway::swap_exact_input_supporting_fee_on_transfer( account_id_type caller,
                                                                                  share_type amount_in,
                                                                                  share_type min_out,
                                                                                  const vector<asset_id_type>& path,
                                                                                  account_id_type recipient,
                                                                                  time_point_sec deadline )
{ try {
   LEVY_ASSERT( deadline >= _db.head_block_time(), exchange_deadline_expired,
                "Deadline ${d} has passed", ("d", deadline)("now", _db.head_block_time()) );
   LEVY_ASSERT( path.size() == 2 && path[0] != path[1], exchange_invalid_path,
                "A path needs two distinct assets", ("path", path) );
   const liquidity_pool_object* found = _db.find_liquidity_pool( path[0], path[1] );
   LEVY_ASSERT( found != nullptr, exchange_unknown_pair,
                "No pool for ${a}/${b}", ("a", path[0])("b", path[1]) );
   const liquidity_pool_id_type pool_id = found->id;
   const account_id_type pair_account = found->pair_account;
   LEVY_ASSERT( !found->is_empty(), exchange_insufficient_liquidity,
                "Pool ${p} has no liquidity", ("p", pool_id) );

   const share_type received = pull( caller, pool_id, asset( amount_in, path[0] ) );

   pool_lock lock( _locked_pools, pool_id );

   // the transfer in may have moved the reserves through a nested conversion
   const liquidity_pool_object& pool = _db.get_liquidity_pool( pool_id );
   const bool sell_a = ( path[0] == pool.asset_a );
   const share_type reserve_in  = sell_a ? pool.balance_a : pool.balance_b;
   const share_type reserve_out = sell_a ? pool.balance_b : pool.balance_a;

   const share_type amount_out = get_amount_out( received, reserve_in, reserve_out, pool.taker_fee_percent );
   LEVY_ASSERT( amount_out > 0, exchange_insufficient_output,
                "Swap of ${i} would receive nothing", ("i", received) );
   LEVY_ASSERT( amount_out >= min_out, exchange_insufficient_output,
                "Swap would receive ${o}, less than the minimum ${m}", ("o", amount_out)("m", min_out) );
   FC_ASSERT( amount_out < reserve_out, "Internal error" );

   _db.modify( pool, [sell_a,&received,&amount_out]( liquidity_pool_object& p ) {
      if( sell_a )
      {
         p.balance_a += received;
         p.balance_b -= amount_out;
      }
      else
      {
         p.balance_b += received;
         p.balance_a -= amount_out;
      }
   });

   _db.transfer( pair_account, recipient, asset( amount_out, path[1] ) );

   dlog( "Swapped ${i} of ${a} for ${o} of ${b} in pool ${p}",
         ("i", received)("a", path[0])("o", amount_out)("b", path[1])("p", pool_id) );
   return amount_out;
} FC_CAPTURE_AND_RETHROW( (caller)(amount_in)(min_out)(path)(recipient)(deadline) ) }

add_liquidity_result constant_product_gateway::add_liquidity( account_id_type caller,
                                                              asset_id_type token_a,
                                                              asset_id_type token_b,
                                                              share_type desired_a,
                                                              share_type desired_b,
                                                              share_type min_a,
                                                              share_type min_b,
                                                              account_id_type recipient,
                                                              time_point_sec deadline )
{ try {
   LEVY_ASSERT( deadline >= _db.head_block_time(), exchange_deadline_expired,
                "Deadline ${d} has passed", ("d", deadline)("now", _db.head_block_time()) );
   const liquidity_pool_object* found = _db.find_liquidity_pool( token_a, token_b );
   LEVY_ASSERT( found != nullptr, exchange_unknown_pair,
                "No pool for ${a}/${b}", ("a", token_a)("b", token_b) );
   const liquidity_pool_id_type pool_id = found->id;

   // reserves in the order of the arguments
   const bool a_first = ( token_a == found->asset_a );
   const share_type reserve_a = a_first ? found->balance_a : found->balance_b;
   const share_type reserve_b = a_first ? found->balance_b : found->balance_a;

   share_type amount_a;
   share_type amount_b;
   if( reserve_a == 0 && reserve_b == 0 )
   {
      amount_a = desired_a;
      amount_b = desired_b;
   }
   else
   {
      const share_type optimal_b = quote( desired_a, reserve_a, reserve_b );
      if( optimal_b <= desired_b )
      {
         LEVY_ASSERT( optimal_b >= min_b, exchange_insufficient_amount,
                      "Deposit of ${b} is less than the minimum ${m}", ("b", optimal_b)("m", min_b) );
         amount_a = desired_a;
         amount_b = optimal_b;
      }
      else
      {
         const share_type optimal_a = quote( desired_b, reserve_b, reserve_a );
         FC_ASSERT( optimal_a <= desired_a, "Internal error" );
         LEVY_ASSERT( optimal_a >= min_a, exchange_insufficient_amount,
                      "Deposit of ${a} is less than the minimum ${m}", ("a", optimal_a)("m", min_a) );
         amount_a = optimal_a;
         amount_b = desired_b;
      }
   }

   const share_type received_a = pull( caller, pool_id, asset( amount_a, token_a ) );
   const share_type received_b = pull( caller, pool_id, asset( amount_b, token_b ) );

   pool_lock lock( _locked_pools, pool_id );

   const liquidity_pool_object& pool = _db.get_liquidity_pool( pool_id );
   const share_type pool_a = a_first ? pool.balance_a : pool.balance_b;
   const share_type pool_b = a_first ? pool.balance_b : pool.balance_a;
   const share_type supply = _db.total_supply( pool.share_asset );

   share_type liquidity;
   if( supply == 0 )
      liquidity = std::max( received_a, received_b );
   else
   {
      const share_type by_a = received_a * supply / pool_a;
      const share_type by_b = received_b * supply / pool_b;
      liquidity = std::min( by_a, by_b );
   }
   LEVY_ASSERT( liquidity > 0, exchange_insufficient_liquidity,
                "Deposit would mint no liquidity", ("a", received_a)("b", received_b) );

   _db.modify( pool, [a_first,&received_a,&received_b]( liquidity_pool_object& p ) {
      p.balance_a += a_first ? received_a : received_b;
      p.balance_b += a_first ? received_b : received_a;
   });

   const asset minted( liquidity, pool.share_asset );
   _db.issue( recipient, minted );

   dlog( "Deposited ${a} and ${b} into pool ${p}, minted ${l}",
         ("a", received_a)("b", received_b)("p", pool_id)("l", minted) );

   add_liquidity_result result;
   result.amount_a = amount_a;
   result.amount_b = amount_b;
   result.liquidity = minted;
   return result;
} FC_CAPTURE_AND_RETHROW( (caller)(token_a)(token_b)(desired_a)(desired_b)(min_a)(min_b)(recipient)(deadline) ) }

} } // levy::chain
