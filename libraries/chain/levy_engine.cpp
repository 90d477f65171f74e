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
#include <levy/chain/levy_engine.hpp>
#include <levy/chain/database.hpp>
#include <levy/chain/exemption_registry.hpp>
#include <levy/chain/liquidity_converter.hpp>
#include <levy/chain/token_ledger.hpp>

namespace levy { namespace chain {

/**
 * Held for the duration of a conversion. Released on every exit path, including a failed conversion.
 */
class levy_engine::swap_guard
{
   public:
      explicit swap_guard( bool& swapping )
      :_swapping(swapping)
      {
         FC_ASSERT( !_swapping, "A conversion is already in progress" );
         _swapping = true;
      }
      ~swap_guard() { _swapping = false; }

      swap_guard( const swap_guard& ) = delete;
      swap_guard& operator=( const swap_guard& ) = delete;

   private:
      bool& _swapping;
};

levy_engine::levy_engine( database& db, token_ledger& ledger, const exemption_registry& exemptions,
                          liquidity_converter& converter, account_id_type custody,
                          uint16_t tax_percent, time_point_sec tax_end_time )
   : _db( db ), _ledger( ledger ), _exemptions( exemptions ), _converter( converter ), _custody( custody ),
     _tax_percent( tax_percent ), _tax_end_time( tax_end_time )
{
   FC_ASSERT( tax_percent <= LEVY_100_PERCENT, "Tax can not exceed 100%" );
}

share_type levy_engine::compute_tax( share_type amount )const
{
   const share_type tax = amount * _tax_percent / LEVY_100_PERCENT;
   return tax;
}

void levy_engine::intercept( account_id_type from, account_id_type to, share_type amount, time_point_sec now )
{ try {
   if( now > _tax_end_time )
   {
      _ledger.move_value( from, to, amount );
      return;
   }

   if( _exemptions.is_exempt( from ) || _exemptions.is_exempt( to ) || _swapping )
   {
      _ledger.move_value( from, to, amount );
      return;
   }

   const share_type tax = compute_tax( amount );
   const share_type net = amount - tax;

   _ledger.move_value( from, to, net );

   if( tax > 0 )
   {
      _ledger.move_value( from, _custody, tax );
      _db.push_applied_operation( tax_collected_operation( from, _ledger.amount( tax ) ) );
      dlog( "Collected levy of ${t} from ${f}", ("t", tax)("f", from) );

      swap_guard guard( _swapping );
      _converter.convert( tax );
   }
} FC_CAPTURE_AND_RETHROW( (from)(to)(amount)(now) ) }

} } // levy::chain
