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
#include <levy/chain/types.hpp>

namespace levy { namespace chain {

   /**
    * @brief an identity that can hold balances and grant allowances
    * @ingroup object
    *
    * Accounts are created for people, for the custody of a levy token and for the pair of every pool.
    */
   class account_object
   {
      public:
         static const uint8_t space_id = protocol_ids;
         static const uint8_t type_id  = account_object_type;

         account_id_type   id;
         string            name;
   };

   /**
    * @brief Tracks the balance of a single account/asset pair
    * @ingroup object
    *
    * Indexed on owner and asset_type, and by asset_type in descending balance order so that the
    * holders of an asset can be listed.
    */
   class account_balance_object
   {
      public:
         static const uint8_t space_id = implementation_ids;
         static const uint8_t type_id  = impl_account_balance_object_type;

         account_id_type   owner;
         asset_id_type     asset_type;
         share_type        balance;

         asset get_balance()const { return asset(balance, asset_type); }
   };

   /**
    * @brief The amount of asset_type that spender may still move out of owner's balance
    * @ingroup object
    */
   class allowance_object
   {
      public:
         static const uint8_t space_id = implementation_ids;
         static const uint8_t type_id  = impl_allowance_object_type;

         account_id_type   owner;
         account_id_type   spender;
         asset_id_type     asset_type;
         share_type        amount;

         /// An allowance at the maximum amount is never spent down
         bool is_unlimited()const { return amount == max_share_amount(); }
   };

   struct by_account_asset;
   struct by_asset_balance;

   /**
    * @ingroup object_index
    */
   typedef multi_index_container<
      account_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< account_object, account_id_type, &account_object::id > >,
         ordered_unique< tag<by_name>, member< account_object, string, &account_object::name > >
      >
   > account_index;

   /**
    * @ingroup object_index
    */
   typedef multi_index_container<
      account_balance_object,
      indexed_by<
         ordered_unique< tag<by_account_asset>,
            composite_key<
               account_balance_object,
               member<account_balance_object, account_id_type, &account_balance_object::owner>,
               member<account_balance_object, asset_id_type, &account_balance_object::asset_type>
            >
         >,
         ordered_unique< tag<by_asset_balance>,
            composite_key<
               account_balance_object,
               member<account_balance_object, asset_id_type, &account_balance_object::asset_type>,
               member<account_balance_object, share_type, &account_balance_object::balance>,
               member<account_balance_object, account_id_type, &account_balance_object::owner>
            >,
            composite_key_compare<
               std::less< asset_id_type >,
               std::greater< share_type >,
               std::less< account_id_type >
            >
         >
      >
   > account_balance_index;

   struct by_owner_spender;

   /**
    * @ingroup object_index
    */
   typedef multi_index_container<
      allowance_object,
      indexed_by<
         ordered_unique< tag<by_owner_spender>,
            composite_key<
               allowance_object,
               member<allowance_object, account_id_type, &allowance_object::owner>,
               member<allowance_object, account_id_type, &allowance_object::spender>,
               member<allowance_object, asset_id_type, &allowance_object::asset_type>
            >
         >
      >
   > allowance_index;

} }

FC_REFLECT( levy::chain::account_object, (id)(name) )
FC_REFLECT( levy::chain::account_balance_object, (owner)(asset_type)(balance) )
FC_REFLECT( levy::chain::allowance_object, (owner)(spender)(asset_type)(amount) )
