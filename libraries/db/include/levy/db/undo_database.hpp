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

#include <fc/exception/exception.hpp>
#include <fc/log/logger.hpp>

#include <deque>
#include <functional>
#include <vector>

namespace levy { namespace db {

   /**
    * @class undo_database
    * @brief tracks changes to the state and allows changes to be undone
    *
    * The owner of the state reports every change through @ref on_create, @ref on_modify,
    * @ref on_remove or @ref on_change while a session is active. Each session keeps the old values of
    * what changed under it, so starting a session costs nothing regardless of the size of the state.
    * Sessions nest: undoing an inner session reverts its own changes, merging it hands them to the
    * enclosing session to keep or undo. Changes made while no session is active are permanent.
    */
   class undo_database
   {
      public:
         class session
         {
            public:
               session( session&& mv )
               :_db(mv._db),_apply_undo(mv._apply_undo)
               {
                  mv._apply_undo = false;
               }
               ~session() {
                  try {
                     if( _apply_undo ) _db.undo();
                  }
                  catch ( const fc::exception& e )
                  {
                     elog( "${e}", ("e",e.to_detail_string() ) );
                     throw; // maybe crash..
                  }
               }
               void undo()   { if( _apply_undo ) _db.undo(); _apply_undo = false; }
               void merge()  { if( _apply_undo ) _db.merge(); _apply_undo = false; }

               session& operator = ( session&& mv ) = delete;
               session( const session& ) = delete;

            private:
               friend class undo_database;
               explicit session( undo_database& db ): _db(db) {}
               undo_database& _db;
               bool _apply_undo = true;
         };

         session start_undo_session()
         {
            _stack.emplace_back();
            return session( *this );
         }

         /**
          * This should be called just after @p obj was inserted into @p idx.
          *
          * Undoing erases the object again, looking it up with the first index of @p idx.
          */
         template<typename Index>
         void on_create( Index& idx, const typename Index::value_type& obj )
         {
            on_change( [&idx, obj]() {
               auto itr = idx.find( idx.key_extractor()( obj ) );
               FC_ASSERT( itr != idx.end(), "Created object is gone" );
               idx.erase( itr );
            });
         }

         /**
          * This should be called just before @p obj is modified in place. The modification must not
          * change the key of the first index of @p idx.
          */
         template<typename Index>
         void on_modify( Index& idx, const typename Index::value_type& obj )
         {
            on_change( [&idx, obj]() {
               auto itr = idx.find( idx.key_extractor()( obj ) );
               // a modifier that throws erases the object
               if( itr == idx.end() )
                  FC_ASSERT( idx.insert( obj ).second, "Unable to restore modified object" );
               else
                  FC_ASSERT( idx.replace( itr, obj ), "Unable to restore modified object" );
            });
         }

         /// This should be called just before @p obj is erased from @p idx
         template<typename Index>
         void on_remove( Index& idx, const typename Index::value_type& obj )
         {
            on_change( [&idx, obj]() {
               FC_ASSERT( idx.insert( obj ).second, "Unable to restore removed object" );
            });
         }

         /// Records how to revert a change of anything that is not an indexed object
         void on_change( std::function<void()> revert )
         {
            if( _stack.empty() )
               return;
            _stack.back().push_back( std::move(revert) );
         }

         std::size_t size()const { return _stack.size(); }

      private:
         typedef std::vector< std::function<void()> > undo_state;

         void undo()
         { try {
            FC_ASSERT( !_stack.empty(), "No undo session to revert" );
            undo_state& state = _stack.back();
            for( auto ritr = state.rbegin(); ritr != state.rend(); ++ritr )
               (*ritr)();
            _stack.pop_back();
         } FC_CAPTURE_AND_RETHROW() }

         void merge()
         { try {
            FC_ASSERT( !_stack.empty(), "No undo session to merge" );
            if( _stack.size() >= 2 )
            {
               undo_state& state = _stack.back();
               undo_state& prev_state = _stack[_stack.size()-2];
               prev_state.reserve( prev_state.size() + state.size() );
               for( auto& revert : state )
                  prev_state.push_back( std::move(revert) );
            }
            _stack.pop_back();
         } FC_CAPTURE_AND_RETHROW() }

         std::deque<undo_state>  _stack;
   };

} } // levy::db
