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
#include <tessera/db/object.hpp>
#include <fc/log/logger.hpp>

#include <memory>
#include <unordered_map>
#include <unordered_set>

namespace tessera { namespace db {

   using std::unordered_map;
   class object_database;

   /**
    *  Everything needed to put the objects touched by one session back the way
    *  they were when the session started.
    */
   struct undo_state
   {
      unordered_map<object_id_type, unique_ptr<object> > old_values;
      unordered_map<object_id_type, object_id_type>      old_index_next_ids;
      std::unordered_set<object_id_type>                 new_ids;
      unordered_map<object_id_type, unique_ptr<object> > removed;
   };

   /**
    * @class undo_database
    * @brief records the changes made while a session is open so they can be reverted
    *
    * At most one session is open at a time.  Committing a session discards what
    * it recorded, letting it go out of scope without commit() restores every
    * object it touched.  Changes made while no session is open are not recorded.
    */
   class undo_database
   {
      public:
         undo_database( object_database& db ):_db(db){}

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
                     throw; // an undo which cannot complete leaves the state unusable
                  }
               }
               void commit() { if( _apply_undo ) _db.commit(); _apply_undo = false; }
               void undo()   { if( _apply_undo ) _db.undo();   _apply_undo = false; }

               session& operator = ( session&& mv ) = delete;

            private:
               friend class undo_database;
               session( undo_database& db, bool apply_undo ): _db(db),_apply_undo(apply_undo) {}
               undo_database& _db;
               bool _apply_undo = true;
         };

         void    disable();
         void    enable();
         bool    enabled()const { return !_disabled; }

         /// Returns an inert session while recording is disabled
         session start_undo_session();
         bool    session_active()const { return _state != nullptr; }

         /// Called just after obj was added to its index
         void on_create( const object& obj );
         /**
          * Called just before obj is modified.  Objects created in the open session
          * are not copied, undoing the session removes them anyway.
          */
         void on_modify( const object& obj );
         /**
          * Called just before obj is removed.  Removing an object created in the open
          * session cancels its creation.
          */
         void on_remove( const object& obj );

      private:
         void undo();
         void commit();
         void revert( undo_state& state );

         bool                         _disabled = true;
         std::unique_ptr<undo_state>  _state;
         object_database&             _db;
   };

} } // tessera::db
