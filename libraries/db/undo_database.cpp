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
#include <tessera/db/object_database.hpp>
#include <tessera/db/undo_database.hpp>

namespace tessera { namespace db {

void undo_database::enable()  { _disabled = false; }
void undo_database::disable() { _disabled = true; }

undo_database::session undo_database::start_undo_session()
{
   if( _disabled ) return session( *this, false );

   FC_ASSERT( !_state, "An undo session is already open" );
   _state.reset( new undo_state );
   return session( *this, true );
}

void undo_database::on_create( const object& obj )
{
   if( _disabled || !_state ) return;

   // the first id handed out by an index in this session is where its counter goes back to
   const object_id_type index_id( obj.id.space(), obj.id.type(), 0 );
   _state->old_index_next_ids.emplace( index_id, obj.id );
   _state->new_ids.insert( obj.id );
}

void undo_database::on_modify( const object& obj )
{
   if( _disabled || !_state ) return;

   if( _state->new_ids.count( obj.id ) || _state->old_values.count( obj.id ) )
      return;
   _state->old_values[obj.id] = obj.clone();
}

void undo_database::on_remove( const object& obj )
{
   if( _disabled || !_state ) return;

   undo_state& state = *_state;
   if( state.new_ids.erase( obj.id ) )
      return;

   auto prior = state.old_values.find( obj.id );
   if( prior != state.old_values.end() )
   {
      state.removed[obj.id] = std::move( prior->second );
      state.old_values.erase( prior );
   }
   else if( !state.removed.count( obj.id ) )
      state.removed[obj.id] = obj.clone();
}

void undo_database::revert( undo_state& state )
{
   for( auto& item : state.old_values )
      _db.modify( _db.get_object( item.first ), [&item]( object& obj ){ obj.move_from( *item.second ); } );

   for( const auto& id : state.new_ids )
      _db.remove( _db.get_object( id ) );

   for( const auto& item : state.old_index_next_ids )
      _db.get_mutable_index( item.first.space(), item.first.type() ).set_next_id( item.second );

   for( auto& item : state.removed )
      _db.insert( std::move( *item.second ) );
}

void undo_database::undo()
{ try {
   FC_ASSERT( !_disabled );
   FC_ASSERT( _state, "No undo session is open" );

   std::unique_ptr<undo_state> state = std::move( _state );
   disable();
   revert( *state );
   enable();
} FC_CAPTURE_AND_RETHROW() }

void undo_database::commit()
{
   FC_ASSERT( _state, "No undo session is open" );
   _state.reset();
}

} } // tessera::db
