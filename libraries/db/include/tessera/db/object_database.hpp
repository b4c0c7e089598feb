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
#include <tessera/db/index.hpp>
#include <tessera/db/undo_database.hpp>

#include <fc/log/logger.hpp>

#include <memory>
#include <vector>

namespace tessera { namespace db {

   /**
    *   @class object_database
    *   @brief owns one index per object type and routes every mutation through the undo_database
    *
    *   Indexes are addressed by the space and type ids of the objects they hold.
    *   Readers only ever see const references, changes go through create, modify,
    *   insert and remove so the open undo session can record them.
    */
   class object_database
   {
      public:
         object_database();
         virtual ~object_database();

         static constexpr uint8_t _index_size = 255;

         /// Drops every registered index
         void reset_indexes()
         {
            _index.clear();
            _index.resize( _index_size );
         }

         template<typename IndexType>
         IndexType* add_index()
         {
            using ObjectType = typename IndexType::object_type;
            const uint8_t space = ObjectType::space_id;
            const uint8_t type = ObjectType::type_id;
            FC_ASSERT( space < _index.size(), "Space ID ${s} overflow", ("s",space) );
            auto& types = _index[space];
            if( types.size() <= type )
               types.resize( _index_size );
            FC_ASSERT( !types[type], "Index ${s}.${t} already exists", ("s",space)("t",type) );
            types[type] = std::make_unique<IndexType>( *this );
            return static_cast<IndexType*>( types[type].get() );
         }

         template<typename IndexType>
         const IndexType& get_index_type()const
         {
            static_assert( std::is_base_of<index,IndexType>::value, "Type must be an index type" );
            using ObjectType = typename IndexType::object_type;
            return static_cast<const IndexType&>( get_index( ObjectType::space_id, ObjectType::type_id ) );
         }
         const index& get_index( uint8_t space_id, uint8_t type_id )const;

         const object& get_object( const object_id_type& id )const;
         const object* find_object( const object_id_type& id )const;

         template<typename T>
         const T& get( const object_id_type& id )const
         {
            const object& obj = get_object( id );
            assert( nullptr != dynamic_cast<const T*>(&obj) );
            return static_cast<const T&>( obj );
         }

         template<typename T, typename F>
         const T& create( F&& constructor )
         {
            auto& idx = get_mutable_index( T::space_id, T::type_id );
            return static_cast<const T&>( idx.create( [&constructor]( object& o ) {
               assert( dynamic_cast<T*>(&o) );
               constructor( static_cast<T&>(o) );
            } ) );
         }

         template<typename T, typename Lambda>
         void modify( const T& obj, const Lambda& m )
         {
            get_mutable_index( obj.id ).modify( obj, m );
         }

         const object& insert( object&& obj ) { return get_mutable_index( obj.id ).insert( std::move(obj) ); }
         void          remove( const object& obj ) { get_mutable_index( obj.id ).remove( obj ); }

         /** public so tests can open sessions directly */
         undo_database                          _undo_db;

      protected:
         index& get_mutable_index( const object_id_type& id ) { return get_mutable_index( id.space(), id.type() ); }
         index& get_mutable_index( uint8_t space_id, uint8_t type_id );

      private:
         friend class base_primary_index;
         friend class undo_database;

         std::vector< std::vector< std::unique_ptr<index> > >      _index;
   };

} } // tessera::db
