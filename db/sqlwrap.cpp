
//    --------------------------------------------------------------------
//
//    This file is part of seisnoise.
//
//    seisnoise is free software: you can redistribute it and/or modify
//    it under the terms of the GNU General Public License as published by
//    the Free Software Foundation, either version 3 of the License, or
//    (at your option) any later version.
//
//    seisnoise is distributed in the hope that it will be useful,
//    but WITHOUT ANY WARRANTY; without even the implied warranty of
//    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//    GNU General Public License for more details.
//
//    You should have received a copy of the GNU General Public License
//    along with seisnoise. If not, see <http://www.gnu.org/licenses/>.
//
//    Please see LICENSE.txt for more details.
//
//    --------------------------------------------------------------------

#include "db/sqlwrap.h"
#include "helper/helper.h"
#include "defs/defs.h"

#include <cmath>
#include <limits>

void SQL::open( const std::string & filename , bool readonly )
{

  close();

  name = filename;

  const int flags = readonly
    ? SQLITE_OPEN_READONLY
    : SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE ;

  rc = sqlite3_open_v2( name.c_str() , &db , flags , NULL );

  if ( rc )
    {
      std::string msg = db ? sqlite3_errmsg( db ) : "out of memory";
      // a handle is returned even on failure
      if ( db ) { sqlite3_close( db ); db = NULL; }
      Helper::halt( "problem opening database " + name + ": " + msg );
    }
}

void SQL::synchronous(bool b)
{
  if ( !b )
    query( "PRAGMA synchronous=0;" ); // OFF
  else
    query( "PRAGMA synchronous=2;" ); // FULL
}

bool SQL::table_exists( const std::string & table_name )
{
  sqlite3_stmt * s = prepare( "SELECT name FROM sqlite_master WHERE type='table' AND name= :table_name ; " );
  bind_text( s , ":table_name" , table_name );
  const bool found = step(s);
  finalise(s);
  return found;
}

void SQL::close()
{
  if ( db )
    {
      std::set<sqlite3_stmt*>::iterator i = statements.begin();
      while ( i != statements.end() )
	{
	  sqlite3_finalize( *i );
	  ++i;
	}
      statements.clear();
      sqlite3_close(db);
      db = NULL;
    }
}

bool SQL::query( const std::string & q )
{
  char * db_err = NULL;
  rc = sqlite3_exec( db , q.c_str() , 0 , 0 , &db_err );
  if ( rc )
    {
      std::string msg = db_err ? db_err : "unknown error";
      sqlite3_free( db_err );
      Helper::warn( "database (" + name + ") " + msg );
    }
  return rc == 0;
}

sqlite3_stmt * SQL::prepare( const std::string & q )
{
  sqlite3_stmt * p = NULL;
  rc = sqlite3_prepare_v2( db , q.c_str() , q.size() , &p , NULL );
  if ( rc ) Helper::halt( "database (" + name + ") preparing query: " + std::string( sqlite3_errmsg(db) ) );
  statements.insert(p);
  return p;
}

void SQL::begin()
{
  if ( ! query( "BEGIN;" ) )
    Helper::halt( "database (" + name + ") could not begin transaction" );
}

void SQL::commit()
{
  if ( ! query( "COMMIT;" ) )
    Helper::halt( "database (" + name + ") could not commit transaction" );
}

void SQL::rollback()
{
  query( "ROLLBACK;" );
}

void SQL::finalise(sqlite3_stmt * stmt)
{
  std::set<sqlite3_stmt*>::iterator i = statements.find( stmt );
  if ( stmt && i != statements.end() )
    {
      statements.erase( i );
      sqlite3_finalize( stmt );
    }
}

bool SQL::step(sqlite3_stmt * stmt)
{

  rc = sqlite3_step( stmt );

  if ( rc != SQLITE_ROW && rc != SQLITE_DONE )
    {
      reset(stmt);
      Helper::halt( "database (" + name +") error (" + Helper::int2str( sqlite3_errcode(db) ) +") " + sqlite3_errmsg(db) );
    }

  return rc == SQLITE_ROW;
}

void SQL::reset( sqlite3_stmt * stmt )
{
  sqlite3_reset( stmt );
}

int SQL::index( sqlite3_stmt * stmt , const std::string & n )
{
  const int i = sqlite3_bind_parameter_index( stmt , n.c_str() );
  if ( i == 0 ) Helper::halt( "database (" + name + ") no parameter " + n );
  return i;
}

void SQL::bind_int( sqlite3_stmt * stmt , const std::string & n , int value )
{
  sqlite3_bind_int( stmt , index( stmt , n ) , value );
}

void SQL::bind_null( sqlite3_stmt * stmt , const std::string & n )
{
  sqlite3_bind_null( stmt , index( stmt , n ) );
}

void SQL::bind_double( sqlite3_stmt * stmt , const std::string & n , double value )
{
  sqlite3_bind_double( stmt , index( stmt , n ) , value );
}

void SQL::bind_real( sqlite3_stmt * stmt , const std::string & n , double value )
{
  if ( std::isfinite( value ) ) bind_double( stmt , n , value );
  else bind_null( stmt , n );
}

void SQL::bind_text( sqlite3_stmt * stmt , const std::string & n , const std::string & value )
{
  sqlite3_bind_text( stmt , index( stmt , n ) , value.c_str() , value.size() , SQLITE_TRANSIENT );
}

int SQL::get_int( sqlite3_stmt * stmt , int col )
{
  return sqlite3_column_int( stmt , col );
}

double SQL::get_double( sqlite3_stmt * stmt , int col )
{
  return sqlite3_column_double( stmt , col );
}

double SQL::get_real( sqlite3_stmt * stmt , int col )
{
  return is_null( stmt , col ) ? std::numeric_limits<double>::quiet_NaN() : get_double( stmt , col );
}

bool SQL::is_null( sqlite3_stmt * stmt , int col )
{
  return sqlite3_column_type( stmt , col ) == SQLITE_NULL;
}

std::string SQL::get_text( sqlite3_stmt * stmt , int col )
{
  const unsigned char * s = sqlite3_column_text( stmt , col );
  return s == NULL ? "" : (const char*)s;
}
