
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

#ifndef __SEISNOISE_SQLWRAP_H__
#define __SEISNOISE_SQLWRAP_H__

#include <string>
#include <set>

#include "sqlite3.h"

//
// Thin wrapper around one SQLite connection; prepared statements are
// tracked and finalised on close(). Failures to open, prepare, step or
// commit go through Helper::halt()
//

class SQL {

 public:

  SQL() : db( NULL ) , rc( 0 ) { }

  ~SQL() { close(); }

  SQL( const SQL & ) = delete;
  SQL & operator=( const SQL & ) = delete;

  // creates the file unless readonly
  void open( const std::string & filename , bool readonly = false );

  void close();

  // PRAGMA synchronous FULL or OFF
  void synchronous( bool b );

  // false (and a warning) on error
  bool query( const std::string & q );

  bool table_exists( const std::string & table );

  sqlite3_stmt * prepare( const std::string & q );

  // true while rows remain
  bool step( sqlite3_stmt * stmt );

  void reset( sqlite3_stmt * stmt );

  void finalise( sqlite3_stmt * stmt );

  void begin();
  void commit();
  void rollback();

  // named parameters, e.g. ":idx"
  void bind_int( sqlite3_stmt * stmt , const std::string & name , int value );
  void bind_double( sqlite3_stmt * stmt , const std::string & name , double value );
  void bind_text( sqlite3_stmt * stmt , const std::string & name , const std::string & value );
  void bind_null( sqlite3_stmt * stmt , const std::string & name );

  // NULL for NaN/Inf
  void bind_real( sqlite3_stmt * stmt , const std::string & name , double value );

  int get_int( sqlite3_stmt * stmt , int col );
  double get_double( sqlite3_stmt * stmt , int col );
  std::string get_text( sqlite3_stmt * stmt , int col );
  bool is_null( sqlite3_stmt * stmt , int col );

  // NaN for NULL
  double get_real( sqlite3_stmt * stmt , int col );

  static std::string library_version() { return SQLITE_VERSION; }

 private:

  int index( sqlite3_stmt * stmt , const std::string & name );

  std::set<sqlite3_stmt*> statements;

  sqlite3 * db;

  int rc;

  std::string name;

};

#endif
