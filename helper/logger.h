
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

#ifndef __SEISNOISE_LOGGER_H__
#define	__SEISNOISE_LOGGER_H__

#include <iostream>
#include <sstream>
#include <ctime>
#include <string>
#include <fstream>
#include <mutex>

#include "defs/defs.h"

//
// Progress log: console (stderr) plus an optional copy in a file;
// globals::silent mutes both, globals::logger_function takes over
// completely when set
//

class logger_t
{

 public:

  explicit logger_t( const std::string & header , std::ostream & out = std::cerr )
    : header( header ) , out( out ) , to_file( false ) , nwarn( 0 ) { }

  ~logger_t() { close_log(); }

  // mirror everything that follows into 'filename'
  void write_log( const std::string & filename )
  {
    if ( globals::silent ) return;
    close_log();
    file.open( filename.c_str() );
    to_file = file.good();
  }

  void close_log()
  {
    if ( ! to_file ) return;
    file.close();
    to_file = false;
  }

  void banner( const std::string & version , const std::string & build )
  {
    if ( globals::silent ) return;
    std::stringstream ss;
    ss << rule( '=' ) << "\n"
       << header << " | " << version << ", " << build << " | starting " << now() << " +++\n"
       << rule( '=' ) << "\n";
    emit( ss.str() );
  }

  void finish()
  {
    if ( globals::silent ) return;
    std::stringstream ss;
    ss << rule( '-' ) << "\n"
       << header << " | finishing " << now();
    if ( nwarn ) ss << " | " << nwarn << " warning(s)";
    ss << " +++\n"
       << rule( '=' ) << "\n";
    emit( ss.str() );
    close_log();
  }

  void warning( const std::string & msg )
  {
    {
      std::lock_guard<std::mutex> guard( lock );
      ++nwarn;
    }
    const std::string line = " ** warning: " + msg + " **\n";
    if ( globals::logger_function )
      (*globals::logger_function)( line );
    else if ( ! globals::silent )
      emit( line );
  }

  template<typename T>
    logger_t & operator<<( const T & data )
    {
      if ( globals::logger_function )
	{
	  std::stringstream ss;
	  ss << data;
	  (*globals::logger_function)( ss.str() );
	}
      else if ( ! globals::silent )
	{
	  std::lock_guard<std::mutex> guard( lock );
	  out << data;
	  if ( to_file ) file << data;
	}

      return *this;
    }

 private:

  void emit( const std::string & s )
  {
    std::lock_guard<std::mutex> guard( lock );
    out << s << std::flush;
    if ( to_file ) file << s << std::flush;
  }

  static std::string rule( char c ) { return std::string( 67 , c ); }

  static std::string now()
  {
    time_t raw;
    time( &raw );
    char buf[50];
    strftime( buf , sizeof(buf) , "%d-%b-%Y %H:%M:%S" , localtime( &raw ) );
    return buf;
  }

  const std::string header;

  std::ostream & out;

  std::ofstream file;

  bool to_file;

  int nwarn;

  // batch callers may log from several workers
  std::mutex lock;

};

#endif
