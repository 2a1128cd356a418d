
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

#ifndef __SEISNOISE_PARAM_H__
#define __SEISNOISE_PARAM_H__

#include <string>
#include <map>
#include <set>
#include <vector>

//
// Helper to parse key=value option syntax, from the command line or
// from a parameter file (one key=value per line, '#' comments)
//

struct param_t
{

 public:

  void add( const std::string & option , const std::string & value = "" );

  int size() const;

  void parse( const std::string & s );

  // read key=value lines; later lines may not repeat a key
  void read_file( const std::string & filename );

  // write key=value lines (sorted by key)
  void write_file( const std::string & filename ) const;

  bool has(const std::string & s ) const;

  bool empty(const std::string & s ) const;

  // a bare key counts as yes
  bool yesno(const std::string & s ) const;

  std::string value( const std::string & s , const bool uppercase = false ) const;

  std::string requires( const std::string & s , const bool uppercase = false ) const;

  int requires_int( const std::string & s ) const;

  double requires_dbl( const std::string & s ) const;

  // comma-delimited numbers, from key+= appends
  std::vector<double> dblvector( const std::string & k , const std::string delim = "," ) const;

  std::set<std::string> keys() const;

private:

  std::map<std::string,std::string> opt;

};


#endif
