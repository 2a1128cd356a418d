
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

#ifndef __SEISNOISE_HELPER_H__
#define __SEISNOISE_HELPER_H__

#include <iostream>
#include <string>
#include <sstream>
#include <vector>
#include <set>
#include <algorithm>
#include <cctype>
#include <stdint.h>
#include <stdexcept>
#include <cmath>


//
// Error taxonomy: everything thrown by the library derives from
// seisnoise_error_t, so a batch caller can catch per item and carry on
//

struct seisnoise_error_t : public std::runtime_error
{
  explicit seisnoise_error_t( const std::string & msg ) : std::runtime_error( msg ) { }
};

// empty, malformed or non-finite waveform data
struct invalid_input_t : public seisnoise_error_t
{
  explicit invalid_input_t( const std::string & msg ) : seisnoise_error_t( msg ) { }
};

// bad parameter values (instrument type, filter kind, window, ranges)
struct invalid_config_t : public seisnoise_error_t
{
  explicit invalid_config_t( const std::string & msg ) : seisnoise_error_t( msg ) { }
};

// bundled resources (noise models) missing or malformed
struct resource_error_t : public seisnoise_error_t
{
  explicit resource_error_t( const std::string & msg ) : seisnoise_error_t( msg ) { }
};


namespace Helper
{

  std::string toupper( const std::string & );

  // trim from start
  static inline std::string ltrim( std::string s ) {
    s.erase(s.begin(), std::find_if( s.begin(), s.end(),  [](unsigned char c) {return !std::isspace(c);} ));
    return s;
  }

  // trim from end
  static inline std::string rtrim(std::string s) {
    s.erase(std::find_if( s.rbegin(), s.rend(),  [](unsigned char c) {return !std::isspace(c);} ).base(), s.end() );
    return s;
  }

  // trim from both ends
  static inline std::string lrtrim( std::string s ) {
    return ltrim(rtrim(s));
  }

  static inline std::string unquote(const std::string &s , const char q2 = '"' ) {
    if ( s.size() == 0 ) return s;
    int a = ( s[0] == '"' || s[0] == q2 ) ? 1 : 0;
    int b = ( s[s.size()-1] == '"' || s[s.size()-1] == q2 ) ? 1 : 0 ;
    if ( a + b > (int)s.size() ) return "";
    return s.substr(a,s.size()-a-b);
  }

  std::string remove_all_quotes(const std::string &s , const char q2 = '"' );

  bool yesno( const std::string & );

  bool fileExists(const std::string &);

  bool is_folder( const std::string & f );

  std::istream& safe_getline(std::istream& is, std::string& t);

  // raise a seisnoise_error_t (after any registered bail function)
  void halt( const std::string & msg );

  void warn( const std::string & msg );

  bool similar( double a, double b , double EPS = 1e-6 );

  std::string int2str(int n);
  std::string int2str(long n);
  std::string dbl2str(double n);

  bool str2dbl(const std::string & , double * );
  bool str2int(const std::string & , int * );

  std::vector<std::string> parse(const std::string & item, const std::string & s = " \t\n" , bool empty = false );

  std::vector<std::string> quoted_parse(const std::string & item , const std::string & s , const char q = '"' , const char q2 = '\'' , bool empty = false );

}



//
// Calendar date/time to the second; used to tag segments and artifacts
// and to select them by time window
//

struct datetime_t
{

  datetime_t() : y(1970) , m(1) , d(1) , h(0) , mi(0) , s(0) { }

  datetime_t( int y , int m , int d , int h = 0 , int mi = 0 , int s = 0 )
    : y(y) , m(m) , d(d) , h(h) , mi(mi) , s(s)
  {
    if ( ! valid() )
      Helper::halt( "invalid date/time: " + as_string() );
  }

  // YYYYmmddHHMMSS, YYYY-mm-dd, YYYY-mm-dd HH:MM:SS or YYYY-mm-ddTHH:MM:SS
  explicit datetime_t( const std::string & t );

  static bool parse( const std::string & t , datetime_t * dt );

  // seconds past 1/1/1970 00:00:00
  static datetime_t from_seconds( int64_t secs );

  int64_t seconds() const;

  // days past 1/1/1970
  static int count( int y , int m , int d );

  static bool leap_year( const int year )
  {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0 ;
  }

  static int days_in_month( int mn, int yr )
  {
    static int mlength[] =      { 0, 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 };
    static int leap_mlength[] = { 0, 31, 29, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 };
    return leap_year( yr ) ? leap_mlength[mn] : mlength[mn];
  }

  bool valid() const;

  // start of the n-hour block (within the day) holding this time
  datetime_t floor_hours( int n ) const;

  // YYYY-mm-dd HH:MM:SS
  std::string as_string() const;

  // YYYYmmddHHMMSS
  std::string as_compact_string() const;

  bool operator<( const datetime_t & rhs ) const { return seconds() < rhs.seconds(); }
  bool operator<=( const datetime_t & rhs ) const { return seconds() <= rhs.seconds(); }
  bool operator==( const datetime_t & rhs ) const { return seconds() == rhs.seconds(); }
  bool operator!=( const datetime_t & rhs ) const { return seconds() != rhs.seconds(); }

  int y;
  int m;
  int d;
  int h;
  int mi;
  int s;

};


#endif
