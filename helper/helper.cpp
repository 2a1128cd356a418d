
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

#include "helper/helper.h"
#include "helper/logger.h"
#include "defs/defs.h"

#include <fstream>
#include <iomanip>
#include <sstream>
#include <cstdio>
#include <sys/stat.h>

extern logger_t logger;


std::string Helper::toupper( const std::string & s )
{
  std::string j = s;
  for (int i=0;i<(int)j.size();i++) j[i] = std::toupper( (unsigned char)j[i] );
  return j;
}

std::string Helper::remove_all_quotes( const std::string & s , const char q2 )
{
  std::string r;
  for (int i=0;i<(int)s.size();i++)
    if ( s[i] != '"' && s[i] != q2 ) r += s[i];
  return r;
}

bool Helper::yesno( const std::string & s )
{
  // 0 no NO n N F f false FALSE
  // versus all else  (including empty, i.e. 'var'  --> 'var=T'
  if ( s.size() == 0 ) return false; // empty == NO
  if ( s[0] == '0' || s[0] == 'n' || s[0] == 'N' || s[0] == 'f' || s[0] == 'F' ) return false;
  return true;
}


void Helper::halt( const std::string & msg )
{

  // some other code handles the failure first, e.g. to log it?
  if ( globals::bail_function != NULL )
    globals::bail_function( msg );

  throw seisnoise_error_t( msg );
}

void Helper::warn( const std::string & msg )
{
  logger.warning( msg );
}

bool Helper::similar( double a, double b , double EPS )
{
  return fabs( a - b ) < EPS ;
}

std::string Helper::int2str(int n)
{
  std::ostringstream s2( std::stringstream::out );
  s2 << n;
  return s2.str();
}

std::string Helper::int2str(long n)
{
  std::ostringstream s2( std::stringstream::out );
  s2 << n;
  return s2.str();
}

std::string Helper::dbl2str(double n)
{
  std::ostringstream s2( std::stringstream::out );
  s2 << n;
  return s2.str();
}

bool Helper::str2dbl(const std::string & s , double * d)
{
  // require the whole token to be consumed, e.g. reject '1.2x'
  std::istringstream iss( s );
  double t;
  if ( ( iss >> std::dec >> t ).fail() ) return false;
  std::string rest;
  if ( iss >> rest ) return false;
  *d = t;
  return true;
}

bool Helper::str2int(const std::string & s , int * i)
{
  std::istringstream iss( s );
  int t;
  if ( ( iss >> std::dec >> t ).fail() ) return false;
  std::string rest;
  if ( iss >> rest ) return false;
  *i = t;
  return true;
}


std::vector<std::string> Helper::parse(const std::string & item, const std::string & s , bool empty )
{

  std::vector<std::string> strs;
  if ( item.size() == 0 ) return strs;

  int p = 0;
  const int n = item.size();
  for (int j=0; j<n; j++)
    {
      if ( s.find( item[j] ) != std::string::npos )
	{
	  if ( j == p ) // empty slot?
	    {
	      if ( empty ) strs.push_back( "." );
	      ++p;
	    }
	  else
	    {
	      strs.push_back( item.substr(p,j-p) );
	      p=j+1;
	    }
	}
    }

  if ( empty && p == n )
    strs.push_back( "." );
  else if ( p < n )
    strs.push_back( item.substr(p) );

  return strs;
}


std::vector<std::string> Helper::quoted_parse(const std::string & item , const std::string & s , const char q , const char q2, bool empty )
{

  // as parse(), but delimiters within "..." or '...' do not split

  std::vector<std::string> strs;
  if ( item.size() == 0 ) return strs;

  bool in_quote = false;
  char open = q;
  std::string cur;
  bool pending = false;

  for (int j=0; j<(int)item.size(); j++)
    {
      const char c = item[j];

      if ( in_quote )
	{
	  if ( c == open ) in_quote = false;
	  cur += c;
	  continue;
	}

      if ( c == q || c == q2 )
	{
	  in_quote = true;
	  open = c;
	  cur += c;
	  pending = true;
	  continue;
	}

      if ( s.find( c ) != std::string::npos )
	{
	  if ( cur.size() > 0 ) strs.push_back( cur );
	  else if ( empty ) strs.push_back( "." );
	  cur = "";
	  pending = false;
	  continue;
	}

      cur += c;
      pending = true;
    }

  if ( pending || cur.size() > 0 ) strs.push_back( cur );

  return strs;
}


bool Helper::fileExists( const std::string & f )
{

  FILE *file;

  if ( ( file = fopen( f.c_str() , "r" ) ) )
    {
      fclose(file);
      return true;
    }

  return false;

}

bool Helper::is_folder( const std::string & f )
{
  struct stat sb;
  if ( stat( f.c_str() , &sb ) != 0 ) return false;
  return S_ISDIR( sb.st_mode );
}


std::istream& Helper::safe_getline(std::istream& is, std::string& t)
{
  t.clear();

  // The characters in the stream are read one-by-one using a std::streambuf.
  // That is faster than reading them one-by-one using the std::istream.
  // Code that uses streambuf this way must be guarded by a sentry object.

  std::istream::sentry se(is, true);
  std::streambuf* sb = is.rdbuf();

  for ( ; ; )
    {

      int c = sb->sbumpc();

      switch (c)
	{
	case '\n':
	  return is;

	case '\r':
	  if (sb->sgetc() == '\n')
	    sb->sbumpc();
	  return is;

	case EOF :
	  // Also handle the case when the last line has no line ending
	  if (t.empty())
	    is.setstate(std::ios::eofbit);
	  return is;

	default:
	  t += (char)c;
	}
    }
}



//
// datetime_t
//

datetime_t::datetime_t( const std::string & t )
{
  if ( ! parse( t , this ) )
    Helper::halt( "invalid date/time string: " + t );
}

bool datetime_t::parse( const std::string & t0 , datetime_t * dt )
{

  const std::string t = Helper::lrtrim( t0 );

  int y1 = 0 , m1 = 0 , d1 = 0 , h1 = 0 , mi1 = 0 , s1 = 0;

  // compact form: YYYYmmdd[HHMMSS]
  bool digits = t.size() > 0;
  for (int i=0;i<(int)t.size();i++)
    if ( ! std::isdigit( (unsigned char)t[i] ) ) { digits = false; break; }

  if ( digits )
    {
      if ( t.size() != 8 && t.size() != 14 ) return false;
      if ( ! Helper::str2int( t.substr(0,4) , &y1 ) ) return false;
      if ( ! Helper::str2int( t.substr(4,2) , &m1 ) ) return false;
      if ( ! Helper::str2int( t.substr(6,2) , &d1 ) ) return false;
      if ( t.size() == 14 )
	{
	  if ( ! Helper::str2int( t.substr(8,2) , &h1 ) ) return false;
	  if ( ! Helper::str2int( t.substr(10,2) , &mi1 ) ) return false;
	  if ( ! Helper::str2int( t.substr(12,2) , &s1 ) ) return false;
	}
    }
  else
    {
      // YYYY-mm-dd[ HH:MM:SS] (also 'T' separated)
      std::vector<std::string> tok = Helper::parse( t , " T" );
      if ( tok.size() < 1 || tok.size() > 2 ) return false;
      std::vector<std::string> dtok = Helper::parse( tok[0] , "-/." );
      if ( dtok.size() != 3 ) return false;
      if ( ! Helper::str2int( dtok[0] , &y1 ) ) return false;
      if ( ! Helper::str2int( dtok[1] , &m1 ) ) return false;
      if ( ! Helper::str2int( dtok[2] , &d1 ) ) return false;
      if ( tok.size() == 2 )
	{
	  std::vector<std::string> ttok = Helper::parse( tok[1] , ":" );
	  if ( ttok.size() < 2 || ttok.size() > 3 ) return false;
	  if ( ! Helper::str2int( ttok[0] , &h1 ) ) return false;
	  if ( ! Helper::str2int( ttok[1] , &mi1 ) ) return false;
	  if ( ttok.size() == 3 && ! Helper::str2int( ttok[2] , &s1 ) ) return false;
	}
    }

  datetime_t r;
  r.y = y1; r.m = m1; r.d = d1;
  r.h = h1; r.mi = mi1; r.s = s1;
  if ( ! r.valid() ) return false;

  *dt = r;
  return true;
}

bool datetime_t::valid() const
{
  if ( y < 1970 || y > 2999 ) return false;
  if ( m < 1 || m > 12 ) return false;
  if ( d < 1 || d > days_in_month( m , y ) ) return false;
  if ( h < 0 || h > 23 ) return false;
  if ( mi < 0 || mi > 59 ) return false;
  if ( s < 0 || s > 59 ) return false;
  return true;
}

int datetime_t::count( int y , int m , int d )
{

  int days = 0;

  // count up until the final year
  for ( int y1 = 1970 ; y1 < y ; y1++ )
    days += leap_year( y1 ) ? 366 : 365 ;

  // count up until the final month
  for ( int m1 = 1 ; m1 < m ; m1++ )
    days += days_in_month( m1 , y );

  // count final days in last month
  days += d;

  // is 0-based count, so -1
  // i.e. 1/1/70 == 0 not 1
  return days - 1 ;

}

int64_t datetime_t::seconds() const
{
  return (int64_t)count( y , m , d ) * 86400 + h * 3600 + mi * 60 + s;
}

datetime_t datetime_t::from_seconds( int64_t secs )
{
  if ( secs < 0 ) Helper::halt( "negative time not supported" );

  int64_t days = secs / 86400;
  int64_t rem  = secs % 86400;

  datetime_t r;
  r.y = 1970;
  while ( 1 )
    {
      const int ny = leap_year( r.y ) ? 366 : 365;
      if ( days < ny ) break;
      days -= ny;
      ++r.y;
    }

  r.m = 1;
  while ( days >= days_in_month( r.m , r.y ) )
    {
      days -= days_in_month( r.m , r.y );
      ++r.m;
    }

  r.d  = days + 1;
  r.h  = rem / 3600;
  r.mi = ( rem % 3600 ) / 60;
  r.s  = rem % 60;

  if ( ! r.valid() ) Helper::halt( "time out of range: " + Helper::int2str( (long)secs ) );
  return r;
}

datetime_t datetime_t::floor_hours( int n ) const
{
  if ( n < 1 ) Helper::halt( "floor_hours() requires a positive block length" );
  datetime_t r = *this;
  r.h  = h - ( h % n );
  r.mi = 0;
  r.s  = 0;
  return r;
}

std::string datetime_t::as_string() const
{
  std::stringstream ss;
  ss << std::setfill('0')
     << std::setw(4) << y << "-" << std::setw(2) << m << "-" << std::setw(2) << d << " "
     << std::setw(2) << h << ":" << std::setw(2) << mi << ":" << std::setw(2) << s;
  return ss.str();
}

std::string datetime_t::as_compact_string() const
{
  std::stringstream ss;
  ss << std::setfill('0')
     << std::setw(4) << y << std::setw(2) << m << std::setw(2) << d
     << std::setw(2) << h << std::setw(2) << mi << std::setw(2) << s;
  return ss.str();
}
