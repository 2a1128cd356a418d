
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

#include "spectral/noise-models.h"

#include "miscmath/miscmath.h"
#include "helper/helper.h"
#include "helper/logger.h"
#include "defs/defs.h"

#include <fstream>
#include <mutex>
#include <limits>
#include <cmath>

#ifndef SEISNOISE_RESOURCE_DIR
#define SEISNOISE_RESOURCE_DIR "resources"
#endif

extern logger_t logger;


std::string noise_model_t::resource_file()
{
  if ( globals::noise_model_file != "" ) return globals::noise_model_file;
  return std::string( SEISNOISE_RESOURCE_DIR ) + "/noise_models.txt";
}


noise_model_t noise_model_t::load( const std::string & filename )
{

  if ( ! Helper::fileExists( filename ) )
    throw resource_error_t( "noise model file not found: " + filename );

  std::ifstream IN1( filename.c_str() , std::ios::in );
  if ( ! IN1.good() )
    throw resource_error_t( "could not open noise model file: " + filename );

  noise_model_t nm;

  int line = 0;

  while ( ! IN1.eof() )
    {
      std::string s;
      Helper::safe_getline( IN1 , s );
      ++line;
      if ( IN1.eof() && s == "" ) break;

      s = Helper::lrtrim( s );
      if ( s == "" || s[0] == '#' ) continue;

      std::vector<std::string> tok = Helper::parse( s , " \t" );

      if ( tok.size() != 3 )
	throw resource_error_t( "expecting 3 columns (period, low, high) on line "
				+ Helper::int2str( line ) + " of " + filename );

      double p , lo , hi;
      if ( ! ( Helper::str2dbl( tok[0] , &p )
	       && Helper::str2dbl( tok[1] , &lo )
	       && Helper::str2dbl( tok[2] , &hi ) ) )
	throw resource_error_t( "non-numeric value on line "
				+ Helper::int2str( line ) + " of " + filename );

      if ( p <= 0 || ( nm.periods.size() != 0 && p <= nm.periods.back() ) )
	throw resource_error_t( "periods must be positive and ascending, line "
				+ Helper::int2str( line ) + " of " + filename );

      nm.periods.push_back( p );
      nm.low_noise_db.push_back( lo );
      nm.high_noise_db.push_back( hi );
    }

  IN1.close();

  if ( nm.periods.size() < 2 )
    throw resource_error_t( "noise model table has fewer than two rows: " + filename );

  return nm;
}


const noise_model_t & noise_model_t::reference()
{
  static noise_model_t nm;
  static std::once_flag loaded;

  // a throw leaves the flag unset, so a later call retries
  std::call_once( loaded , []() {
      const std::string f = resource_file();
      nm = load( f );
      logger << "  read " << nm.size() << " noise model periods from " << f << "\n";
    } );

  return nm;
}


double noise_model_t::interpolate( const std::vector<double> & db , double period ) const
{
  if ( ! ( period >= periods.front() && period <= periods.back() ) )
    return std::numeric_limits<double>::quiet_NaN();

  std::vector<double> lp( periods.size() );
  for (int i=0;i<periods.size();i++) lp[i] = log10( periods[i] );

  return MiscMath::interpolate( lp , db , log10( period ) );
}

double noise_model_t::low( double period ) const
{
  return interpolate( low_noise_db , period );
}

double noise_model_t::high( double period ) const
{
  return interpolate( high_noise_db , period );
}
