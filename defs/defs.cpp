
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

#include "defs.h"
#include "helper/helper.h"

std::string globals::version = "v0.3.0";
std::string globals::date    = "19-Oct-2026";

void (*globals::bail_function) ( const std::string & ) = NULL;
void (*globals::logger_function) ( const std::string & ) = NULL;

bool globals::silent  = false;
bool globals::verbose = false;

std::string globals::noise_model_file = "";

std::string globals::psd_folder = "PSD";
std::string globals::psd_suffix = "_psd.db";

// 150 one-dB bins spanning -200 .. -50 dB
const int globals::psd_db_min  = -200;
const int globals::psd_db_max  = -50;
const int globals::psd_db_bins = 150;


void globals::init_defs()
{

  //
  // Optional bail function after halt() is called
  //

  bail_function = NULL;

  //
  // Optional redirect of logger?
  //

  logger_function = NULL;

  //
  // Output
  //

  silent = false;

  verbose = false;

  //
  // Artifact naming
  //

  psd_folder = "PSD";

  psd_suffix = "_psd.db";

}


void globals::api()
{
  silent = true;
}


std::string globals::window( window_function_t w )
{
  switch ( w )
    {
    case WINDOW_BOXCAR   : return "boxcar";
    case WINDOW_HANN     : return "hann";
    case WINDOW_HAMMING  : return "hamming";
    case WINDOW_BLACKMAN : return "blackman";
    case WINDOW_BARTLETT : return "bartlett";
    case WINDOW_FLATTOP  : return "flattop";
    case WINDOW_TUKEY50  : return "tukey";
    }
  return "?";
}

bool globals::window( const std::string & s , window_function_t * w )
{
  const std::string t = Helper::toupper( s );
  if      ( t == "BOXCAR" || t == "NONE" ) *w = WINDOW_BOXCAR;
  else if ( t == "HANN" )     *w = WINDOW_HANN;
  else if ( t == "HAMMING" )  *w = WINDOW_HAMMING;
  else if ( t == "BLACKMAN" ) *w = WINDOW_BLACKMAN;
  else if ( t == "BARTLETT" ) *w = WINDOW_BARTLETT;
  else if ( t == "FLATTOP" )  *w = WINDOW_FLATTOP;
  else if ( t == "TUKEY" || t == "TUKEY50" ) *w = WINDOW_TUKEY50;
  else return false;
  return true;
}

std::string globals::instrument( instrument_t i )
{
  return i == INSTRUMENT_VELOCITY ? "velocity" : "acceleration" ;
}

bool globals::instrument( const std::string & s , instrument_t * i )
{
  const std::string t = Helper::toupper( s );
  if      ( t == "VELOCITY" || t == "VEL" || t == "0" ) *i = INSTRUMENT_VELOCITY;
  else if ( t == "ACCELERATION" || t == "ACC" || t == "1" ) *i = INSTRUMENT_ACCELERATION;
  else return false;
  return true;
}

std::string globals::filter( psd_filter_t f )
{
  return f == FILTER_HIGHPASS ? "highpass" : "bandpass" ;
}

bool globals::filter( const std::string & s , psd_filter_t * f )
{
  const std::string t = Helper::toupper( s );
  if      ( t == "HIGHPASS" || t == "HIGH PASS" || t == "HP" ) *f = FILTER_HIGHPASS;
  else if ( t == "BANDPASS" || t == "BAND PASS" || t == "BP" ) *f = FILTER_BANDPASS;
  else return false;
  return true;
}
