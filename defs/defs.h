
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

#ifndef __SEISNOISE_DEFS_H__
#define __SEISNOISE_DEFS_H__

#include <string>
#include <complex>

typedef std::complex<double> dcomp;

enum window_function_t
  {
    WINDOW_BOXCAR = 0 ,
    WINDOW_HANN ,
    WINDOW_HAMMING ,
    WINDOW_BLACKMAN ,
    WINDOW_BARTLETT ,
    WINDOW_FLATTOP ,
    WINDOW_TUKEY50
  };

enum instrument_t
  {
    INSTRUMENT_VELOCITY = 0 ,
    INSTRUMENT_ACCELERATION = 1
  };

enum psd_filter_t
  {
    FILTER_HIGHPASS ,
    FILTER_BANDPASS
  };


struct globals
{

  static std::string version;

  static std::string date;

  // function to bail to if needed (called before halt() throws)
  static void (*bail_function) ( const std::string & msg );

  // optional redirect of all logger output
  static void (*logger_function) ( const std::string & msg );

  // no logging at all
  static bool silent;

  // extra diagnostics
  static bool verbose;

  // NLNM/NHNM table (empty: use the bundled resource)
  static std::string noise_model_file;

  // name of sub-folder that holds PSD artifacts, and their suffix
  static std::string psd_folder;
  static std::string psd_suffix;

  // dB histogram grid: [ psd_db_min , psd_db_max ] in 1 dB steps
  static const int psd_db_min;
  static const int psd_db_max;
  static const int psd_db_bins;

  // primary initiation of all globals
  static void init_defs();

  // library use: never write to the console
  static void api();

  static std::string window( window_function_t );

  static bool window( const std::string & , window_function_t * );

  static std::string instrument( instrument_t );

  static bool instrument( const std::string & , instrument_t * );

  static std::string filter( psd_filter_t );

  static bool filter( const std::string & , psd_filter_t * );

};

#endif
