
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

#include "param.h"
#include "helper/helper.h"
#include "defs/defs.h"

#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

#include "tests/test_support.h"

static std::vector<std::string> captured;

static void capture( const std::string & msg )
{
  captured.push_back( msg );
}

int main()
{

  seisnoise_test::init();

  //
  // key=value options
  //

  {
    param_t p;
    p.parse( "fmin=0.01" );
    p.parse( "verbose" );
    p.parse( "label=a=b" );
    p.parse( "f=1" );
    p.parse( "f+=2" );
    p.parse( "f+=3" );
    p.parse( "silent=F" );

    assert( p.size() == 5 );
    assert( p.has( "fmin" ) && ! p.has( "fmax" ) );
    assert( p.requires_dbl( "fmin" ) == 0.01 );
    assert( p.empty( "verbose" ) && ! p.empty( "fmin" ) );
    assert( p.yesno( "verbose" ) );
    assert( ! p.yesno( "silent" ) );
    assert( ! p.yesno( "other" ) );
    assert( p.value( "label" ) == "a=b" );

    std::vector<double> f = p.dblvector( "f" );
    assert( f.size() == 3 && f[0] == 1 && f[2] == 3 );

    SEISNOISE_TEST_THROWS( p.parse( "fmin=0.02" ) , invalid_config_t );
    SEISNOISE_TEST_THROWS( p.requires( "fmax" ) , invalid_config_t );
    SEISNOISE_TEST_THROWS( p.requires_int( "label" ) , invalid_config_t );
    SEISNOISE_TEST_THROWS( p.requires_dbl( "label" ) , invalid_config_t );
    SEISNOISE_TEST_THROWS( p.dblvector( "label" ) , invalid_config_t );

    assert( p.keys().size() == 5 );
  }

  //
  // parameter files
  //

  {
    const std::string f = "test_param_file.txt";
    std::ofstream O1( f.c_str() , std::ios::out );
    O1 << "# PSD settings\n"
       << "window-size=600   # ten minutes\n"
       << "\n"
       << "  window=hamming\r\n"
       << "remove-response\n";
    O1.close();

    param_t p;
    p.read_file( f );
    assert( p.size() == 3 );
    assert( p.requires_dbl( "window-size" ) == 600 );
    assert( p.value( "window" ) == "hamming" );
    assert( p.yesno( "remove-response" ) );

    // round trip through write_file
    p.write_file( f );
    param_t q;
    q.read_file( f );
    assert( q.keys() == p.keys() );
    assert( q.value( "window" ) == "hamming" && q.empty( "remove-response" ) );

    std::remove( f.c_str() );

    param_t r;
    SEISNOISE_TEST_THROWS( r.read_file( "no_such_param_file.txt" ) , invalid_config_t );
  }

  //
  // dates and times
  //

  {
    datetime_t a;
    assert( datetime_t::parse( "20200229123456" , &a ) );
    assert( a.y == 2020 && a.m == 2 && a.d == 29 && a.h == 12 && a.mi == 34 && a.s == 56 );
    assert( a.as_string() == "2020-02-29 12:34:56" );
    assert( a.as_compact_string() == "20200229123456" );

    datetime_t b;
    assert( datetime_t::parse( "2020-02-29T12:34:56" , &b ) );
    assert( a == b );
    assert( datetime_t::parse( "2020-02-29 12:34" , &b ) );
    assert( b.s == 0 && b < a );
    assert( datetime_t::parse( "20200229" , &b ) );
    assert( b.h == 0 && b.mi == 0 );

    assert( ! datetime_t::parse( "20190229" , &b ) );
    assert( ! datetime_t::parse( "2020-13-01" , &b ) );
    assert( ! datetime_t::parse( "2020022912" , &b ) );
    assert( ! datetime_t::parse( "yesterday" , &b ) );
    assert( ! datetime_t::parse( "2020\xe9\xa0" "0229" , &b ) );
    assert( Helper::lrtrim( "\xa0 x \xa0" ) == "\xa0 x \xa0" );

    assert( datetime_t( 1970 , 1 , 1 ).seconds() == 0 );
    assert( datetime_t( 1970 , 1 , 2 , 0 , 0 , 1 ).seconds() == 86401 );
    assert( datetime_t::from_seconds( a.seconds() ) == a );
    assert( datetime_t::from_seconds( 951782400 ).as_string() == "2000-02-29 00:00:00" );

    assert( a.floor_hours( 1 ).as_string() == "2020-02-29 12:00:00" );
    assert( a.floor_hours( 5 ).as_string() == "2020-02-29 10:00:00" );
    assert( a.floor_hours( 24 ).as_string() == "2020-02-29 00:00:00" );

    SEISNOISE_TEST_THROWS( datetime_t( 2021 , 2 , 29 ) , seisnoise_error_t );
    SEISNOISE_TEST_THROWS( datetime_t( std::string( "bad" ) ) , seisnoise_error_t );
  }

  //
  // option names
  //

  {
    window_function_t w;
    assert( globals::window( "Hann" , &w ) && w == WINDOW_HANN );
    assert( globals::window( "none" , &w ) && w == WINDOW_BOXCAR );
    assert( ! globals::window( "kaiser" , &w ) );
    assert( globals::window( WINDOW_TUKEY50 ) == "tukey" );

    instrument_t i;
    assert( globals::instrument( "acc" , &i ) && i == INSTRUMENT_ACCELERATION );
    assert( globals::instrument( "0" , &i ) && i == INSTRUMENT_VELOCITY );
    assert( ! globals::instrument( "displacement" , &i ) );

    psd_filter_t f;
    assert( globals::filter( "BP" , &f ) && f == FILTER_BANDPASS );
    assert( ! globals::filter( "lowpass" , &f ) );
  }

  //
  // redirected warnings and failures
  //

  {
    globals::logger_function = capture;
    Helper::warn( "odd sample rate" );
    assert( captured.size() == 1 );
    assert( captured[0].find( "odd sample rate" ) != std::string::npos );
    globals::logger_function = NULL;

    globals::bail_function = capture;
    SEISNOISE_TEST_THROWS( Helper::halt( "stop here" ) , seisnoise_error_t );
    assert( captured.size() == 2 && captured[1] == "stop here" );
    globals::bail_function = NULL;
  }

  std::cerr << "test_param: OK\n";
  return 0;
}
