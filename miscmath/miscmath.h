
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

#ifndef __SEISNOISE_MISCMATH_H__
#define __SEISNOISE_MISCMATH_H__

#include <vector>
#include <cstddef>
#include <complex>
#include <algorithm>

#include "defs/defs.h"

namespace MiscMath
{

  double mean( const std::vector<double> & x );
  double sum_of_squares( const std::vector<double> & x );

  // all values finite (no NaN/Inf)
  bool finite( const std::vector<double> & x );

  // mean-centre
  std::vector<double> centre( const std::vector<double> & x );
  void centre( std::vector<double> * x );

  // remove least-squares line (x = 0..n-1); optionally return intercept & slope
  std::vector<double> detrend( const std::vector<double> & x , double * pa = NULL , double * pb = NULL );
  void detrend( std::vector<double> * x , double * pa = NULL , double * pb = NULL );

  //
  // Window functions: symmetric forms, as used for filter design and
  // plotting; the spectral estimator uses periodic windows (the
  // symmetric window of n+1 points with the last dropped)
  //

  std::vector<double> boxcar_window( int n );

  std::vector<double> hann_window( int n );
  double hann_window(unsigned int n, unsigned int N);

  std::vector<double> hamming_window( int n );
  double hamming_window(unsigned int n, unsigned int N);

  std::vector<double> blackman_window( int n );

  std::vector<double> bartlett_window( int n );

  std::vector<double> flattop_window( int n );

  // Tukey (cosine-taper) window, r = fraction of the window inside the taper
  std::vector<double> tukey_window( int n , double r = 0.5 );

  // dispatch on type
  std::vector<double> window( window_function_t w , int n , bool periodic = true );

  // piecewise-linear interpolation of (x,y) at xi; x ascending; flat extrapolation
  double interpolate( const std::vector<double> & x , const std::vector<double> & y , double xi );

}

#endif
