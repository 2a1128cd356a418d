
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

#include "miscmath/miscmath.h"
#include "helper/helper.h"

#include <cmath>
#include <limits>


double MiscMath::mean( const std::vector<double> & x )
{
  if ( x.size() == 0 ) return 0;
  double s = 0;
  for (int i=0;i<x.size();i++) s += x[i];
  return s / (double)x.size();
}

double MiscMath::sum_of_squares( const std::vector<double> & x )
{
  double s = 0;
  for (int i=0;i<x.size();i++) s += x[i] * x[i];
  return s;
}

bool MiscMath::finite( const std::vector<double> & x )
{
  for (int i=0;i<x.size();i++)
    if ( ! std::isfinite( x[i] ) ) return false;
  return true;
}


//
// centre/detrend
//

std::vector<double> MiscMath::centre( const std::vector<double> & x )
{
  std::vector<double> r = x;
  centre( &r );
  return r;
}

void MiscMath::centre( std::vector<double> * x )
{
  const double m = mean( *x );
  for (int i=0;i<x->size();i++) (*x)[i] -= m;
}

std::vector<double> MiscMath::detrend( const std::vector<double> & x , double * pa , double * pb )
{
  std::vector<double> r = x;
  detrend(&r,pa,pb);
  return r;
}

void MiscMath::detrend( std::vector<double> * y , double * pa , double * pb )
{
  const int n = y->size();

  if ( n == 0 ) return;

  if ( n == 1 )
    {
      if ( pa ) *pa = (*y)[0];
      if ( pb ) *pb = 0;
      (*y)[0] = 0;
      return;
    }

  // assume equal spacing, x = 0 .. n-1
  const double xbar = ( n - 1 ) / 2.0;
  const double ybar = mean( *y );

  double sxy = 0 , sxx = 0;
  for (int i=0; i<n; i++)
    {
      const double dx = i - xbar;
      sxy += dx * ( (*y)[i] - ybar );
      sxx += dx * dx;
    }

  const double beta = sxy / sxx;
  const double m = ybar - beta * xbar;

  // adjust
  for (int i=0; i<n; i++) (*y)[i] -= m + beta * i;

  if ( pa ) *pa = m;
  if ( pb ) *pb = beta;
}


//
// Windows
//

std::vector<double> MiscMath::boxcar_window( int N )
{
  return std::vector<double>( N , 1.0 );
}

double MiscMath::hann_window(unsigned int i, unsigned int N)
{
  if ( N < 2 ) return 1.0;
  return 0.5*(1 - cos(2.0*M_PI*i/(double)(N - 1)));
}

std::vector<double> MiscMath::hann_window(int N )
{
  std::vector<double> w(N);
  for (int i = 0; i < N; i++) w[i] = hann_window( i , N );
  return w;
}

double MiscMath::hamming_window(unsigned int n, unsigned int N)
{
  if ( N < 2 ) return 1.0;
  return 0.54 - 0.46 * std::cos( 2.0 * M_PI * ( (n) / (double)(N-1) ) );
}

std::vector<double> MiscMath::hamming_window( int N )
{
  std::vector<double> w(N);
  for (int n=0;n<N;n++) w[n] = hamming_window(n,N);
  return w;
}

std::vector<double> MiscMath::blackman_window( int N )
{
  if ( N == 1 ) return std::vector<double>( 1 , 1.0 );
  std::vector<double> w(N);
  for (int n=0;n<N;n++)
    {
      const double x = 2.0 * M_PI * n / (double)(N-1);
      w[n] = 0.42 - 0.5 * cos( x ) + 0.08 * cos( 2 * x );
    }
  return w;
}

std::vector<double> MiscMath::bartlett_window( int N )
{
  if ( N == 1 ) return std::vector<double>( 1 , 1.0 );
  std::vector<double> w(N);
  const double h = ( N - 1 ) / 2.0;
  for (int n=0;n<N;n++)
    w[n] = n <= h ? 2.0 * n / (double)(N-1) : 2.0 - 2.0 * n / (double)(N-1);
  return w;
}

std::vector<double> MiscMath::flattop_window( int N )
{
  if ( N == 1 ) return std::vector<double>( 1 , 1.0 );

  static const double a[] = { 0.21557895, 0.41663158, 0.277263158, 0.083578947, 0.006947368 };

  std::vector<double> w(N);
  for (int n=0;n<N;n++)
    {
      const double x = 2.0 * M_PI * n / (double)(N-1);
      double s = 0;
      double sgn = 1;
      for (int k=0;k<5;k++)
	{
	  s += sgn * a[k] * cos( k * x );
	  sgn = -sgn;
	}
      w[n] = s;
    }
  return w;
}

std::vector<double> MiscMath::tukey_window( int n , double r )
{

  if ( n == 1 ) return std::vector<double>( 1 , 1.0 );

  if ( r <= 0 ) return boxcar_window( n );
  if ( r >= 1 ) return hann_window( n );

  std::vector<double> w( n , 1.0 );

  const int width = floor( r * ( n - 1 ) / 2.0 );

  // rising taper
  for (int i=0;i<=width;i++)
    w[i] = 0.5 * ( 1 + cos( M_PI * ( -1 + 2.0 * i / r / (double)( n - 1 ) ) ) );

  // falling taper
  for (int i=n-width-1;i<n;i++)
    w[i] = 0.5 * ( 1 + cos( M_PI * ( -2.0 / r + 1 + 2.0 * i / r / (double)( n - 1 ) ) ) );

  return w;
}

std::vector<double> MiscMath::window( window_function_t type , int n , bool periodic )
{

  if ( n < 1 ) Helper::halt( "window length must be positive" );

  // periodic: compute n+1 symmetric points, drop the last
  const int m = periodic ? n + 1 : n;

  std::vector<double> w;

  switch ( type )
    {
    case WINDOW_BOXCAR   : w = boxcar_window( m ); break;
    case WINDOW_HANN     : w = hann_window( m ); break;
    case WINDOW_HAMMING  : w = hamming_window( m ); break;
    case WINDOW_BLACKMAN : w = blackman_window( m ); break;
    case WINDOW_BARTLETT : w = bartlett_window( m ); break;
    case WINDOW_FLATTOP  : w = flattop_window( m ); break;
    case WINDOW_TUKEY50  : w = tukey_window( m , 0.5 ); break;
    default : throw invalid_config_t( "unknown window function" );
    }

  // a single point is left unweighted
  if ( n == 1 ) w.assign( 1 , 1.0 );

  if ( periodic ) w.resize( n );

  return w;
}


double MiscMath::interpolate( const std::vector<double> & x , const std::vector<double> & y , double xi )
{
  const int n = x.size();
  if ( n == 0 || n != y.size() ) return std::numeric_limits<double>::quiet_NaN();
  if ( xi <= x[0] ) return y[0];
  if ( xi >= x[n-1] ) return y[n-1];

  // first x > xi
  const int j = std::upper_bound( x.begin() , x.end() , xi ) - x.begin();
  const double t = ( xi - x[j-1] ) / ( x[j] - x[j-1] );
  return y[j-1] + t * ( y[j] - y[j-1] );
}
