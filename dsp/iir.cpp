
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

#include "dsp/iir.h"

#include "helper/helper.h"

#include <Eigen/Dense>

#include <algorithm>


std::vector<dcomp> dsptools::butterworth_poles( int order )
{
  // p = -exp( j pi m / 2N ),  m = -N+1, -N+3, ..., N-1
  std::vector<dcomp> p;
  for (int m = -order+1 ; m < order ; m += 2 )
    p.push_back( - std::exp( dcomp( 0 , M_PI * m / (double)( 2 * order ) ) ) );
  return p;
}


std::vector<double> dsptools::poly( const std::vector<dcomp> & roots )
{
  std::vector<dcomp> c( 1 , dcomp( 1 , 0 ) );

  for (int r=0;r<roots.size();r++)
    {
      // multiply by ( x - root )
      std::vector<dcomp> n( c.size() + 1 , dcomp( 0 , 0 ) );
      for (int i=0;i<c.size();i++)
	{
	  n[i] += c[i];
	  n[i+1] -= c[i] * roots[r];
	}
      c = n;
    }

  // conjugate pairs: imaginary parts are rounding noise
  std::vector<double> res( c.size() );
  for (int i=0;i<c.size();i++) res[i] = std::real( c[i] );
  return res;
}


void dsptools::butterworth( iir_type_t type , int order , double w1 , double w2 ,
			    std::vector<double> * b , std::vector<double> * a )
{

  if ( order < 1 )
    throw invalid_config_t( "filter order must be positive" );

  if ( ! ( w1 > 0 && w1 < 1 ) )
    throw invalid_config_t( "normalized cutoff must be in (0,1), got " + Helper::dbl2str( w1 ) );

  if ( type == BUTTERWORTH_BANDPASS )
    {
      if ( ! ( w2 > 0 && w2 < 1 ) )
	throw invalid_config_t( "normalized cutoff must be in (0,1), got " + Helper::dbl2str( w2 ) );
      if ( w1 >= w2 )
	throw invalid_config_t( "band-pass requires low < high cutoff" );
    }

  // analog prototype
  std::vector<dcomp> z;
  std::vector<dcomp> p = butterworth_poles( order );
  double k = 1.0;

  // pre-warp for the bilinear transform (fs = 2)
  const double fs2 = 4.0;
  const double warped1 = fs2 * tan( M_PI * w1 / 2.0 );
  const double warped2 = type == BUTTERWORTH_BANDPASS ? fs2 * tan( M_PI * w2 / 2.0 ) : 0 ;

  const int degree = p.size() - z.size();

  if ( type == BUTTERWORTH_LOWPASS )
    {
      for (int i=0;i<p.size();i++) p[i] *= warped1;
      k *= pow( warped1 , degree );
    }
  else if ( type == BUTTERWORTH_HIGHPASS )
    {
      // s -> wo / s
      dcomp prodp( 1 , 0 );
      for (int i=0;i<p.size();i++) prodp *= -p[i];
      for (int i=0;i<p.size();i++) p[i] = warped1 / p[i];
      z.assign( degree , dcomp( 0 , 0 ) );
      k *= std::real( dcomp( 1 , 0 ) / prodp );
    }
  else if ( type == BUTTERWORTH_BANDPASS )
    {
      // s -> ( s^2 + wo^2 ) / ( s bw )
      const double bw = warped2 - warped1;
      const double wo = sqrt( warped1 * warped2 );
      std::vector<dcomp> pbp;
      for (int i=0;i<p.size();i++)
	{
	  const dcomp plp = p[i] * ( bw / 2.0 );
	  pbp.push_back( plp + std::sqrt( plp * plp - wo * wo ) );
	}
      for (int i=0;i<p.size();i++)
	{
	  const dcomp plp = p[i] * ( bw / 2.0 );
	  pbp.push_back( plp - std::sqrt( plp * plp - wo * wo ) );
	}
      p = pbp;
      z.assign( degree , dcomp( 0 , 0 ) );
      k *= pow( bw , degree );
    }
  else
    throw invalid_config_t( "unsupported filter type" );

  //
  // bilinear transform
  //

  const int degree2 = p.size() - z.size();

  dcomp num( 1 , 0 ) , den( 1 , 0 );
  for (int i=0;i<z.size();i++) { num *= fs2 - z[i]; z[i] = ( fs2 + z[i] ) / ( fs2 - z[i] ); }
  for (int i=0;i<p.size();i++) { den *= fs2 - p[i]; p[i] = ( fs2 + p[i] ) / ( fs2 - p[i] ); }
  for (int i=0;i<degree2;i++) z.push_back( dcomp( -1 , 0 ) );

  k *= std::real( num / den );

  //
  // zpk -> transfer function
  //

  *b = poly( z );
  for (int i=0;i<b->size();i++) (*b)[i] *= k;

  *a = poly( p );

}


std::vector<double> dsptools::lfilter( const std::vector<double> & b0 ,
				       const std::vector<double> & a0 ,
				       const std::vector<double> & x ,
				       const std::vector<double> * zi )
{

  if ( a0.size() == 0 || b0.size() == 0 ) Helper::halt( "empty filter coefficients" );
  if ( a0[0] == 0 ) Helper::halt( "leading denominator coefficient cannot be zero" );

  const int n = std::max( a0.size() , b0.size() );

  // normalize & pad to a common length
  std::vector<double> b( n , 0 ) , a( n , 0 );
  for (int i=0;i<b0.size();i++) b[i] = b0[i] / a0[0];
  for (int i=0;i<a0.size();i++) a[i] = a0[i] / a0[0];

  // delays
  std::vector<double> z( n , 0 );
  if ( zi != NULL )
    {
      if ( zi->size() != n - 1 ) Helper::halt( "bad initial-condition length in lfilter()" );
      for (int i=0;i<n-1;i++) z[i] = (*zi)[i];
    }

  std::vector<double> y( x.size() );

  for (int t=0;t<x.size();t++)
    {
      const double xt = x[t];
      const double yt = b[0] * xt + z[0];
      for (int i=1;i<n;i++)
	z[i-1] = b[i] * xt + z[i] - a[i] * yt;
      y[t] = yt;
    }

  return y;
}


std::vector<double> dsptools::lfilter_zi( const std::vector<double> & b0 ,
					  const std::vector<double> & a0 )
{

  if ( a0.size() == 0 || a0[0] == 0 ) Helper::halt( "bad denominator in lfilter_zi()" );

  const int n = std::max( a0.size() , b0.size() );

  std::vector<double> b( n , 0 ) , a( n , 0 );
  for (int i=0;i<b0.size();i++) b[i] = b0[i] / a0[0];
  for (int i=0;i<a0.size();i++) a[i] = a0[i] / a0[0];

  if ( n == 1 ) return std::vector<double>();

  // solve ( I - companion(a)^T ) zi = b[1:] - a[1:] b[0]

  const int m = n - 1;

  Eigen::MatrixXd C = Eigen::MatrixXd::Zero( m , m );
  for (int j=0;j<m;j++) C(0,j) = -a[j+1];
  for (int i=1;i<m;i++) C(i,i-1) = 1;

  Eigen::MatrixXd IminusA = Eigen::MatrixXd::Identity( m , m ) - C.transpose();

  Eigen::VectorXd B( m );
  for (int i=0;i<m;i++) B[i] = b[i+1] - a[i+1] * b[0];

  Eigen::VectorXd zi = IminusA.partialPivLu().solve( B );

  std::vector<double> r( m );
  for (int i=0;i<m;i++) r[i] = zi[i];
  return r;
}


std::vector<double> dsptools::filtfilt( const std::vector<double> & b ,
					const std::vector<double> & a ,
					const std::vector<double> & x )
{

  const int n = x.size();

  const int padlen = 3 * std::max( a.size() , b.size() );

  if ( n <= padlen )
    throw invalid_input_t( "signal of " + Helper::int2str( n )
			   + " samples too short to filter, needs more than "
			   + Helper::int2str( padlen ) );

  //
  // odd extension at both ends
  //

  std::vector<double> ext( n + 2 * padlen );

  for (int i=0;i<padlen;i++)
    ext[i] = 2 * x[0] - x[ padlen - i ];

  for (int i=0;i<n;i++)
    ext[ padlen + i ] = x[i];

  for (int i=0;i<padlen;i++)
    ext[ padlen + n + i ] = 2 * x[n-1] - x[ n - 2 - i ];

  const std::vector<double> zi = lfilter_zi( b , a );

  // forward
  std::vector<double> z0( zi.size() );
  for (int i=0;i<zi.size();i++) z0[i] = zi[i] * ext[0];
  std::vector<double> y = lfilter( b , a , ext , &z0 );

  // backward
  std::reverse( y.begin() , y.end() );
  for (int i=0;i<zi.size();i++) z0[i] = zi[i] * y[0];
  y = lfilter( b , a , y , &z0 );
  std::reverse( y.begin() , y.end() );

  // unpad
  return std::vector<double>( y.begin() + padlen , y.begin() + padlen + n );
}



//
// iir_t
//

void iir_t::init( iir_type_t t , int o , double w1 , double w2 )
{
  type = t;
  order = o;
  dsptools::butterworth( type , order , w1 , w2 , &b , &a );
}

std::vector<double> iir_t::apply( const std::vector<double> & x ) const
{
  if ( order == 0 ) Helper::halt( "filter not initialized" );
  return dsptools::lfilter( b , a , x );
}

std::vector<double> iir_t::filtfilt( const std::vector<double> & x ) const
{
  if ( order == 0 ) Helper::halt( "filter not initialized" );
  return dsptools::filtfilt( b , a , x );
}
