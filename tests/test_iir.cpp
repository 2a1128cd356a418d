
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

#include <cmath>
#include <complex>
#include <vector>

#include "tests/test_support.h"

// |H(e^jw)| from transfer-function coefficients
static double gain( const std::vector<double> & b , const std::vector<double> & a , double w )
{
  std::complex<double> num( 0 , 0 ) , den( 0 , 0 );
  for (int k=0;k<b.size();k++) num += b[k] * std::exp( std::complex<double>( 0 , -w * k ) );
  for (int k=0;k<a.size();k++) den += a[k] * std::exp( std::complex<double>( 0 , -w * k ) );
  return std::abs( num / den );
}

static std::vector<double> sine( double fs , double f , int n )
{
  std::vector<double> x( n );
  for (int i=0;i<n;i++) x[i] = sin( 2 * M_PI * f * i / fs );
  return x;
}

static double rms( const std::vector<double> & x , int from , int to )
{
  double s = 0;
  for (int i=from;i<to;i++) s += x[i] * x[i];
  return sqrt( s / (double)( to - from ) );
}

int main()
{

  seisnoise_test::init();

  // second-order half-band designs have closed forms
  {
    std::vector<double> b, a;
    dsptools::butterworth( BUTTERWORTH_LOWPASS , 2 , 0.5 , 0 , &b , &a );
    assert( b.size() == 3 && a.size() == 3 );
    assert( seisnoise_test::near( b[0] , 0.29289321881345254 , 1e-12 ) );
    assert( seisnoise_test::near( b[1] , 0.58578643762690508 , 1e-12 ) );
    assert( seisnoise_test::near( b[2] , 0.29289321881345254 , 1e-12 ) );
    assert( seisnoise_test::near( a[0] , 1 , 1e-12 ) );
    assert( seisnoise_test::near( a[1] , 0 , 1e-12 ) );
    assert( seisnoise_test::near( a[2] , 0.17157287525380996 , 1e-12 ) );

    dsptools::butterworth( BUTTERWORTH_HIGHPASS , 2 , 0.5 , 0 , &b , &a );
    assert( seisnoise_test::near( b[0] , 0.29289321881345254 , 1e-12 ) );
    assert( seisnoise_test::near( b[1] , -0.58578643762690508 , 1e-12 ) );
    assert( seisnoise_test::near( b[2] , 0.29289321881345254 , 1e-12 ) );
    assert( seisnoise_test::near( a[2] , 0.17157287525380996 , 1e-12 ) );
  }

  // 5th-order high-pass: DC blocked, unit gain at Nyquist, -3 dB at cutoff
  {
    std::vector<double> b, a;
    dsptools::butterworth( BUTTERWORTH_HIGHPASS , 5 , 0.1 , 0 , &b , &a );
    assert( b.size() == 6 && a.size() == 6 );
    assert( gain( b , a , 0 ) < 1e-9 );
    assert( seisnoise_test::near( gain( b , a , M_PI ) , 1.0 , 1e-9 ) );
    assert( seisnoise_test::near( gain( b , a , 0.1 * M_PI ) , 1.0 / sqrt( 2.0 ) , 1e-6 ) );
  }

  // 5th-order band-pass: order doubles, passband ~1, edges -3 dB, ends blocked
  {
    std::vector<double> b, a;
    dsptools::butterworth( BUTTERWORTH_BANDPASS , 5 , 0.1 , 0.4 , &b , &a );
    assert( b.size() == 11 && a.size() == 11 );
    assert( gain( b , a , 0 ) < 1e-9 );
    assert( gain( b , a , M_PI ) < 1e-9 );
    assert( seisnoise_test::near( gain( b , a , 0.1 * M_PI ) , 1.0 / sqrt( 2.0 ) , 1e-6 ) );
    assert( seisnoise_test::near( gain( b , a , 0.4 * M_PI ) , 1.0 / sqrt( 2.0 ) , 1e-6 ) );
    // geometric center of the pre-warped band
    const double wc = 2 * atan( sqrt( tan( 0.1 * M_PI / 2 ) * tan( 0.4 * M_PI / 2 ) ) );
    assert( seisnoise_test::near( gain( b , a , wc ) , 1.0 , 1e-6 ) );
  }

  // bad cutoffs
  {
    std::vector<double> b, a;
    SEISNOISE_TEST_THROWS( dsptools::butterworth( BUTTERWORTH_HIGHPASS , 5 , 0 , 0 , &b , &a ) , invalid_config_t );
    SEISNOISE_TEST_THROWS( dsptools::butterworth( BUTTERWORTH_HIGHPASS , 5 , 1.0 , 0 , &b , &a ) , invalid_config_t );
    SEISNOISE_TEST_THROWS( dsptools::butterworth( BUTTERWORTH_BANDPASS , 5 , 0.4 , 0.1 , &b , &a ) , invalid_config_t );
    SEISNOISE_TEST_THROWS( dsptools::butterworth( BUTTERWORTH_LOWPASS , 0 , 0.4 , 0 , &b , &a ) , invalid_config_t );
  }

  // steady-state initial conditions: a step stays at the DC gain
  {
    std::vector<double> b, a;
    dsptools::butterworth( BUTTERWORTH_LOWPASS , 4 , 0.2 , 0 , &b , &a );
    std::vector<double> zi = dsptools::lfilter_zi( b , a );
    assert( zi.size() == 4 );
    std::vector<double> ones( 50 , 1.0 );
    std::vector<double> y = dsptools::lfilter( b , a , ones , &zi );
    for (int i=0;i<y.size();i++)
      assert( seisnoise_test::near( y[i] , 1.0 , 1e-9 ) );
  }

  // simple FIR case of lfilter
  {
    std::vector<double> b( 2 , 0.5 ) , a( 1 , 1.0 );
    std::vector<double> x;
    x.push_back( 1 ); x.push_back( 2 ); x.push_back( 3 );
    std::vector<double> y = dsptools::lfilter( b , a , x );
    assert( seisnoise_test::near( y[0] , 0.5 , 1e-15 ) );
    assert( seisnoise_test::near( y[1] , 1.5 , 1e-15 ) );
    assert( seisnoise_test::near( y[2] , 2.5 , 1e-15 ) );
  }

  // zero-phase high-pass: offset removed, passband tone kept in place
  {
    const double fs = 100;
    iir_t hp;
    hp.init( BUTTERWORTH_HIGHPASS , 5 , 1.0 / ( fs / 2 ) );

    std::vector<double> x = sine( fs , 10 , 4000 );
    std::vector<double> xo = x;
    for (int i=0;i<xo.size();i++) xo[i] += 5.0;

    std::vector<double> y = hp.filtfilt( xo );
    assert( y.size() == xo.size() );

    // no phase shift: close to the original tone away from the edges
    double maxdiff = 0;
    for (int i=500;i<3500;i++) maxdiff = std::max( maxdiff , fabs( y[i] - x[i] ) );
    assert( maxdiff < 1e-3 );

    // a low tone is strongly attenuated
    std::vector<double> lo = hp.filtfilt( sine( fs , 0.1 , 4000 ) );
    assert( rms( lo , 500 , 3500 ) < 1e-3 );

    // one causal pass is plain lfilter with the designed coefficients
    std::vector<double> once = hp.apply( xo );
    std::vector<double> ref = dsptools::lfilter( hp.b , hp.a , xo );
    assert( once == ref );
  }

  // too short for the padding
  {
    iir_t hp;
    hp.init( BUTTERWORTH_HIGHPASS , 5 , 0.1 );
    // pad = 3 * 6
    SEISNOISE_TEST_THROWS( hp.filtfilt( std::vector<double>( 18 , 1.0 ) ) , invalid_input_t );
    std::vector<double> y = hp.filtfilt( std::vector<double>( 19 , 1.0 ) );
    assert( y.size() == 19 );
  }

  std::cerr << "test_iir: OK\n";
  return 0;
}
