
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

#include "fftw/fftwrap.h"

#include "miscmath/miscmath.h"
#include "helper/helper.h"
#include "helper/logger.h"

#include <cmath>

extern logger_t logger;


// --------------------------------------------------------------------------
//
// Real 1D DFT (real to complex)
//
// --------------------------------------------------------------------------

void real_FFT::reset()
{
  if ( planned ) fftw_destroy_plan(p);
  if ( in != NULL ) fftw_free(in);
  if ( out != NULL ) fftw_free(out);
  in = NULL;
  out = NULL;
  planned = false;
}

real_FFT::~real_FFT()
{
  reset();
}


void real_FFT::init( int Ndata_, int Nfft_, double Fs_ , window_function_t window_ )
{

  reset();

  Ndata = Ndata_;
  Nfft = Nfft_;
  Fs = Fs_;
  window = window_;

  if ( Ndata < 1 ) Helper::halt( "FFT requires at least one data point" );
  if ( Ndata > Nfft ) Helper::halt( "Ndata cannot be larger than Nfft" );
  if ( Fs <= 0 ) Helper::halt( "FFT requires a positive sampling rate" );

  // Allocate storage for input/output
  in = (double*) fftw_malloc(sizeof(double) * Nfft);
  if ( in == NULL ) Helper::halt( "FFT failed to allocate input buffer" );

  // r2c writes Nfft/2+1 outputs
  out = (fftw_complex*) fftw_malloc(sizeof(fftw_complex) * ( Nfft/2 + 1 ) );
  if ( out == NULL ) Helper::halt( "FFT failed to allocate output buffer" );

  for (int i=0;i<Nfft;i++) { in[i] = 0; }

  // Generate plan: nb. r2c 1D plan
  p = fftw_plan_dft_r2c_1d( Nfft, in, out , FFTW_ESTIMATE ) ;
  planned = true;

  // We want to return only the positive spectrum, so set the cut-off
  cutoff = Nfft % 2 == 0 ? Nfft/2+1 : (Nfft+1)/2 ;
  X.assign(cutoff,0);
  frq.assign(cutoff,0);

  //
  // Scale frequencies appropriately
  //

  const double T = Nfft/Fs;

  for (int i=0;i<cutoff;i++) frq[i] = i/T;

  //
  // Normalisation factor for PSD  (1/value)
  // i.e. equiv. to 1/(N.Fs) in unweighted case, otherwise
  // we take the window into account
  //

  w = MiscMath::window( window , Ndata , true );

  normalisation_factor = 0;
  for (int i=0;i<Ndata;i++) normalisation_factor += w[i] * w[i];
  normalisation_factor *= Fs;

  if ( normalisation_factor <= 0 )
    Helper::halt( "degenerate window for FFT of " + Helper::int2str( Ndata ) + " points" );

  normalisation_factor = 1.0/normalisation_factor;

}

bool real_FFT::apply( const std::vector<double> & x )
{
  return apply( x.data() , x.size() );
}


bool real_FFT::apply( const double * x , const int n )
{

  if ( n < Ndata ) Helper::halt( "too few points passed to FFT" );

  //
  // Load up (windowed) input buffer
  //

  for (int i=0;i<Ndata;i++) in[i] = x[i] * w[i];

  // zero-padding
  for (int i=Ndata;i<Nfft;i++) in[i] = 0;

  //
  // Execute actual FFT
  //

  fftw_execute(p);

  //
  // psdx = (1/(Fs*sum(w^2))) * abs(xdft).^2;
  //

  const bool even = Nfft % 2 == 0;

  for (int i=0;i<cutoff;i++)
    {

      double a = out[i][0];
      double b = out[i][1];

      X[i] =  ( a*a + b*b ) * normalisation_factor;

      // one-sided: double all but DC and (for even Nfft) Nyquist;
      // an odd-length transform has no Nyquist bin

      if ( i > 0 && ( i < cutoff-1 || ! even ) ) X[i] *= 2;

    }

  return true;

}


// --------------------------------------------------------------------------
//
// Welch
//
// --------------------------------------------------------------------------

void PWELCH::process()
{

  const int total_points = data.size();

  if ( total_points == 0 )
    throw invalid_input_t( "cannot estimate a spectrum from an empty signal" );

  if ( M <= 0 )
    throw invalid_config_t( "Welch window size must be positive" );

  if ( overlap < 0 || overlap >= 1 )
    throw invalid_config_t( "Welch overlap must be in [0,1)" );

  // segment length, truncated to whole samples and to the signal
  segment_size_points = (int)( M * Fs );
  if ( segment_size_points > total_points ) segment_size_points = total_points;
  if ( segment_size_points < 1 )
    throw invalid_config_t( "Welch window shorter than one sample" );

  noverlap_points = (int)floor( overlap * segment_size_points );

  const int segment_increment_points = segment_size_points - noverlap_points;

  segments = ( total_points - noverlap_points ) / segment_increment_points;

  //
  // Initial FFT (no zero padding)
  //

  real_FFT fft0( segment_size_points , segment_size_points , Fs , window );

  N = fft0.cutoff;
  psd.assign( N , 0 );
  freq = fft0.frq;

  //
  // Iterate over segments, performing individual FFT in each
  //

  std::vector<double> y( segment_size_points );

  for (int s = 0; s < segments ; s++ )
    {

      const int p = s * segment_increment_points;

      if ( p + segment_size_points > total_points )
	Helper::halt( "internal error in pwelch()" );

      // per-segment mean removal
      for (int j=0;j<segment_size_points;j++) y[j] = data[p+j];
      MiscMath::centre( &y );

      fft0.apply( y );

      for (int i=0;i<N;i++)
	psd[i] += fft0.X[i];

    }

  //
  // average
  //

  for (int i=0;i<N;i++)
    psd[i] /= (double)segments;

}
