
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

#ifndef __SEISNOISE_FFTWRAP_H__
#define __SEISNOISE_FFTWRAP_H__

#include <vector>

#include "fftw3.h"

#include "defs/defs.h"


// --------------------------------------------------------------------------
//
// Real 1D DFT (real to complex), returning the one-sided PSD
//
// --------------------------------------------------------------------------

class real_FFT
{

 public:

  real_FFT() : in(NULL) , out(NULL) , planned(false) { }

  real_FFT( int Ndata , int Nfft , double Fs , window_function_t window = WINDOW_BOXCAR )
    : in(NULL) , out(NULL) , planned(false)
  {
    init( Ndata , Nfft , Fs , window );
  }

  ~real_FFT();

  // owns FFTW buffers and plan
  real_FFT( const real_FFT & ) = delete;
  real_FFT & operator=( const real_FFT & ) = delete;

  void init( int Ndata , int Nfft , double Fs , window_function_t window = WINDOW_BOXCAR );

  void reset();

 private:

  // Size of actual data
  int Ndata;

  // Sampling rate, so we can construct the appropriate Hz for the PSD
  double Fs;

  // Windowing (periodic form)
  window_function_t window;
  std::vector<double> w;

  double * in;
  fftw_complex * out;
  fftw_plan p;
  bool planned;

  // Size of FFT, including zero-padding
  int Nfft;

  // 1/( Fs * sum(w^2) )
  double normalisation_factor;

 public:

  // number of non-negative frequency bins
  int cutoff;

  // one-sided PSD and frequencies (0..cutoff-1)
  std::vector<double> X;
  std::vector<double> frq;

  bool apply( const std::vector<double> & x );
  bool apply( const double * x , const int n );

};



// --------------------------------------------------------------------------
//
// Welch's method: average of modified periodograms over overlapping,
// windowed, mean-removed segments
//
// --------------------------------------------------------------------------

class PWELCH
{

  // Note: computes the power spectral density, not the power spectrum.

  // Segment length is min( M * Fs , N ) samples and consecutive
  // segments overlap by floor( overlap * length ) samples; trailing
  // samples that do not fill a segment are not used.

 public:

 PWELCH( const std::vector<double> & data ,
	 double Fs,
	 double M ,
	 double overlap ,
	 window_function_t W = WINDOW_HANN )
   : data(data) , Fs(Fs) , M(M) , overlap(overlap) , window(W)
  {
    process();
  }

  //
  // Derived variables
  //

  int N;

  std::vector<double> psd;

  std::vector<double> freq;

  // segment geometry actually used
  int segment_size_points;
  int noverlap_points;
  int segments;

 private:

  const std::vector<double> & data;
  double Fs;
  double M;
  double overlap;
  window_function_t window;

  void process();

};


#endif
