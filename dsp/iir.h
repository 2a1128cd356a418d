
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

#ifndef __SEISNOISE_DSP_IIR_H__
#define __SEISNOISE_DSP_IIR_H__

#include <vector>
#include <cmath>
#include <complex>

#include "defs/defs.h"

enum iir_type_t {
  BUTTERWORTH_LOWPASS ,
  BUTTERWORTH_HIGHPASS ,
  BUTTERWORTH_BANDPASS
};


namespace dsptools {

  //
  // Digital Butterworth design: analog prototype -> frequency transform
  // -> bilinear transform (zero/pole/gain form), then expanded to
  // transfer-function coefficients; cutoffs are fractions of Nyquist
  //

  void butterworth( iir_type_t type , int order , double w1 , double w2 ,
		    std::vector<double> * b , std::vector<double> * a );

  // analog prototype poles (unit cutoff)
  std::vector<dcomp> butterworth_poles( int order );

  // direct-form II transposed filter; zi (if given) holds initial delays
  std::vector<double> lfilter( const std::vector<double> & b ,
			       const std::vector<double> & a ,
			       const std::vector<double> & x ,
			       const std::vector<double> * zi = NULL );

  // steady-state initial delays for a unit step
  std::vector<double> lfilter_zi( const std::vector<double> & b ,
				  const std::vector<double> & a );

  // zero-phase forward-backward filter, odd extension of 3 * max(len(a),len(b))
  std::vector<double> filtfilt( const std::vector<double> & b ,
				const std::vector<double> & a ,
				const std::vector<double> & x );

  // expand roots into real polynomial coefficients (highest power first)
  std::vector<double> poly( const std::vector<dcomp> & roots );

}


struct iir_t {

  iir_t() : order(0) { }

  // w1 (and w2 for band-pass) as fractions of Nyquist, in (0,1)
  void init( iir_type_t , int order , double w1 , double w2 = 0 );

  // single forward pass
  std::vector<double> apply( const std::vector<double> & x ) const;

  // zero-phase
  std::vector<double> filtfilt( const std::vector<double> & x ) const;

  iir_type_t type;

  int order;

  std::vector<double> b, a;

};


#endif
