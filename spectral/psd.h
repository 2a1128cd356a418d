
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

#ifndef __SEISNOISE_PSD_H__
#define __SEISNOISE_PSD_H__

#include <vector>
#include <string>

#include <Eigen/Dense>

#include "defs/defs.h"
#include "helper/helper.h"
#include "param.h"

struct psd_config_builder_t;


//
// A raw waveform segment: counts, sampling rate (Hz), sensitivity
// (counts per physical unit) and instrument type; owned by the caller
//

struct waveform_t
{

  waveform_t() : sample_rate(0) , sensitivity(1) , instrument( INSTRUMENT_VELOCITY ) { }

  waveform_t( const std::vector<double> & samples ,
	      double sample_rate ,
	      double sensitivity ,
	      instrument_t instrument ,
	      const datetime_t & start_time = datetime_t() )
    : samples(samples) , sample_rate(sample_rate) , sensitivity(sensitivity) ,
      instrument(instrument) , start_time(start_time) { }

  std::vector<double> samples;

  double sample_rate;

  double sensitivity;

  instrument_t instrument;

  datetime_t start_time;

};


//
// PSD estimation parameters; immutable once built, either from
// psd_config_builder_t or from key=value parameters
//

class psd_config_t
{

  friend struct psd_config_builder_t;

 public:

  // defaults: no filter, 1000 s Hann windows at 80% overlap,
  // [0.001,100] Hz, no response removal
  psd_config_t();

  bool filter_enabled() const { return use_filter; }
  psd_filter_t filter_type() const { return ftype; }

  // high-pass cutoff (Hz)
  double cutoff() const { return hp_cutoff; }

  // band-pass corners (Hz)
  double low_cutoff() const { return bp_low; }
  double high_cutoff() const { return bp_high; }

  // Welch segment length (s), overlap fraction and taper
  double window_size() const { return segment_sec; }
  double overlap() const { return overlap_frac; }
  window_function_t window() const { return wfun; }

  // retained frequency range (Hz), inclusive
  double fmin() const { return freq_min; }
  double fmax() const { return freq_max; }

  // theoretical seismometer response
  bool response_removal() const { return remove_response; }
  double damping() const { return damping_ratio; }
  double natural_period() const { return period_n; }

  // keys: filter, filter-type, cutoff, low, high, window-size, overlap,
  // window, fmin, fmax, remove-response, damping, natural-period
  static psd_config_t from_param( const param_t & param );

  param_t to_param() const;

  bool operator==( const psd_config_t & rhs ) const;

 private:

  bool use_filter;
  psd_filter_t ftype;
  double hp_cutoff;
  double bp_low, bp_high;

  double segment_sec;
  double overlap_frac;
  window_function_t wfun;

  double freq_min, freq_max;

  bool remove_response;
  double damping_ratio;
  double period_n;

};


struct psd_config_builder_t
{

  psd_config_builder_t() { }

  explicit psd_config_builder_t( const psd_config_t & base ) : c( base ) { }

  psd_config_builder_t & filter( bool b ) { c.use_filter = b; return *this; }

  // enables the filter
  psd_config_builder_t & highpass( double cutoff )
  { c.use_filter = true; c.ftype = FILTER_HIGHPASS; c.hp_cutoff = cutoff; return *this; }

  // enables the filter
  psd_config_builder_t & bandpass( double low , double high )
  { c.use_filter = true; c.ftype = FILTER_BANDPASS; c.bp_low = low; c.bp_high = high; return *this; }

  psd_config_builder_t & filter_type( psd_filter_t t ) { c.ftype = t; return *this; }
  psd_config_builder_t & cutoff( double f ) { c.hp_cutoff = f; return *this; }
  psd_config_builder_t & low_cutoff( double f ) { c.bp_low = f; return *this; }
  psd_config_builder_t & high_cutoff( double f ) { c.bp_high = f; return *this; }

  psd_config_builder_t & window_size( double s ) { c.segment_sec = s; return *this; }
  psd_config_builder_t & overlap( double o ) { c.overlap_frac = o; return *this; }
  psd_config_builder_t & window( window_function_t w ) { c.wfun = w; return *this; }

  psd_config_builder_t & frequency_range( double lwr , double upr )
  { c.freq_min = lwr; c.freq_max = upr; return *this; }

  psd_config_builder_t & remove_response( bool b ) { c.remove_response = b; return *this; }
  psd_config_builder_t & damping( double d ) { c.damping_ratio = d; return *this; }
  psd_config_builder_t & natural_period( double t ) { c.period_n = t; return *this; }

  // invalid_config_t on any out-of-range value
  psd_config_t build() const;

 private:

  psd_config_t c;

};


//
// Output of one PSD calculation
//

struct psd_result_t
{

  psd_result_t() : instrument( INSTRUMENT_VELOCITY ) , sample_rate(0) , nan_points(0) { }

  // retained Welch frequencies (ascending) and acceleration power (dB)
  std::vector<double> frequencies;
  std::vector<double> psd_db;

  // octave-smoothed curve (ascending frequency); NaN for empty bins
  std::vector<double> smoothed_frequencies;
  std::vector<double> smoothed_psd_db;

  // counts: smoothed frequency (rows) x dB bin (cols)
  Eigen::MatrixXd distribution;

  // left edges of the dB grid
  std::vector<double> db_bin_edges;

  psd_config_t config;

  instrument_t instrument;

  double sample_rate;

  datetime_t start_time;

  // points whose power could not be expressed in dB
  int nan_points;

};


//
// PSD estimator
//

class psd_t
{

 public:

  explicit psd_t( const psd_config_t & config = psd_config_t() ) : config( config ) { }

  // invalid_input_t / invalid_config_t; the result is also kept in 'result'
  const psd_result_t & calculate( const waveform_t & segment );

  const psd_config_t & settings() const { return config; }

  psd_result_t result;

  //
  // individual steps
  //

  // 5th-order Butterworth, zero-phase
  static std::vector<double> filter( const std::vector<double> & x , double sample_rate , const psd_config_t & config );

  // divide by |H(jw)|^2 of a damped oscillator
  static void remove_response( std::vector<double> * power ,
			       const std::vector<double> & frequencies ,
			       double damping , double natural_period );

  // velocity power -> acceleration power
  static void to_acceleration( std::vector<double> * power ,
			       const std::vector<double> & frequencies );

  // 10 log10(p); NaN where p is not positive and finite; returns NaN count
  static int decibels( const std::vector<double> & power , std::vector<double> * db );

  // octave smoothing and dB histograms into res
  static void smooth( const std::vector<double> & frequencies ,
		      const std::vector<double> & db ,
		      psd_result_t * res );

  // left edges of the fixed dB grid
  static std::vector<double> db_grid();

  // histogram bin of a dB value, or -1 if off the grid (or NaN)
  static int db_bin( double db );

 private:

  psd_config_t config;

};


#endif
