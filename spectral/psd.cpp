
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

#include "spectral/psd.h"
#include "spectral/octave.h"

#include "fftw/fftwrap.h"
#include "dsp/iir.h"
#include "miscmath/miscmath.h"
#include "helper/logger.h"

#include <cmath>
#include <limits>
#include <algorithm>

extern logger_t logger;

// dB values may be NaN: order on period alone
static bool by_period( const std::pair<double,double> & a , const std::pair<double,double> & b )
{
  return a.first < b.first;
}


//
// psd_config_t
//

psd_config_t::psd_config_t()
{
  use_filter = false;
  ftype = FILTER_HIGHPASS;
  hp_cutoff = 0.1;
  bp_low = 0.1;
  bp_high = 100;

  segment_sec = 1000;
  overlap_frac = 0.8;
  wfun = WINDOW_HANN;

  freq_min = 0.001;
  freq_max = 100;

  remove_response = false;
  damping_ratio = 0.707;
  period_n = 10;
}


bool psd_config_t::operator==( const psd_config_t & rhs ) const
{
  return use_filter == rhs.use_filter
    && ftype == rhs.ftype
    && hp_cutoff == rhs.hp_cutoff
    && bp_low == rhs.bp_low
    && bp_high == rhs.bp_high
    && segment_sec == rhs.segment_sec
    && overlap_frac == rhs.overlap_frac
    && wfun == rhs.wfun
    && freq_min == rhs.freq_min
    && freq_max == rhs.freq_max
    && remove_response == rhs.remove_response
    && damping_ratio == rhs.damping_ratio
    && period_n == rhs.period_n;
}


psd_config_t psd_config_builder_t::build() const
{

  // all values checked, whether or not the relevant step is enabled

  if ( ! ( std::isfinite( c.hp_cutoff ) && c.hp_cutoff > 0 ) )
    throw invalid_config_t( "high-pass cutoff must be positive" );

  if ( ! ( std::isfinite( c.bp_low ) && c.bp_low > 0 ) )
    throw invalid_config_t( "band-pass low cutoff must be positive" );

  if ( ! ( std::isfinite( c.bp_high ) && c.bp_high > c.bp_low ) )
    throw invalid_config_t( "band-pass high cutoff must exceed the low cutoff" );

  if ( ! ( std::isfinite( c.segment_sec ) && c.segment_sec > 0 ) )
    throw invalid_config_t( "window-size must be positive" );

  if ( ! ( c.overlap_frac >= 0 && c.overlap_frac < 1 ) )
    throw invalid_config_t( "overlap must be in [0,1)" );

  if ( c.wfun < WINDOW_BOXCAR || c.wfun > WINDOW_TUKEY50 )
    throw invalid_config_t( "unknown window function" );

  if ( c.ftype != FILTER_HIGHPASS && c.ftype != FILTER_BANDPASS )
    throw invalid_config_t( "unknown filter type" );

  if ( ! ( std::isfinite( c.freq_min ) && std::isfinite( c.freq_max ) && c.freq_min >= 0 ) )
    throw invalid_config_t( "frequency range must be finite and non-negative" );

  if ( c.freq_min > c.freq_max )
    throw invalid_config_t( "fmin (" + Helper::dbl2str( c.freq_min )
			    + ") greater than fmax (" + Helper::dbl2str( c.freq_max ) + ")" );

  if ( ! ( std::isfinite( c.damping_ratio ) && c.damping_ratio > 0 ) )
    throw invalid_config_t( "damping must be positive" );

  if ( ! ( std::isfinite( c.period_n ) && c.period_n > 0 ) )
    throw invalid_config_t( "natural-period must be positive" );

  return c;
}


psd_config_t psd_config_t::from_param( const param_t & param )
{

  psd_config_builder_t builder;

  if ( param.has( "filter" ) )
    builder.filter( param.yesno( "filter" ) );

  if ( param.has( "filter-type" ) )
    {
      psd_filter_t t;
      if ( ! globals::filter( param.value( "filter-type" ) , &t ) )
	throw invalid_config_t( "unknown filter-type: " + param.value( "filter-type" ) );
      builder.filter_type( t );
    }

  if ( param.has( "cutoff" ) ) builder.cutoff( param.requires_dbl( "cutoff" ) );
  if ( param.has( "low" ) ) builder.low_cutoff( param.requires_dbl( "low" ) );
  if ( param.has( "high" ) ) builder.high_cutoff( param.requires_dbl( "high" ) );

  if ( param.has( "window-size" ) ) builder.window_size( param.requires_dbl( "window-size" ) );
  if ( param.has( "overlap" ) ) builder.overlap( param.requires_dbl( "overlap" ) );

  if ( param.has( "window" ) )
    {
      window_function_t w;
      if ( ! globals::window( param.value( "window" ) , &w ) )
	throw invalid_config_t( "unknown window: " + param.value( "window" ) );
      builder.window( w );
    }

  psd_config_t defaults;
  if ( param.has( "fmin" ) || param.has( "fmax" ) )
    builder.frequency_range( param.has( "fmin" ) ? param.requires_dbl( "fmin" ) : defaults.fmin() ,
			     param.has( "fmax" ) ? param.requires_dbl( "fmax" ) : defaults.fmax() );

  if ( param.has( "remove-response" ) )
    builder.remove_response( param.yesno( "remove-response" ) );

  if ( param.has( "damping" ) ) builder.damping( param.requires_dbl( "damping" ) );
  if ( param.has( "natural-period" ) ) builder.natural_period( param.requires_dbl( "natural-period" ) );

  return builder.build();
}


param_t psd_config_t::to_param() const
{
  param_t param;
  param.add( "filter" , use_filter ? "T" : "F" );
  param.add( "filter-type" , globals::filter( ftype ) );
  param.add( "cutoff" , Helper::dbl2str( hp_cutoff ) );
  param.add( "low" , Helper::dbl2str( bp_low ) );
  param.add( "high" , Helper::dbl2str( bp_high ) );
  param.add( "window-size" , Helper::dbl2str( segment_sec ) );
  param.add( "overlap" , Helper::dbl2str( overlap_frac ) );
  param.add( "window" , globals::window( wfun ) );
  param.add( "fmin" , Helper::dbl2str( freq_min ) );
  param.add( "fmax" , Helper::dbl2str( freq_max ) );
  param.add( "remove-response" , remove_response ? "T" : "F" );
  param.add( "damping" , Helper::dbl2str( damping_ratio ) );
  param.add( "natural-period" , Helper::dbl2str( period_n ) );
  return param;
}



//
// psd_t
//

const psd_result_t & psd_t::calculate( const waveform_t & segment )
{

  //
  // check inputs
  //

  const int n = segment.samples.size();

  if ( n == 0 )
    throw invalid_input_t( "empty waveform segment" );

  if ( ! ( std::isfinite( segment.sample_rate ) && segment.sample_rate > 0 ) )
    throw invalid_input_t( "sample rate must be positive" );

  if ( ! ( std::isfinite( segment.sensitivity ) && segment.sensitivity > 0 ) )
    throw invalid_input_t( "sensitivity must be positive" );

  if ( segment.instrument != INSTRUMENT_VELOCITY && segment.instrument != INSTRUMENT_ACCELERATION )
    throw invalid_config_t( "invalid instrument type: " + Helper::int2str( (int)segment.instrument ) );

  if ( ! MiscMath::finite( segment.samples ) )
    throw invalid_input_t( "waveform contains non-finite samples" );

  logger << "  estimating PSD for " << n << " samples at " << segment.sample_rate << " Hz ("
	 << globals::instrument( segment.instrument ) << ")\n";

  psd_result_t res;
  res.config = config;
  res.instrument = segment.instrument;
  res.sample_rate = segment.sample_rate;
  res.start_time = segment.start_time;

  //
  // mean, then linear trend; physical units
  //

  std::vector<double> x = MiscMath::centre( segment.samples );
  MiscMath::detrend( &x );

  for (int i=0;i<n;i++) x[i] /= segment.sensitivity;

  //
  // optional filter
  //

  if ( config.filter_enabled() )
    x = filter( x , segment.sample_rate , config );

  //
  // Welch
  //

  PWELCH pwelch( x , segment.sample_rate , config.window_size() , config.overlap() , config.window() );

  if ( globals::verbose )
    logger << "  Welch: " << pwelch.segments << " segment(s) of "
	   << pwelch.segment_size_points << " points, "
	   << pwelch.noverlap_points << " overlapping\n";

  //
  // clip to [fmin,fmax]
  //

  std::vector<double> power;
  for (int i=0;i<pwelch.N;i++)
    {
      const double f = pwelch.freq[i];
      if ( f >= config.fmin() && f <= config.fmax() )
	{
	  res.frequencies.push_back( f );
	  power.push_back( pwelch.psd[i] );
	}
    }

  if ( res.frequencies.size() == 0 )
    throw invalid_input_t( "no frequencies in [" + Helper::dbl2str( config.fmin() )
			   + "," + Helper::dbl2str( config.fmax() ) + "] Hz" );

  //
  // response, instrument conversion, dB
  //

  if ( config.response_removal() )
    remove_response( &power , res.frequencies , config.damping() , config.natural_period() );

  if ( segment.instrument == INSTRUMENT_VELOCITY )
    to_acceleration( &power , res.frequencies );

  res.nan_points = decibels( power , &res.psd_db );

  if ( res.nan_points > 0 )
    Helper::warn( Helper::int2str( res.nan_points )
		  + " PSD value(s) not positive, set to NaN and excluded from smoothing" );

  //
  // octave smoothing and dB distribution
  //

  smooth( res.frequencies , res.psd_db , &res );

  logger << "  " << res.frequencies.size() << " frequencies retained, "
	 << res.smoothed_frequencies.size() << " octave bins\n";

  result = res;

  return result;
}


std::vector<double> psd_t::filter( const std::vector<double> & x , double sample_rate , const psd_config_t & config )
{

  const double nyquist = sample_rate / 2.0;

  iir_t iir;

  if ( config.filter_type() == FILTER_HIGHPASS )
    {
      if ( config.cutoff() >= nyquist )
	throw invalid_config_t( "high-pass cutoff " + Helper::dbl2str( config.cutoff() )
				+ " Hz not below Nyquist (" + Helper::dbl2str( nyquist ) + " Hz)" );
      iir.init( BUTTERWORTH_HIGHPASS , 5 , config.cutoff() / nyquist );
    }
  else
    {
      if ( config.high_cutoff() >= nyquist )
	throw invalid_config_t( "band-pass high cutoff " + Helper::dbl2str( config.high_cutoff() )
				+ " Hz not below Nyquist (" + Helper::dbl2str( nyquist ) + " Hz)" );
      iir.init( BUTTERWORTH_BANDPASS , 5 , config.low_cutoff() / nyquist , config.high_cutoff() / nyquist );
    }

  return iir.filtfilt( x );
}


void psd_t::remove_response( std::vector<double> * power ,
			     const std::vector<double> & frequencies ,
			     double damping , double natural_period )
{
  // H(s) = s^2 / ( s^2 + 2 zeta wn s + wn^2 )

  const double wn = 2 * M_PI / natural_period;

  for (int i=0;i<frequencies.size();i++)
    {
      const double w = 2 * M_PI * frequencies[i];
      const double re = wn * wn - w * w;
      const double im = 2 * damping * wn * w;
      const double h2 = ( w * w * w * w ) / ( re * re + im * im );
      (*power)[i] /= h2;
    }
}


void psd_t::to_acceleration( std::vector<double> * power , const std::vector<double> & frequencies )
{
  for (int i=0;i<frequencies.size();i++)
    {
      const double w = 2 * M_PI * frequencies[i];
      (*power)[i] *= w * w;
    }
}


int psd_t::decibels( const std::vector<double> & power , std::vector<double> * db )
{
  int nan = 0;
  db->resize( power.size() );
  for (int i=0;i<power.size();i++)
    {
      if ( std::isfinite( power[i] ) && power[i] > 0 )
	(*db)[i] = 10 * log10( power[i] );
      else
	{
	  (*db)[i] = std::numeric_limits<double>::quiet_NaN();
	  ++nan;
	}
    }
  return nan;
}


std::vector<double> psd_t::db_grid()
{
  std::vector<double> g( globals::psd_db_bins );
  for (int i=0;i<globals::psd_db_bins;i++) g[i] = globals::psd_db_min + i;
  return g;
}


int psd_t::db_bin( double db )
{
  if ( ! std::isfinite( db ) ) return -1;
  if ( db < globals::psd_db_min || db > globals::psd_db_max ) return -1;
  // last bin is closed on the right
  if ( db == globals::psd_db_max ) return globals::psd_db_bins - 1;
  const int b = floor( db - globals::psd_db_min );
  return b < globals::psd_db_bins ? b : globals::psd_db_bins - 1;
}


void psd_t::smooth( const std::vector<double> & frequencies ,
		    const std::vector<double> & db ,
		    psd_result_t * res )
{

  res->db_bin_edges = db_grid();
  res->smoothed_frequencies.clear();
  res->smoothed_psd_db.clear();

  //
  // (period, dB) for positive frequencies, by ascending period
  //

  std::vector<std::pair<double,double> > pts;
  for (int i=0;i<frequencies.size();i++)
    if ( frequencies[i] > 0 )
      pts.push_back( std::make_pair( 1.0 / frequencies[i] , db[i] ) );

  if ( pts.size() == 0 )
    {
      Helper::warn( "no positive frequencies, octave smoothing skipped" );
      res->distribution = Eigen::MatrixXd::Zero( 0 , globals::psd_db_bins );
      return;
    }

  std::sort( pts.begin() , pts.end() , by_period );

  period_bins_t bins = dsptools::period_bins( 1.0 , 0.125 , pts.front().first , pts.back().first );

  const int nb = bins.size();

  // row per bin, in period order
  std::vector<double> mean_db( nb , std::numeric_limits<double>::quiet_NaN() );
  Eigen::MatrixXd counts = Eigen::MatrixXd::Zero( nb , globals::psd_db_bins );

  for (int b=0;b<nb;b++)
    {
      const double lwr = bins.left[b];
      const double upr = bins.right[b];

      // first point with period >= lwr
      std::vector<std::pair<double,double> >::const_iterator pp
	= std::lower_bound( pts.begin() , pts.end() , std::make_pair( lwr , 0.0 ) , by_period );

      double sum = 0;
      int cnt = 0;

      while ( pp != pts.end() && pp->first <= upr )
	{
	  if ( std::isfinite( pp->second ) )
	    {
	      sum += pp->second;
	      ++cnt;
	      const int k = db_bin( pp->second );
	      if ( k != -1 ) counts( b , k ) += 1;
	    }
	  ++pp;
	}

      if ( cnt > 0 ) mean_db[b] = sum / (double)cnt;
    }

  //
  // re-order by ascending frequency (1/center)
  //

  std::vector<std::pair<double,int> > order( nb );
  for (int b=0;b<nb;b++) order[b] = std::make_pair( 1.0 / bins.center[b] , b );
  std::sort( order.begin() , order.end() );

  res->distribution = Eigen::MatrixXd::Zero( nb , globals::psd_db_bins );

  for (int i=0;i<nb;i++)
    {
      const int b = order[i].second;
      res->smoothed_frequencies.push_back( order[i].first );
      res->smoothed_psd_db.push_back( mean_db[b] );
      res->distribution.row( i ) = counts.row( b );
    }

}
