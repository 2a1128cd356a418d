
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

#include "pdf/pdf.h"

#include "spectral/psd.h"
#include "db/psdstore.h"
#include "helper/logger.h"

#include <cmath>
#include <limits>
#include <map>
#include <algorithm>

extern logger_t logger;


static bool same_values( const std::vector<double> & a , const std::vector<double> & b )
{
  if ( a.size() != b.size() ) return false;
  for (int i=0;i<a.size();i++)
    if ( ! Helper::similar( a[i] , b[i] , 1e-9 ) ) return false;
  return true;
}


std::string pdf_schema_t::mismatch( const pdf_schema_t & rhs ) const
{
  if ( rows != rhs.rows )
    return "expecting " + Helper::int2str( rows ) + " frequency bins, found " + Helper::int2str( rhs.rows );

  if ( ! same_values( db_grid , rhs.db_grid ) )
    return "dB grid differs";

  // only compared when both sides know their frequencies
  if ( frequencies.size() != 0 && rhs.frequencies.size() != 0
       && ! same_values( frequencies , rhs.frequencies ) )
    return "smoothed frequencies differ";

  return "";
}


pdf_input_t pdf_input_t::from_result( const psd_result_t & res , const std::string & source )
{
  return pdf_input_t( res.distribution , res.db_bin_edges , res.start_time , source , res.smoothed_frequencies );
}



//
// pdf_accumulator_t
//

pdf_accumulator_t::pdf_accumulator_t( const pdf_schema_t & s ) : sch( s )
{
  total = Eigen::MatrixXd::Zero( sch.rows , sch.cols() );
}


void pdf_accumulator_t::warn( const std::string & source , const std::string & msg )
{
  warns.push_back( pdf_warning_t( source , msg ) );
  Helper::warn( ( source != "" ? source + ": " : "" ) + msg );
}


bool pdf_accumulator_t::add( const pdf_input_t & input )
{

  const Eigen::MatrixXd & d = input.distribution;

  //
  // malformed?
  //

  if ( d.rows() == 0 || d.cols() == 0 )
    {
      warn( input.source , "empty distribution skipped" );
      return false;
    }

  if ( d.cols() != input.db_grid.size() )
    {
      warn( input.source , "distribution has " + Helper::int2str( (int)d.cols() )
	    + " dB bins but its grid has " + Helper::int2str( (int)input.db_grid.size() ) + ", skipped" );
      return false;
    }

  if ( input.frequencies.size() != 0 && input.frequencies.size() != d.rows() )
    {
      warn( input.source , "distribution rows do not match its frequencies, skipped" );
      return false;
    }

  if ( ! d.allFinite() || ( d.array() < 0 ).any() )
    {
      warn( input.source , "distribution has negative or non-finite counts, skipped" );
      return false;
    }

  //
  // compatible?
  //

  pdf_schema_t s( d.rows() , input.db_grid , input.frequencies );

  if ( sch.empty() )
    {
      sch = s;
      total = Eigen::MatrixXd::Zero( sch.rows , sch.cols() );
    }
  else
    {
      const std::string why = sch.mismatch( s );
      if ( why != "" )
	{
	  warn( input.source , "incompatible distribution skipped (" + why + ")" );
	  return false;
	}
      if ( sch.frequencies.size() == 0 ) sch.frequencies = input.frequencies;
    }

  total += d;
  times.push_back( input.time );
  return true;
}


void pdf_accumulator_t::merge( const pdf_accumulator_t & other )
{

  for (int i=0;i<other.warns.size();i++)
    warns.push_back( other.warns[i] );

  if ( other.times.size() == 0 ) return;

  if ( sch.empty() )
    {
      sch = other.sch;
      total = Eigen::MatrixXd::Zero( sch.rows , sch.cols() );
    }
  else
    {
      const std::string why = sch.mismatch( other.sch );
      if ( why != "" )
	{
	  warn( "" , "cannot merge " + Helper::int2str( (int)other.times.size() )
		+ " distribution(s) (" + why + ")" );
	  return;
	}
      if ( sch.frequencies.size() == 0 ) sch.frequencies = other.sch.frequencies;
    }

  total += other.total;
  times.insert( times.end() , other.times.begin() , other.times.end() );
}


Eigen::MatrixXd pdf_accumulator_t::probability() const
{
  Eigen::MatrixXd p = total;
  for (int r=0;r<p.rows();r++)
    {
      double rt = p.row(r).sum();
      // empty rows stay zero
      if ( rt == 0 ) rt = 1;
      p.row(r) /= rt;
    }
  return p;
}


pdf_result_t pdf_accumulator_t::result( const std::string & group ) const
{
  pdf_result_t res;
  res.group = group;
  res.counts = total;
  res.probability = probability();
  res.frequencies = sch.frequencies;
  res.db_grid = sch.db_grid;
  res.used = times.size();
  res.times = times;
  std::sort( res.times.begin() , res.times.end() );
  res.warnings = warns;

  // zero usable inputs: all-zero, on the default grid if none is known
  if ( res.used == 0 && sch.empty() )
    {
      res.db_grid = psd_t::db_grid();
      res.counts = Eigen::MatrixXd::Zero( 0 , res.db_grid.size() );
      res.probability = res.counts;
    }

  return res;
}



//
// pdf_t
//

static bool in_window( const datetime_t & t , const datetime_t * start , const datetime_t * end )
{
  if ( start != NULL && t < *start ) return false;
  if ( end != NULL && *end < t ) return false;
  return true;
}


pdf_result_t pdf_t::aggregate( const std::string & group ,
			       const std::vector<pdf_input_t> & inputs ,
			       const datetime_t * start ,
			       const datetime_t * end ,
			       const pdf_schema_t * schema )
{

  pdf_accumulator_t acc = schema != NULL ? pdf_accumulator_t( *schema ) : pdf_accumulator_t();

  int outside = 0;

  for (int i=0;i<inputs.size();i++)
    {
      if ( ! in_window( inputs[i].time , start , end ) )
	{
	  ++outside;
	  continue;
	}
      acc.add( inputs[i] );
    }

  pdf_result_t res = acc.result( group );

  if ( res.used == 0 )
    {
      res.warnings.push_back( pdf_warning_t( group , "no usable distributions" ) );
      Helper::warn( ( group != "" ? group + ": " : "" ) + std::string( "no usable distributions" ) );
    }

  logger << "  aggregated " << res.used << " of " << inputs.size() << " distribution(s)";
  if ( group != "" ) logger << " for " << group;
  if ( outside ) logger << " (" << outside << " outside the time window)";
  logger << "\n";

  return res;
}


pdf_result_t pdf_t::aggregate_files( const std::string & group ,
				     const std::vector<std::string> & files ,
				     const datetime_t * start ,
				     const datetime_t * end )
{

  std::vector<pdf_input_t> inputs;
  std::vector<pdf_warning_t> unreadable;

  for (int i=0;i<files.size();i++)
    {

      datetime_t t;
      const bool named = psd_store_t::timestamp( files[i] , &t );

      // skip without opening if the name says it is out of range
      if ( named && ! in_window( t , start , end ) ) continue;

      try
	{
	  psd_result_t res = psd_store_t::read( files[i] );
	  pdf_input_t input = pdf_input_t::from_result( res , files[i] );
	  if ( named ) input.time = t;
	  inputs.push_back( input );
	}
      catch ( const seisnoise_error_t & e )
	{
	  unreadable.push_back( pdf_warning_t( files[i] , e.what() ) );
	  Helper::warn( files[i] + ": " + e.what() );
	}
    }

  pdf_result_t res = aggregate( group , inputs , start , end );

  res.warnings.insert( res.warnings.begin() , unreadable.begin() , unreadable.end() );

  return res;
}


//
// time-ordered series
//

struct dated_file_t
{
  datetime_t time;
  psd_result_t res;
  std::string file;
  bool operator<( const dated_file_t & rhs ) const
  {
    if ( time != rhs.time ) return time < rhs.time;
    return file < rhs.file;
  }
};


static std::vector<dated_file_t> load_dated( const std::vector<std::string> & files ,
					     std::vector<pdf_warning_t> * warnings )
{
  std::vector<dated_file_t> d;
  for (int i=0;i<files.size();i++)
    {
      try
	{
	  dated_file_t df;
	  df.file = files[i];
	  df.res = psd_store_t::read( files[i] );
	  if ( ! psd_store_t::timestamp( files[i] , &df.time ) )
	    df.time = df.res.start_time;
	  d.push_back( df );
	}
      catch ( const seisnoise_error_t & e )
	{
	  warnings->push_back( pdf_warning_t( files[i] , e.what() ) );
	  Helper::warn( files[i] + ": " + e.what() );
	}
    }
  std::sort( d.begin() , d.end() );
  return d;
}


// a non-empty axis with one value per point
static bool has_curve( const std::vector<double> & f , const std::vector<double> & p )
{
  return f.size() != 0 && p.size() == f.size();
}

static void skip( const std::string & file , const std::string & msg ,
		  std::vector<pdf_warning_t> * warnings )
{
  warnings->push_back( pdf_warning_t( file , msg ) );
  Helper::warn( file + ": " + msg );
}


psd_lines_t pdf_t::psd_lines( const std::vector<std::string> & files , int hours )
{

  if ( hours < 1 ) throw invalid_config_t( "hour group length must be positive" );

  psd_lines_t ret;

  std::vector<dated_file_t> d = load_dated( files , &ret.warnings );

  // frequencies fixed by the first file
  std::vector<dated_file_t> keep;
  for (int i=0;i<d.size();i++)
    {
      if ( ! has_curve( d[i].res.frequencies , d[i].res.psd_db ) )
	{
	  skip( d[i].file , "no PSD curve, skipped" , &ret.warnings );
	  continue;
	}

      if ( ret.frequencies.size() == 0 )
	ret.frequencies = d[i].res.frequencies;
      else if ( ! same_values( ret.frequencies , d[i].res.frequencies ) )
	{
	  skip( d[i].file , "frequencies differ from the first file, skipped" , &ret.warnings );
	  continue;
	}
      keep.push_back( d[i] );
    }

  if ( hours == 1 )
    {
      for (int i=0;i<keep.size();i++)
	{
	  psd_line_t line;
	  line.time = keep[i].time;
	  line.label = keep[i].time.as_string().substr( 0 , 16 );
	  line.psd = keep[i].res.psd_db;
	  line.n = 1;
	  ret.lines.push_back( line );
	}
      return ret;
    }

  //
  // average within hour blocks (finite values only)
  //

  const int nf = ret.frequencies.size();

  std::map<int64_t,std::vector<int> > blocks;
  for (int i=0;i<keep.size();i++)
    blocks[ keep[i].time.floor_hours( hours ).seconds() ].push_back( i );

  std::map<int64_t,std::vector<int> >::const_iterator bb = blocks.begin();
  while ( bb != blocks.end() )
    {
      psd_line_t line;
      line.time = datetime_t::from_seconds( bb->first );
      line.label = line.time.as_string().substr( 0 , 16 );
      line.n = bb->second.size();
      line.psd.resize( nf );

      for (int f=0;f<nf;f++)
	{
	  double s = 0;
	  int c = 0;
	  for (int j=0;j<bb->second.size();j++)
	    {
	      const double v = keep[ bb->second[j] ].res.psd_db[f];
	      if ( std::isfinite( v ) ) { s += v; ++c; }
	    }
	  line.psd[f] = c ? s / (double)c : std::numeric_limits<double>::quiet_NaN();
	}

      ret.lines.push_back( line );
      ++bb;
    }

  return ret;
}


timefreq_t pdf_t::timefreq( const std::vector<std::string> & files )
{

  timefreq_t ret;

  std::vector<dated_file_t> d = load_dated( files , &ret.warnings );

  std::vector<int> keep;
  for (int i=0;i<d.size();i++)
    {
      if ( ! has_curve( d[i].res.smoothed_frequencies , d[i].res.smoothed_psd_db ) )
	{
	  skip( d[i].file , "no smoothed PSD curve, skipped" , &ret.warnings );
	  continue;
	}

      if ( ret.frequencies.size() == 0 )
	ret.frequencies = d[i].res.smoothed_frequencies;
      else if ( ! same_values( ret.frequencies , d[i].res.smoothed_frequencies ) )
	{
	  skip( d[i].file , "smoothed frequencies differ from the first file, skipped" , &ret.warnings );
	  continue;
	}
      keep.push_back( i );
    }

  ret.psd = Eigen::MatrixXd::Zero( keep.size() , ret.frequencies.size() );

  for (int r=0;r<keep.size();r++)
    {
      const dated_file_t & df = d[ keep[r] ];
      ret.times.push_back( df.time );
      for (int c=0;c<ret.frequencies.size();c++)
	ret.psd( r , c ) = df.res.smoothed_psd_db[c];
    }

  return ret;
}
