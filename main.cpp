
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

#include "main.h"
#include "seisnoise.h"

#include <iostream>
#include <iomanip>
#include <sstream>
#include <fstream>
#include <cstring>
#include <cstdlib>
#include <new>

extern globals global;

extern logger_t logger;


void NoMem()
{
  std::cerr << "*****************************************************\n"
	    << "* seisnoise could not allocate enough memory: quitting\n"
	    << "*****************************************************\n";
  std::exit(1);
}


std::string seisnoise_version()
{
  std::stringstream ss;
  ss << "seisnoise " << globals::version << " (" << globals::date << ")\n";
  return ss.str();
}


int main(int argc , char ** argv )
{

  std::set_new_handler(NoMem);

  global.init_defs();

  //
  // display version info?
  //

  if ( argc >= 2 && ( strcmp( argv[1] ,"-v" ) == 0 || strcmp( argv[1] ,"--version" ) == 0 ) )
    {
      global.api();
      std::cerr << seisnoise_version();
      std::cerr << "Eigen library v"
		<< EIGEN_WORLD_VERSION << "."
		<< EIGEN_MAJOR_VERSION << "."
		<< EIGEN_MINOR_VERSION << "\n";
      std::cerr << "sqlite v"
		<< SQL::library_version() << "\n";
      std::cerr << "FFTW " << fftw_version << "\n";
      return 0;
    }

  //
  // primary usage
  //

  const std::string usage_msg = seisnoise_version() +
    "usage: seisnoise psd <samples.txt> [more.txt ...] sr=<Hz> sens=<counts/unit> inst=velocity|acceleration\n"
    "                     [time=YYYYmmddHHMMSS] [station=S] [component=C] [out=<file>|outdir=<folder>]\n"
    "                     [param=<file>] [save-param=<file>] [filter=T filter-type=highpass|bandpass\n"
    "                     cutoff=<Hz> low=<Hz> high=<Hz>] [window-size=<s>] [overlap=<0-1>]\n"
    "                     [window=hann|hamming|blackman|bartlett|flattop|boxcar|tukey] [fmin=<Hz>] [fmax=<Hz>]\n"
    "                     [remove-response=T damping=<x> natural-period=<s>]\n"
    "       seisnoise pdf <folder> [start=<time>] [end=<time>] [group=<key>]\n"
    "       seisnoise lines <folder> [hours=<N>] [start=<time>] [end=<time>]\n"
    "       seisnoise timefreq <folder> [start=<time>] [end=<time>]\n"
    "       seisnoise nm [nm=<file>]\n"
    "       seisnoise bins <min-period> <max-period> [width=1] [step=0.125]\n"
    "common options: log=<file> silent verbose\n";

  if ( argc < 2 )
    {
      std::cerr << usage_msg;
      return 1;
    }

  const std::string cmd = Helper::toupper( argv[1] );

  std::vector<std::string> args;

  try
    {

      param_t param = parse_cmdline( argc , argv , 2 , &args );

      if ( param.yesno( "silent" ) ) globals::silent = true;
      if ( param.yesno( "verbose" ) ) globals::verbose = true;
      if ( param.has( "log" ) ) logger.write_log( param.value( "log" ) );
      if ( param.has( "nm" ) ) globals::noise_model_file = param.value( "nm" );

      logger.banner( globals::version , globals::date );

      int rc = 0;

      if      ( cmd == "PSD" )      rc = proc_psd( args , param );
      else if ( cmd == "PDF" )      rc = proc_pdf( args , param );
      else if ( cmd == "LINES" )    rc = proc_lines( args , param );
      else if ( cmd == "TIMEFREQ" ) rc = proc_timefreq( args , param );
      else if ( cmd == "NM" )       rc = proc_noise_models( args , param );
      else if ( cmd == "BINS" )     rc = proc_bins( args , param );
      else
	{
	  logger << "  unrecognized command: " << argv[1] << "\n\n";
	  std::cerr << usage_msg;
	  return 1;
	}

      logger.finish();

      return rc;

    }
  catch ( const seisnoise_error_t & e )
    {
      logger.warning( e.what() );
      std::cerr << "error : " << e.what() << "\n";
      return 1;
    }

}


param_t parse_cmdline( int argc , char ** argv , int first , std::vector<std::string> * args )
{
  param_t param;
  for (int i=first;i<argc;i++)
    {
      const std::string t = argv[i];
      if ( t.find( '=' ) != std::string::npos ) param.parse( t );
      else if ( t == "silent" || t == "verbose" ) param.parse( t );
      else args->push_back( t );
    }
  return param;
}


param_t merge_param_file( const param_t & cmdline )
{

  if ( ! cmdline.has( "param" ) ) return cmdline;

  param_t file;
  file.read_file( cmdline.value( "param" ) );

  param_t merged = cmdline;
  std::set<std::string> keys = file.keys();
  std::set<std::string>::const_iterator kk = keys.begin();
  while ( kk != keys.end() )
    {
      if ( ! cmdline.has( *kk ) )
	merged.add( *kk , file.value( *kk ) );
      ++kk;
    }
  return merged;
}


std::vector<double> read_samples( const std::string & filename )
{

  if ( ! Helper::fileExists( filename ) )
    throw invalid_input_t( "could not find " + filename );

  std::ifstream IN1( filename.c_str() , std::ios::in );

  std::vector<double> x;
  int line = 0;

  while ( ! IN1.eof() )
    {
      std::string s;
      Helper::safe_getline( IN1 , s );
      ++line;
      if ( IN1.eof() && s == "" ) break;

      s = Helper::lrtrim( s );
      if ( s == "" || s[0] == '#' ) continue;

      double d;
      if ( ! Helper::str2dbl( s , &d ) )
	throw invalid_input_t( "bad sample value on line " + Helper::int2str( line ) + " of " + filename + ": " + s );
      x.push_back( d );
    }

  IN1.close();

  logger << "  read " << x.size() << " samples from " << filename << "\n";

  return x;
}


//
// psd: one artifact per sample file; failures are per file
//

int proc_psd( const std::vector<std::string> & args , const param_t & cmdline )
{

  if ( args.size() == 0 )
    throw invalid_config_t( "psd requires at least one sample file" );

  const param_t param = merge_param_file( cmdline );

  const psd_config_t config = psd_config_t::from_param( param );

  if ( param.has( "save-param" ) )
    {
      config.to_param().write_file( param.value( "save-param" ) );
      logger << "  wrote settings to " << param.value( "save-param" ) << "\n";
    }

  const double sr = param.requires_dbl( "sr" );
  const double sens = param.has( "sens" ) ? param.requires_dbl( "sens" ) : 1.0;

  instrument_t inst;
  if ( ! globals::instrument( param.requires( "inst" ) , &inst ) )
    throw invalid_config_t( "inst must be velocity or acceleration" );

  datetime_t time;
  const bool fixed_time = param.has( "time" );
  if ( fixed_time && ! datetime_t::parse( param.value( "time" ) , &time ) )
    throw invalid_config_t( "could not parse time=" + param.value( "time" ) );

  if ( param.has( "out" ) && args.size() > 1 )
    throw invalid_config_t( "out= can only be used with a single sample file, use outdir=" );

  std::string outdir = param.has( "outdir" ) ? param.value( "outdir" ) : "";
  if ( outdir != "" && outdir[ outdir.size() - 1 ] != '/' ) outdir += "/";

  psd_t psd( config );

  int failed = 0;

  for (int i=0;i<args.size();i++)
    {
      try
	{
	  //
	  // station/component/time from a NET-style name (STA.CMP.YYYYmmddHHMMSS...)
	  //

	  std::string base = args[i];
	  const std::size_t slash = base.find_last_of( "/" );
	  if ( slash != std::string::npos ) base = base.substr( slash + 1 );
	  std::vector<std::string> tok = Helper::parse( base , "." );

	  datetime_t t = time;
	  if ( ! fixed_time && ! psd_store_t::timestamp( base , &t ) )
	    throw invalid_config_t( "no time= given and none in the name of " + args[i] );

	  const std::string station = param.has( "station" ) ? param.value( "station" ) : ( tok.size() >= 3 ? tok[0] : "STA" );
	  const std::string component = param.has( "component" ) ? param.value( "component" ) : ( tok.size() >= 3 ? tok[1] : "CMP" );

	  waveform_t segment( read_samples( args[i] ) , sr , sens , inst , t );

	  const psd_result_t & res = psd.calculate( segment );

	  const std::string out = param.has( "out" )
	    ? param.value( "out" )
	    : outdir + psd_store_t::filename( station , component , t );

	  psd_store_t::write( out , res );

	  // smoothed curve to stdout
	  for (int j=0;j<res.smoothed_frequencies.size();j++)
	    std::cout << base << "\t"
		      << res.smoothed_frequencies[j] << "\t"
		      << res.smoothed_psd_db[j] << "\n";
	}
      catch ( const seisnoise_error_t & e )
	{
	  ++failed;
	  logger.warning( args[i] + ": " + e.what() );
	}
    }

  if ( failed )
    logger << "  " << failed << " of " << args.size() << " file(s) failed\n";

  return failed == args.size() ? 1 : 0;
}


//
// time window from start=/end=
//

static void time_window( const param_t & param , datetime_t * start , datetime_t * end , bool * has_start , bool * has_end )
{
  *has_start = param.has( "start" );
  *has_end = param.has( "end" );
  if ( *has_start && ! datetime_t::parse( param.value( "start" ) , start ) )
    throw invalid_config_t( "could not parse start=" + param.value( "start" ) );
  if ( *has_end && ! datetime_t::parse( param.value( "end" ) , end ) )
    throw invalid_config_t( "could not parse end=" + param.value( "end" ) );
  if ( *has_start && *has_end && *end < *start )
    throw invalid_config_t( "end= is before start=" );
}


int proc_pdf( const std::vector<std::string> & args , const param_t & param )
{
  if ( args.size() != 1 ) throw invalid_config_t( "pdf requires a single folder" );

  datetime_t start , end;
  bool has_start , has_end;
  time_window( param , &start , &end , &has_start , &has_end );

  std::vector<std::string> files = psd_store_t::scan( args[0] ,
						      has_start ? &start : NULL ,
						      has_end ? &end : NULL );

  const std::string group = param.has( "group" ) ? param.value( "group" ) : args[0];

  pdf_result_t pdf = pdf_t::aggregate_files( group , files ,
					     has_start ? &start : NULL ,
					     has_end ? &end : NULL );

  logger << "  " << pdf.used << " distribution(s) used, " << pdf.warnings.size() << " warning(s)\n";

  std::cout << "F\tDB\tP\n";
  for (int r=0;r<pdf.probability.rows();r++)
    for (int c=0;c<pdf.probability.cols();c++)
      if ( pdf.probability(r,c) > 0 )
	std::cout << ( r < pdf.frequencies.size() ? pdf.frequencies[r] : r ) << "\t"
		  << pdf.db_grid[c] << "\t"
		  << pdf.probability(r,c) << "\n";

  return pdf.used > 0 ? 0 : 1;
}


int proc_lines( const std::vector<std::string> & args , const param_t & param )
{
  if ( args.size() != 1 ) throw invalid_config_t( "lines requires a single folder" );

  datetime_t start , end;
  bool has_start , has_end;
  time_window( param , &start , &end , &has_start , &has_end );

  const int hours = param.has( "hours" ) ? param.requires_int( "hours" ) : 1;

  std::vector<std::string> files = psd_store_t::scan( args[0] ,
						      has_start ? &start : NULL ,
						      has_end ? &end : NULL );

  psd_lines_t lines = pdf_t::psd_lines( files , hours );

  std::cout << "TIME\tN\tF\tPSD\n";
  for (int i=0;i<lines.lines.size();i++)
    for (int f=0;f<lines.frequencies.size();f++)
      std::cout << lines.lines[i].label << "\t"
		<< lines.lines[i].n << "\t"
		<< lines.frequencies[f] << "\t"
		<< lines.lines[i].psd[f] << "\n";

  return 0;
}


int proc_timefreq( const std::vector<std::string> & args , const param_t & param )
{
  if ( args.size() != 1 ) throw invalid_config_t( "timefreq requires a single folder" );

  datetime_t start , end;
  bool has_start , has_end;
  time_window( param , &start , &end , &has_start , &has_end );

  std::vector<std::string> files = psd_store_t::scan( args[0] ,
						      has_start ? &start : NULL ,
						      has_end ? &end : NULL );

  timefreq_t tf = pdf_t::timefreq( files );

  std::cout << "TIME\tF\tPSD\n";
  for (int r=0;r<tf.times.size();r++)
    for (int c=0;c<tf.frequencies.size();c++)
      std::cout << tf.times[r].as_string() << "\t"
		<< tf.frequencies[c] << "\t"
		<< tf.psd(r,c) << "\n";

  return 0;
}


int proc_noise_models( const std::vector<std::string> & args , const param_t & param )
{
  const noise_model_t & nm = noise_model_t::reference();

  std::cout << "P\tNLNM\tNHNM\n";
  for (int i=0;i<nm.size();i++)
    std::cout << nm.periods[i] << "\t"
	      << nm.low_noise_db[i] << "\t"
	      << nm.high_noise_db[i] << "\n";

  return 0;
}


int proc_bins( const std::vector<std::string> & args , const param_t & param )
{
  if ( args.size() != 2 ) throw invalid_config_t( "bins requires min and max periods" );

  double pmin , pmax;
  if ( ! ( Helper::str2dbl( args[0] , &pmin ) && Helper::str2dbl( args[1] , &pmax ) ) )
    throw invalid_config_t( "bins requires numeric periods" );

  const double width = param.has( "width" ) ? param.requires_dbl( "width" ) : 1.0;
  const double step = param.has( "step" ) ? param.requires_dbl( "step" ) : 0.125;

  period_bins_t bins = dsptools::period_bins( width , step , pmin , pmax );

  std::cout << "BIN\tLEFT\tPLOT_LEFT\tCENTER\tPLOT_RIGHT\tRIGHT\n";
  for (int i=0;i<bins.size();i++)
    std::cout << i+1 << "\t"
	      << bins.left[i] << "\t"
	      << bins.plot_left[i] << "\t"
	      << bins.center[i] << "\t"
	      << bins.plot_right[i] << "\t"
	      << bins.right[i] << "\n";

  return 0;
}
