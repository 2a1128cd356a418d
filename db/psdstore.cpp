
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

#include "db/psdstore.h"
#include "db/sqlwrap.h"

#include "helper/logger.h"
#include "defs/defs.h"

#include <dirent.h>
#include <cstdio>
#include <algorithm>

extern logger_t logger;

const int psd_store_t::format_version = 1;


// all rows of one artifact, inside the caller's transaction
static void insert_rows( SQL & sql , const psd_result_t & res )
{

  //
  // raw and smoothed curves; NaN stored as NULL
  //

  sqlite3_stmt * s = sql.prepare( "INSERT INTO psd ( idx , frequency , psd ) VALUES ( :idx , :f , :p ) ; " );
  for (int i=0;i<res.frequencies.size();i++)
    {
      sql.bind_int( s , ":idx" , i );
      sql.bind_double( s , ":f" , res.frequencies[i] );
      sql.bind_real( s , ":p" , res.psd_db[i] );
      sql.step( s );
      sql.reset( s );
    }
  sql.finalise( s );

  s = sql.prepare( "INSERT INTO smoothed ( idx , frequency , psd ) VALUES ( :idx , :f , :p ) ; " );
  for (int i=0;i<res.smoothed_frequencies.size();i++)
    {
      sql.bind_int( s , ":idx" , i );
      sql.bind_double( s , ":f" , res.smoothed_frequencies[i] );
      sql.bind_real( s , ":p" , res.smoothed_psd_db[i] );
      sql.step( s );
      sql.reset( s );
    }
  sql.finalise( s );

  //
  // distribution: non-zero cells
  //

  s = sql.prepare( "INSERT INTO distribution ( fbin , dbbin , count ) VALUES ( :r , :c , :n ) ; " );
  for (int r=0;r<res.distribution.rows();r++)
    for (int c=0;c<res.distribution.cols();c++)
      {
	if ( res.distribution(r,c) == 0 ) continue;
	sql.bind_int( s , ":r" , r );
	sql.bind_int( s , ":c" , c );
	sql.bind_double( s , ":n" , res.distribution(r,c) );
	sql.step( s );
	sql.reset( s );
      }
  sql.finalise( s );

  s = sql.prepare( "INSERT INTO dbgrid ( idx , db ) VALUES ( :idx , :db ) ; " );
  for (int i=0;i<res.db_bin_edges.size();i++)
    {
      sql.bind_int( s , ":idx" , i );
      sql.bind_double( s , ":db" , res.db_bin_edges[i] );
      sql.step( s );
      sql.reset( s );
    }
  sql.finalise( s );

  //
  // metadata: settings plus segment details
  //

  std::map<std::string,std::string> meta;

  param_t cfg = res.config.to_param();
  std::set<std::string> keys = cfg.keys();
  std::set<std::string>::const_iterator kk = keys.begin();
  while ( kk != keys.end() )
    {
      meta[ *kk ] = cfg.value( *kk );
      ++kk;
    }

  meta[ "instrument" ] = globals::instrument( res.instrument );
  meta[ "sample-rate" ] = Helper::dbl2str( res.sample_rate );
  meta[ "start-time" ] = res.start_time.as_compact_string();
  meta[ "db-bins" ] = Helper::int2str( (int)res.db_bin_edges.size() );
  meta[ "smoothed-bins" ] = Helper::int2str( (int)res.smoothed_frequencies.size() );
  meta[ "nan-points" ] = Helper::int2str( res.nan_points );
  meta[ "format-version" ] = Helper::int2str( psd_store_t::format_version );
  meta[ "seisnoise-version" ] = globals::version;

  s = sql.prepare( "INSERT INTO metadata ( key , value ) VALUES ( :k , :v ) ; " );
  std::map<std::string,std::string>::const_iterator mm = meta.begin();
  while ( mm != meta.end() )
    {
      sql.bind_text( s , ":k" , mm->first );
      sql.bind_text( s , ":v" , mm->second );
      sql.step( s );
      sql.reset( s );
      ++mm;
    }
  sql.finalise( s );
}


void psd_store_t::write( const std::string & filename , const psd_result_t & res )
{

  // start afresh
  if ( Helper::fileExists( filename ) )
    if ( std::remove( filename.c_str() ) != 0 )
      Helper::halt( "could not overwrite " + filename );

  SQL sql;
  sql.open( filename );
  sql.synchronous( false );

  sql.query( "CREATE TABLE psd( idx INTEGER PRIMARY KEY , frequency REAL NOT NULL , psd REAL );" );
  sql.query( "CREATE TABLE smoothed( idx INTEGER PRIMARY KEY , frequency REAL NOT NULL , psd REAL );" );
  sql.query( "CREATE TABLE distribution( fbin INTEGER NOT NULL , dbbin INTEGER NOT NULL , count REAL NOT NULL , PRIMARY KEY( fbin , dbbin ) );" );
  sql.query( "CREATE TABLE dbgrid( idx INTEGER PRIMARY KEY , db REAL NOT NULL );" );
  sql.query( "CREATE TABLE metadata( key TEXT PRIMARY KEY , value TEXT );" );

  if ( ! sql.table_exists( "metadata" ) )
    Helper::halt( "could not create tables in " + filename );

  sql.begin();

  try
    {
      insert_rows( sql , res );
      sql.commit();
    }
  catch ( const seisnoise_error_t & )
    {
      sql.rollback();
      throw;
    }

  sql.close();

  logger << "  wrote " << filename << "\n";
}


std::map<std::string,std::string> psd_store_t::metadata( const std::string & filename )
{
  if ( ! Helper::fileExists( filename ) )
    Helper::halt( "could not find " + filename );

  SQL sql;
  sql.open( filename , true );

  if ( ! sql.table_exists( "metadata" ) )
    Helper::halt( filename + " is not a PSD file (no metadata)" );

  std::map<std::string,std::string> meta;
  sqlite3_stmt * s = sql.prepare( "SELECT key , value FROM metadata ; " );
  while ( sql.step( s ) )
    meta[ sql.get_text( s , 0 ) ] = sql.get_text( s , 1 );
  sql.finalise( s );
  return meta;
}


psd_result_t psd_store_t::read( const std::string & filename )
{

  if ( ! Helper::fileExists( filename ) )
    Helper::halt( "could not find " + filename );

  SQL sql;
  sql.open( filename , true );

  const char * tables[] = { "psd" , "smoothed" , "distribution" , "dbgrid" , "metadata" };
  for (int t=0;t<5;t++)
    if ( ! sql.table_exists( tables[t] ) )
      Helper::halt( filename + " is not a PSD file (no table " + tables[t] + ")" );

  psd_result_t res;

  sqlite3_stmt * s = sql.prepare( "SELECT frequency , psd FROM psd ORDER BY idx ; " );
  while ( sql.step( s ) )
    {
      res.frequencies.push_back( sql.get_double( s , 0 ) );
      res.psd_db.push_back( sql.get_real( s , 1 ) );
    }
  sql.finalise( s );

  s = sql.prepare( "SELECT frequency , psd FROM smoothed ORDER BY idx ; " );
  while ( sql.step( s ) )
    {
      res.smoothed_frequencies.push_back( sql.get_double( s , 0 ) );
      res.smoothed_psd_db.push_back( sql.get_real( s , 1 ) );
    }
  sql.finalise( s );

  s = sql.prepare( "SELECT db FROM dbgrid ORDER BY idx ; " );
  while ( sql.step( s ) )
    res.db_bin_edges.push_back( sql.get_double( s , 0 ) );
  sql.finalise( s );

  const int nr = res.smoothed_frequencies.size();
  const int nc = res.db_bin_edges.size();

  res.distribution = Eigen::MatrixXd::Zero( nr , nc );

  s = sql.prepare( "SELECT fbin , dbbin , count FROM distribution ; " );
  while ( sql.step( s ) )
    {
      const int r = sql.get_int( s , 0 );
      const int c = sql.get_int( s , 1 );
      if ( r < 0 || r >= nr || c < 0 || c >= nc )
	{
	  sql.finalise( s );
	  Helper::halt( filename + " has a distribution cell outside its grid" );
	}
      res.distribution( r , c ) = sql.get_double( s , 2 );
    }
  sql.finalise( s );

  sql.close();

  //
  // settings and segment details
  //

  std::map<std::string,std::string> meta = metadata( filename );

  param_t cfg;
  param_t defaults = psd_config_t().to_param();
  std::set<std::string> keys = defaults.keys();
  std::set<std::string>::const_iterator kk = keys.begin();
  while ( kk != keys.end() )
    {
      if ( meta.find( *kk ) != meta.end() )
	cfg.add( *kk , meta[ *kk ] );
      ++kk;
    }
  res.config = psd_config_t::from_param( cfg );

  if ( meta.find( "instrument" ) != meta.end() )
    if ( ! globals::instrument( meta[ "instrument" ] , &res.instrument ) )
      Helper::halt( filename + " has a bad instrument type: " + meta[ "instrument" ] );

  if ( meta.find( "sample-rate" ) != meta.end() )
    if ( ! Helper::str2dbl( meta[ "sample-rate" ] , &res.sample_rate ) )
      Helper::halt( filename + " has a bad sample rate: " + meta[ "sample-rate" ] );

  if ( meta.find( "start-time" ) != meta.end() )
    if ( ! datetime_t::parse( meta[ "start-time" ] , &res.start_time ) )
      Helper::halt( filename + " has a bad start time: " + meta[ "start-time" ] );

  if ( meta.find( "nan-points" ) != meta.end() )
    Helper::str2int( meta[ "nan-points" ] , &res.nan_points );

  return res;
}


std::string psd_store_t::filename( const std::string & station ,
				   const std::string & component ,
				   const datetime_t & start ,
				   const std::string & tag )
{
  if ( station.find( '.' ) != std::string::npos || component.find( '.' ) != std::string::npos )
    throw invalid_config_t( "station and component codes cannot contain '.'" );

  std::string f = station + "." + component + "." + start.as_compact_string();
  if ( tag != "" ) f += "_" + tag;
  return f + globals::psd_suffix;
}


bool psd_store_t::timestamp( const std::string & filename , datetime_t * dt )
{
  // base name only
  std::string f = filename;
  const std::size_t slash = f.find_last_of( "/" );
  if ( slash != std::string::npos ) f = f.substr( slash + 1 );

  std::vector<std::string> tok = Helper::parse( f , "." );
  if ( tok.size() < 3 ) return false;

  std::string t = tok[2];
  const std::size_t us = t.find( '_' );
  if ( us != std::string::npos ) t = t.substr( 0 , us );

  if ( t.size() != 14 ) return false;

  return datetime_t::parse( t , dt );
}


std::vector<std::string> psd_store_t::scan( const std::string & folder0 ,
					    const datetime_t * start ,
					    const datetime_t * end )
{

  std::string folder = folder0;
  if ( folder.size() == 0 ) folder = ".";
  if ( folder[ folder.size() - 1 ] != '/' ) folder += "/";

  if ( ! Helper::is_folder( folder ) )
    Helper::halt( "could not open folder " + folder );

  std::vector<std::string> folders;
  folders.push_back( folder );
  if ( Helper::is_folder( folder + globals::psd_folder ) )
    folders.push_back( folder + globals::psd_folder + "/" );

  const std::string & sfx = globals::psd_suffix;

  std::vector<std::pair<int64_t,std::string> > found;

  for (int i=0;i<folders.size();i++)
    {
      DIR * dir;
      struct dirent *ent;
      if ( (dir = opendir ( folders[i].c_str() ) ) == NULL )
	Helper::halt( "could not open folder " + folders[i] );

      while ((ent = readdir (dir)) != NULL)
	{
	  std::string fname = ent->d_name;

	  if ( fname.size() <= sfx.size() ) continue;
	  if ( fname.substr( fname.size() - sfx.size() ) != sfx ) continue;

	  datetime_t dt;
	  if ( ! timestamp( fname , &dt ) )
	    {
	      if ( globals::verbose )
		logger << "  skipping " << fname << " (no timestamp in name)\n";
	      continue;
	    }

	  if ( start != NULL && dt < *start ) continue;
	  if ( end != NULL && *end < dt ) continue;

	  found.push_back( std::make_pair( dt.seconds() , folders[i] + fname ) );
	}
      closedir (dir);
    }

  std::sort( found.begin() , found.end() );

  std::vector<std::string> files;
  for (int i=0;i<found.size();i++) files.push_back( found[i].second );

  logger << "  found " << files.size() << " PSD file(s) in " << folder << "\n";

  return files;
}
