
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

#ifndef __SEISNOISE_PDF_H__
#define __SEISNOISE_PDF_H__

#include <string>
#include <vector>

#include <Eigen/Dense>

#include "helper/helper.h"

struct psd_result_t;


//
// A skipped input, or an empty aggregation
//

struct pdf_warning_t
{
  pdf_warning_t( const std::string & source , const std::string & message )
    : source( source ) , message( message ) { }

  std::string source;
  std::string message;
};


//
// What every summed distribution must share
//

struct pdf_schema_t
{

  pdf_schema_t() : rows(0) { }

  pdf_schema_t( int rows , const std::vector<double> & db_grid ,
		const std::vector<double> & frequencies = std::vector<double>() )
    : rows( rows ) , db_grid( db_grid ) , frequencies( frequencies ) { }

  int rows;

  // left edges of the dB bins (one per column)
  std::vector<double> db_grid;

  // smoothed frequencies (one per row); empty if not known
  std::vector<double> frequencies;

  int cols() const { return db_grid.size(); }

  bool empty() const { return rows == 0 && db_grid.size() == 0; }

  // empty string if compatible, else the reason
  std::string mismatch( const pdf_schema_t & rhs ) const;

};


//
// One per-segment distribution with its time tag
//

struct pdf_input_t
{

  pdf_input_t() { }

  pdf_input_t( const Eigen::MatrixXd & distribution ,
	       const std::vector<double> & db_grid ,
	       const datetime_t & time ,
	       const std::string & source = "" ,
	       const std::vector<double> & frequencies = std::vector<double>() )
    : distribution( distribution ) , db_grid( db_grid ) , frequencies( frequencies ) ,
      time( time ) , source( source ) { }

  // from an estimator result (time = segment start)
  static pdf_input_t from_result( const psd_result_t & res , const std::string & source = "" );

  Eigen::MatrixXd distribution;
  std::vector<double> db_grid;
  std::vector<double> frequencies;
  datetime_t time;
  std::string source;

};


//
// Normalized distribution for one group
//

struct pdf_result_t
{

  pdf_result_t() : used(0) { }

  std::string group;

  // rows sum to 1, or to 0 where nothing was counted
  Eigen::MatrixXd probability;

  // summed raw counts
  Eigen::MatrixXd counts;

  std::vector<double> frequencies;
  std::vector<double> db_grid;

  // number of distributions summed, and their times
  int used;
  std::vector<datetime_t> times;

  std::vector<pdf_warning_t> warnings;

};


//
// Running element-wise sum; partial accumulators over disjoint subsets
// merge into the same total as one pass over the union
//

class pdf_accumulator_t
{

 public:

  // schema fixed by the first usable input
  pdf_accumulator_t() { }

  // only inputs matching this schema are used
  explicit pdf_accumulator_t( const pdf_schema_t & s );

  // false (with a warning recorded and logged) if the input was skipped
  bool add( const pdf_input_t & input );

  void merge( const pdf_accumulator_t & other );

  Eigen::MatrixXd probability() const;

  pdf_result_t result( const std::string & group = "" ) const;

  const Eigen::MatrixXd & counts() const { return total; }

  const pdf_schema_t & schema() const { return sch; }

  int size() const { return times.size(); }

  const std::vector<pdf_warning_t> & warnings() const { return warns; }

 private:

  void warn( const std::string & source , const std::string & msg );

  pdf_schema_t sch;

  Eigen::MatrixXd total;

  std::vector<datetime_t> times;

  std::vector<pdf_warning_t> warns;

};


//
// PSD curve for one time (or the mean over one block of hours)
//

struct psd_line_t
{
  datetime_t time;
  std::string label;
  std::vector<double> psd;
  int n;
};

struct psd_lines_t
{
  std::vector<double> frequencies;
  std::vector<psd_line_t> lines;
  std::vector<pdf_warning_t> warnings;
};


//
// Smoothed PSD ordered by time (rows) and frequency (cols)
//

struct timefreq_t
{
  std::vector<datetime_t> times;
  std::vector<double> frequencies;
  Eigen::MatrixXd psd;
  std::vector<pdf_warning_t> warnings;
};


struct pdf_t
{

  // sum inputs with start <= time <= end (either bound optional) and
  // normalize each row; never throws on bad inputs
  static pdf_result_t aggregate( const std::string & group ,
				 const std::vector<pdf_input_t> & inputs ,
				 const datetime_t * start = NULL ,
				 const datetime_t * end = NULL ,
				 const pdf_schema_t * schema = NULL );

  // as above, reading each artifact file (unreadable files are warnings)
  static pdf_result_t aggregate_files( const std::string & group ,
				       const std::vector<std::string> & files ,
				       const datetime_t * start = NULL ,
				       const datetime_t * end = NULL );

  // raw PSD curves sorted by time; with hours > 1, averaged over
  // blocks starting at hours floored to a multiple of 'hours'
  static psd_lines_t psd_lines( const std::vector<std::string> & files , int hours = 1 );

  static timefreq_t timefreq( const std::vector<std::string> & files );

};

#endif
