
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
#include "db/psdstore.h"
#include "spectral/psd.h"
#include "helper/helper.h"

#include <cmath>
#include <cstdio>
#include <random>
#include <string>
#include <vector>

#include "tests/test_support.h"

static std::vector<double> grid( int n )
{
  std::vector<double> g( n );
  for (int i=0;i<n;i++) g[i] = -200 + i;
  return g;
}

static pdf_input_t random_input( std::mt19937 & rng , int rows , int cols , const datetime_t & t , const std::string & src )
{
  std::uniform_int_distribution<int> u( 0 , 5 );
  Eigen::MatrixXd d( rows , cols );
  for (int r=0;r<rows;r++)
    for (int c=0;c<cols;c++)
      d(r,c) = u( rng );
  return pdf_input_t( d , grid( cols ) , t , src );
}

// small artifact with a flat PSD of 'level' dB
static psd_result_t flat( double level , const datetime_t & t , int nf = 3 )
{
  psd_result_t res;
  for (int i=0;i<nf;i++)
    {
      res.frequencies.push_back( 0.5 * ( i + 1 ) );
      res.psd_db.push_back( level + i );
    }
  res.smoothed_frequencies.push_back( 0.75 );
  res.smoothed_frequencies.push_back( 1.25 );
  res.smoothed_psd_db.push_back( level );
  res.smoothed_psd_db.push_back( level + 1 );
  res.db_bin_edges = psd_t::db_grid();
  res.distribution = Eigen::MatrixXd::Zero( 2 , res.db_bin_edges.size() );
  res.distribution( 0 , psd_t::db_bin( level ) ) = 2;
  res.distribution( 1 , psd_t::db_bin( level + 1 ) ) = 1;
  res.start_time = t;
  res.sample_rate = 100;
  return res;
}

int main()
{

  seisnoise_test::init();

  std::mt19937 rng( 42 );

  //
  // rows of the normalized result sum to one (or zero)
  //

  {
    std::vector<pdf_input_t> in;
    for (int i=0;i<4;i++)
      in.push_back( random_input( rng , 6 , 10 , datetime_t( 2020 , 1 , 1 , i ) , "seg" + Helper::int2str( i ) ) );

    // one row never counted
    for (int i=0;i<4;i++) in[i].distribution.row( 3 ).setZero();

    pdf_result_t res = pdf_t::aggregate( "G" , in );
    assert( res.group == "G" );
    assert( res.used == 4 );
    assert( res.warnings.size() == 0 );
    assert( res.probability.rows() == 6 && res.probability.cols() == 10 );

    for (int r=0;r<6;r++)
      {
	if ( r == 3 ) assert( res.probability.row(r).sum() == 0 );
	else assert( seisnoise_test::near( res.probability.row(r).sum() , 1.0 , 1e-12 ) );
      }

    Eigen::MatrixXd sum = in[0].distribution + in[1].distribution + in[2].distribution + in[3].distribution;
    assert( res.counts == sum );
    assert( res.times.size() == 4 );
    assert( res.times[0] < res.times[3] );
  }

  //
  // partial accumulators merge to the same result
  //

  {
    std::vector<pdf_input_t> in;
    for (int i=0;i<7;i++)
      in.push_back( random_input( rng , 5 , 8 , datetime_t( 2020 , 2 , 1 , i ) , "" ) );

    pdf_accumulator_t all;
    for (int i=0;i<7;i++) all.add( in[i] );

    pdf_accumulator_t a , b , c;
    for (int i=0;i<2;i++) a.add( in[i] );
    for (int i=2;i<5;i++) b.add( in[i] );
    for (int i=5;i<7;i++) c.add( in[i] );

    // (a+b)+c and a+(b+c)
    pdf_accumulator_t ab = a;
    ab.merge( b );
    ab.merge( c );

    pdf_accumulator_t bc = b;
    bc.merge( c );
    pdf_accumulator_t a_bc = a;
    a_bc.merge( bc );

    assert( ab.size() == 7 && a_bc.size() == 7 );
    assert( ab.counts() == all.counts() );
    assert( a_bc.counts() == all.counts() );
    assert( ( ab.probability() - all.probability() ).cwiseAbs().maxCoeff() < 1e-12 );

    // merging an empty accumulator changes nothing
    pdf_accumulator_t empty;
    pdf_accumulator_t e = all;
    e.merge( empty );
    assert( e.counts() == all.counts() );
    empty.merge( all );
    assert( empty.counts() == all.counts() );
  }

  //
  // incompatible or malformed inputs are skipped with a warning
  //

  {
    std::vector<pdf_input_t> in;
    in.push_back( random_input( rng , 4 , 10 , datetime_t( 2020 , 3 , 1 ) , "a" ) );
    in.push_back( random_input( rng , 5 , 10 , datetime_t( 2020 , 3 , 2 ) , "rows" ) );
    in.push_back( random_input( rng , 4 , 12 , datetime_t( 2020 , 3 , 3 ) , "cols" ) );
    in.push_back( random_input( rng , 4 , 10 , datetime_t( 2020 , 3 , 4 ) , "b" ) );

    pdf_input_t bad = random_input( rng , 4 , 10 , datetime_t( 2020 , 3 , 5 ) , "negative" );
    bad.distribution( 0 , 0 ) = -1;
    in.push_back( bad );

    pdf_input_t nogrid = random_input( rng , 4 , 10 , datetime_t( 2020 , 3 , 6 ) , "grid" );
    nogrid.db_grid.pop_back();
    in.push_back( nogrid );

    pdf_result_t res = pdf_t::aggregate( "" , in );
    assert( res.used == 2 );
    assert( res.warnings.size() == 4 );
    assert( res.warnings[0].source == "rows" );
    assert( res.warnings[1].source == "cols" );
    assert( res.warnings[2].source == "negative" );
    assert( res.warnings[3].source == "grid" );
    assert( res.counts == in[0].distribution + in[3].distribution );

    // an explicit schema rejects the first input too
    pdf_schema_t s( 5 , grid( 10 ) );
    pdf_result_t res2 = pdf_t::aggregate( "" , in , NULL , NULL , &s );
    assert( res2.used == 1 );
    assert( res2.counts == in[1].distribution );

    // frequencies differ
    std::vector<double> f1 , f2;
    for (int i=0;i<4;i++) { f1.push_back( i + 1 ); f2.push_back( i + 1.5 ); }
    std::vector<pdf_input_t> fin;
    fin.push_back( in[0] ); fin.back().frequencies = f1;
    fin.push_back( in[3] ); fin.back().frequencies = f2;
    fin.push_back( in[3] );
    pdf_result_t res3 = pdf_t::aggregate( "" , fin );
    assert( res3.used == 2 );
    assert( res3.warnings.size() == 1 );
    assert( res3.frequencies == f1 );
  }

  //
  // nothing to aggregate
  //

  {
    std::vector<pdf_input_t> none;
    pdf_result_t res = pdf_t::aggregate( "Z" , none );
    assert( res.used == 0 );
    assert( res.warnings.size() == 1 );
    assert( res.counts.rows() == 0 && res.counts.cols() == 150 );
    assert( res.db_grid.size() == 150 );

    // with a known schema: zeros of that shape
    pdf_schema_t s( 3 , grid( 10 ) );
    pdf_result_t res2 = pdf_t::aggregate( "Z" , none , NULL , NULL , &s );
    assert( res2.probability.rows() == 3 && res2.probability.cols() == 10 );
    assert( res2.probability.sum() == 0 );
  }

  //
  // time window
  //

  {
    std::vector<pdf_input_t> in;
    for (int h=0;h<6;h++)
      in.push_back( random_input( rng , 3 , 10 , datetime_t( 2020 , 4 , 1 , h ) , "" ) );

    const datetime_t lwr( 2020 , 4 , 1 , 2 );
    const datetime_t upr( 2020 , 4 , 1 , 4 );
    pdf_result_t res = pdf_t::aggregate( "" , in , &lwr , &upr );
    assert( res.used == 3 );
    assert( res.counts == in[2].distribution + in[3].distribution + in[4].distribution );

    pdf_result_t res2 = pdf_t::aggregate( "" , in , &upr , NULL );
    assert( res2.used == 2 );

    const datetime_t later( 2021 , 1 , 1 );
    pdf_result_t res3 = pdf_t::aggregate( "" , in , &later , NULL );
    assert( res3.used == 0 );
    assert( res3.warnings.size() == 1 );
  }

  //
  // from artifact files
  //

  {
    std::vector<std::string> files;
    for (int h=0;h<4;h++)
      {
	const datetime_t t( 2020 , 5 , 1 , h , 30 );
	const std::string f = psd_store_t::filename( "PDF" , "HHZ" , t );
	psd_store_t::write( f , flat( -120 - h , t ) );
	files.push_back( f );
      }

    // odd one out: fewer frequencies
    const datetime_t t4( 2020 , 5 , 1 , 1 , 45 );
    const std::string odd = psd_store_t::filename( "PDF" , "HHZ" , t4 );
    psd_store_t::write( odd , flat( -100 , t4 , 2 ) );

    std::vector<std::string> all = files;
    all.push_back( odd );
    all.push_back( "PDF.HHZ.20200501060000_psd.db" ); // missing

    pdf_result_t res = pdf_t::aggregate_files( "PDF" , all );
    assert( res.used == 5 );
    assert( res.warnings.size() == 1 );
    assert( res.counts.sum() == 15 );
    assert( seisnoise_test::near( res.probability( 0 , psd_t::db_bin( -120 ) ) , 0.2 , 1e-12 ) );

    const datetime_t lwr( 2020 , 5 , 1 , 1 );
    const datetime_t upr( 2020 , 5 , 1 , 2 );
    pdf_result_t res2 = pdf_t::aggregate_files( "PDF" , all , &lwr , &upr );
    assert( res2.used == 2 );

    //
    // lines: individual, then two-hour means
    //

    psd_lines_t lines = pdf_t::psd_lines( all , 1 );
    assert( lines.frequencies.size() == 3 );
    assert( lines.lines.size() == 4 );
    assert( lines.warnings.size() == 2 );
    assert( lines.lines[0].label == "2020-05-01 00:30" );
    assert( lines.lines[3].psd[0] == -123 );

    psd_lines_t blocks = pdf_t::psd_lines( all , 2 );
    assert( blocks.lines.size() == 2 );
    assert( blocks.lines[0].label == "2020-05-01 00:00" );
    assert( blocks.lines[0].n == 2 );
    assert( seisnoise_test::near( blocks.lines[0].psd[0] , -120.5 , 1e-12 ) );
    assert( seisnoise_test::near( blocks.lines[1].psd[2] , -120.5 , 1e-12 ) );

    SEISNOISE_TEST_THROWS( pdf_t::psd_lines( all , 0 ) , invalid_config_t );

    //
    // time x frequency
    //

    timefreq_t tf = pdf_t::timefreq( all );
    assert( tf.times.size() == 5 );
    assert( tf.frequencies.size() == 2 );
    assert( tf.psd.rows() == 5 && tf.psd.cols() == 2 );
    assert( tf.psd( 0 , 0 ) == -120 );
    assert( tf.psd( 2 , 0 ) == -100 );
    assert( tf.psd( 4 , 1 ) == -122 );
    assert( tf.warnings.size() == 1 );

    for (int i=0;i<files.size();i++) std::remove( files[i].c_str() );
    std::remove( odd.c_str() );
  }

  //
  // artifacts without a curve do not fix the axis
  //

  {
    // nothing kept at all
    const datetime_t t0( 2020 , 6 , 1 , 0 );
    psd_result_t none;
    none.db_bin_edges = psd_t::db_grid();
    none.distribution = Eigen::MatrixXd::Zero( 0 , none.db_bin_edges.size() );
    none.start_time = t0;
    none.sample_rate = 100;

    // DC only: a raw curve, but no smoothed one
    const datetime_t t1( 2020 , 6 , 1 , 1 );
    psd_result_t dc = none;
    dc.frequencies.push_back( 0 );
    dc.psd_db.push_back( NAN );
    dc.nan_points = 1;
    dc.start_time = t1;

    const std::string f0 = psd_store_t::filename( "AX" , "HHZ" , t0 );
    const std::string f1 = psd_store_t::filename( "AX" , "HHZ" , t1 );
    const std::string f2 = psd_store_t::filename( "AX" , "HHZ" , datetime_t( 2020 , 6 , 1 , 2 ) );
    const std::string f3 = psd_store_t::filename( "AX" , "HHZ" , datetime_t( 2020 , 6 , 1 , 3 ) );
    psd_store_t::write( f0 , none );
    psd_store_t::write( f1 , dc );
    psd_store_t::write( f2 , flat( -130 , datetime_t( 2020 , 6 , 1 , 2 ) ) );
    psd_store_t::write( f3 , flat( -140 , datetime_t( 2020 , 6 , 1 , 3 ) ) );

    std::vector<std::string> all;
    all.push_back( f3 ); all.push_back( f1 ); all.push_back( f0 ); all.push_back( f2 );

    timefreq_t tf = pdf_t::timefreq( all );
    assert( tf.warnings.size() == 2 );
    assert( tf.frequencies.size() == 2 );
    assert( tf.times.size() == 2 && tf.times[0] == datetime_t( 2020 , 6 , 1 , 2 ) );
    assert( tf.psd.rows() == 2 && tf.psd.cols() == 2 );
    assert( tf.psd( 0 , 0 ) == -130 && tf.psd( 1 , 1 ) == -139 );

    std::vector<std::string> some;
    some.push_back( f0 ); some.push_back( f2 ); some.push_back( f3 );

    psd_lines_t lines = pdf_t::psd_lines( some , 1 );
    assert( lines.warnings.size() == 1 && lines.warnings[0].source == f0 );
    assert( lines.frequencies.size() == 3 );
    assert( lines.lines.size() == 2 );
    assert( lines.lines[1].psd[2] == -138 );

    psd_lines_t blocks = pdf_t::psd_lines( some , 6 );
    assert( blocks.lines.size() == 1 && blocks.lines[0].n == 2 );
    assert( seisnoise_test::near( blocks.lines[0].psd[0] , -135 , 1e-12 ) );

    std::remove( f0.c_str() );
    std::remove( f1.c_str() );
    std::remove( f2.c_str() );
    std::remove( f3.c_str() );
  }

  std::cerr << "test_pdf: OK\n";
  return 0;
}
