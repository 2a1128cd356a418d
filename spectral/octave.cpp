
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

#include "spectral/octave.h"

#include "helper/helper.h"

#include <cmath>


period_bins_t dsptools::period_bins( double width , double step , double pmin , double pmax )
{

  if ( ! ( std::isfinite( width ) && width > 0 ) )
    throw invalid_config_t( "octave smoothing width must be positive" );

  if ( ! ( std::isfinite( step ) && step > 0 ) )
    throw invalid_config_t( "octave step must be positive" );

  if ( ! ( std::isfinite( pmin ) && std::isfinite( pmax ) && pmin > 0 && pmax > 0 ) )
    throw invalid_config_t( "period limits must be positive and finite" );

  if ( pmin > pmax )
    throw invalid_config_t( "period limits out of order: "
			    + Helper::dbl2str( pmin ) + " > " + Helper::dbl2str( pmax ) );

  const double step_factor = pow( 2.0 , step );
  const double smoothing_factor = pow( 2.0 , width );

  period_bins_t bins;

  // centers advance geometrically from pmin; computing each center
  // directly keeps the first one exactly at pmin
  const double halfwidth = sqrt( smoothing_factor );

  int k = 0;
  double center = pmin;

  while ( true )
    {
      const double left = center / halfwidth;
      bins.left.push_back( left );
      bins.right.push_back( left * smoothing_factor );
      bins.center.push_back( center );

      if ( ! ( center < pmax ) ) break;

      ++k;
      center = pmin * pow( step_factor , k );
    }

  // plotting edges: half a step either side of the center
  const double half = sqrt( step_factor );
  for (int i=0;i<bins.center.size();i++)
    {
      bins.plot_left.push_back( bins.center[i] / half );
      bins.plot_right.push_back( bins.center[i] * half );
    }

  return bins;
}
