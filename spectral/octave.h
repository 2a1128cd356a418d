
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

#ifndef __SEISNOISE_OCTAVE_H__
#define __SEISNOISE_OCTAVE_H__

#include <vector>

//
// Geometric period bins for octave smoothing: each bin spans
// 'width' octaves and consecutive bins advance by 'step' octaves
//

struct period_bins_t
{

  std::vector<double> left;
  std::vector<double> plot_left;
  std::vector<double> center;
  std::vector<double> plot_right;
  std::vector<double> right;

  int size() const { return center.size(); }

};

namespace dsptools {

  // invalid_config_t unless 0 < pmin <= pmax (finite) and width, step > 0
  period_bins_t period_bins( double width_octaves ,
			     double step_octaves ,
			     double pmin ,
			     double pmax );

}

#endif
