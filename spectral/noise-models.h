
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

#ifndef __SEISNOISE_NOISE_MODELS_H__
#define __SEISNOISE_NOISE_MODELS_H__

#include <vector>
#include <string>

//
// Peterson New Low / New High Noise Models: reference curves of
// acceleration power (dB) against period (s)
//

struct noise_model_t
{

  std::vector<double> periods;
  std::vector<double> low_noise_db;
  std::vector<double> high_noise_db;

  int size() const { return periods.size(); }

  // linear interpolation in log10(period); NaN outside the table
  double low( double period ) const;
  double high( double period ) const;

  // parse a whitespace-delimited table (period, NLNM, NHNM; '#' comments);
  // resource_error_t if the file is missing or malformed
  static noise_model_t load( const std::string & filename );

  // the shared table, loaded on first use (thread-safe) from
  // globals::noise_model_file, or else the bundled resource
  static const noise_model_t & reference();

  // where reference() reads from
  static std::string resource_file();

 private:

  double interpolate( const std::vector<double> & db , double period ) const;

};

#endif
