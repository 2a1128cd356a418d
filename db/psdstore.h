
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

#ifndef __SEISNOISE_PSDSTORE_H__
#define __SEISNOISE_PSDSTORE_H__

#include <string>
#include <vector>
#include <map>

#include "spectral/psd.h"
#include "helper/helper.h"

//
// One SQLite file per processed segment: raw and smoothed PSD, the
// dB distribution, its grid, and the settings that produced it
//

struct psd_store_t
{

  static const int format_version;

  // replaces any existing file
  static void write( const std::string & filename , const psd_result_t & res );

  // seisnoise_error_t if the file is missing or not an artifact
  static psd_result_t read( const std::string & filename );

  // metadata table only
  static std::map<std::string,std::string> metadata( const std::string & filename );

  // <station>.<component>.<YYYYmmddHHMMSS>[_tag]_psd.db
  static std::string filename( const std::string & station ,
			       const std::string & component ,
			       const datetime_t & start ,
			       const std::string & tag = "" );

  // timestamp from the third dot-delimited field of the base name
  static bool timestamp( const std::string & filename , datetime_t * dt );

  // artifacts in folder (and its PSD sub-folder) whose name time lies in
  // [start,end] (either bound optional), sorted by time then name
  static std::vector<std::string> scan( const std::string & folder ,
					const datetime_t * start = NULL ,
					const datetime_t * end = NULL );

};

#endif
