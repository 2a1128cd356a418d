
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

#ifndef __SEISNOISE_MAIN_H__
#define __SEISNOISE_MAIN_H__

#include <string>
#include <vector>

struct param_t;

std::string seisnoise_version();

// key=value tokens from argv[first..]; bare tokens go to 'args'
param_t parse_cmdline( int argc , char ** argv , int first , std::vector<std::string> * args );

// options from param= (if any), overridden by the command line
param_t merge_param_file( const param_t & cmdline );

// one sample per line (blank lines and '#' comments ignored)
std::vector<double> read_samples( const std::string & filename );

int proc_psd( const std::vector<std::string> & args , const param_t & param );
int proc_pdf( const std::vector<std::string> & args , const param_t & param );
int proc_lines( const std::vector<std::string> & args , const param_t & param );
int proc_timefreq( const std::vector<std::string> & args , const param_t & param );
int proc_noise_models( const std::vector<std::string> & args , const param_t & param );
int proc_bins( const std::vector<std::string> & args , const param_t & param );

#endif
