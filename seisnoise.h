
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

#ifndef __SEISNOISE_H__
#define __SEISNOISE_H__

#include <cstddef>

#include "defs/defs.h"
#include "helper/helper.h"
#include "helper/logger.h"
#include "param.h"

#include "miscmath/miscmath.h"

#include "fftw/fftwrap.h"

#include "dsp/iir.h"

#include "spectral/octave.h"
#include "spectral/psd.h"
#include "spectral/noise-models.h"

#include "db/sqlwrap.h"
#include "db/psdstore.h"

#include "pdf/pdf.h"

#include <Eigen/Dense>

#endif
