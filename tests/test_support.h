
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

#ifndef __SEISNOISE_TEST_SUPPORT_H__
#define __SEISNOISE_TEST_SUPPORT_H__

// assert() that stays on in release (NDEBUG) builds; a failure prints
// the expression and exits non-zero

#include <cassert>

#include <cstdlib>
#include <cmath>
#include <iostream>
#include <string>

#include "defs/defs.h"

namespace seisnoise_test {

  inline void fail( const char * expr , const char * file , int line )
  {
    std::cerr << "test assertion failed: " << expr << " (" << file << ":" << line << ")\n";
    std::exit(1);
  }

  inline bool near( double a , double b , double eps )
  {
    return std::fabs( a - b ) <= eps;
  }

  // quiet logging for all tests
  inline void init()
  {
    globals::init_defs();
    globals::silent = true;
  }

}

#define SEISNOISE_TEST_ASSERT(expr) \
  (static_cast<bool>(expr) ? (void)0 : ::seisnoise_test::fail(#expr, __FILE__, __LINE__))

#ifdef assert
#undef assert
#endif
#define assert(expr) SEISNOISE_TEST_ASSERT(expr)

// expect a given exception type from a statement
#define SEISNOISE_TEST_THROWS(stmt, type)				\
  do {									\
    bool thrown_ = false;						\
    try { stmt; } catch ( const type & ) { thrown_ = true; }		\
    if ( ! thrown_ ) ::seisnoise_test::fail( #stmt " throws " #type , __FILE__ , __LINE__ ); \
  } while ( 0 )

#endif
