
//    --------------------------------------------------------------------
//
//    This file is part of CMEA.
//
//    CMEA is free software: you can redistribute it and/or modify
//    it under the terms of the GNU General Public License as published by
//    the Free Software Foundation, either version 3 of the License, or
//    (at your option) any later version.
//
//    CMEA is distributed in the hope that it will be useful,
//    but WITHOUT ANY WARRANTY; without even the implied warranty of
//    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//    GNU General Public License for more details.
//
//    You should have received a copy of the GNU General Public License
//    along with CMEA. If not, see <http://www.gnu.org/licenses/>.
//
//    Please see LICENSE.txt for more details.
//
//    --------------------------------------------------------------------

#ifndef __CMEA_MISCMATH_H__
#define __CMEA_MISCMATH_H__

#include <vector>
#include <cstddef>
#include <algorithm>

namespace MiscMath
{

  // differences
  std::vector<double> diff( const std::vector<double> & x );

  // mean/variance (n-1 denominator)
  double mean( const std::vector<double> & x );
  double variance( const std::vector<double> & x );
  double variance( const std::vector<double> & x , double m );
  double sdev( const std::vector<double> & x );
  double sdev( const std::vector<double> & x , double m );

  // lower median for even n unless 'upper' (then average of the two)
  double median( const std::vector<double> & x , const bool upper = false );

  // median absolute deviation (unscaled)
  double mad( const std::vector<double> & x );

  double kth_smallest_preserve( const std::vector<double> & x , int k );

  // clip to [a,b]
  inline double clip( const double x , const double a , const double b )
  {
    return x < a ? a : ( x > b ? b : x );
  }

}

#endif
