
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

#ifndef __CMEA_SERIES_H__
#define __CMEA_SERIES_H__

#include <vector>
#include <string>

#include "helper/helper.h"

//
// A uniformly sampled, time-indexed trace for one channel
//

struct series_t {

  series_t() { }

  series_t( const std::vector<double> & time , const std::vector<double> & data )
    : time(time) , data(data)
  {
    if ( time.size() != data.size() )
      Helper::halt( "series time index and data differ in length" );
  }

  // index i / fs + t0
  series_t( const std::vector<double> & data , double fs , double t0 = 0 )
    : data(data)
  {
    const int n = data.size();
    time.resize( n );
    for (int i=0; i<n; i++) time[i] = t0 + i / fs;
  }

  int size() const { return data.size(); }

  // mean sampling interval over the whole time index
  double dt() const
  {
    const int n = time.size();
    if ( n < 2 )
      {
	Helper::halt( "series has fewer than 2 samples, cannot infer sampling interval" );
	return 0;
      }
    return ( time[ n - 1 ] - time[0] ) / ( n - 1 );
  }

  std::vector<double> time;

  std::vector<double> data;

};

#endif
