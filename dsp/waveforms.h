
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

#ifndef __CMEA_WAVEFORMS_H__
#define __CMEA_WAVEFORMS_H__

#include <vector>

#include "defs/defs.h"

struct series_t;

namespace dsptools {

  // samples in a full (non-truncated) window: 2 * floor( window_len / ( 2 * dt ) )
  int waveform_length( double window_len , double dt );

  // one window of window_len seconds per spike time, centred on the
  // sample nearest to t; windows that run past either
  // end of the series are returned shorter, not padded
  std::vector<std::vector<double> > extract_waveforms( const series_t & s ,
						       const std::vector<double> & times ,
						       double window_len = defaults::window_len );

}

#endif
