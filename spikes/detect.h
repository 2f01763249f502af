
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

#ifndef __CMEA_DETECT_H__
#define __CMEA_DETECT_H__

#include "defs/defs.h"
#include "spikes/spikes.h"

struct param_t;
struct recording_t;

struct detect_param_t {

  detect_param_t()
  {
    amp = defaults::amp;
    dead_time = defaults::dead_time;
    filter = true;
    low = defaults::filter_low;
    high = defaults::filter_high;
  }

  // amp , dead , filter , low , high
  void init( const param_t & param );

  double amp;
  double dead_time;

  // band-pass before detection
  bool filter;
  double low;
  double high;

};


namespace mea {

  // per channel, in recording order
  spike_table_t detect_spikes( const recording_t & rec , const detect_param_t & dp );

  spike_table_t detect_spikes( const recording_t & rec , const param_t & param );

}

#endif
