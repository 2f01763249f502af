
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

#ifndef __CMEA_COFIRING_H__
#define __CMEA_COFIRING_H__

#include <string>
#include <vector>

#include "defs/defs.h"

struct spike_table_t;

// two spikes (row indices) on distinct electrodes, isolated from all
// other spikes of the pair; a is on the alphabetically first electrode
struct cofiring_event_t {

  cofiring_event_t() : a(-1) , b(-1) { }

  cofiring_event_t( int a , int b ) : a(a) , b(b) { }

  int a;

  int b;

};


namespace mea {

  // rows sorted by time (stable), split wherever consecutive spikes are
  // more than min_sep apart; each run of exactly two spikes from two
  // different electrodes is an event; events in time order
  std::vector<cofiring_event_t> cofiring_events( const spike_table_t & spikes ,
						 const std::vector<int> & rows ,
						 const double min_sep = defaults::cofire_sep );

  // all spikes of electrodes e1 and e2
  std::vector<cofiring_event_t> cofiring_events( const spike_table_t & spikes ,
						 const std::string & e1 ,
						 const std::string & e2 ,
						 const double min_sep = defaults::cofire_sep );

}

#endif
