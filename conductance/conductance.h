
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

#ifndef __CMEA_CONDUCTANCE_H__
#define __CMEA_CONDUCTANCE_H__

#include <string>
#include <vector>
#include <set>

#include "defs/defs.h"
#include "conductance/cofiring.h"

struct param_t;
struct spike_table_t;

struct conductance_param_t {

  conductance_param_t()
  {
    sep = defaults::conductance_sep;
    min_events = defaults::conductance_min_events;
    max_jitter = defaults::conductance_max_jitter;
    keep_frac = defaults::keep_frac;
  }

  // sep , min-events , max-jitter , keep-frac
  void init( const param_t & param );

  // cofiring separation (seconds)
  double sep;

  // a pair needs strictly more events than this
  int min_events;

  // and a timing jitter (msec) strictly below this
  double max_jitter;

  // keep candidates: |mean amplitude| > keep_frac * the largest
  double keep_frac;

};


// one electrode pair judged to be a conductance artifact
struct conductance_pair_t {

  conductance_pair_t() : events(0) , jitter(0) { }

  std::string e1;
  std::string e2;

  int events;

  // msec
  double jitter;

  std::string keep;

  // rows of the non-kept electrode, across all events
  std::set<int> flagged;

};


namespace mea {

  // SD (msec) of the differences between consecutive event spikes (taken
  // in event order, each event in electrode order) that fall below sep;
  // F if there are fewer than two such differences
  bool event_jitter( const spike_table_t & spikes ,
		     const std::vector<cofiring_event_t> & events ,
		     const double sep ,
		     double * jitter );

  // more than min_events events, with jitter below max_jitter
  bool is_conductance_pair( const spike_table_t & spikes ,
			    const std::vector<cofiring_event_t> & events ,
			    const conductance_param_t & cp ,
			    double * jitter = NULL );

  // alphabetically first electrode whose |mean amplitude| over these rows
  // exceeds keep_frac times the largest such value
  std::string choose_keep_electrode( const spike_table_t & spikes ,
				     const std::vector<int> & rows ,
				     const double keep_frac = defaults::keep_frac );

  std::string choose_keep_electrode( const spike_table_t & spikes ,
				     const std::vector<cofiring_event_t> & events ,
				     const double keep_frac = defaults::keep_frac );

  // T and fills 'pair' if e1/e2 is a conductance pair; pairs with fewer
  // than two cofiring events are not analysed
  bool analyse_pair( const spike_table_t & spikes ,
		     const std::string & e1 ,
		     const std::string & e2 ,
		     const conductance_param_t & cp ,
		     conductance_pair_t * pair );

  // test every pair of non-analog electrodes, then reset the conductance
  // flags to exactly the rows of non-kept electrodes in detected pairs
  std::vector<conductance_pair_t> tag_conductance_spikes( spike_table_t & spikes ,
							  const conductance_param_t & cp );

  std::vector<conductance_pair_t> tag_conductance_spikes( spike_table_t & spikes ,
							  const param_t & param );

}

#endif
