
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

#ifndef __CMEA_SORT_H__
#define __CMEA_SORT_H__

#include <vector>

#include "defs/defs.h"

struct param_t;
struct recording_t;
struct spike_table_t;

struct subcluster_param_t {

  subcluster_param_t()
  {
    low = defaults::filter_low;
    high = defaults::filter_high;
    window_len = defaults::window_len;
    eps = defaults::dbscan_eps;
    minpts = defaults::dbscan_minpts;
    nc = 2;
  }

  // low , high , win , eps , minpts
  void init( const param_t & param );

  double low;
  double high;
  double window_len;

  double eps;
  int minpts;

  // principal components
  int nc;

};


namespace mea {

  // cluster labels (0..k-1, or -1 for noise) for one electrode's waveforms;
  // only full-length waveforms are embedded, shorter ones are noise
  std::vector<int> subcluster( const std::vector<std::vector<double> > & waveforms ,
			       const int full_length ,
			       const subcluster_param_t & sp );

  // rewrite each tag as <tag>.<label>, per electrode, from waveforms of the
  // band-passed recording channel
  void sort_spikes( spike_table_t & spikes , const recording_t & rec , const subcluster_param_t & sp );

  void sort_spikes( spike_table_t & spikes , const recording_t & rec , const param_t & param );

}

#endif
