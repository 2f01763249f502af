
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

#ifndef __CMEA_PEAKS_H__
#define __CMEA_PEAKS_H__

#include <vector>

#include "defs/defs.h"

struct series_t;

struct peak_t {

  peak_t() : time(0) , amplitude(0) , threshold(0) { }

  peak_t( double time , double amplitude , double threshold )
    : time(time) , amplitude(amplitude) , threshold(threshold) { }

  double time;
  double amplitude;
  double threshold;
};


struct peaks_t {

  peaks_t()
  {
    // option defaults
    amp = defaults::amp;
    dead_time = defaults::dead_time;
    noise = 0;
    threshold = 0;
  }

  // find negative-going spikes; results in pk
  void detect( const series_t & s );

  // threshold multiplier (of the MAD noise estimate)
  double amp;

  // seconds after a spike during which no new spike is accepted
  double dead_time;

  // set by detect()
  double noise;
  double threshold;

  std::vector<peak_t> pk;

};


namespace dsptools
{
  // noise = MAD / 0.6745 , threshold = -amp * noise; one spike (the
  // most negative sample) per excursion below threshold
  std::vector<peak_t> find_series_peaks( const series_t & s ,
					 double amp = defaults::amp ,
					 double dead_time = defaults::dead_time );
}

#endif
